#pragma once
#include "api_client.hpp"
#include "../config.hpp"
#include <functional>
#include <string>

namespace minim {

// ── PKCE helpers ─────────────────────────────────────────────────
std::string make_code_verifier();
std::string make_code_challenge_s256(const std::string& verifier);

// ── Authorize URL builder ────────────────────────────────────────
// code_challenge empty = plain authorization code flow
std::string build_authorize_url(const std::string& authorize_url,
                                const std::string& client_id,
                                const std::string& redirect_uri,
                                const std::string& scopes,
                                const std::string& state,
                                const std::string& code_challenge = "");

// ── OAuth input parsing ──────────────────────────────────────────
// Accepts a full redirect URL, a bare query string or a bare code.
struct ParsedOAuthInput {
    std::string code;
    std::string state;
    std::string error;
};
ParsedOAuthInput parse_oauth_input(const std::string& raw_input);

struct OAuth2Settings {
    std::string client_name;
    std::string env_prefix;      // reads <PREFIX>_CLIENT_ID and <PREFIX>_CLIENT_SECRET
    std::string base_url;
    std::string authorize_url;
    std::string token_url;
    std::string flow = kFlowClientCredentials;
    std::string client_id;
    std::string client_secret;
    std::string redirect_uri;
    std::string scopes;
    std::string user_identifier; // '~' prefix forces a new authorization
    bool store_tokens = true;
};

// Receives the authorization URL and returns what the user was redirected
// to (full URL or bare code).
using AuthorizationPrompt = std::function<std::string(const std::string& authorize_url)>;

// OAuth 2.0 client base: client credentials, authorization code and
// authorization code with PKCE, plus refresh. Derived classes call
// authenticate() at the end of their constructor.
class OAuth2Client : public ApiClient {
public:
    OAuth2Client(OAuth2Settings settings, const ClientEntry& config_entry,
                 HttpClient& http, ClientResources resources,
                 AuthorizationPrompt prompt = {});

    const std::string& flow() const { return settings_.flow; }
    const std::string& client_id() const { return settings_.client_id; }
    const CredentialRecord& credential() const { return credential_; }

    // Exchange the refresh token for a new access token and persist it.
    void refresh();

protected:
    void authenticate();
    void prepare(ApiRequest& request) override;
    bool reauthenticate() override;

    // Identifier of the authorized user, queried after a user flow.
    virtual std::string fetch_user_identifier() { return ""; }

private:
    CredentialRecord exchange();
    CredentialRecord authorize_user(bool pkce);
    CredentialRecord request_token(QueryParams form, bool basic_auth);
    void rerun_flow();
    void ensure_fresh();
    bool user_flow() const { return settings_.flow != kFlowClientCredentials; }

    OAuth2Settings settings_;
    AuthorizationPrompt prompt_;
    CredentialRecord credential_;
    bool authenticating_ = false;
};

} // namespace minim
