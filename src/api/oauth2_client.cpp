#include "oauth2_client.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <openssl/sha.h>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace minim {

using json = nlohmann::json;

namespace {

std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() &&
            std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else if (s[i] == '+') {
            out.push_back(' ');
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::string query_param(const std::string& input, const std::string& key) {
    auto qpos = input.find('?');
    std::string query = (qpos == std::string::npos) ? input : input.substr(qpos + 1);
    auto hash = query.find('#');
    if (hash != std::string::npos) query = query.substr(0, hash);

    for (const auto& p : split(query, '&')) {
        auto eq = p.find('=');
        if (eq == std::string::npos) continue;
        if (p.substr(0, eq) == key) {
            return percent_decode(p.substr(eq + 1));
        }
    }
    return "";
}

} // namespace

// ── PKCE helpers ─────────────────────────────────────────────────

std::string make_code_verifier() {
    auto id = generate_id() + generate_id();
    return base64url_encode(reinterpret_cast<const unsigned char*>(id.data()), id.size());
}

std::string make_code_challenge_s256(const std::string& verifier) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(verifier.data()), verifier.size(), hash);
    return base64url_encode(hash, SHA256_DIGEST_LENGTH);
}

// ── Authorize URL builder ────────────────────────────────────────

std::string build_authorize_url(const std::string& authorize_url,
                                const std::string& client_id,
                                const std::string& redirect_uri,
                                const std::string& scopes,
                                const std::string& state,
                                const std::string& code_challenge) {
    QueryParams params = {
        {"response_type", "code"},
        {"client_id", client_id},
        {"redirect_uri", redirect_uri},
        {"state", state},
    };
    if (!scopes.empty()) params.emplace_back("scope", scopes);
    if (!code_challenge.empty()) {
        params.emplace_back("code_challenge", code_challenge);
        params.emplace_back("code_challenge_method", "S256");
    }
    return with_query(authorize_url, params);
}

// ── OAuth input parsing ──────────────────────────────────────────

ParsedOAuthInput parse_oauth_input(const std::string& raw_input) {
    std::string input = trim(raw_input);
    ParsedOAuthInput result;
    result.code = input;
    result.state = query_param(input, "state");
    result.error = query_param(input, "error");
    std::string code_from_query = query_param(input, "code");
    if (!code_from_query.empty()) {
        result.code = code_from_query;
    } else if (input.find('=') != std::string::npos) {
        result.code.clear();
    }
    return result;
}

// ── OAuth2Client ─────────────────────────────────────────────────

OAuth2Client::OAuth2Client(OAuth2Settings settings, const ClientEntry& config_entry,
                           HttpClient& http, ClientResources resources,
                           AuthorizationPrompt prompt)
    : ApiClient(settings.client_name,
                config_entry.base_url.empty() ? settings.base_url : config_entry.base_url,
                http, std::move(resources)),
      settings_(std::move(settings)),
      prompt_(std::move(prompt)) {
    require_one_of("authorization flow", settings_.flow,
                   {kFlowClientCredentials, kFlowAuthCode, kFlowPkce});

    const std::string& prefix = settings_.env_prefix;
    settings_.client_id = resolve_setting(settings_.client_id, prefix + "_CLIENT_ID",
                                          config_entry.client_id);
    settings_.client_secret = resolve_setting(settings_.client_secret, prefix + "_CLIENT_SECRET",
                                              config_entry.client_secret);
    settings_.redirect_uri = resolve_setting(settings_.redirect_uri, prefix + "_REDIRECT_URI",
                                             config_entry.redirect_uri);
    if (settings_.user_identifier.empty()) {
        settings_.user_identifier = config_entry.user_identifier;
    }

    if (settings_.client_id.empty() && settings_.store_tokens) {
        UserIdentifier id = UserIdentifier::parse(settings_.user_identifier);
        if (auto stored = authenticator().latest(client_name(), settings_.flow, id.value)) {
            settings_.client_id = stored->client_id;
            if (settings_.client_secret.empty()) settings_.client_secret = stored->client_secret;
            if (settings_.redirect_uri.empty()) settings_.redirect_uri = stored->redirect_uri;
        }
    }

    if (settings_.client_id.empty()) {
        throw std::invalid_argument("No " + client_name() + " client ID provided. Set " +
                                    prefix + "_CLIENT_ID or pass it explicitly.");
    }
    if (settings_.flow != kFlowPkce && settings_.client_secret.empty()) {
        throw std::invalid_argument("The " + settings_.flow + " flow requires a " +
                                    client_name() + " client secret.");
    }
    if (user_flow() && settings_.redirect_uri.empty()) {
        throw std::invalid_argument("The " + settings_.flow + " flow requires a redirect URI.");
    }
}

void OAuth2Client::authenticate() {
    AuthRequest request;
    request.client_name = client_name();
    request.authorization_flow = settings_.flow;
    request.client_id = settings_.client_id;
    request.user_identifier = settings_.user_identifier;
    request.store_tokens = settings_.store_tokens;

    credential_ = authenticator().resolve(request, [this]() { return exchange(); });
    if (settings_.client_secret.empty()) settings_.client_secret = credential_.client_secret;
}

CredentialRecord OAuth2Client::exchange() {
    CredentialRecord record;
    if (settings_.flow == kFlowClientCredentials) {
        record = request_token({{"grant_type", "client_credentials"}}, true);
    } else {
        record = authorize_user(settings_.flow == kFlowPkce);
    }

    record.client_name = client_name();
    record.authorization_flow = settings_.flow;
    record.client_id = settings_.client_id;
    record.client_secret = settings_.client_secret;
    record.redirect_uri = settings_.redirect_uri;
    if (record.scopes.empty()) record.scopes = settings_.scopes;

    if (user_flow() && UserIdentifier::parse(settings_.user_identifier).value.empty()) {
        credential_ = record;
        authenticating_ = true;
        try {
            record.user_identifier = fetch_user_identifier();
        } catch (...) {
            authenticating_ = false;
            throw;
        }
        authenticating_ = false;
    }
    return record;
}

CredentialRecord OAuth2Client::authorize_user(bool pkce) {
    if (!prompt_) {
        throw std::invalid_argument("The " + settings_.flow +
                                    " flow needs an authorization prompt.");
    }

    std::string state = generate_id();
    std::string verifier;
    std::string challenge;
    if (pkce) {
        verifier = make_code_verifier();
        challenge = make_code_challenge_s256(verifier);
    }

    std::string url = build_authorize_url(settings_.authorize_url, settings_.client_id,
                                          settings_.redirect_uri, settings_.scopes,
                                          state, challenge);
    ParsedOAuthInput input = parse_oauth_input(prompt_(url));

    if (!input.error.empty()) {
        throw std::runtime_error("Authorization denied: " + input.error);
    }
    if (!input.state.empty() && input.state != state) {
        throw std::runtime_error("Authorization state mismatch");
    }
    if (input.code.empty()) {
        throw std::runtime_error("No authorization code in redirect");
    }

    QueryParams form = {
        {"grant_type", "authorization_code"},
        {"code", input.code},
        {"redirect_uri", settings_.redirect_uri},
    };
    if (pkce) form.emplace_back("code_verifier", verifier);
    return request_token(std::move(form), !pkce);
}

// Non-string values count as absent
static std::string string_field(const json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

CredentialRecord OAuth2Client::request_token(QueryParams form, bool basic_auth) {
    std::vector<Header> headers = {{"Content-Type", "application/x-www-form-urlencoded"}};
    if (basic_auth) {
        headers.emplace_back("Authorization",
                             "Basic " + base64_encode(settings_.client_id + ":" +
                                                      settings_.client_secret));
    } else {
        form.emplace_back("client_id", settings_.client_id);
    }

    auto resp = http().post(settings_.token_url, form_encode(form), headers);
    if (resp.status_code < 200 || resp.status_code >= 300) {
        throw ApiError(resp.status_code, "Token request to " + settings_.token_url +
                       " failed (HTTP " + std::to_string(resp.status_code) + ")");
    }

    auto tok = json::parse(resp.body, nullptr, false);
    if (tok.is_discarded() || !tok.is_object() || !tok.contains("access_token") ||
        !tok["access_token"].is_string() || tok["access_token"].get<std::string>().empty()) {
        throw ApiError(resp.status_code, "Token response is missing access_token");
    }

    CredentialRecord record;
    record.access_token = tok["access_token"].get<std::string>();
    record.token_type = string_field(tok, "token_type", "Bearer");
    record.refresh_token = string_field(tok, "refresh_token", "");
    record.scopes = string_field(tok, "scope", "");
    if (tok.contains("expires_in") && tok["expires_in"].is_number_unsigned()) {
        record.expires_at = epoch_seconds() + tok["expires_in"].get<uint64_t>();
    }
    return record;
}

void OAuth2Client::refresh() {
    if (credential_.refresh_token.empty()) {
        throw std::runtime_error("No refresh token available for " + client_name());
    }

    QueryParams form = {
        {"grant_type", "refresh_token"},
        {"refresh_token", credential_.refresh_token},
    };
    CredentialRecord fresh = request_token(std::move(form), !settings_.client_secret.empty());

    credential_.access_token = fresh.access_token;
    credential_.token_type = fresh.token_type;
    credential_.expires_at = fresh.expires_at;
    if (!fresh.refresh_token.empty()) credential_.refresh_token = fresh.refresh_token;
    if (!fresh.scopes.empty()) credential_.scopes = fresh.scopes;

    if (settings_.store_tokens) authenticator().persist(credential_);
    std::cerr << "[auth] Refreshed " << client_name() << " access token\n";
}

void OAuth2Client::rerun_flow() {
    CredentialRecord record = exchange();
    if (record.user_identifier.empty()) record.user_identifier = credential_.user_identifier;
    credential_ = record;
    if (settings_.store_tokens) authenticator().persist(credential_);
}

void OAuth2Client::ensure_fresh() {
    if (authenticating_ || !credential_.expired(epoch_seconds())) return;

    if (!credential_.refresh_token.empty()) {
        refresh();
    } else {
        std::cerr << "[auth] " << client_name() << " access token expired, re-authorizing\n";
        rerun_flow();
    }
}

void OAuth2Client::prepare(ApiRequest& request) {
    ensure_fresh();
    std::string type = credential_.token_type.empty() ? "Bearer" : credential_.token_type;
    request.headers.emplace_back("Authorization", type + " " + credential_.access_token);
}

bool OAuth2Client::reauthenticate() {
    if (authenticating_) return false;

    if (!credential_.refresh_token.empty()) {
        try {
            refresh();
            return true;
        } catch (const ApiError& e) {
            std::cerr << "[auth] " << client_name() << " refresh failed: " << e.what() << "\n";
        }
    }
    rerun_flow();
    return true;
}

} // namespace minim
