#pragma once
#include "credential.hpp"
#include "token_store.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace minim {

// What a client asks the pipeline for at construction time.
struct AuthRequest {
    std::string client_name;
    std::string authorization_flow;
    std::string client_id;         // may be empty when not yet known
    std::string user_identifier;   // raw; a leading '~' forces re-authentication
    bool store_tokens = true;
};

// Runs the flow-specific exchange and returns a fresh record.
using Exchange = std::function<CredentialRecord()>;

// Resolves credentials against a token store and persists new ones.
// A null store behaves like store_tokens = false.
class Authenticator {
public:
    explicit Authenticator(std::shared_ptr<TokenStore> store);

    // Stored record for the request unless bypassed or storage is disabled;
    // otherwise run exchange and persist its result under the stripped
    // identifier. Exchange failures propagate, nothing is stored.
    CredentialRecord resolve(const AuthRequest& request, const Exchange& exchange);

    // Most recently used stored record of (client_name, flow) across client
    // ids. Used to recover a client id/secret when no other source has one.
    std::optional<CredentialRecord> latest(const std::string& client_name,
                                           const std::string& authorization_flow,
                                           const std::string& user_identifier = "");

    // Store a refreshed record. No-op without a store.
    void persist(const CredentialRecord& record);

    const std::shared_ptr<TokenStore>& store() const { return store_; }

private:
    std::shared_ptr<TokenStore> store_;
};

// Try each candidate in order and return the first one accepted.
// Throws NoValidCredentialError when every candidate is rejected or the
// list is empty. Exceptions thrown by accepts() count as a rejection.
std::string probe_secrets(const std::string& client_name,
                          const std::vector<std::string>& candidates,
                          const std::function<bool(const std::string&)>& accepts);

// First non-empty of: explicit value, environment variable, config file
// value, stored value. Empty when none is set.
std::string resolve_setting(const std::string& explicit_value,
                            const std::string& env_name,
                            const std::string& config_value,
                            const std::string& stored_value = "");

} // namespace minim
