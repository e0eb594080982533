#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace minim {

// Authorization flow names
constexpr const char* kFlowClientCredentials = "client_credentials";
constexpr const char* kFlowAuthCode = "auth_code";
constexpr const char* kFlowPkce = "pkce";
constexpr const char* kFlowPassword = "password";

// Leading character of a user identifier that forces re-authentication
constexpr char kBypassMarker = '~';

// Persisted identity + secret bundle for one account.
struct CredentialRecord {
    // Identity
    std::string client_name;
    std::string authorization_flow;
    std::string client_id;
    std::string user_identifier;  // empty = not bound to a user

    // Payload
    std::string client_secret;
    std::string redirect_uri;
    std::string scopes;
    std::string token_type;
    std::string access_token;
    std::string refresh_token;
    uint64_t expires_at = 0;      // epoch seconds, 0 = no known expiry
    nlohmann::json extras = nlohmann::json::object();
    uint64_t last_accessed = 0;   // epoch microseconds, set by the store

    bool expired(uint64_t now) const { return expires_at != 0 && now >= expires_at; }
};

// Selects records by identity. Each non-empty field is a set of accepted
// values; fields are combined by intersection. An empty filter matches all.
struct TokenFilter {
    std::vector<std::string> client_names;
    std::vector<std::string> authorization_flows;
    std::vector<std::string> client_ids;
    std::vector<std::string> user_identifiers;

    bool empty() const;
    bool matches(const CredentialRecord& record) const;
};

// Record view without secret material
struct CredentialSummary {
    std::string client_name;
    std::string authorization_flow;
    std::string client_id;
    std::string user_identifier;
    std::string scopes;
    uint64_t expires_at = 0;
    uint64_t last_accessed = 0;
};

CredentialSummary summarize(const CredentialRecord& record);

// A user identifier as passed by a caller, split into the bare value
// and the bypass flag ("~alice" -> {"alice", true}).
struct UserIdentifier {
    std::string value;
    bool bypass = false;

    static UserIdentifier parse(const std::string& raw);
};

nlohmann::json record_to_json(const CredentialRecord& record);
CredentialRecord record_from_json(const nlohmann::json& j);

} // namespace minim
