#include "credential.hpp"
#include <algorithm>

namespace minim {

static bool accepts(const std::vector<std::string>& allowed, const std::string& value) {
    return allowed.empty() ||
           std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

bool TokenFilter::empty() const {
    return client_names.empty() && authorization_flows.empty() &&
           client_ids.empty() && user_identifiers.empty();
}

bool TokenFilter::matches(const CredentialRecord& record) const {
    return accepts(client_names, record.client_name) &&
           accepts(authorization_flows, record.authorization_flow) &&
           accepts(client_ids, record.client_id) &&
           accepts(user_identifiers, record.user_identifier);
}

CredentialSummary summarize(const CredentialRecord& record) {
    CredentialSummary s;
    s.client_name = record.client_name;
    s.authorization_flow = record.authorization_flow;
    s.client_id = record.client_id;
    s.user_identifier = record.user_identifier;
    s.scopes = record.scopes;
    s.expires_at = record.expires_at;
    s.last_accessed = record.last_accessed;
    return s;
}

UserIdentifier UserIdentifier::parse(const std::string& raw) {
    UserIdentifier id;
    if (!raw.empty() && raw[0] == kBypassMarker) {
        id.value = raw.substr(1);
        id.bypass = true;
    } else {
        id.value = raw;
    }
    return id;
}

nlohmann::json record_to_json(const CredentialRecord& record) {
    return {
        {"client_name", record.client_name},
        {"authorization_flow", record.authorization_flow},
        {"client_id", record.client_id},
        {"user_identifier", record.user_identifier},
        {"client_secret", record.client_secret},
        {"redirect_uri", record.redirect_uri},
        {"scopes", record.scopes},
        {"token_type", record.token_type},
        {"access_token", record.access_token},
        {"refresh_token", record.refresh_token},
        {"expires_at", record.expires_at},
        {"extras", record.extras},
        {"last_accessed", record.last_accessed},
    };
}

CredentialRecord record_from_json(const nlohmann::json& j) {
    CredentialRecord r;
    r.client_name = j.value("client_name", "");
    r.authorization_flow = j.value("authorization_flow", "");
    r.client_id = j.value("client_id", "");
    r.user_identifier = j.value("user_identifier", "");
    r.client_secret = j.value("client_secret", "");
    r.redirect_uri = j.value("redirect_uri", "");
    r.scopes = j.value("scopes", "");
    r.token_type = j.value("token_type", "");
    r.access_token = j.value("access_token", "");
    r.refresh_token = j.value("refresh_token", "");
    r.expires_at = j.value("expires_at", uint64_t{0});
    if (j.contains("extras") && j["extras"].is_object()) {
        r.extras = j["extras"];
    }
    r.last_accessed = j.value("last_accessed", uint64_t{0});
    return r;
}

} // namespace minim
