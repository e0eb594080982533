#include "authenticator.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include <iostream>

namespace minim {

static std::string describe(const std::string& client_name, const std::string& user) {
    return user.empty() ? client_name : client_name + " (" + user + ")";
}

Authenticator::Authenticator(std::shared_ptr<TokenStore> store)
    : store_(std::move(store)) {}

CredentialRecord Authenticator::resolve(const AuthRequest& request, const Exchange& exchange) {
    UserIdentifier id = UserIdentifier::parse(request.user_identifier);
    bool use_store = store_ && request.store_tokens;

    if (use_store && !id.bypass && !request.client_id.empty()) {
        std::optional<std::string> user;
        if (!id.value.empty()) user = id.value;

        auto stored = store_->find(request.client_name, request.authorization_flow,
                                   request.client_id, user);
        if (stored) {
            std::cerr << "[auth] Using stored " << request.authorization_flow
                      << " credential for " << describe(request.client_name, stored->user_identifier)
                      << "\n";
            return *stored;
        }
    }

    if (id.bypass) {
        std::cerr << "[auth] Ignoring stored credentials for "
                  << describe(request.client_name, id.value) << "\n";
    }

    CredentialRecord record = exchange();
    record.client_name = request.client_name;
    record.authorization_flow = request.authorization_flow;
    if (record.client_id.empty()) record.client_id = request.client_id;
    if (!id.value.empty()) record.user_identifier = id.value;

    if (use_store) {
        store_->upsert(record);
        std::cerr << "[auth] Stored " << record.authorization_flow << " credential for "
                  << describe(record.client_name, record.user_identifier) << "\n";
    }
    return record;
}

std::optional<CredentialRecord> Authenticator::latest(const std::string& client_name,
                                                      const std::string& authorization_flow,
                                                      const std::string& user_identifier) {
    if (!store_) return std::nullopt;

    TokenFilter filter;
    filter.client_names = {client_name};
    filter.authorization_flows = {authorization_flow};
    if (!user_identifier.empty()) filter.user_identifiers = {user_identifier};

    auto summaries = store_->list(filter);
    if (summaries.empty()) return std::nullopt;

    const auto& top = summaries.front();
    return store_->find(top.client_name, top.authorization_flow, top.client_id,
                        top.user_identifier);
}

void Authenticator::persist(const CredentialRecord& record) {
    if (store_) store_->upsert(record);
}

std::string probe_secrets(const std::string& client_name,
                          const std::vector<std::string>& candidates,
                          const std::function<bool(const std::string&)>& accepts) {
    for (size_t i = 0; i < candidates.size(); ++i) {
        bool ok = false;
        try {
            ok = accepts(candidates[i]);
        } catch (const std::exception& e) {
            std::cerr << "[auth] " << client_name << " secret candidate " << (i + 1)
                      << " failed: " << e.what() << "\n";
        }
        if (ok) {
            std::cerr << "[auth] " << client_name << " secret candidate " << (i + 1)
                      << " of " << candidates.size() << " accepted\n";
            return candidates[i];
        }
    }
    throw NoValidCredentialError("No valid " + client_name + " secret among " +
                                 std::to_string(candidates.size()) + " candidate(s)");
}

std::string resolve_setting(const std::string& explicit_value,
                            const std::string& env_name,
                            const std::string& config_value,
                            const std::string& stored_value) {
    if (!explicit_value.empty()) return explicit_value;
    if (!env_name.empty()) {
        if (auto v = env_value(env_name)) return *v;
    }
    if (!config_value.empty()) return config_value;
    return stored_value;
}

} // namespace minim
