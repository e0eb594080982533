#pragma once
#include "credential.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace minim {

struct Config;

// Persistence-backed repository of credential records.
// All operations throw StoreUnavailable when the backing storage cannot be
// read or written; a missing record is reported as nullopt.
class TokenStore {
public:
    virtual ~TokenStore() = default;

    // Exact match when user_identifier is given, otherwise the most recently
    // used record of (client_name, flow, client_id). Touches last_accessed.
    virtual std::optional<CredentialRecord> find(const std::string& client_name,
                                                 const std::string& authorization_flow,
                                                 const std::string& client_id,
                                                 const std::optional<std::string>& user_identifier) = 0;

    // Insert or overwrite by full identity; last_accessed = now.
    virtual void upsert(const CredentialRecord& record) = 0;

    // Delete every matching record. Returns the number deleted.
    virtual size_t remove(const TokenFilter& filter) = 0;

    // Matching records without secrets, most recently used first.
    virtual std::vector<CredentialSummary> list(const TokenFilter& filter) = 0;

    virtual std::string backend_name() const = 0;
};

// Backend selected by config.tokens.backend ("sqlite" or "json").
// Throws std::invalid_argument for an unknown backend name.
std::shared_ptr<TokenStore> create_token_store(const Config& config);

} // namespace minim
