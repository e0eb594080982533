#pragma once
#include "token_store.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace minim {

// Token store in a single JSON file ({"tokens": [...]}).
// The file is re-read on every operation and rewritten atomically, so
// several clients and processes share state through the file. Each
// operation holds an exclusive flock() on "<path>.lock" for its whole
// load, modify and save sequence.
class JsonTokenStore : public TokenStore {
public:
    explicit JsonTokenStore(const std::string& path, uint32_t lock_timeout_ms = 5000);

    std::optional<CredentialRecord> find(const std::string& client_name,
                                         const std::string& authorization_flow,
                                         const std::string& client_id,
                                         const std::optional<std::string>& user_identifier) override;
    void upsert(const CredentialRecord& record) override;
    size_t remove(const TokenFilter& filter) override;
    std::vector<CredentialSummary> list(const TokenFilter& filter) override;
    std::string backend_name() const override { return "json"; }

    const std::string& path() const { return path_; }

private:
    std::vector<CredentialRecord> load() const;
    void save(const std::vector<CredentialRecord>& records) const;
    static uint64_t next_stamp(const std::vector<CredentialRecord>& records);

    std::string path_;
    uint32_t lock_timeout_ms_;
    std::mutex mutex_;
};

} // namespace minim
