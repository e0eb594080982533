#pragma once
#include "token_store.hpp"
#include <cstdint>
#include <mutex>
#include <string>

struct sqlite3;

namespace minim {

// Token store in a SQLite database (table "tokens").
// Every read-modify-write runs in a BEGIN IMMEDIATE transaction so
// concurrent processes sharing the file serialize on the write lock.
class SqliteTokenStore : public TokenStore {
public:
    explicit SqliteTokenStore(const std::string& path, uint32_t busy_timeout_ms = 5000);
    ~SqliteTokenStore() override;

    SqliteTokenStore(const SqliteTokenStore&) = delete;
    SqliteTokenStore& operator=(const SqliteTokenStore&) = delete;

    std::optional<CredentialRecord> find(const std::string& client_name,
                                         const std::string& authorization_flow,
                                         const std::string& client_id,
                                         const std::optional<std::string>& user_identifier) override;
    void upsert(const CredentialRecord& record) override;
    size_t remove(const TokenFilter& filter) override;
    std::vector<CredentialSummary> list(const TokenFilter& filter) override;
    std::string backend_name() const override { return "sqlite"; }

    const std::string& path() const { return path_; }

private:
    void init_schema();
    void exec(const char* sql);
    // Next last_accessed stamp: now in microseconds, strictly above every stored stamp
    uint64_t next_stamp();

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace minim
