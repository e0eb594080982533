#include "sqlite_token_store.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace minim {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// BEGIN IMMEDIATE ... COMMIT, rolled back unless commit() was reached
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw StoreUnavailable("Token store is busy or unreadable: " + msg);
        }
    }

    ~Transaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }

    void commit() {
        char* err = nullptr;
        if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw StoreUnavailable("Token store commit failed: " + msg);
        }
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

static void check(sqlite3* db, int rc, const char* what) {
    if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw StoreUnavailable(std::string("Token store ") + what + " failed: " + sqlite3_errmsg(db));
    }
}

static void prepare(sqlite3* db, const std::string& sql, StmtGuard& g) {
    check(db, sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr), "prepare");
}

static void bind_text(sqlite3_stmt* stmt, int col, const std::string& value) {
    sqlite3_bind_text(stmt, col, value.c_str(), -1, SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

static const char* kSelectColumns =
    "SELECT client_name, authorization_flow, client_id, user_identifier,"
    " client_secret, redirect_uri, scopes, token_type, access_token,"
    " refresh_token, expires_at, extras, last_accessed FROM tokens";

static CredentialRecord record_from_stmt(sqlite3_stmt* stmt) {
    CredentialRecord r;
    r.client_name        = column_text(stmt, 0);
    r.authorization_flow = column_text(stmt, 1);
    r.client_id          = column_text(stmt, 2);
    r.user_identifier    = column_text(stmt, 3);
    r.client_secret      = column_text(stmt, 4);
    r.redirect_uri       = column_text(stmt, 5);
    r.scopes             = column_text(stmt, 6);
    r.token_type         = column_text(stmt, 7);
    r.access_token       = column_text(stmt, 8);
    r.refresh_token      = column_text(stmt, 9);
    r.expires_at         = static_cast<uint64_t>(sqlite3_column_int64(stmt, 10));
    auto extras = nlohmann::json::parse(column_text(stmt, 11), nullptr, false);
    if (extras.is_object()) r.extras = std::move(extras);
    r.last_accessed      = static_cast<uint64_t>(sqlite3_column_int64(stmt, 12));
    return r;
}

// WHERE clause for a filter, with the values to bind in order
static std::string where_clause(const TokenFilter& filter, std::vector<std::string>& params) {
    std::vector<std::string> conditions;
    auto add = [&](const char* column, const std::vector<std::string>& values) {
        if (values.empty()) return;
        std::string cond = std::string(column) + " IN (";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) cond += ',';
            cond += '?';
            params.push_back(values[i]);
        }
        cond += ')';
        conditions.push_back(std::move(cond));
    };
    add("client_name", filter.client_names);
    add("authorization_flow", filter.authorization_flows);
    add("client_id", filter.client_ids);
    add("user_identifier", filter.user_identifiers);

    if (conditions.empty()) return "";
    return " WHERE " + join(conditions, " AND ");
}

SqliteTokenStore::SqliteTokenStore(const std::string& path, uint32_t busy_timeout_ms)
    : path_(path) {
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreUnavailable("Failed to open token store " + path_ + ": " + err);
    }

    sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_ms));
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    try {
        init_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteTokenStore::~SqliteTokenStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteTokenStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreUnavailable("Token store statement failed: " + msg);
    }
}

void SqliteTokenStore::init_schema() {
    exec("CREATE TABLE IF NOT EXISTS tokens ("
         "  client_name        TEXT NOT NULL,"
         "  authorization_flow TEXT NOT NULL,"
         "  client_id          TEXT NOT NULL,"
         "  user_identifier    TEXT NOT NULL DEFAULT '',"
         "  client_secret      TEXT NOT NULL DEFAULT '',"
         "  redirect_uri       TEXT NOT NULL DEFAULT '',"
         "  scopes             TEXT NOT NULL DEFAULT '',"
         "  token_type         TEXT NOT NULL DEFAULT '',"
         "  access_token       TEXT NOT NULL DEFAULT '',"
         "  refresh_token      TEXT NOT NULL DEFAULT '',"
         "  expires_at         INTEGER NOT NULL DEFAULT 0,"
         "  extras             TEXT NOT NULL DEFAULT '{}',"
         "  last_accessed      INTEGER NOT NULL DEFAULT 0,"
         "  PRIMARY KEY (client_name, authorization_flow, client_id, user_identifier)"
         ");");
    exec("CREATE INDEX IF NOT EXISTS tokens_recency"
         " ON tokens(client_name, authorization_flow, client_id, last_accessed);");
}

uint64_t SqliteTokenStore::next_stamp() {
    StmtGuard g;
    prepare(db_, "SELECT COALESCE(MAX(last_accessed), 0) FROM tokens;", g);
    check(db_, sqlite3_step(g.stmt), "read");
    auto latest = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 0));
    return std::max(epoch_micros(), latest + 1);
}

std::optional<CredentialRecord> SqliteTokenStore::find(
        const std::string& client_name,
        const std::string& authorization_flow,
        const std::string& client_id,
        const std::optional<std::string>& user_identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    std::optional<CredentialRecord> found;
    {
        StmtGuard g;
        std::string sql = std::string(kSelectColumns) +
            " WHERE client_name = ? AND authorization_flow = ? AND client_id = ?";
        if (user_identifier) {
            sql += " AND user_identifier = ?;";
        } else {
            sql += " ORDER BY last_accessed DESC LIMIT 1;";
        }
        prepare(db_, sql, g);
        bind_text(g.stmt, 1, client_name);
        bind_text(g.stmt, 2, authorization_flow);
        bind_text(g.stmt, 3, client_id);
        if (user_identifier) bind_text(g.stmt, 4, *user_identifier);

        int rc = sqlite3_step(g.stmt);
        check(db_, rc, "read");
        if (rc == SQLITE_ROW) found = record_from_stmt(g.stmt);
    }
    if (!found) {
        tx.commit();
        return std::nullopt;
    }

    found->last_accessed = next_stamp();
    {
        StmtGuard g;
        prepare(db_,
                "UPDATE tokens SET last_accessed = ? WHERE client_name = ?"
                " AND authorization_flow = ? AND client_id = ? AND user_identifier = ?;", g);
        sqlite3_bind_int64(g.stmt, 1, static_cast<int64_t>(found->last_accessed));
        bind_text(g.stmt, 2, found->client_name);
        bind_text(g.stmt, 3, found->authorization_flow);
        bind_text(g.stmt, 4, found->client_id);
        bind_text(g.stmt, 5, found->user_identifier);
        check(db_, sqlite3_step(g.stmt), "touch");
    }
    tx.commit();
    return found;
}

void SqliteTokenStore::upsert(const CredentialRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    uint64_t stamp = next_stamp();
    StmtGuard g;
    prepare(db_,
            "INSERT OR REPLACE INTO tokens (client_name, authorization_flow, client_id,"
            " user_identifier, client_secret, redirect_uri, scopes, token_type,"
            " access_token, refresh_token, expires_at, extras, last_accessed)"
            " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);", g);
    bind_text(g.stmt, 1, record.client_name);
    bind_text(g.stmt, 2, record.authorization_flow);
    bind_text(g.stmt, 3, record.client_id);
    bind_text(g.stmt, 4, record.user_identifier);
    bind_text(g.stmt, 5, record.client_secret);
    bind_text(g.stmt, 6, record.redirect_uri);
    bind_text(g.stmt, 7, record.scopes);
    bind_text(g.stmt, 8, record.token_type);
    bind_text(g.stmt, 9, record.access_token);
    bind_text(g.stmt, 10, record.refresh_token);
    sqlite3_bind_int64(g.stmt, 11, static_cast<int64_t>(record.expires_at));
    bind_text(g.stmt, 12, record.extras.is_object() ? record.extras.dump() : "{}");
    sqlite3_bind_int64(g.stmt, 13, static_cast<int64_t>(stamp));
    check(db_, sqlite3_step(g.stmt), "write");

    tx.commit();
}

size_t SqliteTokenStore::remove(const TokenFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    std::vector<std::string> params;
    std::string sql = "DELETE FROM tokens" + where_clause(filter, params) + ";";

    StmtGuard g;
    prepare(db_, sql, g);
    for (size_t i = 0; i < params.size(); ++i) {
        bind_text(g.stmt, static_cast<int>(i + 1), params[i]);
    }
    check(db_, sqlite3_step(g.stmt), "delete");
    auto removed = static_cast<size_t>(sqlite3_changes(db_));

    tx.commit();
    if (removed > 0) {
        std::cerr << "[tokens] Removed " << removed << " record(s) from " << path_ << "\n";
    }
    return removed;
}

std::vector<CredentialSummary> SqliteTokenStore::list(const TokenFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> params;
    std::string sql = std::string(kSelectColumns) + where_clause(filter, params) +
                      " ORDER BY last_accessed DESC;";

    StmtGuard g;
    prepare(db_, sql, g);
    for (size_t i = 0; i < params.size(); ++i) {
        bind_text(g.stmt, static_cast<int>(i + 1), params[i]);
    }

    std::vector<CredentialSummary> out;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        out.push_back(summarize(record_from_stmt(g.stmt)));
        rc = sqlite3_step(g.stmt);
    }
    check(db_, rc, "read");
    return out;
}

} // namespace minim
