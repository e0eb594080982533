#include "json_token_store.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace minim {

static bool same_identity(const CredentialRecord& a, const CredentialRecord& b) {
    return a.client_name == b.client_name &&
           a.authorization_flow == b.authorization_flow &&
           a.client_id == b.client_id &&
           a.user_identifier == b.user_identifier;
}

// Exclusive advisory lock on a sibling file, released on destruction.
// Waits at most timeout_ms, then raises StoreUnavailable.
namespace {
class FileLock {
public:
    FileLock(const std::string& path, uint32_t timeout_ms) {
        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);

        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            throw StoreUnavailable("Cannot open lock file " + path);
        }

        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms);
        while (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            if (errno != EWOULDBLOCK && errno != EINTR) {
                ::close(fd_);
                throw StoreUnavailable("Cannot lock " + path);
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                ::close(fd_);
                throw StoreUnavailable("Timed out waiting for lock on " + path);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};
} // namespace

JsonTokenStore::JsonTokenStore(const std::string& path, uint32_t lock_timeout_ms)
    : path_(path), lock_timeout_ms_(lock_timeout_ms) {
    // Fail early on an unreadable file
    load();
}

std::vector<CredentialRecord> JsonTokenStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return {};

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw StoreUnavailable("Cannot open token store " + path_);
    }

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("tokens") || !j["tokens"].is_array()) {
        throw StoreUnavailable("Token store " + path_ + " is corrupt");
    }

    std::vector<CredentialRecord> records;
    records.reserve(j["tokens"].size());
    for (const auto& item : j["tokens"]) {
        if (!item.is_object()) {
            throw StoreUnavailable("Token store " + path_ + " is corrupt");
        }
        try {
            records.push_back(record_from_json(item));
        } catch (const nlohmann::json::exception& e) {
            throw StoreUnavailable("Token store " + path_ + " is corrupt: " + e.what());
        }
    }
    return records;
}

void JsonTokenStore::save(const std::vector<CredentialRecord>& records) const {
    nlohmann::json tokens = nlohmann::json::array();
    for (const auto& r : records) tokens.push_back(record_to_json(r));
    nlohmann::json j = {{"tokens", tokens}};
    if (!atomic_write_file(path_, j.dump(2))) {
        throw StoreUnavailable("Cannot write token store " + path_);
    }
}

uint64_t JsonTokenStore::next_stamp(const std::vector<CredentialRecord>& records) {
    uint64_t latest = 0;
    for (const auto& r : records) latest = std::max(latest, r.last_accessed);
    return std::max(epoch_micros(), latest + 1);
}

std::optional<CredentialRecord> JsonTokenStore::find(
        const std::string& client_name,
        const std::string& authorization_flow,
        const std::string& client_id,
        const std::optional<std::string>& user_identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLock file_lock(path_ + ".lock", lock_timeout_ms_);
    auto records = load();

    CredentialRecord* best = nullptr;
    for (auto& r : records) {
        if (r.client_name != client_name || r.authorization_flow != authorization_flow ||
            r.client_id != client_id) {
            continue;
        }
        if (user_identifier) {
            if (r.user_identifier == *user_identifier) {
                best = &r;
                break;
            }
        } else if (!best || r.last_accessed > best->last_accessed) {
            best = &r;
        }
    }
    if (!best) return std::nullopt;

    best->last_accessed = next_stamp(records);
    CredentialRecord found = *best;
    save(records);
    return found;
}

void JsonTokenStore::upsert(const CredentialRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLock file_lock(path_ + ".lock", lock_timeout_ms_);
    auto records = load();

    CredentialRecord stored = record;
    stored.last_accessed = next_stamp(records);
    if (!stored.extras.is_object()) stored.extras = nlohmann::json::object();

    auto it = std::find_if(records.begin(), records.end(),
                           [&](const CredentialRecord& r) { return same_identity(r, stored); });
    if (it != records.end()) {
        *it = std::move(stored);
    } else {
        records.push_back(std::move(stored));
    }
    save(records);
}

size_t JsonTokenStore::remove(const TokenFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLock file_lock(path_ + ".lock", lock_timeout_ms_);
    auto records = load();

    auto before = records.size();
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&](const CredentialRecord& r) { return filter.matches(r); }),
                  records.end());
    size_t removed = before - records.size();

    if (removed > 0) {
        save(records);
        std::cerr << "[tokens] Removed " << removed << " record(s) from " << path_ << "\n";
    }
    return removed;
}

std::vector<CredentialSummary> JsonTokenStore::list(const TokenFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLock file_lock(path_ + ".lock", lock_timeout_ms_);
    auto records = load();

    std::vector<CredentialSummary> out;
    for (const auto& r : records) {
        if (filter.matches(r)) out.push_back(summarize(r));
    }
    std::sort(out.begin(), out.end(), [](const CredentialSummary& a, const CredentialSummary& b) {
        return a.last_accessed > b.last_accessed;
    });
    return out;
}

} // namespace minim
