#pragma once
#include "cache_key.hpp"
#include "ttl_policy.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace minim {

struct CacheEntry {
    nlohmann::json value;
    uint64_t expires_at;   // epoch seconds, kNoExpiry for the static tier
    uint64_t last_access;  // LRU tick, not a timestamp
};

// Process-wide memo table for idempotent read calls.
//
// Entries are valid while now < expires_at and are dropped lazily when an
// expired entry is read. When more than max_entries are held, expired entries
// go first, then the least recently used. The compute function of fetch()
// runs outside the lock: two concurrent misses on one key may both call it,
// the last writer wins. Errors thrown by compute are never stored.
class ResponseCache {
public:
    using Clock = std::function<uint64_t()>;

    // max_entries = 0 disables the capacity bound
    explicit ResponseCache(TtlPolicy policy = TtlPolicy(),
                           uint32_t max_entries = 1024,
                           Clock clock = epoch_seconds);

    // Non-copyable
    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // Look up a valid entry. Returns nullopt on miss or expiry.
    std::optional<nlohmann::json> get(const CacheKey& key);

    // Store value with the tier's TTL, replacing any existing entry.
    void put(const CacheKey& key, nlohmann::json value, const std::string& tier);

    // Return the cached value for (owner, method, args) or run compute and
    // cache its result.
    nlohmann::json fetch(const std::string& owner,
                         const std::string& method,
                         const std::string& tier,
                         const CallArgs& args,
                         const std::function<nlohmann::json()>& compute);

    // Memoizing wrapper around fn. Arguments become positional key parts.
    // The tier and method identity are checked here, before any call.
    // The returned function refers to this cache and must not outlive it.
    template <typename... Args>
    std::function<nlohmann::json(Args...)> wrap(std::string owner,
                                                std::string method,
                                                std::string tier,
                                                std::function<nlohmann::json(Args...)> fn);

    // All invalidations are no-ops on absent entries.
    bool invalidate(const CacheKey& key);
    bool invalidate(const std::string& owner, const std::string& method, const CallArgs& args);
    uint32_t invalidate_method(const std::string& method,
                               const std::optional<std::string>& owner = std::nullopt);
    uint32_t invalidate_owner(const std::string& owner);
    void invalidate_all();

    uint32_t size() const;
    uint32_t max_entries() const { return max_entries_; }
    const TtlPolicy& policy() const { return policy_; }

private:
    void store(const CacheKey& key, nlohmann::json value, uint64_t ttl);
    void evict(uint64_t now);

    const TtlPolicy policy_;
    const uint32_t max_entries_;
    Clock clock_;
    uint64_t tick_ = 0;
    std::unordered_map<CacheKey, CacheEntry, CacheKeyHash> entries_;
    mutable std::mutex mutex_;
};

template <typename... Args>
std::function<nlohmann::json(Args...)> ResponseCache::wrap(std::string owner,
                                                           std::string method,
                                                           std::string tier,
                                                           std::function<nlohmann::json(Args...)> fn) {
    static_assert((std::is_constructible_v<nlohmann::json, const std::decay_t<Args>&> && ...),
                  "cached method arguments must be convertible to nlohmann::json");

    if (method.empty()) {
        throw CacheKeyError("Cached method must have a non-empty identity");
    }
    policy_.resolve(tier);

    return [this, owner = std::move(owner), method = std::move(method),
            tier = std::move(tier), fn = std::move(fn)](Args... args) -> nlohmann::json {
        CallArgs call;
        (call.add(nlohmann::json(args)), ...);
        return fetch(owner, method, tier, call, [&]() { return fn(args...); });
    };
}

} // namespace minim
