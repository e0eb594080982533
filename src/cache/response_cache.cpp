#include "response_cache.hpp"
#include <algorithm>
#include <vector>

namespace minim {

ResponseCache::ResponseCache(TtlPolicy policy, uint32_t max_entries, Clock clock)
    : policy_(std::move(policy)), max_entries_(max_entries), clock_(std::move(clock)) {}

std::optional<nlohmann::json> ResponseCache::get(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    if (clock_() >= it->second.expires_at) {
        entries_.erase(it);
        return std::nullopt;
    }

    it->second.last_access = ++tick_;
    return it->second.value;
}

void ResponseCache::put(const CacheKey& key, nlohmann::json value, const std::string& tier) {
    store(key, std::move(value), policy_.resolve(tier));
}

nlohmann::json ResponseCache::fetch(const std::string& owner,
                                    const std::string& method,
                                    const std::string& tier,
                                    const CallArgs& args,
                                    const std::function<nlohmann::json()>& compute) {
    uint64_t ttl = policy_.resolve(tier);
    CacheKey key = make_cache_key(owner, method, args);

    if (auto hit = get(key)) return std::move(*hit);

    nlohmann::json value = compute();
    store(key, value, ttl);
    return value;
}

void ResponseCache::store(const CacheKey& key, nlohmann::json value, uint64_t ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = clock_();
    uint64_t expires_at = (ttl == kNoExpiry || now > kNoExpiry - ttl) ? kNoExpiry : now + ttl;

    entries_[key] = CacheEntry{std::move(value), expires_at, ++tick_};

    evict(now);
}

void ResponseCache::evict(uint64_t now) {
    // Must be called with mutex_ already held.
    if (max_entries_ == 0 || entries_.size() <= max_entries_) return;

    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (now >= it->second.expires_at) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    if (entries_.size() > max_entries_) {
        std::vector<std::pair<uint64_t, CacheKey>> by_access; // {last_access, key}
        by_access.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            by_access.emplace_back(entry.last_access, key);
        }

        std::sort(by_access.begin(), by_access.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });

        size_t to_remove = entries_.size() - max_entries_;
        for (size_t i = 0; i < to_remove; ++i) {
            entries_.erase(by_access[i].second);
        }
    }
}

bool ResponseCache::invalidate(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

bool ResponseCache::invalidate(const std::string& owner,
                               const std::string& method,
                               const CallArgs& args) {
    return invalidate(make_cache_key(owner, method, args));
}

uint32_t ResponseCache::invalidate_method(const std::string& method,
                                          const std::optional<std::string>& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->first.method == method && (!owner || it->first.owner == *owner)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

uint32_t ResponseCache::invalidate_owner(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->first.owner == owner) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void ResponseCache::invalidate_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

uint32_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(entries_.size());
}

} // namespace minim
