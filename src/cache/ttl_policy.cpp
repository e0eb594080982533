#include "ttl_policy.hpp"
#include "../errors.hpp"

#include <stdexcept>

namespace minim {

const std::map<std::string, uint64_t>& TtlPolicy::defaults() {
    static const std::map<std::string, uint64_t> table = {
        {kTierStatic,     kNoExpiry},
        {kTierDaily,      86400},
        {kTierCatalog,    86400},
        {kTierFeatured,   43200},
        {kTierPopularity, 3600},
        {kTierTop,        3600},
        {kTierSearch,     600},
        {kTierUser,       60},
    };
    return table;
}

TtlPolicy::TtlPolicy() : durations_(defaults()) {}

TtlPolicy::TtlPolicy(std::map<std::string, uint64_t> durations)
    : durations_(std::move(durations)) {
    for (const auto& [name, seconds] : durations_) {
        if (seconds == 0) {
            throw std::invalid_argument("Cache tier '" + name + "' must have a positive TTL");
        }
    }
}

TtlPolicy TtlPolicy::with_overrides(const std::unordered_map<std::string, uint64_t>& overrides) {
    std::map<std::string, uint64_t> table = defaults();
    for (const auto& [name, seconds] : overrides) {
        auto it = table.find(name);
        if (it == table.end()) throw UnknownTierError(name);
        it->second = seconds;
    }
    return TtlPolicy(std::move(table));
}

uint64_t TtlPolicy::resolve(const std::string& tier) const {
    auto it = durations_.find(tier);
    if (it == durations_.end()) throw UnknownTierError(tier);
    return it->second;
}

bool TtlPolicy::has(const std::string& tier) const {
    return durations_.count(tier) > 0;
}

std::vector<std::string> TtlPolicy::names() const {
    std::vector<std::string> out;
    out.reserve(durations_.size());
    for (const auto& [name, seconds] : durations_) out.push_back(name);
    return out;
}

std::string describe_ttl(uint64_t seconds) {
    if (seconds == kNoExpiry) return "never";
    if (seconds % 86400 == 0) return std::to_string(seconds / 86400) + "d";
    if (seconds % 3600 == 0) return std::to_string(seconds / 3600) + "h";
    if (seconds % 60 == 0) return std::to_string(seconds / 60) + "m";
    return std::to_string(seconds) + "s";
}

} // namespace minim
