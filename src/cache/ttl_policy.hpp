#pragma once
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace minim {

// Tier names used by cached endpoint methods
constexpr const char* kTierStatic = "static";
constexpr const char* kTierDaily = "daily";
constexpr const char* kTierCatalog = "catalog";
constexpr const char* kTierFeatured = "featured";
constexpr const char* kTierPopularity = "popularity";
constexpr const char* kTierTop = "top";
constexpr const char* kTierSearch = "search";
constexpr const char* kTierUser = "user";

// TTL value meaning "never expires while the process lives"
constexpr uint64_t kNoExpiry = std::numeric_limits<uint64_t>::max();

// Maps the closed set of tier names to TTLs in seconds.
// Built once at startup; read-only afterwards.
class TtlPolicy {
public:
    // Default durations for every known tier
    TtlPolicy();

    // Explicit table (tests). Every duration must be positive.
    explicit TtlPolicy(std::map<std::string, uint64_t> durations);

    // Defaults with overrides applied. Overrides must name known tiers
    // and carry positive durations; otherwise UnknownTierError or
    // std::invalid_argument is thrown.
    static TtlPolicy with_overrides(const std::unordered_map<std::string, uint64_t>& overrides);

    // TTL seconds for a tier. Throws UnknownTierError.
    uint64_t resolve(const std::string& tier) const;

    bool has(const std::string& tier) const;

    // Tier names in sorted order
    std::vector<std::string> names() const;

    static const std::map<std::string, uint64_t>& defaults();

private:
    std::map<std::string, uint64_t> durations_;
};

// Human-readable TTL ("10m", "1d", "never")
std::string describe_ttl(uint64_t seconds);

} // namespace minim
