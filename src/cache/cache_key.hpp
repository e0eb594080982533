#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace minim {

// Positional and named arguments of one endpoint call.
// Named arguments are kept sorted, so the order they are set in is irrelevant.
struct CallArgs {
    std::vector<nlohmann::json> positional;
    std::map<std::string, nlohmann::json> named;

    CallArgs& add(nlohmann::json value) {
        positional.push_back(std::move(value));
        return *this;
    }

    CallArgs& set(const std::string& name, nlohmann::json value) {
        named[name] = std::move(value);
        return *this;
    }

    // Unset optionals are skipped so an omitted argument and an explicit
    // nullopt share a key.
    template <typename T>
    CallArgs& set(const std::string& name, const std::optional<T>& value) {
        if (value) named[name] = *value;
        return *this;
    }
};

struct CacheKey {
    std::string owner;
    std::string method;
    std::string digest;  // SHA-256 over owner, method and canonical arguments

    bool operator==(const CacheKey& other) const {
        return digest == other.digest && method == other.method && owner == other.owner;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const {
        return std::hash<std::string>{}(key.digest);
    }
};

// Canonical form of one argument value: integral floats collapse to
// integers, nested objects keep sorted keys. Throws CacheKeyError for NaN,
// infinities and discarded values.
nlohmann::json normalize_argument(const nlohmann::json& value);

// Canonical serialization of a full argument list.
std::string canonical_arguments(const CallArgs& args);

// Build the cache key for one call. Throws CacheKeyError on an empty method
// identity or a non-normalizable argument.
CacheKey make_cache_key(const std::string& owner,
                        const std::string& method,
                        const CallArgs& args);

} // namespace minim
