#include "cache_key.hpp"
#include "../errors.hpp"
#include "../util.hpp"

#include <cmath>
#include <limits>

namespace minim {

using json = nlohmann::json;

json normalize_argument(const json& value) {
    switch (value.type()) {
        case json::value_t::discarded:
            throw CacheKeyError("Discarded JSON value cannot be used as a cache key argument");

        case json::value_t::number_float: {
            double d = value.get<double>();
            if (!std::isfinite(d)) {
                throw CacheKeyError("Non-finite number cannot be used as a cache key argument");
            }
            // 2 and 2.0 must hash the same
            if (std::floor(d) == d &&
                d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
                d < static_cast<double>(std::numeric_limits<int64_t>::max())) {
                return json(static_cast<int64_t>(d));
            }
            return value;
        }

        case json::value_t::number_unsigned: {
            auto u = value.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                return json(static_cast<int64_t>(u));
            return value;
        }

        case json::value_t::array: {
            json out = json::array();
            for (const auto& item : value) out.push_back(normalize_argument(item));
            return out;
        }

        case json::value_t::object: {
            json out = json::object();
            for (const auto& [key, item] : value.items()) out[key] = normalize_argument(item);
            return out;
        }

        default:
            return value;
    }
}

std::string canonical_arguments(const CallArgs& args) {
    json positional = json::array();
    for (const auto& arg : args.positional) {
        positional.push_back(normalize_argument(arg));
    }

    json named = json::object();
    for (const auto& [name, arg] : args.named) {
        named[name] = normalize_argument(arg);
    }

    return json::array({positional, named}).dump();
}

CacheKey make_cache_key(const std::string& owner,
                        const std::string& method,
                        const CallArgs& args) {
    if (method.empty()) {
        throw CacheKeyError("Cached method must have a non-empty identity");
    }

    CacheKey key;
    key.owner = owner;
    key.method = method;

    // Unit separator between fields so ("ab", "c") and ("a", "bc") differ.
    std::string material = owner;
    material += '\x1f';
    material += method;
    material += '\x1f';
    material += canonical_arguments(args);
    key.digest = sha256_hex(material);
    return key;
}

} // namespace minim
