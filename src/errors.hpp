#pragma once
#include <stdexcept>
#include <string>

namespace minim {

// Argument value cannot be turned into a stable cache key.
class CacheKeyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Tier name is not registered in the TTL policy.
class UnknownTierError : public std::runtime_error {
public:
    explicit UnknownTierError(const std::string& tier)
        : std::runtime_error("Unknown cache tier '" + tier + "'"), tier_(tier) {}

    const std::string& tier() const { return tier_; }

private:
    std::string tier_;
};

// Token persistence could not be read or written.
class StoreUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Every candidate secret was rejected by the provider.
class NoValidCredentialError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Non-2xx response from a provider endpoint.
class ApiError : public std::runtime_error {
public:
    ApiError(long status_code, const std::string& message)
        : std::runtime_error(message), status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

} // namespace minim
