#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace minim {

struct CacheConfig {
    bool enabled = true;
    uint32_t max_entries = 1024;
    // Tier name -> TTL seconds. Validated against the tier set at startup.
    std::unordered_map<std::string, uint64_t> tiers;
};

struct TokenStoreConfig {
    bool enabled = true;
    std::string backend = "sqlite";  // "sqlite" or "json"
    std::string path;                // empty = ~/.minim/auth.db or ~/.minim/auth.json
    uint32_t busy_timeout_ms = 5000;
};

// Per-provider defaults from the config file. Environment variables and
// explicit constructor arguments take precedence over these.
struct ClientEntry {
    std::string client_id;
    std::string client_secret;
    std::string user_identifier;
    std::string redirect_uri;
    std::string base_url;
};

struct Config {
    CacheConfig cache;
    TokenStoreConfig tokens;
    std::unordered_map<std::string, ClientEntry> clients;

    // Load from ~/.minim/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults when missing) + env vars
    static Config load_from(const std::string& config_path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Entry for a provider key ("qobuz", "spotify"); empty entry if absent
    ClientEntry client(const std::string& name) const;

    // Token store path with the backend-specific default filled in
    std::string token_store_path() const;
};

// Non-empty environment variable value
std::optional<std::string> env_value(const std::string& name);

} // namespace minim
