#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace minim {

nlohmann::json Config::defaults_json() {
    return {
        {"cache", {
            {"enabled", true},
            {"max_entries", 1024},
            {"tiers", nlohmann::json::object()}
        }},
        {"tokens", {
            {"enabled", true},
            {"backend", "sqlite"},
            {"path", ""},
            {"busy_timeout_ms", 5000}
        }},
        {"clients", {
            {"qobuz", {{"client_id", ""}, {"client_secret", ""}}},
            {"spotify", {{"client_id", ""}, {"client_secret", ""}, {"redirect_uri", ""}}}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static std::string string_field(const nlohmann::json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string())
        return obj[key].get<std::string>();
    return {};
}

static bool env_flag(const std::string& value) {
    std::string v = to_lower(trim(value));
    return !(v == "0" || v == "false" || v == "no" || v == "off");
}

Config Config::load() {
    return load_from(expand_home("~/.minim/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    Config cfg;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.cache.enabled = c["enabled"].get<bool>();
        if (c.contains("max_entries") && c["max_entries"].is_number_unsigned())
            cfg.cache.max_entries = c["max_entries"].get<uint32_t>();
        if (c.contains("tiers") && c["tiers"].is_object()) {
            for (auto& [name, seconds] : c["tiers"].items()) {
                // Non-integral values become 0, which TtlPolicy rejects.
                cfg.cache.tiers[name] = seconds.is_number_unsigned()
                    ? seconds.get<uint64_t>() : 0;
            }
        }
    }

    if (j.contains("tokens") && j["tokens"].is_object()) {
        auto& t = j["tokens"];
        if (t.contains("enabled") && t["enabled"].is_boolean())
            cfg.tokens.enabled = t["enabled"].get<bool>();
        if (t.contains("backend") && t["backend"].is_string())
            cfg.tokens.backend = t["backend"].get<std::string>();
        if (t.contains("path") && t["path"].is_string())
            cfg.tokens.path = t["path"].get<std::string>();
        if (t.contains("busy_timeout_ms") && t["busy_timeout_ms"].is_number_unsigned())
            cfg.tokens.busy_timeout_ms = t["busy_timeout_ms"].get<uint32_t>();
    }

    if (j.contains("clients") && j["clients"].is_object()) {
        for (auto& [name, obj] : j["clients"].items()) {
            if (!obj.is_object()) continue;
            ClientEntry entry;
            entry.client_id = string_field(obj, "client_id");
            entry.client_secret = string_field(obj, "client_secret");
            entry.user_identifier = string_field(obj, "user_identifier");
            entry.redirect_uri = string_field(obj, "redirect_uri");
            entry.base_url = string_field(obj, "base_url");
            cfg.clients[name] = std::move(entry);
        }
    }

    // Environment variables always override config file
    if (auto v = env_value("MINIM_TOKEN_STORE"))
        cfg.tokens.path = *v;
    if (auto v = env_value("MINIM_TOKEN_BACKEND"))
        cfg.tokens.backend = *v;
    if (auto v = env_value("MINIM_CACHE_ENABLED"))
        cfg.cache.enabled = env_flag(*v);

    return cfg;
}

ClientEntry Config::client(const std::string& name) const {
    auto it = clients.find(name);
    if (it != clients.end()) return it->second;
    return {};
}

std::string Config::token_store_path() const {
    if (!tokens.path.empty()) return expand_home(tokens.path);
    if (tokens.backend == "json") return expand_home("~/.minim/auth.json");
    return expand_home("~/.minim/auth.db");
}

std::optional<std::string> env_value(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (v == nullptr || *v == '\0') return std::nullopt;
    return std::string(v);
}

} // namespace minim
