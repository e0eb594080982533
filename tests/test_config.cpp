#include <catch2/catch.hpp>
#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace minim;

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = "/tmp/minim_test_config_" + std::to_string(getpid());
        std::filesystem::create_directories(dir);
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("MINIM_TOKEN_STORE");
        unsetenv("MINIM_TOKEN_BACKEND");
        unsetenv("MINIM_CACHE_ENABLED");
    }
    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("MINIM_TOKEN_STORE");
        unsetenv("MINIM_TOKEN_BACKEND");
        unsetenv("MINIM_CACHE_ENABLED");
        std::filesystem::remove_all(dir);
    }

    std::string config_path() const { return dir + "/.minim/config.json"; }

    void write(const nlohmann::json& j) const {
        std::filesystem::create_directories(dir + "/.minim");
        std::ofstream(config_path()) << j.dump();
    }
};

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.cache.enabled);
    REQUIRE(cfg.cache.max_entries == 1024);
    REQUIRE(cfg.cache.tiers.empty());
    REQUIRE(cfg.tokens.enabled);
    REQUIRE(cfg.tokens.backend == "sqlite");
    REQUIRE(cfg.tokens.busy_timeout_ms == 5000);
}

TEST_CASE("Config::load: creates default file when missing", "[config]") {
    ConfigTestGuard guard;
    auto cfg = Config::load();

    REQUIRE(std::filesystem::exists(guard.config_path()));
    REQUIRE(cfg.tokens.backend == "sqlite");
    REQUIRE(cfg.token_store_path() == guard.dir + "/.minim/auth.db");
}

TEST_CASE("Config::load: reads cache, tokens and clients", "[config]") {
    ConfigTestGuard guard;
    guard.write({
        {"cache", {{"enabled", false}, {"max_entries", 16}, {"tiers", {{"search", 30}}}}},
        {"tokens", {{"backend", "json"}, {"path", "/tmp/x.json"}}},
        {"clients", {{"qobuz", {{"client_id", "123"}, {"user_identifier", "alice"}}}}}
    });

    auto cfg = Config::load();
    REQUIRE_FALSE(cfg.cache.enabled);
    REQUIRE(cfg.cache.max_entries == 16);
    REQUIRE(cfg.cache.tiers.at("search") == 30);
    REQUIRE(cfg.tokens.backend == "json");
    REQUIRE(cfg.token_store_path() == "/tmp/x.json");
    REQUIRE(cfg.client("qobuz").client_id == "123");
    REQUIRE(cfg.client("qobuz").user_identifier == "alice");
    REQUIRE(cfg.client("tidal").client_id.empty());
}

TEST_CASE("Config::load: missing keys are merged into the file", "[config]") {
    ConfigTestGuard guard;
    guard.write({{"cache", {{"enabled", true}}}});

    Config::load();

    std::ifstream in(guard.config_path());
    auto j = nlohmann::json::parse(in);
    REQUIRE(j["cache"].contains("max_entries"));
    REQUIRE(j.contains("tokens"));
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard guard;
    std::filesystem::create_directories(guard.dir + "/.minim");
    std::ofstream(guard.config_path()) << "{ not json";

    auto cfg = Config::load();
    REQUIRE(cfg.cache.enabled);
    REQUIRE(cfg.tokens.backend == "sqlite");
}

TEST_CASE("Config::load: non-integral tier durations become zero", "[config]") {
    ConfigTestGuard guard;
    guard.write({{"cache", {{"tiers", {{"user", "soon"}}}}}});

    auto cfg = Config::load();
    REQUIRE(cfg.cache.tiers.at("user") == 0);
}

TEST_CASE("Config::load: environment overrides file", "[config]") {
    ConfigTestGuard guard;
    guard.write({{"tokens", {{"backend", "sqlite"}}}, {"cache", {{"enabled", true}}}});
    setenv("MINIM_TOKEN_BACKEND", "json", 1);
    setenv("MINIM_TOKEN_STORE", "/tmp/env_store.json", 1);
    setenv("MINIM_CACHE_ENABLED", "false", 1);

    auto cfg = Config::load();
    REQUIRE(cfg.tokens.backend == "json");
    REQUIRE(cfg.token_store_path() == "/tmp/env_store.json");
    REQUIRE_FALSE(cfg.cache.enabled);
}

TEST_CASE("Config::token_store_path: backend-specific default", "[config]") {
    ConfigTestGuard guard;
    Config cfg;
    cfg.tokens.backend = "json";
    REQUIRE(cfg.token_store_path() == guard.dir + "/.minim/auth.json");
}

TEST_CASE("env_value: empty counts as unset", "[config]") {
    setenv("MINIM_TEST_EMPTY", "", 1);
    REQUIRE_FALSE(env_value("MINIM_TEST_EMPTY").has_value());
    setenv("MINIM_TEST_EMPTY", "x", 1);
    REQUIRE(env_value("MINIM_TEST_EMPTY").value() == "x");
    unsetenv("MINIM_TEST_EMPTY");
}
