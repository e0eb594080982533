#include <catch2/catch.hpp>
#include "auth/json_token_store.hpp"
#include "auth/sqlite_token_store.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

using namespace minim;

// Per-test store file, removed on destruction
struct StoreFixture {
    std::string dir;
    std::string backend;
    std::shared_ptr<TokenStore> store;

    explicit StoreFixture(const std::string& backend_name) : backend(backend_name) {
        dir = "/tmp/minim_test_tokens_" + backend + "_" + std::to_string(getpid());
        std::filesystem::remove_all(dir);
        if (backend == "sqlite") {
            store = std::make_shared<SqliteTokenStore>(dir + "/auth.db");
        } else {
            store = std::make_shared<JsonTokenStore>(dir + "/auth.json");
        }
    }
    ~StoreFixture() {
        store.reset();
        std::filesystem::remove_all(dir);
    }
};

static CredentialRecord make_record(const std::string& client, const std::string& flow,
                                    const std::string& client_id, const std::string& user,
                                    const std::string& token) {
    CredentialRecord r;
    r.client_name = client;
    r.authorization_flow = flow;
    r.client_id = client_id;
    r.user_identifier = user;
    r.access_token = token;
    return r;
}

TEST_CASE("TokenStore: upsert then exact find", "[tokens]") {
    StoreFixture f(GENERATE(std::string("sqlite"), std::string("json")));

    auto rec = make_record("Qobuz", kFlowPassword, "100", "alice", "tok-a");
    rec.client_secret = "s3cret";
    rec.refresh_token = "ref";
    rec.scopes = "a b";
    rec.expires_at = 1234;
    rec.extras = {{"user_id", 42}};
    f.store->upsert(rec);

    auto found = f.store->find("Qobuz", kFlowPassword, "100", std::string("alice"));
    REQUIRE(found.has_value());
    REQUIRE(found->access_token == "tok-a");
    REQUIRE(found->client_secret == "s3cret");
    REQUIRE(found->refresh_token == "ref");
    REQUIRE(found->scopes == "a b");
    REQUIRE(found->expires_at == 1234);
    REQUIRE(found->extras["user_id"] == 42);
    REQUIRE(found->last_accessed > 0);

    REQUIRE_FALSE(f.store->find("Qobuz", kFlowPassword, "100", std::string("bob")).has_value());
    REQUIRE_FALSE(f.store->find("Qobuz", kFlowPassword, "999", std::nullopt).has_value());
    REQUIRE_FALSE(f.store->find("Spotify", kFlowPassword, "100", std::nullopt).has_value());
}

TEST_CASE("TokenStore: upsert overwrites by identity", "[tokens]") {
    StoreFixture f(GENERATE(std::string("sqlite"), std::string("json")));

    f.store->upsert(make_record("Qobuz", kFlowPassword, "100", "alice", "old"));
    f.store->upsert(make_record("Qobuz", kFlowPassword, "100", "alice", "new"));

    auto all = f.store->list(TokenFilter{});
    REQUIRE(all.size() == 1);
    auto found = f.store->find("Qobuz", kFlowPassword, "100", std::string("alice"));
    REQUIRE(found->access_token == "new");
}

TEST_CASE("TokenStore: no user identifier resolves the most recently used", "[tokens]") {
    StoreFixture f(GENERATE(std::string("sqlite"), std::string("json")));

    f.store->upsert(make_record("Spotify", kFlowPkce, "cid", "alice", "tok-alice"));
    f.store->upsert(make_record("Spotify", kFlowPkce, "cid", "bob", "tok-bob"));

    auto mru = f.store->find("Spotify", kFlowPkce, "cid", std::nullopt);
    REQUIRE(mru->user_identifier == "bob");

    // Touching alice makes her the most recent
    f.store->find("Spotify", kFlowPkce, "cid", std::string("alice"));
    mru = f.store->find("Spotify", kFlowPkce, "cid", std::nullopt);
    REQUIRE(mru->user_identifier == "alice");
}

TEST_CASE("TokenStore: last_accessed strictly increases", "[tokens]") {
    StoreFixture f(GENERATE(std::string("sqlite"), std::string("json")));

    f.store->upsert(make_record("Qobuz", kFlowPassword, "100", "a", "t"));
    f.store->upsert(make_record("Qobuz", kFlowPassword, "100", "b", "t"));
    f.store->upsert(make_record("Qobuz", kFlowPassword, "100", "c", "t"));

    auto all = f.store->list(TokenFilter{});
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].user_identifier == "c");
    REQUIRE(all[1].user_identifier == "b");
    REQUIRE(all[2].user_identifier == "a");
    REQUIRE(all[0].last_accessed > all[1].last_accessed);
    REQUIRE(all[1].last_accessed > all[2].last_accessed);
}

TEST_CASE("TokenStore: empty user identifier is its own identity", "[tokens]") {
    StoreFixture f(GENERATE(std::string("sqlite"), std::string("json")));

    f.store->upsert(make_record("Spotify", kFlowClientCredentials, "cid", "", "app"));
    f.store->upsert(make_record("Spotify", kFlowClientCredentials, "cid", "alice", "user"));

    auto unbound = f.store->find("Spotify", kFlowClientCredentials, "cid", std::string(""));
    REQUIRE(unbound.has_value());
    REQUIRE(unbound->access_token == "app");
}

TEST_CASE("TokenStore: remove by filter", "[tokens]") {
    StoreFixture f(GENERATE(std::string("sqlite"), std::string("json")));

    f.store->upsert(make_record("Qobuz", kFlowPassword, "100", "alice", "t"));
    f.store->upsert(make_record("Qobuz", kFlowPassword, "100", "bob", "t"));
    f.store->upsert(make_record("Spotify", kFlowPkce, "cid", "alice", "t"));
    f.store->upsert(make_record("Spotify", kFlowClientCredentials, "cid", "", "t"));

    TokenFilter by_user;
    by_user.client_names = {"Qobuz"};
    by_user.user_identifiers = {"alice"};
    REQUIRE(f.store->remove(by_user) == 1);
    REQUIRE(f.store->remove(by_user) == 0);

    TokenFilter by_flow;
    by_flow.authorization_flows = {kFlowPkce, kFlowClientCredentials};
    REQUIRE(f.store->remove(by_flow) == 2);

    auto rest = f.store->list(TokenFilter{});
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].user_identifier == "bob");

    REQUIRE(f.store->remove(TokenFilter{}) == 1);
    REQUIRE(f.store->list(TokenFilter{}).empty());
}

TEST_CASE("TokenStore: list filters and orders", "[tokens]") {
    StoreFixture f(GENERATE(std::string("sqlite"), std::string("json")));

    f.store->upsert(make_record("Qobuz", kFlowPassword, "100", "alice", "t"));
    f.store->upsert(make_record("Spotify", kFlowPkce, "cid", "alice", "t"));
    f.store->upsert(make_record("Qobuz", kFlowPassword, "200", "bob", "t"));

    TokenFilter qobuz;
    qobuz.client_names = {"Qobuz"};
    auto listed = f.store->list(qobuz);
    REQUIRE(listed.size() == 2);
    REQUIRE(listed[0].client_id == "200");
    REQUIRE(listed[1].client_id == "100");

    TokenFilter none;
    none.client_names = {"Tidal"};
    REQUIRE(f.store->list(none).empty());
}

TEST_CASE("TokenStore: backend names", "[tokens]") {
    StoreFixture s("sqlite");
    StoreFixture j("json");
    REQUIRE(s.store->backend_name() == "sqlite");
    REQUIRE(j.store->backend_name() == "json");
}

// ── Persistence ──────────────────────────────────────────────────

TEST_CASE("SqliteTokenStore: records survive reopening", "[tokens]") {
    std::string dir = "/tmp/minim_test_tokens_reopen_" + std::to_string(getpid());
    std::filesystem::remove_all(dir);
    {
        SqliteTokenStore store(dir + "/auth.db");
        store.upsert(make_record("Qobuz", kFlowPassword, "100", "alice", "persisted"));
    }
    {
        SqliteTokenStore store(dir + "/auth.db");
        auto found = store.find("Qobuz", kFlowPassword, "100", std::nullopt);
        REQUIRE(found.has_value());
        REQUIRE(found->access_token == "persisted");
    }
    std::filesystem::remove_all(dir);
}

TEST_CASE("JsonTokenStore: two instances share the file", "[tokens]") {
    std::string dir = "/tmp/minim_test_tokens_shared_" + std::to_string(getpid());
    std::filesystem::remove_all(dir);

    JsonTokenStore a(dir + "/auth.json");
    JsonTokenStore b(dir + "/auth.json");
    a.upsert(make_record("Qobuz", kFlowPassword, "100", "alice", "from-a"));

    auto found = b.find("Qobuz", kFlowPassword, "100", std::nullopt);
    REQUIRE(found.has_value());
    REQUIRE(found->access_token == "from-a");

    std::filesystem::remove_all(dir);
}

TEST_CASE("JsonTokenStore: concurrent writers through separate instances keep every record", "[tokens]") {
    std::string dir = "/tmp/minim_test_tokens_concurrent_" + std::to_string(getpid());
    std::filesystem::remove_all(dir);

    JsonTokenStore a(dir + "/auth.json");
    JsonTokenStore b(dir + "/auth.json");
    std::atomic<int> errors{0};

    auto writer = [&errors](JsonTokenStore& store, const std::string& prefix) {
        for (int i = 0; i < 50; i++) {
            try {
                store.upsert(make_record("Qobuz", kFlowPassword, "100",
                                         prefix + std::to_string(i), "t"));
            } catch (const StoreUnavailable&) {
                errors++;
            }
        }
    };
    std::thread ta(writer, std::ref(a), "a");
    std::thread tb(writer, std::ref(b), "b");
    ta.join();
    tb.join();

    REQUIRE(errors.load() == 0);
    REQUIRE(a.list(TokenFilter{}).size() == 100);

    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        REQUIRE(entry.path().extension() != ".tmp");
    }
    std::filesystem::remove_all(dir);
}

TEST_CASE("JsonTokenStore: held lock times out with StoreUnavailable", "[tokens]") {
    std::string dir = "/tmp/minim_test_tokens_locked_" + std::to_string(getpid());
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    std::string path = dir + "/auth.json";

    int fd = ::open((path + ".lock").c_str(), O_RDWR | O_CREAT, 0600);
    REQUIRE(fd >= 0);
    REQUIRE(::flock(fd, LOCK_EX) == 0);

    JsonTokenStore store(path, 50);
    REQUIRE_THROWS_AS(store.upsert(make_record("Qobuz", kFlowPassword, "100", "alice", "t")),
                      StoreUnavailable);

    ::flock(fd, LOCK_UN);
    ::close(fd);
    store.upsert(make_record("Qobuz", kFlowPassword, "100", "alice", "t"));
    REQUIRE(store.list(TokenFilter{}).size() == 1);
    std::filesystem::remove_all(dir);
}

TEST_CASE("JsonTokenStore: corrupt file raises StoreUnavailable", "[tokens]") {
    std::string dir = "/tmp/minim_test_tokens_corrupt_" + std::to_string(getpid());
    std::filesystem::create_directories(dir);
    std::string path = dir + "/auth.json";

    SECTION("unparseable") {
        std::ofstream(path) << "{ nope";
        REQUIRE_THROWS_AS(JsonTokenStore(path), StoreUnavailable);
    }
    SECTION("wrong shape") {
        std::ofstream(path) << R"({"tokens": {"a": 1}})";
        REQUIRE_THROWS_AS(JsonTokenStore(path), StoreUnavailable);
    }
    SECTION("corrupted after opening") {
        JsonTokenStore store(path);
        std::ofstream(path) << "garbage";
        REQUIRE_THROWS_AS(store.list(TokenFilter{}), StoreUnavailable);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("SqliteTokenStore: unopenable path raises StoreUnavailable", "[tokens]") {
    std::string dir = "/tmp/minim_test_tokens_bad_" + std::to_string(getpid());
    std::filesystem::create_directories(dir + "/auth.db");  // a directory, not a file
    REQUIRE_THROWS_AS(SqliteTokenStore(dir + "/auth.db"), StoreUnavailable);
    std::filesystem::remove_all(dir);
}

// ── Factory ──────────────────────────────────────────────────────

TEST_CASE("create_token_store: selects backend from config", "[tokens]") {
    std::string dir = "/tmp/minim_test_tokens_factory_" + std::to_string(getpid());
    Config cfg;

    cfg.tokens.backend = "json";
    cfg.tokens.path = dir + "/auth.json";
    REQUIRE(create_token_store(cfg)->backend_name() == "json");

    cfg.tokens.backend = "sqlite";
    cfg.tokens.path = dir + "/auth.db";
    REQUIRE(create_token_store(cfg)->backend_name() == "sqlite");

    cfg.tokens.backend = "redis";
    REQUIRE_THROWS_AS(create_token_store(cfg), std::invalid_argument);

    std::filesystem::remove_all(dir);
}

// ── Credential helpers ───────────────────────────────────────────

TEST_CASE("UserIdentifier::parse: bypass marker", "[tokens]") {
    auto plain = UserIdentifier::parse("alice");
    REQUIRE(plain.value == "alice");
    REQUIRE_FALSE(plain.bypass);

    auto bypass = UserIdentifier::parse("~alice");
    REQUIRE(bypass.value == "alice");
    REQUIRE(bypass.bypass);

    auto bare = UserIdentifier::parse("~");
    REQUIRE(bare.value.empty());
    REQUIRE(bare.bypass);

    REQUIRE_FALSE(UserIdentifier::parse("").bypass);
}

TEST_CASE("TokenFilter: intersection of fields", "[tokens]") {
    auto rec = make_record("Qobuz", kFlowPassword, "100", "alice", "t");

    TokenFilter empty;
    REQUIRE(empty.empty());
    REQUIRE(empty.matches(rec));

    TokenFilter f;
    f.client_names = {"Qobuz", "Spotify"};
    f.user_identifiers = {"alice"};
    REQUIRE_FALSE(f.empty());
    REQUIRE(f.matches(rec));

    f.user_identifiers = {"bob"};
    REQUIRE_FALSE(f.matches(rec));
}

TEST_CASE("summarize: drops secret material", "[tokens]") {
    auto rec = make_record("Qobuz", kFlowPassword, "100", "alice", "tok");
    rec.client_secret = "secret";
    rec.refresh_token = "ref";
    rec.scopes = "s";
    rec.expires_at = 9;

    auto s = summarize(rec);
    REQUIRE(s.client_name == "Qobuz");
    REQUIRE(s.user_identifier == "alice");
    REQUIRE(s.scopes == "s");
    REQUIRE(s.expires_at == 9);
}

TEST_CASE("CredentialRecord::expired", "[tokens]") {
    CredentialRecord r;
    REQUIRE_FALSE(r.expired(1000000));
    r.expires_at = 100;
    REQUIRE_FALSE(r.expired(99));
    REQUIRE(r.expired(100));
}
