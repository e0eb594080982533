#include <catch2/catch.hpp>
#include "auth/authenticator.hpp"
#include "auth/json_token_store.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

using namespace minim;

struct AuthFixture {
    std::string dir;
    std::shared_ptr<TokenStore> store;
    Authenticator auth;

    AuthFixture()
        : dir("/tmp/minim_test_auth_" + std::to_string(getpid())),
          store(make_store(dir)),
          auth(store) {}
    ~AuthFixture() { std::filesystem::remove_all(dir); }

    static std::shared_ptr<TokenStore> make_store(const std::string& d) {
        std::filesystem::remove_all(d);
        return std::make_shared<JsonTokenStore>(d + "/auth.json");
    }
};

static AuthRequest request_for(const std::string& user) {
    AuthRequest req;
    req.client_name = "Qobuz";
    req.authorization_flow = kFlowPassword;
    req.client_id = "100";
    req.user_identifier = user;
    return req;
}

static Exchange issuing(const std::string& token, int* calls) {
    return [token, calls]() {
        (*calls)++;
        CredentialRecord r;
        r.access_token = token;
        return r;
    };
}

TEST_CASE("Authenticator: first resolve runs the exchange and stores", "[auth]") {
    AuthFixture f;
    int calls = 0;

    auto rec = f.auth.resolve(request_for("alice"), issuing("tok-1", &calls));
    REQUIRE(calls == 1);
    REQUIRE(rec.access_token == "tok-1");
    REQUIRE(rec.client_name == "Qobuz");
    REQUIRE(rec.authorization_flow == kFlowPassword);
    REQUIRE(rec.client_id == "100");
    REQUIRE(rec.user_identifier == "alice");

    auto stored = f.store->find("Qobuz", kFlowPassword, "100", std::string("alice"));
    REQUIRE(stored.has_value());
    REQUIRE(stored->access_token == "tok-1");
}

TEST_CASE("Authenticator: stored credential skips the exchange", "[auth]") {
    AuthFixture f;
    int calls = 0;

    f.auth.resolve(request_for("alice"), issuing("tok-1", &calls));
    auto again = f.auth.resolve(request_for("alice"), issuing("tok-2", &calls));
    REQUIRE(calls == 1);
    REQUIRE(again.access_token == "tok-1");

    // No identifier resolves the most recently used account
    auto mru = f.auth.resolve(request_for(""), issuing("tok-3", &calls));
    REQUIRE(calls == 1);
    REQUIRE(mru.user_identifier == "alice");
}

TEST_CASE("Authenticator: bypass marker forces a fresh exchange", "[auth]") {
    AuthFixture f;
    int calls = 0;

    f.auth.resolve(request_for("alice"), issuing("tok-1", &calls));
    auto fresh = f.auth.resolve(request_for("~alice"), issuing("tok-2", &calls));
    REQUIRE(calls == 2);
    REQUIRE(fresh.access_token == "tok-2");
    REQUIRE(fresh.user_identifier == "alice");

    // Stored under the stripped identifier
    auto stored = f.store->find("Qobuz", kFlowPassword, "100", std::string("alice"));
    REQUIRE(stored->access_token == "tok-2");
    REQUIRE_FALSE(f.store->find("Qobuz", kFlowPassword, "100", std::string("~alice")).has_value());
}

TEST_CASE("Authenticator: store_tokens = false neither reads nor writes", "[auth]") {
    AuthFixture f;
    int calls = 0;

    f.auth.resolve(request_for("alice"), issuing("tok-1", &calls));

    auto req = request_for("alice");
    req.store_tokens = false;
    auto rec = f.auth.resolve(req, issuing("tok-2", &calls));
    REQUIRE(calls == 2);
    REQUIRE(rec.access_token == "tok-2");

    auto stored = f.store->find("Qobuz", kFlowPassword, "100", std::string("alice"));
    REQUIRE(stored->access_token == "tok-1");
}

TEST_CASE("Authenticator: null store always exchanges", "[auth]") {
    Authenticator auth(nullptr);
    int calls = 0;
    auth.resolve(request_for("alice"), issuing("a", &calls));
    auth.resolve(request_for("alice"), issuing("b", &calls));
    REQUIRE(calls == 2);
    REQUIRE_FALSE(auth.latest("Qobuz", kFlowPassword).has_value());
}

TEST_CASE("Authenticator: failed exchange stores nothing", "[auth]") {
    AuthFixture f;
    Exchange failing = []() -> CredentialRecord { throw ApiError(401, "bad password"); };

    REQUIRE_THROWS_AS(f.auth.resolve(request_for("alice"), failing), ApiError);
    REQUIRE(f.store->list(TokenFilter{}).empty());
}

TEST_CASE("Authenticator: empty client id always exchanges", "[auth]") {
    AuthFixture f;
    int calls = 0;

    auto req = request_for("alice");
    req.client_id = "";
    Exchange exchange = [&calls]() {
        calls++;
        CredentialRecord r;
        r.client_id = "discovered";
        r.access_token = "tok";
        return r;
    };
    auto rec = f.auth.resolve(req, exchange);
    REQUIRE(rec.client_id == "discovered");
    REQUIRE(f.store->find("Qobuz", kFlowPassword, "discovered", std::nullopt).has_value());
    f.auth.resolve(req, exchange);
    REQUIRE(calls == 2);
}

TEST_CASE("Authenticator::latest: most recent record across client ids", "[auth]") {
    AuthFixture f;
    int calls = 0;

    auto a = request_for("alice");
    a.client_id = "100";
    f.auth.resolve(a, issuing("t1", &calls));
    auto b = request_for("bob");
    b.client_id = "200";
    f.auth.resolve(b, issuing("t2", &calls));

    auto latest = f.auth.latest("Qobuz", kFlowPassword);
    REQUIRE(latest.has_value());
    REQUIRE(latest->client_id == "200");

    auto for_alice = f.auth.latest("Qobuz", kFlowPassword, "alice");
    REQUIRE(for_alice->client_id == "100");

    REQUIRE_FALSE(f.auth.latest("Spotify", kFlowPkce).has_value());
}

TEST_CASE("Authenticator::persist: overwrites the stored record", "[auth]") {
    AuthFixture f;
    int calls = 0;
    auto rec = f.auth.resolve(request_for("alice"), issuing("old", &calls));

    rec.access_token = "refreshed";
    f.auth.persist(rec);
    auto again = f.auth.resolve(request_for("alice"), issuing("unused", &calls));
    REQUIRE(again.access_token == "refreshed");
    REQUIRE(calls == 1);
}

// ── Secret probing ───────────────────────────────────────────────

TEST_CASE("probe_secrets: returns the first accepted candidate", "[auth]") {
    std::vector<std::string> tried;
    auto winner = probe_secrets("Qobuz", {"a", "b", "c"}, [&](const std::string& s) {
        tried.push_back(s);
        return s == "b";
    });
    REQUIRE(winner == "b");
    REQUIRE(tried == std::vector<std::string>{"a", "b"});
}

TEST_CASE("probe_secrets: exceptions count as rejection", "[auth]") {
    auto winner = probe_secrets("Qobuz", {"a", "b"}, [](const std::string& s) -> bool {
        if (s == "a") throw ApiError(400, "invalid signature");
        return true;
    });
    REQUIRE(winner == "b");
}

TEST_CASE("probe_secrets: no accepted candidate", "[auth]") {
    REQUIRE_THROWS_AS(probe_secrets("Qobuz", {"a", "b"}, [](const std::string&) { return false; }),
                      NoValidCredentialError);
    REQUIRE_THROWS_AS(probe_secrets("Qobuz", {}, [](const std::string&) { return true; }),
                      NoValidCredentialError);
}

// ── Setting precedence ───────────────────────────────────────────

TEST_CASE("resolve_setting: explicit > env > config > stored", "[auth]") {
    const char* var = "MINIM_TEST_SETTING";
    unsetenv(var);

    REQUIRE(resolve_setting("", var, "", "").empty());
    REQUIRE(resolve_setting("", var, "", "stored") == "stored");
    REQUIRE(resolve_setting("", var, "config", "stored") == "config");

    setenv(var, "env", 1);
    REQUIRE(resolve_setting("", var, "config", "stored") == "env");
    REQUIRE(resolve_setting("explicit", var, "config", "stored") == "explicit");

    setenv(var, "", 1);
    REQUIRE(resolve_setting("", var, "config") == "config");
    unsetenv(var);
}
