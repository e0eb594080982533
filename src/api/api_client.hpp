#pragma once
#include "../auth/authenticator.hpp"
#include "../auth/token_store.hpp"
#include "../cache/cache_key.hpp"
#include "../cache/response_cache.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace minim {

// Shared infrastructure handed to every client instance.
struct ClientResources {
    std::shared_ptr<ResponseCache> cache;  // null = no caching
    std::shared_ptr<TokenStore> tokens;    // null = no token persistence
};

struct Config;

// Cache and token store as configured. Disabled parts stay null.
// Throws UnknownTierError or std::invalid_argument for bad tier overrides.
ClientResources make_client_resources(const Config& config);

// One outgoing endpoint call before authorization is attached.
struct ApiRequest {
    std::string method = "GET";
    std::string endpoint;            // relative to the client's base URL
    QueryParams params;
    std::string body;
    std::vector<Header> headers;
    long timeout_seconds = 30;
};

// Base class for provider API clients.
//
// Owns the per-instance cache identity: two clients never share cache
// entries, even for the same provider. Read endpoints go through cached();
// every call goes through request_json(), which attaches credentials via
// prepare() and replays once after a successful reauthenticate() on 401.
class ApiClient {
public:
    ApiClient(std::string client_name, std::string base_url,
              HttpClient& http, ClientResources resources);
    virtual ~ApiClient();

    ApiClient(const ApiClient&) = delete;
    ApiClient& operator=(const ApiClient&) = delete;

    const std::string& client_name() const { return client_name_; }
    const std::string& base_url() const { return base_url_; }
    const std::string& cache_owner() const { return cache_owner_; }

    // ── Cache management ─────────────────────────────────────────
    // Disabling also drops this client's cached entries.
    void set_cache_enabled(bool enabled);
    bool cache_enabled() const { return cache_enabled_.load() && cache_ != nullptr; }

    // Drop every cached entry of this client. Returns the count removed.
    uint32_t clear_cache();
    // Drop cached entries of the named endpoint methods only.
    uint32_t clear_cache(const std::vector<std::string>& methods);

    // ── Token management ─────────────────────────────────────────
    // Both force the filter's client name to this client.
    std::vector<CredentialSummary> get_tokens(TokenFilter filter = {}) const;
    // With no other filter set, removes every token of this client.
    size_t remove_tokens(TokenFilter filter = {});

protected:
    // Memoize compute under (this client, method, args) with the tier's TTL.
    // Runs compute directly when caching is disabled.
    nlohmann::json cached(const std::string& method,
                          const std::string& tier,
                          const CallArgs& args,
                          const std::function<nlohmann::json()>& compute);

    // Send request and parse the JSON body. Throws ApiError on transport
    // failure, non-2xx status or a malformed body. An empty body yields null.
    nlohmann::json request_json(const ApiRequest& request);

    // Attach credentials (headers, signed params) to an outgoing request.
    virtual void prepare(ApiRequest& /*request*/) {}

    // Obtain a fresh credential after a 401. Returns false to give up.
    virtual bool reauthenticate() { return false; }

    HttpClient& http() { return http_; }
    Authenticator& authenticator() { return authenticator_; }

private:
    HttpResponse dispatch(const ApiRequest& request);

    std::string client_name_;
    std::string base_url_;
    std::string cache_owner_;
    HttpClient& http_;
    std::shared_ptr<ResponseCache> cache_;
    Authenticator authenticator_;
    std::atomic<bool> cache_enabled_{true};
};

// Throw std::invalid_argument unless value is in allowed
void require_one_of(const std::string& name, const std::string& value,
                    const std::vector<std::string>& allowed);

// Throw std::invalid_argument unless min <= value <= max
void require_range(const std::string& name, long value, long min, long max);

} // namespace minim
