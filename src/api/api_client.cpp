#include "api_client.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace minim {

ClientResources make_client_resources(const Config& config) {
    ClientResources resources;
    if (config.cache.enabled) {
        resources.cache = std::make_shared<ResponseCache>(
            TtlPolicy::with_overrides(config.cache.tiers), config.cache.max_entries);
    }
    if (config.tokens.enabled) {
        resources.tokens = create_token_store(config);
    }
    return resources;
}

ApiClient::ApiClient(std::string client_name, std::string base_url,
                     HttpClient& http, ClientResources resources)
    : client_name_(std::move(client_name)),
      base_url_(std::move(base_url)),
      cache_owner_(client_name_ + ":" + generate_id()),
      http_(http),
      cache_(std::move(resources.cache)),
      authenticator_(std::move(resources.tokens)) {}

ApiClient::~ApiClient() {
    if (cache_) cache_->invalidate_owner(cache_owner_);
}

void ApiClient::set_cache_enabled(bool enabled) {
    cache_enabled_ = enabled;
    if (!enabled) clear_cache();
}

uint32_t ApiClient::clear_cache() {
    if (!cache_) return 0;
    uint32_t removed = cache_->invalidate_owner(cache_owner_);
    if (removed > 0) {
        std::cerr << "[cache] Cleared " << removed << " " << client_name_ << " entries\n";
    }
    return removed;
}

uint32_t ApiClient::clear_cache(const std::vector<std::string>& methods) {
    if (!cache_) return 0;
    uint32_t removed = 0;
    for (const auto& m : methods) {
        removed += cache_->invalidate_method(m, cache_owner_);
    }
    return removed;
}

std::vector<CredentialSummary> ApiClient::get_tokens(TokenFilter filter) const {
    const auto& store = authenticator_.store();
    if (!store) return {};
    filter.client_names = {client_name_};
    return store->list(filter);
}

size_t ApiClient::remove_tokens(TokenFilter filter) {
    const auto& store = authenticator_.store();
    if (!store) return 0;
    filter.client_names = {client_name_};
    if (filter.authorization_flows.empty() && filter.client_ids.empty() &&
        filter.user_identifiers.empty()) {
        std::cerr << "[tokens] Removing every stored " << client_name_ << " token\n";
    }
    return store->remove(filter);
}

nlohmann::json ApiClient::cached(const std::string& method,
                                 const std::string& tier,
                                 const CallArgs& args,
                                 const std::function<nlohmann::json()>& compute) {
    if (!cache_enabled()) return compute();
    return cache_->fetch(cache_owner_, method, tier, args, compute);
}

HttpResponse ApiClient::dispatch(const ApiRequest& request) {
    ApiRequest prepared = request;
    prepare(prepared);
    std::string url = with_query(base_url_ + prepared.endpoint, prepared.params);
    return http_.request(prepared.method, url, prepared.body, prepared.headers,
                         prepared.timeout_seconds);
}

nlohmann::json ApiClient::request_json(const ApiRequest& request) {
    HttpResponse resp = dispatch(request);

    if (resp.status_code == 401 && reauthenticate()) {
        std::cerr << "[auth] " << client_name_ << " re-authenticated, replaying "
                  << request.endpoint << "\n";
        resp = dispatch(request);
    }

    if (resp.status_code == 0) {
        throw ApiError(0, client_name_ + " " + request.endpoint + ": request failed");
    }
    if (resp.status_code < 200 || resp.status_code >= 300) {
        std::string detail = resp.body.substr(0, 200);
        throw ApiError(resp.status_code,
                       client_name_ + " " + request.endpoint + " returned HTTP " +
                       std::to_string(resp.status_code) +
                       (detail.empty() ? "" : ": " + detail));
    }

    if (trim(resp.body).empty()) return nullptr;
    auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded()) {
        throw ApiError(resp.status_code,
                       client_name_ + " " + request.endpoint + " returned malformed JSON");
    }
    return j;
}

void require_one_of(const std::string& name, const std::string& value,
                    const std::vector<std::string>& allowed) {
    if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
        throw std::invalid_argument("Invalid " + name + " '" + value +
                                    "'. Valid values: " + join(allowed, ", ") + ".");
    }
}

void require_range(const std::string& name, long value, long min, long max) {
    if (value < min || value > max) {
        throw std::invalid_argument(name + " must be between " + std::to_string(min) +
                                    " and " + std::to_string(max) + ".");
    }
}

} // namespace minim
