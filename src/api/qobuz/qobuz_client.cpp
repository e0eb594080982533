#include "qobuz_client.hpp"
#include "../../errors.hpp"
#include "../../util.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <stdexcept>

namespace minim {

using json = nlohmann::json;

// ── Application credentials ─────────────────────────────────────

std::string find_bundle_path(const std::string& login_page) {
    static const std::regex bundle_re(R"(/resources/[^"'\s<>]*/bundle\.js)");
    std::smatch m;
    if (std::regex_search(login_page, m, bundle_re)) return m.str(0);
    return "";
}

QobuzAppCredentials parse_web_player_bundle(const std::string& bundle) {
    static const std::regex app_id_re(R"re(production:\{api:\{appId:"([^"]*)",appSecret)re");
    static const std::regex seed_re(R"re([a-z]\.initialSeed\("([^"]*)",window\.utimezone\.([a-z]+)\))re");

    QobuzAppCredentials creds;
    std::smatch m;
    if (!std::regex_search(bundle, m, app_id_re) || m.str(1).empty()) {
        throw std::runtime_error("No Qobuz app ID found in the web player bundle");
    }
    creds.app_id = m.str(1);

    for (auto it = std::sregex_iterator(bundle.begin(), bundle.end(), seed_re);
         it != std::sregex_iterator(); ++it) {
        std::string seed = (*it)[1].str();
        std::string city = (*it)[2].str();
        city[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(city[0])));

        std::regex info_re(city + R"re(",info:"([^"]*)",extras:"([^"]*)"\},\{offset)re");
        std::smatch info;
        if (!std::regex_search(bundle, info, info_re)) continue;

        // The last 44 characters of the joined parts are padding
        std::string joined = seed + info.str(1) + info.str(2);
        if (joined.size() <= 44) continue;
        std::string secret = base64_decode(joined.substr(0, joined.size() - 44));
        if (!secret.empty()) creds.secrets.push_back(std::move(secret));
    }
    return creds;
}

std::string qobuz_signature(const std::string& endpoint,
                            const QueryParams& sig_params,
                            const std::string& timestamp,
                            const std::string& app_secret) {
    QueryParams sorted = sig_params;
    std::sort(sorted.begin(), sorted.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::string payload;
    for (char c : endpoint) {
        if (c != '/') payload += c;
    }
    for (const auto& [name, value] : sorted) {
        payload += name;
        payload += value;
    }
    payload += timestamp;
    payload += app_secret;
    return md5_hex(payload);
}

QobuzAppCredentials QobuzClient::resolve_app_credentials(HttpClient& http) {
    std::string base = kQobuzWebPlayerUrl;

    auto page = http.get(base + "/login", {});
    if (page.status_code < 200 || page.status_code >= 300) {
        throw ApiError(page.status_code, "Qobuz web player login page unavailable");
    }
    std::string path = find_bundle_path(page.body);
    if (path.empty()) {
        throw std::runtime_error("No bundle.js reference on the Qobuz web player login page");
    }

    auto bundle = http.get(base + path, {});
    if (bundle.status_code < 200 || bundle.status_code >= 300) {
        throw ApiError(bundle.status_code, "Qobuz web player bundle unavailable");
    }

    auto creds = parse_web_player_bundle(bundle.body);
    std::cerr << "[qobuz] Found app ID " << creds.app_id << " with "
              << creds.secrets.size() << " secret candidate(s)\n";
    return creds;
}

// ── Client ──────────────────────────────────────────────────────

static std::string id_string(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    return "";
}

QobuzClient::QobuzClient(QobuzSettings settings, const ClientEntry& config_entry,
                         HttpClient& http, ClientResources resources,
                         QobuzLoginPrompt login_prompt)
    : ApiClient("qobuz",
                config_entry.base_url.empty() ? kQobuzBaseUrl : config_entry.base_url,
                http, std::move(resources)),
      catalog(*this),
      tracks(*this),
      users(*this),
      favorites(*this),
      flow_(std::move(settings.flow)),
      store_tokens_(settings.store_tokens),
      login_prompt_(std::move(login_prompt)) {
    if (!flow_.empty()) require_one_of("authorization flow", flow_, {kFlowPassword});

    std::string prefix = kQobuzEnvPrefix;
    app_id_ = resolve_setting(settings.app_id, prefix + "_APP_ID", config_entry.client_id);
    app_secret_ = resolve_setting(settings.app_secret, prefix + "_APP_SECRET",
                                  config_entry.client_secret);
    bool secret_configured = !app_secret_.empty();

    std::string raw_user = settings.user_identifier.empty() ? config_entry.user_identifier
                                                            : settings.user_identifier;
    UserIdentifier id = UserIdentifier::parse(raw_user);

    if (app_id_.empty() && !flow_.empty() && store_tokens_ && !id.bypass) {
        if (auto stored = authenticator().latest(client_name(), flow_, id.value)) {
            app_id_ = stored->client_id;
            if (app_secret_.empty()) app_secret_ = stored->client_secret;
        }
    }

    if (app_id_.empty()) {
        std::cerr << "[qobuz] Resolving app credentials from the web player\n";
        auto resolved = resolve_app_credentials(http);
        app_id_ = resolved.app_id;
        if (app_secret_.empty()) secret_candidates_ = std::move(resolved.secrets);
    }

    if (!app_secret_.empty()) {
        secret_candidates_ = {app_secret_};
    } else if (!secret_candidates_.empty()) {
        app_secret_ = secret_candidates_.front();
    }

    if (flow_.empty()) return;

    AuthRequest request;
    request.client_name = client_name();
    request.authorization_flow = flow_;
    request.client_id = app_id_;
    request.user_identifier = raw_user;
    request.store_tokens = store_tokens_;

    CredentialRecord record = authenticator().resolve(request, [this]() { return login_exchange(); });
    user_auth_token_ = record.access_token;
    user_identifier_ = record.user_identifier;
    extras_ = record.extras;
    if (!secret_configured && !record.client_secret.empty()) {
        app_secret_ = record.client_secret;
        secret_candidates_ = {app_secret_};
    }
}

CredentialRecord QobuzClient::login_exchange() {
    if (!login_prompt_) {
        throw std::invalid_argument("The password flow needs a login prompt.");
    }
    QobuzLogin creds = login_prompt_();

    authenticating_ = true;
    try {
        json resp = users.login(creds.username, creds.password_md5);
        std::string key = resp.contains("token") ? "token" : "user_auth_token";
        if (!resp.is_object() || !resp.contains(key) || !resp[key].is_string()) {
            throw ApiError(200, "Qobuz login response has no user token");
        }
        user_auth_token_ = resp[key].get<std::string>();
        resp.erase(key);
        extras_ = resp;

        CredentialRecord record;
        record.client_name = client_name();
        record.authorization_flow = flow_;
        record.client_id = app_id_;
        record.access_token = user_auth_token_;
        record.extras = resp;
        record.user_identifier = resolve_user_identifier(resp);

        if (secret_candidates_.size() > 1) {
            app_secret_ = probe_secrets(client_name(), secret_candidates_,
                [this](const std::string& candidate) {
                    app_secret_ = candidate;
                    tracks.get_playback_info(kQobuzProbeTrackId, 5);
                    return true;
                });
            secret_candidates_ = {app_secret_};
        }
        record.client_secret = app_secret_;

        authenticating_ = false;
        return record;
    } catch (...) {
        authenticating_ = false;
        throw;
    }
}

std::string QobuzClient::resolve_user_identifier(const json& extras) {
    if (extras.contains("user_id")) {
        std::string id = id_string(extras["user_id"]);
        if (!id.empty()) return id;
    }
    if (extras.contains("user") && extras["user"].is_object() && extras["user"].contains("id")) {
        std::string id = id_string(extras["user"]["id"]);
        if (!id.empty()) return id;
    }
    json profile = users.get_my_profile();
    return profile.is_object() && profile.contains("id") ? id_string(profile["id"]) : "";
}

void QobuzClient::require_authentication(const std::string& method) const {
    if (user_auth_token_.empty()) {
        throw std::runtime_error("QobuzClient::" + method + "() requires user authentication.");
    }
}

void QobuzClient::sign(ApiRequest& request, const QueryParams& sig_params) const {
    std::string timestamp = std::to_string(epoch_seconds());
    request.params.emplace_back("request_ts", timestamp);
    request.params.emplace_back("request_sig",
                                qobuz_signature(request.endpoint, sig_params, timestamp,
                                                app_secret_));
}

void QobuzClient::prepare(ApiRequest& request) {
    request.headers.emplace_back("X-App-Id", app_id_);
    if (!user_auth_token_.empty()) {
        request.headers.emplace_back("X-User-Auth-Token", user_auth_token_);
    }
}

bool QobuzClient::reauthenticate() {
    if (flow_.empty() || authenticating_) return false;

    std::cerr << "[qobuz] User token rejected, logging in again\n";
    CredentialRecord record = login_exchange();
    if (!user_identifier_.empty()) record.user_identifier = user_identifier_;
    user_identifier_ = record.user_identifier;
    if (store_tokens_) authenticator().persist(record);
    return true;
}

} // namespace minim
