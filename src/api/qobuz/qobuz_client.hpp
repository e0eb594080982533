#pragma once
#include "../api_client.hpp"
#include "../../config.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace minim {

class QobuzClient;

constexpr const char* kQobuzBaseUrl = "https://www.qobuz.com/api.json/0.2/";
constexpr const char* kQobuzWebPlayerUrl = "https://play.qobuz.com";
constexpr const char* kQobuzEnvPrefix = "PRIVATE_QOBUZ_API";

// Track used to test application secret candidates
constexpr const char* kQobuzProbeTrackId = "344521217";

// ── Application credentials from the web player ─────────────────

struct QobuzAppCredentials {
    std::string app_id;
    std::vector<std::string> secrets;  // candidates, most likely first
};

// Path of the JS bundle referenced by the login page ("" if absent)
std::string find_bundle_path(const std::string& login_page);

// App ID and decoded secret candidates embedded in the bundle.
// Throws std::runtime_error when no app ID is present.
QobuzAppCredentials parse_web_player_bundle(const std::string& bundle);

// MD5 request signature: endpoint without slashes, then the parameters
// sorted by name as name+value, then the timestamp and the secret.
std::string qobuz_signature(const std::string& endpoint,
                            const QueryParams& sig_params,
                            const std::string& timestamp,
                            const std::string& app_secret);

// ── Endpoint groups ─────────────────────────────────────────────

class QobuzCatalogApi {
public:
    explicit QobuzCatalogApi(QobuzClient& client) : client_(client) {}

    nlohmann::json search(const std::string& query,
                          std::optional<std::string> type = std::nullopt,
                          long limit = 10, long offset = 0);
    nlohmann::json count_matches(const std::string& query);
    nlohmann::json get_featured_albums(const std::string& type,
                                       std::optional<std::string> genre_id = std::nullopt,
                                       long limit = 50, long offset = 0);

private:
    QobuzClient& client_;
};

class QobuzTracksApi {
public:
    explicit QobuzTracksApi(QobuzClient& client) : client_(client) {}

    nlohmann::json get_track(const std::string& track_id);
    nlohmann::json get_tracks(const std::vector<std::string>& track_ids);
    // Signed; format_id one of 5, 6, 7, 27
    nlohmann::json get_playback_info(const std::string& track_id,
                                     long format_id = 27,
                                     const std::string& intent = "stream");

private:
    QobuzClient& client_;
};

class QobuzUsersApi {
public:
    explicit QobuzUsersApi(QobuzClient& client) : client_(client) {}

    // Web player login; password_md5 is the hex MD5 of the password
    nlohmann::json login(const std::string& username, const std::string& password_md5);
    nlohmann::json get_my_profile();
    nlohmann::json get_my_last_updates();

private:
    QobuzClient& client_;
};

class QobuzFavoritesApi {
public:
    explicit QobuzFavoritesApi(QobuzClient& client) : client_(client) {}

    nlohmann::json save(const std::vector<std::string>& album_ids,
                        const std::vector<std::string>& artist_ids,
                        const std::vector<std::string>& track_ids);
    nlohmann::json remove_saved(const std::vector<std::string>& album_ids,
                                const std::vector<std::string>& artist_ids,
                                const std::vector<std::string>& track_ids);
    nlohmann::json get_my_saved(std::optional<std::string> type = std::nullopt,
                                long limit = 50, long offset = 0);
    nlohmann::json get_my_saved_ids();

private:
    nlohmann::json modify(const std::string& endpoint,
                          const std::vector<std::string>& album_ids,
                          const std::vector<std::string>& artist_ids,
                          const std::vector<std::string>& track_ids);

    QobuzClient& client_;
};

// ── Client ──────────────────────────────────────────────────────

struct QobuzLogin {
    std::string username;
    std::string password_md5;
};

// Asked for credentials when the password flow has no stored token
using QobuzLoginPrompt = std::function<QobuzLogin()>;

struct QobuzSettings {
    std::string flow;             // "" = no user authentication, or "password"
    std::string app_id;
    std::string app_secret;
    std::string user_identifier;  // '~' prefix forces a new login
    bool store_tokens = true;
};

// Client for the private Qobuz API used by the web player.
class QobuzClient : public ApiClient {
public:
    QobuzClient(QobuzSettings settings, const ClientEntry& config_entry,
                HttpClient& http, ClientResources resources,
                QobuzLoginPrompt login_prompt = {});

    // Endpoint groups, constructed in declaration order
    QobuzCatalogApi catalog;
    QobuzTracksApi tracks;
    QobuzUsersApi users;
    QobuzFavoritesApi favorites;

    const std::string& app_id() const { return app_id_; }
    const std::string& app_secret() const { return app_secret_; }
    const std::string& user_identifier() const { return user_identifier_; }
    const std::string& flow() const { return flow_; }
    bool authenticated() const { return !user_auth_token_.empty(); }

    // Download the web player login page and bundle and extract the app
    // ID and secret candidates.
    static QobuzAppCredentials resolve_app_credentials(HttpClient& http);

protected:
    void prepare(ApiRequest& request) override;
    bool reauthenticate() override;

private:
    friend class QobuzCatalogApi;
    friend class QobuzTracksApi;
    friend class QobuzUsersApi;
    friend class QobuzFavoritesApi;

    CredentialRecord login_exchange();
    std::string resolve_user_identifier(const nlohmann::json& extras);
    void require_authentication(const std::string& method) const;
    // Adds request_ts and request_sig for a signed endpoint
    void sign(ApiRequest& request, const QueryParams& sig_params) const;

    std::string flow_;
    std::string app_id_;
    std::string app_secret_;
    std::vector<std::string> secret_candidates_;
    std::string user_identifier_;
    std::string user_auth_token_;
    nlohmann::json extras_ = nlohmann::json::object();
    bool store_tokens_ = true;
    bool authenticating_ = false;
    QobuzLoginPrompt login_prompt_;
};

} // namespace minim
