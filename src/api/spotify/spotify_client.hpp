#pragma once
#include "../oauth2_client.hpp"
#include <optional>
#include <string>
#include <vector>

namespace minim {

class SpotifyClient;

constexpr const char* kSpotifyBaseUrl = "https://api.spotify.com/v1/";
constexpr const char* kSpotifyAuthorizeUrl = "https://accounts.spotify.com/authorize";
constexpr const char* kSpotifyTokenUrl = "https://accounts.spotify.com/api/token";
constexpr const char* kSpotifyEnvPrefix = "SPOTIFY_WEB_API";

class SpotifySearchApi {
public:
    explicit SpotifySearchApi(SpotifyClient& client) : client_(client) {}

    // types: album, artist, playlist, track, show, episode, audiobook
    nlohmann::json search(const std::string& query,
                          const std::vector<std::string>& types,
                          std::optional<std::string> market = std::nullopt,
                          long limit = 20, long offset = 0);

private:
    SpotifyClient& client_;
};

class SpotifyTracksApi {
public:
    explicit SpotifyTracksApi(SpotifyClient& client) : client_(client) {}

    nlohmann::json get_track(const std::string& track_id,
                             std::optional<std::string> market = std::nullopt);
    nlohmann::json get_tracks(const std::vector<std::string>& track_ids,
                              std::optional<std::string> market = std::nullopt);

private:
    SpotifyClient& client_;
};

class SpotifyUsersApi {
public:
    explicit SpotifyUsersApi(SpotifyClient& client) : client_(client) {}

    nlohmann::json get_my_profile();
    // item_type: artists or tracks; time_range: short_term, medium_term, long_term
    nlohmann::json get_my_top_items(const std::string& item_type,
                                    const std::string& time_range = "medium_term",
                                    long limit = 20, long offset = 0);

private:
    SpotifyClient& client_;
};

// Spotify Web API client
class SpotifyClient : public OAuth2Client {
public:
    SpotifyClient(OAuth2Settings settings, const ClientEntry& config_entry,
                  HttpClient& http, ClientResources resources,
                  AuthorizationPrompt prompt = {});

    // Endpoint groups, constructed in declaration order
    SpotifySearchApi search;
    SpotifyTracksApi tracks;
    SpotifyUsersApi users;

    // Fills in the Spotify URLs and env prefix on top of caller settings
    static OAuth2Settings defaults(OAuth2Settings settings = {});

protected:
    std::string fetch_user_identifier() override;

private:
    friend class SpotifySearchApi;
    friend class SpotifyTracksApi;
    friend class SpotifyUsersApi;

    void require_user_flow(const std::string& method) const;
};

} // namespace minim
