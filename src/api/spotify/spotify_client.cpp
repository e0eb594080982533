#include "spotify_client.hpp"
#include "../../cache/ttl_policy.hpp"
#include "../../util.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace minim {

using json = nlohmann::json;

// Spotify IDs are 22-character base62 strings
static void validate_spotify_id(const std::string& id) {
    bool ok = id.size() == 22 && std::all_of(id.begin(), id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c));
    });
    if (!ok) throw std::invalid_argument("Invalid Spotify ID '" + id + "'.");
}

static void validate_market(const std::optional<std::string>& market) {
    if (!market) return;
    bool ok = market->size() == 2 && std::all_of(market->begin(), market->end(), [](char c) {
        return std::isupper(static_cast<unsigned char>(c));
    });
    if (!ok) throw std::invalid_argument("Invalid market '" + *market + "'.");
}

OAuth2Settings SpotifyClient::defaults(OAuth2Settings settings) {
    settings.client_name = "spotify";
    settings.env_prefix = kSpotifyEnvPrefix;
    if (settings.base_url.empty()) settings.base_url = kSpotifyBaseUrl;
    if (settings.authorize_url.empty()) settings.authorize_url = kSpotifyAuthorizeUrl;
    if (settings.token_url.empty()) settings.token_url = kSpotifyTokenUrl;
    return settings;
}

SpotifyClient::SpotifyClient(OAuth2Settings settings, const ClientEntry& config_entry,
                             HttpClient& http, ClientResources resources,
                             AuthorizationPrompt prompt)
    : OAuth2Client(defaults(std::move(settings)), config_entry, http,
                   std::move(resources), std::move(prompt)),
      search(*this),
      tracks(*this),
      users(*this) {
    authenticate();
}

std::string SpotifyClient::fetch_user_identifier() {
    ApiRequest req;
    req.endpoint = "me";
    json profile = request_json(req);
    if (!profile.is_object() || !profile.contains("id") || !profile["id"].is_string()) {
        return "";
    }
    return profile["id"].get<std::string>();
}

void SpotifyClient::require_user_flow(const std::string& method) const {
    if (flow() == kFlowClientCredentials) {
        throw std::runtime_error("SpotifyClient::" + method +
                                 "() requires user authentication.");
    }
}

// ── Search ──────────────────────────────────────────────────────

json SpotifySearchApi::search(const std::string& query,
                              const std::vector<std::string>& types,
                              std::optional<std::string> market,
                              long limit, long offset) {
    if (trim(query).empty()) throw std::invalid_argument("Search query must not be empty.");
    if (types.empty()) throw std::invalid_argument("At least one search type is required.");
    for (const auto& t : types) {
        require_one_of("search type", t,
                       {"album", "artist", "playlist", "track", "show", "episode", "audiobook"});
    }
    validate_market(market);
    require_range("limit", limit, 1, 50);
    require_range("offset", offset, 0, 1000);

    CallArgs args;
    args.add(query).add(types).set("market", market).set("limit", limit).set("offset", offset);
    return client_.cached("search.search", kTierSearch, args, [&]() {
        ApiRequest req;
        req.endpoint = "search";
        req.params = {{"q", query},
                      {"type", join(types, ",")},
                      {"limit", std::to_string(limit)},
                      {"offset", std::to_string(offset)}};
        if (market) req.params.emplace_back("market", *market);
        return client_.request_json(req);
    });
}

// ── Tracks ──────────────────────────────────────────────────────

json SpotifyTracksApi::get_track(const std::string& track_id, std::optional<std::string> market) {
    validate_spotify_id(track_id);
    validate_market(market);

    CallArgs args;
    args.add(track_id).set("market", market);
    return client_.cached("tracks.get_track", kTierCatalog, args, [&]() {
        ApiRequest req;
        req.endpoint = "tracks/" + track_id;
        if (market) req.params.emplace_back("market", *market);
        return client_.request_json(req);
    });
}

json SpotifyTracksApi::get_tracks(const std::vector<std::string>& track_ids,
                                  std::optional<std::string> market) {
    if (track_ids.empty() || track_ids.size() > 50) {
        throw std::invalid_argument("Between 1 and 50 Spotify track IDs are required.");
    }
    for (const auto& id : track_ids) validate_spotify_id(id);
    validate_market(market);

    CallArgs args;
    args.add(track_ids).set("market", market);
    return client_.cached("tracks.get_tracks", kTierCatalog, args, [&]() {
        ApiRequest req;
        req.endpoint = "tracks";
        req.params = {{"ids", join(track_ids, ",")}};
        if (market) req.params.emplace_back("market", *market);
        return client_.request_json(req);
    });
}

// ── Users ───────────────────────────────────────────────────────

json SpotifyUsersApi::get_my_profile() {
    client_.require_user_flow("users.get_my_profile");
    return client_.cached("users.get_my_profile", kTierUser, CallArgs{}, [&]() {
        ApiRequest req;
        req.endpoint = "me";
        return client_.request_json(req);
    });
}

json SpotifyUsersApi::get_my_top_items(const std::string& item_type,
                                       const std::string& time_range,
                                       long limit, long offset) {
    client_.require_user_flow("users.get_my_top_items");
    require_one_of("item type", item_type, {"artists", "tracks"});
    require_one_of("time range", time_range, {"short_term", "medium_term", "long_term"});
    require_range("limit", limit, 1, 50);
    require_range("offset", offset, 0, 10000);

    CallArgs args;
    args.add(item_type).set("time_range", time_range).set("limit", limit).set("offset", offset);
    return client_.cached("users.get_my_top_items", kTierTop, args, [&]() {
        ApiRequest req;
        req.endpoint = "me/top/" + item_type;
        req.params = {{"time_range", time_range},
                      {"limit", std::to_string(limit)},
                      {"offset", std::to_string(offset)}};
        return client_.request_json(req);
    });
}

} // namespace minim
