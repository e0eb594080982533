#include "qobuz_client.hpp"
#include "../../cache/ttl_policy.hpp"
#include "../../util.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace minim {

using json = nlohmann::json;

// Qobuz IDs are positive decimal integers
static void validate_qobuz_id(const std::string& id) {
    bool digits = !id.empty() && std::all_of(id.begin(), id.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
    // 18 digits always fit a signed 64-bit integer
    if (!digits || id.size() > 18) {
        throw std::invalid_argument("Invalid Qobuz ID '" + id + "'.");
    }
}

static void validate_qobuz_ids(const std::vector<std::string>& ids, size_t max) {
    if (ids.empty()) throw std::invalid_argument("At least one Qobuz ID is required.");
    if (ids.size() > max) {
        throw std::invalid_argument("At most " + std::to_string(max) + " Qobuz IDs are allowed.");
    }
    for (const auto& id : ids) validate_qobuz_id(id);
}

// ── Catalog ─────────────────────────────────────────────────────

json QobuzCatalogApi::search(const std::string& query, std::optional<std::string> type,
                             long limit, long offset) {
    if (trim(query).empty()) throw std::invalid_argument("Search query must not be empty.");
    if (type) require_one_of("search type", *type, {"albums", "artists", "playlists", "tracks"});
    require_range("limit", limit, 1, 500);
    require_range("offset", offset, 0, 10000);

    CallArgs args;
    args.add(query).set("type", type).set("limit", limit).set("offset", offset);
    return client_.cached("catalog.search", kTierSearch, args, [&]() {
        ApiRequest req;
        req.endpoint = "catalog/search";
        req.params = {{"query", query},
                      {"limit", std::to_string(limit)},
                      {"offset", std::to_string(offset)}};
        if (type) req.params.emplace_back("type", *type);
        return client_.request_json(req);
    });
}

json QobuzCatalogApi::count_matches(const std::string& query) {
    if (trim(query).empty()) throw std::invalid_argument("Search query must not be empty.");

    CallArgs args;
    args.add(query);
    return client_.cached("catalog.count_matches", kTierSearch, args, [&]() {
        ApiRequest req;
        req.endpoint = "catalog/count";
        req.params = {{"query", query}};
        return client_.request_json(req);
    });
}

json QobuzCatalogApi::get_featured_albums(const std::string& type,
                                          std::optional<std::string> genre_id,
                                          long limit, long offset) {
    require_one_of("featured type", type,
                   {"best-sellers", "editor-picks", "ideal-discography", "most-featured",
                    "most-streamed", "new-releases", "new-releases-full", "press-awards",
                    "recent-releases", "qobuzissims"});
    if (genre_id) validate_qobuz_id(*genre_id);
    require_range("limit", limit, 1, 500);
    require_range("offset", offset, 0, 10000);

    CallArgs args;
    args.add(type).set("genre_id", genre_id).set("limit", limit).set("offset", offset);
    return client_.cached("catalog.get_featured_albums", kTierFeatured, args, [&]() {
        ApiRequest req;
        req.endpoint = "album/getFeatured";
        req.params = {{"type", type},
                      {"limit", std::to_string(limit)},
                      {"offset", std::to_string(offset)}};
        if (genre_id) req.params.emplace_back("genre_id", *genre_id);
        return client_.request_json(req);
    });
}

// ── Tracks ──────────────────────────────────────────────────────

json QobuzTracksApi::get_track(const std::string& track_id) {
    validate_qobuz_id(track_id);

    CallArgs args;
    args.add(track_id);
    return client_.cached("tracks.get_track", kTierPopularity, args, [&]() {
        ApiRequest req;
        req.endpoint = "track/get";
        req.params = {{"track_id", track_id}};
        return client_.request_json(req);
    });
}

json QobuzTracksApi::get_tracks(const std::vector<std::string>& track_ids) {
    validate_qobuz_ids(track_ids, 50);

    CallArgs args;
    args.add(track_ids);
    return client_.cached("tracks.get_tracks", kTierPopularity, args, [&]() {
        json ids = json::array();
        for (const auto& id : track_ids) ids.push_back(std::stoll(id));

        ApiRequest req;
        req.method = "POST";
        req.endpoint = "track/getList";
        req.body = json{{"tracks_id", ids}}.dump();
        req.headers = {{"Content-Type", "application/json"}};
        return client_.request_json(req);
    });
}

json QobuzTracksApi::get_playback_info(const std::string& track_id, long format_id,
                                       const std::string& intent) {
    client_.require_authentication("tracks.get_playback_info");
    validate_qobuz_id(track_id);
    if (format_id != 5 && format_id != 6 && format_id != 7 && format_id != 27) {
        throw std::invalid_argument("Invalid format ID " + std::to_string(format_id) +
                                    ". Valid values: 5, 6, 7, 27.");
    }
    require_one_of("intent", intent, {"stream", "import", "download"});

    CallArgs args;
    args.add(track_id).set("format_id", format_id).set("intent", intent);
    return client_.cached("tracks.get_playback_info", kTierStatic, args, [&]() {
        QueryParams params = {{"track_id", track_id},
                              {"format_id", std::to_string(format_id)},
                              {"intent", intent}};
        ApiRequest req;
        req.endpoint = "track/getFileUrl";
        req.params = params;
        client_.sign(req, params);
        return client_.request_json(req);
    });
}

// ── Users ───────────────────────────────────────────────────────

json QobuzUsersApi::login(const std::string& username, const std::string& password_md5) {
    if (username.empty() || password_md5.empty()) {
        throw std::invalid_argument("Qobuz login needs a username and a password hash.");
    }

    ApiRequest req;
    req.method = "POST";
    req.endpoint = "user/login";
    req.params = {{"username", username}, {"password", password_md5}};
    return client_.request_json(req);
}

json QobuzUsersApi::get_my_profile() {
    client_.require_authentication("users.get_my_profile");
    return client_.cached("users.get_my_profile", kTierUser, CallArgs{}, [&]() {
        ApiRequest req;
        req.endpoint = "user/get";
        return client_.request_json(req);
    });
}

json QobuzUsersApi::get_my_last_updates() {
    client_.require_authentication("users.get_my_last_updates");
    return client_.cached("users.get_my_last_updates", kTierUser, CallArgs{}, [&]() {
        ApiRequest req;
        req.endpoint = "user/lastUpdate";
        return client_.request_json(req);
    });
}

// ── Favorites ───────────────────────────────────────────────────

json QobuzFavoritesApi::modify(const std::string& endpoint,
                               const std::vector<std::string>& album_ids,
                               const std::vector<std::string>& artist_ids,
                               const std::vector<std::string>& track_ids) {
    client_.require_authentication(endpoint == "favorite/create" ? "favorites.save"
                                                                 : "favorites.remove_saved");
    if (album_ids.empty() && artist_ids.empty() && track_ids.empty()) {
        throw std::invalid_argument("At least one album, artist or track ID is required.");
    }

    QueryParams form;
    if (!album_ids.empty()) {
        validate_qobuz_ids(album_ids, 500);
        form.emplace_back("album_ids", join(album_ids, ","));
    }
    if (!artist_ids.empty()) {
        validate_qobuz_ids(artist_ids, 500);
        form.emplace_back("artist_ids", join(artist_ids, ","));
    }
    if (!track_ids.empty()) {
        validate_qobuz_ids(track_ids, 500);
        form.emplace_back("track_ids", join(track_ids, ","));
    }

    ApiRequest req;
    req.method = "POST";
    req.endpoint = endpoint;
    req.body = form_encode(form);
    req.headers = {{"Content-Type", "application/x-www-form-urlencoded"}};
    json result = client_.request_json(req);

    client_.clear_cache({"favorites.get_my_saved", "favorites.get_my_saved_ids"});
    return result;
}

json QobuzFavoritesApi::save(const std::vector<std::string>& album_ids,
                             const std::vector<std::string>& artist_ids,
                             const std::vector<std::string>& track_ids) {
    return modify("favorite/create", album_ids, artist_ids, track_ids);
}

json QobuzFavoritesApi::remove_saved(const std::vector<std::string>& album_ids,
                                     const std::vector<std::string>& artist_ids,
                                     const std::vector<std::string>& track_ids) {
    return modify("favorite/delete", album_ids, artist_ids, track_ids);
}

json QobuzFavoritesApi::get_my_saved(std::optional<std::string> type, long limit, long offset) {
    client_.require_authentication("favorites.get_my_saved");
    if (type) require_one_of("favorite type", *type, {"albums", "artists", "tracks"});
    require_range("limit", limit, 1, 500);
    require_range("offset", offset, 0, 10000);

    CallArgs args;
    args.set("type", type).set("limit", limit).set("offset", offset);
    return client_.cached("favorites.get_my_saved", kTierUser, args, [&]() {
        ApiRequest req;
        req.endpoint = "favorite/getUserFavorites";
        req.params = {{"limit", std::to_string(limit)}, {"offset", std::to_string(offset)}};
        if (type) req.params.emplace_back("type", *type);
        return client_.request_json(req);
    });
}

json QobuzFavoritesApi::get_my_saved_ids() {
    client_.require_authentication("favorites.get_my_saved_ids");
    return client_.cached("favorites.get_my_saved_ids", kTierUser, CallArgs{}, [&]() {
        ApiRequest req;
        req.endpoint = "favorite/getUserFavoriteIds";
        return client_.request_json(req);
    });
}

} // namespace minim
