#include "token_store.hpp"
#include "json_token_store.hpp"
#include "sqlite_token_store.hpp"
#include "../config.hpp"
#include <stdexcept>

namespace minim {

std::shared_ptr<TokenStore> create_token_store(const Config& config) {
    const std::string& backend = config.tokens.backend;
    std::string path = config.token_store_path();

    if (backend == "sqlite") {
        return std::make_shared<SqliteTokenStore>(path, config.tokens.busy_timeout_ms);
    }
    if (backend == "json") {
        return std::make_shared<JsonTokenStore>(path, config.tokens.busy_timeout_ms);
    }
    throw std::invalid_argument("Unknown token store backend '" + backend + "'");
}

} // namespace minim
