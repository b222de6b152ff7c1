//
// Created by gregorian-rayne on 2/10/26.
//

#include "cca/storage/store_url.hpp"
#include "cca/utils/string_utils.hpp"

namespace cca::storage {

    namespace {
        constexpr std::string_view SQLITE_PREFIX = "sqlite://";
        constexpr std::string_view SQLITE_MEMORY = "sqlite::memory:";
        constexpr std::string_view BARE_MEMORY = ":memory:";
    }

    Result<StoreLocation> parse_store_url(const std::string_view url) {
        const auto trimmed = string_utils::trim(url);
        if (trimmed.empty()) {
            return Result<StoreLocation>::failure(
                Error::config_error("Store URL is empty"));
        }

        StoreLocation location;
        location.url = std::string(trimmed);

        if (trimmed == SQLITE_MEMORY || trimmed == BARE_MEMORY) {
            location.kind = StoreKind::SQLiteMemory;
            location.path = std::string(BARE_MEMORY);
            return Result<StoreLocation>::success(std::move(location));
        }

        if (string_utils::starts_with(trimmed, SQLITE_PREFIX)) {
            // sqlite:///abs keeps its leading slash, sqlite://rel is relative
            const auto path = trimmed.substr(SQLITE_PREFIX.size());
            if (path.empty() || path == "/") {
                return Result<StoreLocation>::failure(
                    Error::config_error("SQLite URL has no database path", location.url));
            }
            location.kind = StoreKind::SQLiteFile;
            location.path = std::string(path);
            return Result<StoreLocation>::success(std::move(location));
        }

        if (const auto scheme_end = trimmed.find("://"); scheme_end != std::string_view::npos) {
            return Result<StoreLocation>::failure(Error::config_error(
                "Unsupported store URL scheme '" + std::string(trimmed.substr(0, scheme_end)) + "'",
                location.url));
        }

        location.kind = StoreKind::SQLiteFile;
        location.path = location.url;
        return Result<StoreLocation>::success(std::move(location));
    }

}  // namespace cca::storage
