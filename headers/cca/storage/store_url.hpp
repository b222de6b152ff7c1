//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CCA_STORE_URL_HPP
#define CCA_STORE_URL_HPP

#include "cca/result.hpp"

#include <string>
#include <string_view>

namespace cca::storage {

    enum class StoreKind {
        SQLiteFile,
        SQLiteMemory
    };

    /**
     * Where a store lives, resolved from its URL.
     */
    struct StoreLocation {
        StoreKind kind = StoreKind::SQLiteFile;
        std::string path;  // Filesystem path, or ":memory:"
        std::string url;   // The URL as configured
    };

    /**
     * Resolves a store URL.
     *
     * Accepted forms:
     *   sqlite:///absolute/path.db  -> /absolute/path.db
     *   sqlite://relative.db        -> relative.db
     *   sqlite::memory: or :memory: -> private in-memory database
     *   a bare filesystem path
     *
     * Any other "<scheme>://" URL is a ConfigError, as is an empty URL.
     */
    [[nodiscard]] Result<StoreLocation> parse_store_url(std::string_view url);

}  // namespace cca::storage

#endif //CCA_STORE_URL_HPP
