/**
 * @file paginator.hpp
 * @brief Keyset pagination over a published buffer
 */

#pragma once

#include "buffer_cache_config.hpp"
#include "buffer_record.hpp"
#include "buffer_registry.hpp"

#include <mediacache/core/result.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

namespace mediacache::storage {
class cache_database;
}

namespace mediacache::buffer {

/**
 * @brief Reads pages from buffer tables
 *
 * Rows are returned in COALESCE(original_created_at, created_at) DESC,
 * id DESC order. A cursor (v, id) continues strictly after the row it
 * names, so pages never overlap. A page carries a next cursor only when
 * it is full; an empty page is the authoritative end.
 *
 * Every page fetch counts as an access of the buffer.
 */
class paginator {
public:
    paginator(storage::cache_database& db, buffer_registry& registry,
              const buffer_cache_config& config);

    /**
     * @brief Fetch one page
     *
     * @param fingerprint Buffer to read
     * @param cursor Position after the last row of the previous page, or
     *        std::nullopt for the first page
     * @param limit Rows requested; 0 means the default page size, larger
     *        values are clamped to max_page_size
     * @return Result containing the page, buffer_not_found for unknown
     *         fingerprints, or invalid_fingerprint
     */
    [[nodiscard]] auto page(std::string_view fingerprint,
                            const std::optional<page_cursor>& cursor,
                            size_t limit) -> Result<buffer_page>;

    /**
     * @brief Effective page size for a requested limit
     */
    [[nodiscard]] auto effective_limit(size_t requested) const noexcept -> size_t;

private:
    storage::cache_database& db_;
    buffer_registry& registry_;
    const buffer_cache_config& config_;
};

}  // namespace mediacache::buffer
