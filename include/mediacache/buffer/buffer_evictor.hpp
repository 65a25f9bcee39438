/**
 * @file buffer_evictor.hpp
 * @brief Least-recently-used eviction under count and byte budgets
 */

#pragma once

#include "buffer_cache_config.hpp"
#include "buffer_record.hpp"
#include "buffer_registry.hpp"

#include <mediacache/core/result.hpp>

#include <string_view>

namespace mediacache::storage {
class cache_database;
}

namespace mediacache::buffer {

/**
 * @brief Drop a buffer table and delete its registry row atomically
 *
 * Both statements run in one transaction; on any failure it is rolled
 * back and neither the table nor the row changes. A missing table or
 * registry row is not an error.
 *
 * @param db Cache database owning the table
 * @param registry Registry on the same connection
 * @param table_name Backing table of the buffer
 * @param fingerprint Registry key of the buffer
 * @return VoidResult indicating success or the failing storage error
 */
[[nodiscard]] auto remove_buffer(storage::cache_database& db,
                                 buffer_registry& registry,
                                 std::string_view table_name,
                                 std::string_view fingerprint) -> VoidResult;

/**
 * @brief Removes least recently accessed buffers until the budgets hold
 *
 * Victims are chosen purely by access recency; sizes only decide whether
 * the budgets are met. The most recently used buffer is never evicted, so
 * a single buffer larger than the byte budget survives on its own.
 *
 * A victim's backing table and its registry row are removed in one
 * transaction (see remove_buffer()).
 */
class buffer_evictor {
public:
    buffer_evictor(storage::cache_database& db, buffer_registry& registry,
                   const buffer_cache_config& config);

    /**
     * @brief Run one eviction pass
     *
     * Per-victim failures are logged and counted; the pass continues with
     * the remaining victims.
     *
     * @return Result containing the report, or storage_failure when the
     *         registry itself cannot be read
     */
    [[nodiscard]] auto evict() -> Result<eviction_report>;

    /**
     * @brief Check whether the registry totals fit the budgets
     */
    [[nodiscard]] auto within_budget(const buffer_aggregate& totals) const noexcept
        -> bool;

private:
    storage::cache_database& db_;
    buffer_registry& registry_;
    const buffer_cache_config& config_;
};

}  // namespace mediacache::buffer
