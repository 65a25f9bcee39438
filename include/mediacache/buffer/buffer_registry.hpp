/**
 * @file buffer_registry.hpp
 * @brief Durable catalog of published buffers
 *
 * This file provides the buffer_registry class which stores one row per
 * published buffer in the buffer_registry table: backing table, build
 * generation, size figures, timestamps and the canonical filter.
 */

#pragma once

#include "buffer_record.hpp"

#include <mediacache/core/result.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace mediacache::buffer {

/**
 * @brief Repository for buffer registry rows
 *
 * Access times are kept strictly increasing: every bump writes
 * max(now, current maximum + 1 microsecond), so two buffers never share a
 * recency rank even when touched within the same clock tick.
 *
 * The registry never touches backing tables; dropping them is the
 * caller's job.
 *
 * Thread Safety:
 * - This class is NOT thread-safe. External synchronization is required
 *   for concurrent access.
 *
 * @example
 * @code
 * buffer_registry registry(db->native_handle());
 *
 * auto found = registry.lookup(fingerprint);
 * if (found.is_ok() && found.value()) {
 *     auto table = found.value()->table_name;
 * }
 * @endcode
 */
class buffer_registry {
public:
    explicit buffer_registry(sqlite3* db);
    ~buffer_registry();

    buffer_registry(const buffer_registry&) = delete;
    auto operator=(const buffer_registry&) -> buffer_registry& = delete;
    buffer_registry(buffer_registry&&) noexcept;
    auto operator=(buffer_registry&&) noexcept -> buffer_registry&;

    // ========================================================================
    // Lookup
    // ========================================================================

    /**
     * @brief Find a buffer and mark it as most recently used
     *
     * @param fingerprint Buffer fingerprint
     * @return Result containing the record (with the bumped access time),
     *         or std::nullopt if no buffer is registered
     */
    [[nodiscard]] auto lookup(std::string_view fingerprint)
        -> Result<std::optional<buffer_record>>;

    /**
     * @brief Find a buffer without touching its access time
     */
    [[nodiscard]] auto peek(std::string_view fingerprint) const
        -> Result<std::optional<buffer_record>>;

    /**
     * @brief All records, least recently accessed first
     */
    [[nodiscard]] auto list_all() const -> Result<std::vector<buffer_record>>;

    /**
     * @brief Count and totals over all records
     */
    [[nodiscard]] auto aggregate() const -> Result<buffer_aggregate>;

    // ========================================================================
    // Modification
    // ========================================================================

    /**
     * @brief Insert or replace the record for a fingerprint
     *
     * The stored last_accessed_at is the next access stamp, not the value
     * carried by the record. created_at is taken from the record.
     *
     * @param record The record to store
     * @return VoidResult indicating success or error
     */
    [[nodiscard]] auto register_buffer(const buffer_record& record) -> VoidResult;

    /**
     * @brief Delete the record for a fingerprint
     *
     * Removing an unknown fingerprint is not an error.
     */
    [[nodiscard]] auto remove(std::string_view fingerprint) -> VoidResult;

    /**
     * @brief Delete every record
     *
     * @return Result containing the number of removed records
     */
    [[nodiscard]] auto remove_all() -> Result<size_t>;

    [[nodiscard]] auto is_valid() const noexcept -> bool;

private:
    sqlite3* db_{nullptr};
};

}  // namespace mediacache::buffer
