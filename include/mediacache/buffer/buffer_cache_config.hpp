/**
 * @file buffer_cache_config.hpp
 * @brief Budgets and page sizes of the buffer cache
 */

#pragma once

#include <mediacache/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace mediacache::buffer {

/**
 * @brief Buffer cache configuration
 *
 * Every field can be overridden from the environment, see
 * from_environment().
 */
struct buffer_cache_config {
    /// Maximum number of buffers kept (MEDIACACHE_MAX_BUFFERS)
    size_t max_buffers{10};

    /// Byte budget over all buffers in megabytes (MEDIACACHE_MAX_SIZE_MB)
    size_t max_total_size_mb{500};

    /// Page size used when a caller asks for 0 rows (MEDIACACHE_PAGE_SIZE)
    size_t default_page_size{50};

    /// Upper clamp on requested page sizes (MEDIACACHE_MAX_PAGE_SIZE)
    size_t max_page_size{1000};

    /// Bytes charged per buffered row in the size estimate (MEDIACACHE_ROW_BYTES)
    size_t estimated_row_bytes{500};

    /**
     * @brief Byte budget in bytes
     */
    [[nodiscard]] auto max_total_bytes() const noexcept -> int64_t {
        return static_cast<int64_t>(max_total_size_mb) * 1024 * 1024;
    }

    /**
     * @brief Check that budgets and page sizes are usable
     *
     * @return VoidResult with invalid_configuration describing the first
     *         offending field
     */
    [[nodiscard]] auto validate() const -> VoidResult;

    /**
     * @brief Defaults overridden by MEDIACACHE_* environment variables
     *
     * Unset variables keep their default. A variable that is set but not a
     * positive integer is an error.
     */
    [[nodiscard]] static auto from_environment() -> Result<buffer_cache_config>;

    /**
     * @brief Same as from_environment() with a custom variable prefix
     */
    [[nodiscard]] static auto from_environment(const std::string& prefix)
        -> Result<buffer_cache_config>;
};

}  // namespace mediacache::buffer
