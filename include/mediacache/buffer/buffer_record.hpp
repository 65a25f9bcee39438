/**
 * @file buffer_record.hpp
 * @brief Data structures exchanged by the buffer cache components
 *
 * This file provides the registry row (buffer_record), the materialized
 * row projection (buffer_row), the keyset pagination cursor and the small
 * result structures returned by the engine.
 */

#pragma once

#include <mediacache/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediacache::buffer {

/**
 * @brief Registry entry describing one published buffer
 *
 * Maps directly to the buffer_registry table.
 */
struct buffer_record {
    /// Primary key: SHA-256 of the canonical filter (64 hex characters)
    std::string fingerprint;

    /// Name of the backing table (buffer_items_<fingerprint>)
    std::string table_name;

    /// Token of the build that produced the table
    std::string generation;

    /// Number of rows in the buffer
    int64_t item_count{0};

    /// Estimated storage footprint in bytes
    int64_t size_bytes{0};

    /// Publish time
    std::chrono::system_clock::time_point created_at;

    /// Last lookup or page fetch; strictly increasing across the registry
    std::chrono::system_clock::time_point last_accessed_at;

    /// Canonical filter JSON the buffer was built from
    std::string filter_json;

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return !fingerprint.empty() && !table_name.empty();
    }
};

/**
 * @brief One materialized row of a buffer
 */
struct buffer_row {
    /// Row id inside the buffer; follows catalog order starting at 1
    int64_t id{0};

    /// Id of the source catalog record
    int64_t media_file_id{0};

    std::string filename;
    std::string file_path;
    int64_t file_size{0};
    std::string file_type;
    std::string extension;
    int score{0};
    std::optional<int> width;
    std::optional<int> height;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> original_created_at;
    bool nsfw{false};
    std::optional<double> nsfw_score;

    /**
     * @brief Pagination ordering key: original_created_at if set,
     *        otherwise created_at
     */
    [[nodiscard]] auto ordering_time() const noexcept
        -> std::chrono::system_clock::time_point {
        return original_created_at.value_or(created_at);
    }
};

/**
 * @brief Keyset pagination cursor
 *
 * Identifies the last row of a page by its ordering value and row id.
 * Only meaningful for the buffer generation that produced it.
 */
struct page_cursor {
    /// COALESCE(original_created_at, created_at) in epoch microseconds
    int64_t ordering_value{0};

    /// Row id of the last returned row
    int64_t row_id{0};

    /**
     * @brief Encode as a compact transport token ("<ordering>:<row id>")
     */
    [[nodiscard]] auto encode() const -> std::string;

    /**
     * @brief Parse a token produced by encode()
     *
     * @return Result containing the cursor, or invalid_cursor
     */
    [[nodiscard]] static auto decode(std::string_view token)
        -> Result<page_cursor>;

    auto operator==(const page_cursor&) const -> bool = default;
};

/**
 * @brief One page of a buffer
 */
struct buffer_page {
    std::vector<buffer_row> rows;

    /// Present iff the page holds exactly the requested number of rows
    std::optional<page_cursor> next_cursor;
};

/**
 * @brief Registry totals
 */
struct buffer_aggregate {
    size_t count{0};
    int64_t total_items{0};
    int64_t total_size_bytes{0};
};

/**
 * @brief Cache statistics reported to callers
 */
struct buffer_stats {
    size_t buffer_count{0};
    int64_t total_items{0};
    double total_size_mb{0.0};
};

/**
 * @brief Returned by get_or_create_buffer
 */
struct buffer_handle {
    std::string fingerprint;
    int64_t item_count{0};
};

/**
 * @brief Outcome of one buffer build
 */
struct build_result {
    int64_t item_count{0};
    std::string table_name;
    std::string generation;
};

/**
 * @brief Outcome of one eviction pass
 */
struct eviction_report {
    /// Fingerprints removed, oldest access first
    std::vector<std::string> evicted;

    /// Victims that could not be removed
    size_t failures{0};

    /// One eviction_failure error per victim left in place
    std::vector<error_info> errors;
};

}  // namespace mediacache::buffer
