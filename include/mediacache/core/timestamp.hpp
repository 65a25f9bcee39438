/**
 * @file timestamp.hpp
 * @brief Timestamp conversions shared by the cache tables
 *
 * All cache tables store time as INTEGER microseconds since the Unix epoch
 * (UTC). Filter date bounds arrive as ISO-8601 text and are converted here.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mediacache {

using time_point = std::chrono::system_clock::time_point;

/**
 * @brief Convert a time point to microseconds since the epoch
 */
[[nodiscard]] inline auto to_epoch_micros(time_point tp) noexcept -> int64_t {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               tp.time_since_epoch())
        .count();
}

/**
 * @brief Convert microseconds since the epoch to a time point
 */
[[nodiscard]] inline auto from_epoch_micros(int64_t micros) noexcept
    -> time_point {
    return time_point{std::chrono::duration_cast<time_point::duration>(
        std::chrono::microseconds(micros))};
}

/**
 * @brief Parse an ISO-8601 date or date-time
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" and "YYYY-MM-DD HH:MM:SS",
 * optionally followed by fractional seconds and a trailing 'Z'. Values are
 * interpreted as UTC.
 *
 * @param text The text to parse
 * @return The parsed time point, or std::nullopt if the text is malformed
 */
[[nodiscard]] auto parse_iso8601(std::string_view text)
    -> std::optional<time_point>;

/**
 * @brief Check whether a date string carries only a date (no time part)
 */
[[nodiscard]] auto is_date_only(std::string_view text) noexcept -> bool;

/**
 * @brief Format a time point as "YYYY-MM-DDTHH:MM:SS.ffffffZ"
 */
[[nodiscard]] auto format_iso8601(time_point tp) -> std::string;

}  // namespace mediacache
