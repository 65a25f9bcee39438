/**
 * @file buffer_tables.hpp
 * @brief Naming and DDL helpers for per-buffer tables
 *
 * Buffer contents live in one table per fingerprint:
 *   buffer_items_<fingerprint>                    published
 *   buffer_items_<fingerprint>_new_<generation>   staging, private to a build
 *
 * Identifiers are interpolated into SQL, so they are only ever composed from
 * validated lowercase hex and checked again before use.
 */

#pragma once

#include <mediacache/core/result.hpp>

#include <string>
#include <string_view>

namespace mediacache::storage {
class cache_database;
}

namespace mediacache::buffer {

inline constexpr std::string_view buffer_table_prefix = "buffer_items_";
inline constexpr std::string_view staging_marker = "_new_";

/**
 * @brief Published table name for a fingerprint
 */
[[nodiscard]] auto buffer_table_name(std::string_view fingerprint) -> std::string;

/**
 * @brief Staging table name for one build of a fingerprint
 */
[[nodiscard]] auto staging_table_name(std::string_view fingerprint,
                                      std::string_view generation) -> std::string;

/**
 * @brief Create a new generation token (lowercase hex, unique per build)
 */
[[nodiscard]] auto make_generation_token() -> std::string;

/**
 * @brief True for names of the form buffer_items_<64 hex>[_new_<hex>]
 */
[[nodiscard]] auto is_buffer_table_name(std::string_view name) noexcept -> bool;

/**
 * @brief True for staging table names
 */
[[nodiscard]] auto is_staging_table_name(std::string_view name) noexcept -> bool;

/**
 * @brief Create an empty buffer table with the row projection columns
 */
[[nodiscard]] auto create_buffer_table(storage::cache_database& db,
                                       std::string_view table_name) -> VoidResult;

/**
 * @brief Create the pagination and sort indexes of a loaded buffer table
 */
[[nodiscard]] auto create_buffer_indexes(storage::cache_database& db,
                                         std::string_view table_name) -> VoidResult;

/**
 * @brief DROP TABLE IF EXISTS for a buffer or staging table
 *
 * Rejects names that are not buffer table names.
 */
[[nodiscard]] auto drop_buffer_table(storage::cache_database& db,
                                     std::string_view table_name) -> VoidResult;

}  // namespace mediacache::buffer
