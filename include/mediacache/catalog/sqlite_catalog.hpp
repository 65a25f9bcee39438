/**
 * @file sqlite_catalog.hpp
 * @brief catalog_query implementation over a SQLite media catalog
 *
 * The catalog lives in two tables:
 * - media_files: one row per media file
 * - media_keywords: (media_file_id, keyword) pairs, keywords lower-cased
 *
 * The tables may share a database with the cache or live in a separate
 * file; the class only borrows the connection.
 */

#pragma once

#include "catalog_query.hpp"

#include <mediacache/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct sqlite3;

namespace mediacache::catalog {

/**
 * @brief SQLite-backed media catalog
 *
 * Matching rules:
 * - keywords: case-insensitive substring match against a file's keywords,
 *   any (OR) or all (AND) depending on match_all
 * - file types: match the extension (without dot) or the file_type column
 * - score and created_at bounds are inclusive
 * - ties in the sort column are broken by id in the same direction
 *
 * Thread Safety: NOT thread-safe; shares the borrowed connection.
 *
 * @example
 * @code
 * sqlite_catalog catalog(db->native_handle());
 * catalog.create_schema();
 *
 * catalog_record rec;
 * rec.filename = "sunset.jpg";
 * rec.file_path = "/photos/sunset.jpg";
 * rec.extension = "jpg";
 * rec.score = 5;
 * auto id = catalog.insert(rec, {"sunset", "beach"});
 * @endcode
 */
class sqlite_catalog final : public catalog_query {
public:
    explicit sqlite_catalog(sqlite3* db);
    ~sqlite_catalog() override;

    sqlite_catalog(const sqlite_catalog&) = delete;
    auto operator=(const sqlite_catalog&) -> sqlite_catalog& = delete;
    sqlite_catalog(sqlite_catalog&&) noexcept;
    auto operator=(sqlite_catalog&&) noexcept -> sqlite_catalog&;

    /**
     * @brief Create the catalog tables if they do not exist
     */
    [[nodiscard]] auto create_schema() -> VoidResult;

    /**
     * @brief Insert a media file and its keywords
     *
     * A record id of 0 lets the database assign one.
     *
     * @param record The media file
     * @param keywords Keywords attached to the file (normalized on insert)
     * @return Result containing the id of the stored record
     */
    [[nodiscard]] auto insert(const catalog_record& record,
                              const std::vector<std::string>& keywords = {})
        -> Result<int64_t>;

    /**
     * @brief Number of media files in the catalog
     */
    [[nodiscard]] auto count() const -> Result<size_t>;

    [[nodiscard]] auto find(const catalog_predicates& predicates)
        -> Result<std::vector<catalog_record>> override;

private:
    sqlite3* db_{nullptr};
};

}  // namespace mediacache::catalog
