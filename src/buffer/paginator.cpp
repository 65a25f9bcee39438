/**
 * @file paginator.cpp
 * @brief Implementation of keyset pagination
 */

#include <mediacache/buffer/paginator.hpp>

#include <mediacache/buffer/buffer_tables.hpp>
#include <mediacache/buffer/filter_canonicalizer.hpp>
#include <mediacache/compat/format.hpp>
#include <mediacache/core/timestamp.hpp>
#include <mediacache/integration/logger_adapter.hpp>
#include <mediacache/storage/cache_database.hpp>

#include <sqlite3.h>

#include <algorithm>

namespace mediacache::buffer {

using integration::logger_adapter;

namespace {

constexpr const char* kModule = "paginator";

auto get_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text =
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

auto get_optional_int(sqlite3_stmt* stmt, int col) -> std::optional<int> {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int(stmt, col);
}

auto parse_buffer_row(sqlite3_stmt* stmt) -> buffer_row {
    buffer_row row;
    int col = 0;
    row.id = sqlite3_column_int64(stmt, col++);
    row.media_file_id = sqlite3_column_int64(stmt, col++);
    row.filename = get_text(stmt, col++);
    row.file_path = get_text(stmt, col++);
    row.file_size = sqlite3_column_int64(stmt, col++);
    row.file_type = get_text(stmt, col++);
    row.extension = get_text(stmt, col++);
    row.score = sqlite3_column_int(stmt, col++);
    row.width = get_optional_int(stmt, col++);
    row.height = get_optional_int(stmt, col++);
    row.created_at = from_epoch_micros(sqlite3_column_int64(stmt, col++));
    if (sqlite3_column_type(stmt, col) != SQLITE_NULL) {
        row.original_created_at = from_epoch_micros(sqlite3_column_int64(stmt, col));
    }
    ++col;
    row.nsfw = sqlite3_column_int(stmt, col++) != 0;
    if (sqlite3_column_type(stmt, col) != SQLITE_NULL) {
        row.nsfw_score = sqlite3_column_double(stmt, col);
    }
    return row;
}

}  // namespace

paginator::paginator(storage::cache_database& db, buffer_registry& registry,
                     const buffer_cache_config& config)
    : db_(db), registry_(registry), config_(config) {}

auto paginator::effective_limit(size_t requested) const noexcept -> size_t {
    if (requested == 0) {
        requested = config_.default_page_size;
    }
    return std::clamp<size_t>(requested, 1, config_.max_page_size);
}

auto paginator::page(std::string_view fingerprint,
                     const std::optional<page_cursor>& cursor, size_t limit)
    -> Result<buffer_page> {
    if (!is_valid_fingerprint(fingerprint)) {
        return cache_error<buffer_page>(
            error_codes::invalid_fingerprint,
            compat::format("'{}' is not a buffer fingerprint", fingerprint),
            kModule);
    }

    auto found = registry_.lookup(fingerprint);
    if (found.is_err()) {
        return Result<buffer_page>::err(found.error());
    }
    if (!found.value()) {
        return cache_error<buffer_page>(
            error_codes::buffer_not_found,
            compat::format("No buffer registered for {}", fingerprint), kModule);
    }

    const auto& table = found.value()->table_name;
    if (!is_buffer_table_name(table)) {
        return cache_error<buffer_page>(
            error_codes::storage_failure,
            compat::format("Registry holds an invalid table name '{}'", table),
            kModule);
    }

    auto page_size = effective_limit(limit);

    std::string sql = compat::format(R"(
        SELECT id, media_file_id, filename, file_path, file_size, file_type,
               extension, score, width, height, created_at,
               original_created_at, nsfw, nsfw_score
        FROM {}
    )", table);

    if (cursor) {
        sql += R"(
        WHERE COALESCE(original_created_at, created_at) < ?1
           OR (COALESCE(original_created_at, created_at) = ?1 AND id < ?2)
        )";
    }
    sql += R"(
        ORDER BY COALESCE(original_created_at, created_at) DESC, id DESC
        LIMIT ?3
    )";

    auto* db = db_.native_handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return cache_error<buffer_page>(
            error_codes::storage_failure,
            compat::format("Failed to prepare page query: {}", sqlite3_errmsg(db)),
            kModule);
    }

    if (cursor) {
        sqlite3_bind_int64(stmt, 1, cursor->ordering_value);
        sqlite3_bind_int64(stmt, 2, cursor->row_id);
    }
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(page_size));

    buffer_page result;
    result.rows.reserve(page_size);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        result.rows.push_back(parse_buffer_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return cache_error<buffer_page>(
            error_codes::storage_failure,
            compat::format("Failed to read page: {}", sqlite3_errmsg(db)), kModule);
    }

    if (result.rows.size() == page_size) {
        const auto& last = result.rows.back();
        result.next_cursor =
            page_cursor{to_epoch_micros(last.ordering_time()), last.id};
    }

    logger_adapter::debug("Page of {} rows from buffer {}", result.rows.size(),
                          fingerprint);
    return ok(std::move(result));
}

}  // namespace mediacache::buffer
