/**
 * @file sqlite_catalog.cpp
 * @brief Implementation of the SQLite-backed media catalog
 */

#include <mediacache/catalog/sqlite_catalog.hpp>

#include <mediacache/compat/format.hpp>
#include <mediacache/core/result.hpp>
#include <mediacache/core/timestamp.hpp>

#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <variant>

namespace mediacache::catalog {

using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

constexpr const char* kModule = "sqlite_catalog";

using sql_param = std::variant<int64_t, std::string>;

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

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto sort_column(buffer::sort_field field) -> const char* {
    switch (field) {
        case buffer::sort_field::name:
            return "m.filename";
        case buffer::sort_field::date:
            return "COALESCE(m.original_created_at, m.created_at)";
        case buffer::sort_field::size:
            return "m.file_size";
        case buffer::sort_field::rating:
            return "m.score";
    }
    return "COALESCE(m.original_created_at, m.created_at)";
}

auto parse_record_row(sqlite3_stmt* stmt) -> catalog_record {
    catalog_record record;
    int col = 0;
    record.id = sqlite3_column_int64(stmt, col++);
    record.filename = get_text(stmt, col++);
    record.file_path = get_text(stmt, col++);
    record.file_size = sqlite3_column_int64(stmt, col++);
    record.file_type = get_text(stmt, col++);
    record.extension = get_text(stmt, col++);
    record.score = sqlite3_column_int(stmt, col++);
    record.width = get_optional_int(stmt, col++);
    record.height = get_optional_int(stmt, col++);
    record.created_at = from_epoch_micros(sqlite3_column_int64(stmt, col++));
    if (sqlite3_column_type(stmt, col) != SQLITE_NULL) {
        record.original_created_at =
            from_epoch_micros(sqlite3_column_int64(stmt, col));
    }
    ++col;
    record.nsfw = sqlite3_column_int(stmt, col++) != 0;
    if (sqlite3_column_type(stmt, col) != SQLITE_NULL) {
        record.nsfw_score = sqlite3_column_double(stmt, col);
    }
    return record;
}

}  // namespace

sqlite_catalog::sqlite_catalog(sqlite3* db) : db_(db) {}

sqlite_catalog::~sqlite_catalog() = default;

sqlite_catalog::sqlite_catalog(sqlite_catalog&&) noexcept = default;

auto sqlite_catalog::operator=(sqlite_catalog&&) noexcept
    -> sqlite_catalog& = default;

auto sqlite_catalog::create_schema() -> VoidResult {
    if (!db_) {
        return VoidResult(kcenon::common::error_info{
            error_codes::storage_failure, "Database not initialized", kModule});
    }

    static constexpr const char* sql = R"(
        CREATE TABLE IF NOT EXISTS media_files (
            id                  INTEGER PRIMARY KEY AUTOINCREMENT,
            filename            TEXT NOT NULL,
            file_path           TEXT NOT NULL UNIQUE,
            file_size           INTEGER NOT NULL DEFAULT 0,
            file_type           TEXT NOT NULL DEFAULT '',
            extension           TEXT NOT NULL DEFAULT '',
            score               INTEGER NOT NULL DEFAULT 0,
            width               INTEGER,
            height              INTEGER,
            created_at          INTEGER NOT NULL,
            original_created_at INTEGER,
            nsfw                INTEGER NOT NULL DEFAULT 0,
            nsfw_score          REAL
        );

        CREATE INDEX IF NOT EXISTS idx_media_files_score ON media_files(score);
        CREATE INDEX IF NOT EXISTS idx_media_files_created ON media_files(created_at);

        CREATE TABLE IF NOT EXISTS media_keywords (
            media_file_id INTEGER NOT NULL
                REFERENCES media_files(id) ON DELETE CASCADE,
            keyword       TEXT NOT NULL,
            PRIMARY KEY (media_file_id, keyword)
        );

        CREATE INDEX IF NOT EXISTS idx_media_keywords_keyword
            ON media_keywords(keyword);
    )";

    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        return VoidResult(kcenon::common::error_info{
            error_codes::storage_failure,
            compat::format("Failed to create catalog schema: {}", error),
            kModule});
    }
    return ok();
}

auto sqlite_catalog::insert(const catalog_record& record,
                            const std::vector<std::string>& keywords)
    -> Result<int64_t> {
    if (!db_) {
        return make_error<int64_t>(error_codes::storage_failure,
                                   "Database not initialized", kModule);
    }

    if (sqlite3_exec(db_, "SAVEPOINT catalog_insert;", nullptr, nullptr,
                     nullptr) != SQLITE_OK) {
        return make_error<int64_t>(
            error_codes::storage_failure,
            compat::format("Failed to open savepoint: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    auto fail = [this](const std::string& what) -> Result<int64_t> {
        auto message = compat::format("{}: {}", what, sqlite3_errmsg(db_));
        sqlite3_exec(db_, "ROLLBACK TO catalog_insert; RELEASE catalog_insert;",
                     nullptr, nullptr, nullptr);
        return make_error<int64_t>(error_codes::storage_failure, message,
                                   kModule);
    };

    static constexpr const char* file_sql = R"(
        INSERT INTO media_files (
            id, filename, file_path, file_size, file_type, extension, score,
            width, height, created_at, original_created_at, nsfw, nsfw_score
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, file_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail("Failed to prepare insert");
    }

    int idx = 1;
    if (record.id > 0) {
        sqlite3_bind_int64(stmt, idx++, record.id);
    } else {
        sqlite3_bind_null(stmt, idx++);
    }
    sqlite3_bind_text(stmt, idx++, record.filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, record.file_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, idx++, record.file_size);
    sqlite3_bind_text(stmt, idx++, record.file_type.c_str(), -1, SQLITE_TRANSIENT);
    auto extension = to_lower(record.extension);
    if (!extension.empty() && extension.front() == '.') {
        extension.erase(0, 1);
    }
    sqlite3_bind_text(stmt, idx++, extension.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, idx++, record.score);
    if (record.width) {
        sqlite3_bind_int(stmt, idx++, *record.width);
    } else {
        sqlite3_bind_null(stmt, idx++);
    }
    if (record.height) {
        sqlite3_bind_int(stmt, idx++, *record.height);
    } else {
        sqlite3_bind_null(stmt, idx++);
    }
    sqlite3_bind_int64(stmt, idx++, to_epoch_micros(record.created_at));
    if (record.original_created_at) {
        sqlite3_bind_int64(stmt, idx++, to_epoch_micros(*record.original_created_at));
    } else {
        sqlite3_bind_null(stmt, idx++);
    }
    sqlite3_bind_int(stmt, idx++, record.nsfw ? 1 : 0);
    if (record.nsfw_score) {
        sqlite3_bind_double(stmt, idx++, *record.nsfw_score);
    } else {
        sqlite3_bind_null(stmt, idx++);
    }

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return fail("Failed to insert media file");
    }

    auto id = sqlite3_last_insert_rowid(db_);

    if (!keywords.empty()) {
        static constexpr const char* keyword_sql =
            "INSERT OR IGNORE INTO media_keywords (media_file_id, keyword) "
            "VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, keyword_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return fail("Failed to prepare keyword insert");
        }

        for (const auto& keyword : keywords) {
            auto normalized = to_lower(keyword);
            auto begin = normalized.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos) {
                continue;
            }
            auto end = normalized.find_last_not_of(" \t\r\n");
            normalized = normalized.substr(begin, end - begin + 1);

            sqlite3_reset(stmt);
            sqlite3_bind_int64(stmt, 1, id);
            sqlite3_bind_text(stmt, 2, normalized.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt) != SQLITE_DONE) {
                sqlite3_finalize(stmt);
                return fail("Failed to insert keyword");
            }
        }
        sqlite3_finalize(stmt);
    }

    if (sqlite3_exec(db_, "RELEASE catalog_insert;", nullptr, nullptr,
                     nullptr) != SQLITE_OK) {
        return fail("Failed to release savepoint");
    }

    return ok(id);
}

auto sqlite_catalog::count() const -> Result<size_t> {
    if (!db_) {
        return make_error<size_t>(error_codes::storage_failure,
                                  "Database not initialized", kModule);
    }

    static constexpr const char* sql = "SELECT COUNT(*) FROM media_files";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<size_t>(
            error_codes::storage_failure,
            compat::format("Failed to prepare count: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    size_t result = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ok(result);
}

auto sqlite_catalog::find(const catalog_predicates& predicates)
    -> Result<std::vector<catalog_record>> {
    if (!db_) {
        return make_error<std::vector<catalog_record>>(
            error_codes::upstream_query_failure, "Database not initialized",
            kModule);
    }

    std::string sql = R"(
        SELECT m.id, m.filename, m.file_path, m.file_size, m.file_type,
               m.extension, m.score, m.width, m.height, m.created_at,
               m.original_created_at, m.nsfw, m.nsfw_score
        FROM media_files m
        WHERE 1=1
    )";

    std::vector<sql_param> params;

    if (!predicates.keywords.empty()) {
        static constexpr const char* keyword_match =
            "EXISTS (SELECT 1 FROM media_keywords k "
            "WHERE k.media_file_id = m.id AND instr(lower(k.keyword), ?) > 0)";

        if (predicates.match_all) {
            for (const auto& keyword : predicates.keywords) {
                sql += compat::format(" AND {}", keyword_match);
                params.emplace_back(keyword);
            }
        } else {
            sql += " AND (";
            for (size_t i = 0; i < predicates.keywords.size(); ++i) {
                if (i > 0) {
                    sql += " OR ";
                }
                sql += keyword_match;
                params.emplace_back(predicates.keywords[i]);
            }
            sql += ")";
        }
    }

    if (!predicates.file_types.empty()) {
        std::string placeholders;
        for (size_t i = 0; i < predicates.file_types.size(); ++i) {
            placeholders += i == 0 ? "?" : ", ?";
        }
        sql += compat::format(
            " AND (lower(m.extension) IN ({0}) OR lower(m.file_type) IN ({0}))",
            placeholders);
        for (const auto& type : predicates.file_types) {
            params.emplace_back(type);
        }
        for (const auto& type : predicates.file_types) {
            params.emplace_back(type);
        }
    }

    if (predicates.min_score) {
        sql += " AND m.score >= ?";
        params.emplace_back(static_cast<int64_t>(*predicates.min_score));
    }

    if (predicates.max_score) {
        sql += " AND m.score <= ?";
        params.emplace_back(static_cast<int64_t>(*predicates.max_score));
    }

    if (predicates.created_from) {
        sql += " AND m.created_at >= ?";
        params.emplace_back(to_epoch_micros(*predicates.created_from));
    }

    if (predicates.created_until) {
        sql += " AND m.created_at <= ?";
        params.emplace_back(to_epoch_micros(*predicates.created_until));
    }

    if (predicates.nsfw) {
        sql += " AND m.nsfw = ?";
        params.emplace_back(static_cast<int64_t>(*predicates.nsfw ? 1 : 0));
    }

    const char* direction =
        predicates.direction == buffer::sort_direction::asc ? "ASC" : "DESC";
    sql += compat::format(" ORDER BY {0} {1}, m.id {1}",
                          sort_column(predicates.sort), direction);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<std::vector<catalog_record>>(
            error_codes::upstream_query_failure,
            compat::format("Failed to prepare catalog query: {}",
                           sqlite3_errmsg(db_)),
            kModule);
    }

    for (size_t i = 0; i < params.size(); ++i) {
        auto index = static_cast<int>(i + 1);
        if (const auto* number = std::get_if<int64_t>(&params[i])) {
            sqlite3_bind_int64(stmt, index, *number);
        } else {
            const auto& text = std::get<std::string>(params[i]);
            sqlite3_bind_text(stmt, index, text.c_str(), -1, SQLITE_TRANSIENT);
        }
    }

    std::vector<catalog_record> results;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        results.push_back(parse_record_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_error<std::vector<catalog_record>>(
            error_codes::upstream_query_failure,
            compat::format("Catalog query failed: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    return ok(std::move(results));
}

}  // namespace mediacache::catalog
