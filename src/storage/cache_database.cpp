/**
 * @file cache_database.cpp
 * @brief Implementation of the cache database connection owner
 */

#include <mediacache/storage/cache_database.hpp>

#include <mediacache/compat/format.hpp>
#include <mediacache/core/result.hpp>
#include <mediacache/integration/logger_adapter.hpp>

#include <sqlite3.h>

#include <filesystem>

namespace mediacache::storage {

using kcenon::common::make_error;
using kcenon::common::ok;

using integration::logger_adapter;

namespace {

auto get_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text =
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

}  // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

auto cache_database::open(std::string_view db_path)
    -> Result<std::unique_ptr<cache_database>> {
    return open(db_path, cache_db_config{});
}

auto cache_database::open(std::string_view db_path, const cache_db_config& config)
    -> Result<std::unique_ptr<cache_database>> {
    const bool in_memory = db_path == ":memory:";

    if (!in_memory) {
        auto parent = std::filesystem::path(db_path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return make_error<std::unique_ptr<cache_database>>(
                    error_codes::database_open_error,
                    compat::format("Failed to create directory {}: {}",
                                   parent.string(), ec.message()),
                    "storage");
            }
        }
    }

    sqlite3* db = nullptr;
    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return make_error<std::unique_ptr<cache_database>>(
            error_codes::database_open_error,
            compat::format("Failed to open cache database: {}", error_msg),
            "storage");
    }

    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    if (config.wal_mode && !in_memory) {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return make_error<std::unique_ptr<cache_database>>(
                error_codes::database_open_error, "Failed to enable WAL mode",
                "storage");
        }
    }

    // Negative cache_size is in KiB
    auto cache_sql =
        compat::format("PRAGMA cache_size = -{};", config.cache_size_mb * 1024);
    rc = sqlite3_exec(db, cache_sql.c_str(), nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return make_error<std::unique_ptr<cache_database>>(
            error_codes::database_open_error, "Failed to set cache size",
            "storage");
    }

    if (config.temp_store_memory) {
        rc = sqlite3_exec(db, "PRAGMA temp_store = MEMORY;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            logger_adapter::warn("Cache database: temp_store pragma rejected");
        }
    }

    rc = sqlite3_exec(db, "PRAGMA synchronous = NORMAL;", nullptr, nullptr,
                      nullptr);
    if (rc != SQLITE_OK) {
        logger_adapter::warn("Cache database: synchronous pragma rejected");
    }

    auto instance = std::unique_ptr<cache_database>(
        new cache_database(db, std::string(db_path)));

    auto migration_result = instance->migration_runner_.run_migrations(db);
    if (migration_result.is_err()) {
        return make_error<std::unique_ptr<cache_database>>(
            error_codes::database_migration_error,
            compat::format("Migration failed: {}",
                           migration_result.error().message),
            "storage");
    }

    logger_adapter::debug("Opened cache database {} (schema v{})", db_path,
                          instance->schema_version());
    return instance;
}

cache_database::cache_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

cache_database::~cache_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

cache_database::cache_database(cache_database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

auto cache_database::operator=(cache_database&& other) noexcept
    -> cache_database& {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

// ============================================================================
// Statement Execution
// ============================================================================

auto cache_database::execute(std::string_view sql) -> VoidResult {
    if (!db_) {
        return make_error<std::monostate>(error_codes::storage_failure,
                                          "Database not initialized", "storage");
    }

    char* errmsg = nullptr;
    auto sql_str = std::string(sql);
    auto rc = sqlite3_exec(db_, sql_str.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);
        return make_error<std::monostate>(
            error_codes::storage_failure,
            compat::format("SQL execution failed: {}", error_str), "storage");
    }
    return ok();
}

auto cache_database::begin_transaction() -> VoidResult {
    auto result = execute("BEGIN IMMEDIATE TRANSACTION;");
    if (result.is_err()) {
        return make_error<std::monostate>(
            error_codes::database_transaction_error,
            compat::format("Failed to begin transaction: {}",
                           result.error().message),
            "storage");
    }
    return ok();
}

auto cache_database::commit() -> VoidResult {
    auto result = execute("COMMIT;");
    if (result.is_err()) {
        return make_error<std::monostate>(
            error_codes::database_transaction_error,
            compat::format("Failed to commit transaction: {}",
                           result.error().message),
            "storage");
    }
    return ok();
}

auto cache_database::rollback() noexcept -> void {
    if (db_ && sqlite3_get_autocommit(db_) == 0) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

// ============================================================================
// Schema Introspection
// ============================================================================

auto cache_database::table_exists(std::string_view table_name) const
    -> Result<bool> {
    static constexpr const char* sql =
        "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<bool>(
            error_codes::storage_failure,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)),
            "storage");
    }

    sqlite3_bind_text(stmt, 1, table_name.data(),
                      static_cast<int>(table_name.size()), SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return make_error<bool>(
            error_codes::storage_failure,
            compat::format("Failed to query schema: {}", sqlite3_errmsg(db_)),
            "storage");
    }
    return ok(rc == SQLITE_ROW);
}

auto cache_database::list_tables(std::string_view prefix) const
    -> Result<std::vector<std::string>> {
    // substr comparison avoids LIKE treating '_' in the prefix as a wildcard
    static constexpr const char* sql = R"(
        SELECT name FROM sqlite_master
        WHERE type = 'table' AND substr(name, 1, ?) = ?
        ORDER BY name
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<std::vector<std::string>>(
            error_codes::storage_failure,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)),
            "storage");
    }

    sqlite3_bind_int(stmt, 1, static_cast<int>(prefix.size()));
    sqlite3_bind_text(stmt, 2, prefix.data(), static_cast<int>(prefix.size()),
                      SQLITE_TRANSIENT);

    std::vector<std::string> tables;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        tables.push_back(get_text(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_error<std::vector<std::string>>(
            error_codes::storage_failure,
            compat::format("Failed to list tables: {}", sqlite3_errmsg(db_)),
            "storage");
    }
    return ok(std::move(tables));
}

// ============================================================================
// Database Information
// ============================================================================

auto cache_database::path() const -> std::string_view { return path_; }

auto cache_database::schema_version() const -> int {
    return migration_runner_.get_current_version(db_);
}

auto cache_database::is_open() const noexcept -> bool { return db_ != nullptr; }

auto cache_database::native_handle() const noexcept -> sqlite3* { return db_; }

// ============================================================================
// Maintenance
// ============================================================================

auto cache_database::vacuum() -> VoidResult {
    auto rc = sqlite3_exec(db_, "VACUUM;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        return make_error<std::monostate>(
            error_codes::storage_failure,
            compat::format("VACUUM failed: {}", sqlite3_errmsg(db_)), "storage");
    }
    return ok();
}

auto cache_database::checkpoint(bool truncate) -> VoidResult {
    const char* sql = truncate ? "PRAGMA wal_checkpoint(TRUNCATE);"
                               : "PRAGMA wal_checkpoint(PASSIVE);";

    auto rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        return make_error<std::monostate>(
            error_codes::storage_failure,
            compat::format("Checkpoint failed: {}", sqlite3_errmsg(db_)),
            "storage");
    }
    return ok();
}

}  // namespace mediacache::storage
