/**
 * @file cache_database.hpp
 * @brief SQLite database holding the buffer registry, buffers and UI state
 *
 * This file provides the cache_database class that owns the SQLite
 * connection shared by every cache component. Opening the database applies
 * connection pragmas and runs schema migrations.
 */

#pragma once

#include "migration_runner.hpp"

#include <mediacache/core/result.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace mediacache::storage {

/**
 * @brief Connection tuning for the cache database
 */
struct cache_db_config {
    /// Page cache size in megabytes (default: 64 MB)
    size_t cache_size_mb = 64;

    /// Enable WAL (Write-Ahead Logging); ignored for in-memory databases
    bool wal_mode = true;

    /// How long a statement waits on a locked database, in milliseconds
    int busy_timeout_ms = 5000;

    /// Keep temporary tables and indices in memory
    bool temp_store_memory = true;
};

/**
 * @brief Owner of the cache's SQLite connection
 *
 * Thread Safety: This class is NOT thread-safe. Use one cache_database per
 * thread; several connections may share one file-backed database.
 *
 * @example
 * @code
 * auto db_result = cache_database::open("/var/cache/media/buffers.db");
 * if (db_result.is_err()) {
 *     // Handle error
 * }
 * auto db = std::move(db_result.value());
 * buffer_registry registry(db->native_handle());
 * @endcode
 */
class cache_database {
public:
    /**
     * @brief Open or create a database with default configuration
     *
     * @param db_path Path to the database file, or ":memory:"
     * @return Result containing the database instance or error
     */
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::unique_ptr<cache_database>>;

    /**
     * @brief Open or create a database with custom configuration
     *
     * Parent directories of a file path are created when missing.
     *
     * @param db_path Path to the database file, or ":memory:"
     * @param config Connection tuning options
     * @return Result containing the database instance or error
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   const cache_db_config& config)
        -> Result<std::unique_ptr<cache_database>>;

    ~cache_database();

    cache_database(const cache_database&) = delete;
    auto operator=(const cache_database&) -> cache_database& = delete;
    cache_database(cache_database&&) noexcept;
    auto operator=(cache_database&&) noexcept -> cache_database&;

    // ========================================================================
    // Statement Execution
    // ========================================================================

    /**
     * @brief Execute one or more SQL statements without results
     */
    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;

    [[nodiscard]] auto begin_transaction() -> VoidResult;
    [[nodiscard]] auto commit() -> VoidResult;

    /**
     * @brief Roll back the open transaction, if any
     *
     * Safe to call when no transaction is active.
     */
    auto rollback() noexcept -> void;

    // ========================================================================
    // Schema Introspection
    // ========================================================================

    /**
     * @brief Check whether a table exists
     */
    [[nodiscard]] auto table_exists(std::string_view table_name) const
        -> Result<bool>;

    /**
     * @brief List tables whose name starts with the given prefix
     */
    [[nodiscard]] auto list_tables(std::string_view prefix) const
        -> Result<std::vector<std::string>>;

    // ========================================================================
    // Database Information
    // ========================================================================

    [[nodiscard]] auto path() const -> std::string_view;

    [[nodiscard]] auto schema_version() const -> int;

    [[nodiscard]] auto is_open() const noexcept -> bool;

    /**
     * @brief Get the raw SQLite database handle
     *
     * @warning The handle is owned by this class. Do not close it.
     */
    [[nodiscard]] auto native_handle() const noexcept -> sqlite3*;

    // ========================================================================
    // Maintenance
    // ========================================================================

    /**
     * @brief Reclaim space freed by dropped buffer tables
     */
    [[nodiscard]] auto vacuum() -> VoidResult;

    /**
     * @brief Force a WAL checkpoint
     *
     * @param truncate If true, truncate the WAL file after checkpoint
     */
    [[nodiscard]] auto checkpoint(bool truncate = false) -> VoidResult;

private:
    explicit cache_database(sqlite3* db, std::string path);

    /// SQLite database handle
    sqlite3* db_{nullptr};

    /// Database file path
    std::string path_;

    /// Schema migration runner
    migration_runner migration_runner_;
};

}  // namespace mediacache::storage
