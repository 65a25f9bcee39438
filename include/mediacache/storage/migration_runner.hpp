/**
 * @file migration_runner.hpp
 * @brief Cache database schema migration runner
 *
 * This file provides the migration_runner class that brings the cache
 * database (buffer registry and UI state tables) up to the current schema.
 * Buffer content tables are not migrated: they are created per build and
 * discarded on startup.
 */

#pragma once

#include "migration_record.hpp"

#include <mediacache/core/result.hpp>

#include <functional>
#include <string_view>
#include <utility>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace mediacache::storage {

/**
 * @brief Function type for migration implementations
 *
 * @param db The SQLite database handle
 * @return VoidResult Success or error information
 */
using migration_function = std::function<VoidResult(sqlite3* db)>;

/**
 * @brief Manages cache database schema migrations
 *
 * Tracks the schema version in the schema_version table and applies
 * pending migrations in order, each inside its own transaction.
 *
 * Thread Safety: This class is NOT thread-safe.
 */
class migration_runner {
public:
    migration_runner();
    ~migration_runner() = default;

    migration_runner(const migration_runner&) = delete;
    auto operator=(const migration_runner&) -> migration_runner& = delete;
    migration_runner(migration_runner&&) = delete;
    auto operator=(migration_runner&&) -> migration_runner& = delete;

    /**
     * @brief Run all pending migrations
     *
     * @param db The SQLite database handle
     * @return VoidResult Success or error information
     *
     * @note A failing migration is rolled back; earlier ones stay applied.
     */
    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    /**
     * @brief Get the current schema version (0 if nothing applied)
     */
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_latest_version() const noexcept -> int;

    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool;

    /**
     * @brief Get all applied migrations in version order
     */
    [[nodiscard]] auto get_history(sqlite3* db) const
        -> std::vector<migration_record>;

private:
    [[nodiscard]] auto ensure_schema_version_table(sqlite3* db) -> VoidResult;

    [[nodiscard]] auto apply_migration(sqlite3* db, int version) -> VoidResult;

    [[nodiscard]] auto record_migration(sqlite3* db, int version,
                                        std::string_view description)
        -> VoidResult;

    [[nodiscard]] static auto execute_sql(sqlite3* db, std::string_view sql)
        -> VoidResult;

    // Migration implementations
    [[nodiscard]] auto migrate_v1(sqlite3* db) -> VoidResult;

    /// Latest schema version (increment when adding migrations)
    static constexpr int LATEST_VERSION = 1;

    /// Migration function registry
    std::vector<std::pair<int, migration_function>> migrations_;
};

}  // namespace mediacache::storage
