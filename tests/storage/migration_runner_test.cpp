/**
 * @file migration_runner_test.cpp
 * @brief Unit tests for migration_runner class
 */

#include <catch2/catch_test_macros.hpp>

#include <mediacache/storage/migration_runner.hpp>

#include <sqlite3.h>

#include <memory>
#include <stdexcept>

using namespace mediacache::storage;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/// RAII wrapper for SQLite database
class test_database {
public:
    test_database() {
        auto rc = sqlite3_open(":memory:", &db_);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Failed to open in-memory database");
        }
    }

    ~test_database() {
        if (db_ != nullptr) {
            sqlite3_close(db_);
        }
    }

    test_database(const test_database&) = delete;
    auto operator=(const test_database&) -> test_database& = delete;
    test_database(test_database&&) = delete;
    auto operator=(test_database&&) -> test_database& = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto object_exists(const char* type, const char* name) const
        -> bool {
        const char* sql = "SELECT name FROM sqlite_master WHERE type=? AND name=?;";
        sqlite3_stmt* stmt = nullptr;
        auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, type, -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, name, -1, SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW;
    }

    [[nodiscard]] auto exec(const char* sql) const -> int {
        return sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

private:
    sqlite3* db_ = nullptr;
};

}  // namespace

// ============================================================================
// Initial State
// ============================================================================

TEST_CASE("migration_runner initial state", "[migration][version]") {
    test_database db;
    migration_runner runner;

    SECTION("empty database has version 0") {
        CHECK(runner.get_current_version(db.get()) == 0);
    }

    SECTION("empty database needs migration") {
        CHECK(runner.needs_migration(db.get()));
    }

    SECTION("latest version is 1") {
        CHECK(runner.get_latest_version() == 1);
    }

    SECTION("empty database has no history") {
        CHECK(runner.get_history(db.get()).empty());
    }
}

// ============================================================================
// Migration Execution
// ============================================================================

TEST_CASE("migration_runner run_migrations", "[migration][execute]") {
    test_database db;
    migration_runner runner;

    SECTION("successful initial migration") {
        auto result = runner.run_migrations(db.get());
        REQUIRE(result.is_ok());

        CHECK(runner.get_current_version(db.get()) == 1);
        CHECK_FALSE(runner.needs_migration(db.get()));
    }

    SECTION("migration is idempotent") {
        REQUIRE(runner.run_migrations(db.get()).is_ok());
        REQUIRE(runner.run_migrations(db.get()).is_ok());

        CHECK(runner.get_current_version(db.get()) == 1);
        CHECK(runner.get_history(db.get()).size() == 1);
    }

    SECTION("migration records history") {
        REQUIRE(runner.run_migrations(db.get()).is_ok());

        auto history = runner.get_history(db.get());
        REQUIRE(history.size() == 1);
        CHECK(history[0].version == 1);
        CHECK(history[0].description == "Buffer registry and UI state tables");
        CHECK_FALSE(history[0].applied_at.empty());
    }
}

// ============================================================================
// Schema Validation (V1)
// ============================================================================

TEST_CASE("migration_runner v1 creates schema", "[migration][v1]") {
    test_database db;
    migration_runner runner;
    REQUIRE(runner.run_migrations(db.get()).is_ok());

    CHECK(db.object_exists("table", "schema_version"));
    CHECK(db.object_exists("table", "buffer_registry"));
    CHECK(db.object_exists("table", "ui_state"));
    CHECK(db.object_exists("index", "idx_buffer_registry_accessed"));
}

TEST_CASE("migration_runner v1 constraints", "[migration][v1][constraints]") {
    test_database db;
    migration_runner runner;
    REQUIRE(runner.run_migrations(db.get()).is_ok());

    SECTION("registry rejects short fingerprints") {
        CHECK(db.exec(R"(
            INSERT INTO buffer_registry (fingerprint, table_name, generation,
                created_at, last_accessed_at, filter_json)
            VALUES ('abc', 'buffer_items_abc', '1', 0, 0, '{}');
        )") != SQLITE_OK);
    }

    SECTION("registry table names are unique") {
        CHECK(db.exec(R"(
            INSERT INTO buffer_registry (fingerprint, table_name, generation,
                created_at, last_accessed_at, filter_json)
            VALUES (printf('%064d', 1), 't', '1', 0, 0, '{}');
        )") == SQLITE_OK);
        CHECK(db.exec(R"(
            INSERT INTO buffer_registry (fingerprint, table_name, generation,
                created_at, last_accessed_at, filter_json)
            VALUES (printf('%064d', 2), 't', '1', 0, 0, '{}');
        )") != SQLITE_OK);
    }

    SECTION("ui_state rejects empty keys") {
        CHECK(db.exec(
                  "INSERT INTO ui_state (key, value, updated_at) VALUES ('', '{}', 0);") !=
              SQLITE_OK);
    }
}
