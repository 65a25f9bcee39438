/**
 * @file buffer_builder_test.cpp
 * @brief Unit tests for buffer construction and publish
 */

#include "../mocks/mock_catalog.hpp"

#include <mediacache/buffer/buffer_builder.hpp>
#include <mediacache/buffer/buffer_tables.hpp>
#include <mediacache/storage/cache_database.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sqlite3.h>

using namespace mediacache;
using namespace mediacache::buffer;
using namespace mediacache::storage;
using mediacache::catalog::testing::make_record;
using mediacache::catalog::testing::mock_catalog;

namespace {

auto create_test_database() -> std::unique_ptr<cache_database> {
    auto result = cache_database::open(":memory:");
    REQUIRE(result.is_ok());
    return std::move(result.value());
}

/// Builder with its collaborators over an in-memory database
struct builder_fixture {
    std::unique_ptr<cache_database> db{create_test_database()};
    buffer_cache_config config;
    buffer_registry registry{db->native_handle()};
    buffer_evictor evictor{*db, registry, config};
    buffer_builder builder{*db, registry, evictor, config};
    mock_catalog catalog;

    /// 100 records, ids 1..33 scored 4 or 5, the rest 0..3
    void seed_catalog() {
        for (int64_t id = 1; id <= 100; ++id) {
            int score = id <= 33 ? 4 + static_cast<int>(id % 2)
                                 : static_cast<int>(id % 4);
            catalog.add(make_record(id, score));
        }
    }

    auto count_rows(const std::string& table) -> int64_t {
        auto sql = "SELECT COUNT(*) FROM " + table;
        sqlite3_stmt* stmt = nullptr;
        REQUIRE(sqlite3_prepare_v2(db->native_handle(), sql.c_str(), -1, &stmt,
                                   nullptr) == SQLITE_OK);
        REQUIRE(sqlite3_step(stmt) == SQLITE_ROW);
        auto count = sqlite3_column_int64(stmt, 0);
        sqlite3_finalize(stmt);
        return count;
    }

    auto staging_tables() -> std::vector<std::string> {
        auto tables = db->list_tables(buffer_table_prefix);
        REQUIRE(tables.is_ok());
        std::vector<std::string> result;
        for (const auto& table : tables.value()) {
            if (is_staging_table_name(table)) {
                result.push_back(table);
            }
        }
        return result;
    }
};

auto canonical(const filter_spec& spec) -> canonical_filter {
    auto result = canonicalize(spec);
    REQUIRE(result.is_ok());
    return result.value();
}

auto score_filter() -> filter_spec {
    filter_spec spec;
    spec.min_score = 4;
    spec.max_score = 5;
    return spec;
}

}  // namespace

// ============================================================================
// Build
// ============================================================================

TEST_CASE("buffer_builder: build materializes matching records",
          "[buffer][builder]") {
    builder_fixture fx;
    fx.seed_catalog();
    auto filter = canonical(score_filter());

    auto built = fx.builder.build(filter, fx.catalog);
    REQUIRE(built.is_ok());
    CHECK(built.value().item_count == 33);
    CHECK(built.value().table_name == buffer_table_name(filter.fingerprint));
    CHECK_FALSE(built.value().generation.empty());

    CHECK(fx.catalog.call_count() == 1);
    CHECK(fx.catalog.last_predicates().min_score == 4);
    CHECK(fx.catalog.last_predicates().max_score == 5);

    auto exists = fx.db->table_exists(built.value().table_name);
    REQUIRE(exists.is_ok());
    CHECK(exists.value());
    CHECK(fx.count_rows(built.value().table_name) == 33);
    CHECK(fx.staging_tables().empty());

    auto record = fx.registry.peek(filter.fingerprint);
    REQUIRE(record.is_ok());
    REQUIRE(record.value().has_value());
    CHECK(record.value()->item_count == 33);
    CHECK(record.value()->size_bytes == 33 * 500);
    CHECK(record.value()->generation == built.value().generation);
    CHECK(record.value()->filter_json == filter.canonical_json);
}

TEST_CASE("buffer_builder: row ids follow catalog order", "[buffer][builder]") {
    builder_fixture fx;
    fx.catalog.add(make_record(30, 1));
    fx.catalog.add(make_record(10, 1));
    fx.catalog.add(make_record(20, 1));

    auto filter = canonical(filter_spec{});
    auto built = fx.builder.build(filter, fx.catalog);
    REQUIRE(built.is_ok());

    auto sql = "SELECT id, media_file_id FROM " + built.value().table_name +
               " ORDER BY id";
    sqlite3_stmt* stmt = nullptr;
    REQUIRE(sqlite3_prepare_v2(fx.db->native_handle(), sql.c_str(), -1, &stmt,
                               nullptr) == SQLITE_OK);

    std::vector<std::pair<int64_t, int64_t>> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.emplace_back(sqlite3_column_int64(stmt, 0),
                          sqlite3_column_int64(stmt, 1));
    }
    sqlite3_finalize(stmt);

    REQUIRE(rows.size() == 3);
    CHECK(rows[0] == std::make_pair<int64_t, int64_t>(1, 30));
    CHECK(rows[1] == std::make_pair<int64_t, int64_t>(2, 10));
    CHECK(rows[2] == std::make_pair<int64_t, int64_t>(3, 20));
}

TEST_CASE("buffer_builder: published table carries the secondary indexes",
          "[buffer][builder]") {
    builder_fixture fx;
    fx.seed_catalog();
    auto filter = canonical(score_filter());

    auto built = fx.builder.build(filter, fx.catalog);
    REQUIRE(built.is_ok());

    static constexpr const char* sql =
        "SELECT COUNT(*) FROM sqlite_master WHERE type = 'index' AND tbl_name = ?";
    sqlite3_stmt* stmt = nullptr;
    REQUIRE(sqlite3_prepare_v2(fx.db->native_handle(), sql, -1, &stmt, nullptr) ==
            SQLITE_OK);
    sqlite3_bind_text(stmt, 1, built.value().table_name.c_str(), -1,
                      SQLITE_TRANSIENT);
    REQUIRE(sqlite3_step(stmt) == SQLITE_ROW);
    CHECK(sqlite3_column_int(stmt, 0) == 3);
    sqlite3_finalize(stmt);
}

TEST_CASE("buffer_builder: empty result still publishes a buffer",
          "[buffer][builder]") {
    builder_fixture fx;
    auto filter = canonical(score_filter());

    auto built = fx.builder.build(filter, fx.catalog);
    REQUIRE(built.is_ok());
    CHECK(built.value().item_count == 0);

    auto record = fx.registry.peek(filter.fingerprint);
    REQUIRE(record.is_ok());
    REQUIRE(record.value().has_value());
    CHECK(record.value()->item_count == 0);
}

TEST_CASE("buffer_builder: catalog failure leaves no trace", "[buffer][builder]") {
    builder_fixture fx;
    fx.seed_catalog();
    fx.catalog.set_should_fail(true);
    auto filter = canonical(score_filter());

    auto built = fx.builder.build(filter, fx.catalog);
    REQUIRE(built.is_err());
    CHECK(built.error().code == error_codes::upstream_query_failure);

    auto record = fx.registry.peek(filter.fingerprint);
    REQUIRE(record.is_ok());
    CHECK_FALSE(record.value().has_value());

    auto tables = fx.db->list_tables(buffer_table_prefix);
    REQUIRE(tables.is_ok());
    CHECK(tables.value().empty());
}

TEST_CASE("buffer_builder: force rebuild produces a new generation",
          "[buffer][builder]") {
    builder_fixture fx;
    fx.seed_catalog();
    auto filter = canonical(score_filter());

    auto first = fx.builder.build(filter, fx.catalog, true);
    REQUIRE(first.is_ok());

    // Catalog changes between builds
    fx.catalog.add(make_record(101, 5));

    auto second = fx.builder.build(filter, fx.catalog, true);
    REQUIRE(second.is_ok());

    CHECK(first.value().generation != second.value().generation);
    CHECK(first.value().table_name == second.value().table_name);
    CHECK(second.value().item_count == 34);
    CHECK(fx.count_rows(second.value().table_name) == 34);

    auto all = fx.registry.list_all();
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 1);
    CHECK(all.value()[0].fingerprint == filter.fingerprint);
    CHECK(all.value()[0].generation == second.value().generation);
    CHECK(fx.staging_tables().empty());
}

TEST_CASE("buffer_builder: rebuild without force replaces the table",
          "[buffer][builder]") {
    builder_fixture fx;
    fx.seed_catalog();
    auto filter = canonical(score_filter());

    REQUIRE(fx.builder.build(filter, fx.catalog).is_ok());
    fx.catalog.clear();
    auto rebuilt = fx.builder.build(filter, fx.catalog);
    REQUIRE(rebuilt.is_ok());
    CHECK(rebuilt.value().item_count == 0);
    CHECK(fx.count_rows(rebuilt.value().table_name) == 0);
}

TEST_CASE("buffer_builder: invalid fingerprint is rejected", "[buffer][builder]") {
    builder_fixture fx;
    canonical_filter filter;
    filter.fingerprint = "not-a-fingerprint";

    auto built = fx.builder.build(filter, fx.catalog);
    REQUIRE(built.is_err());
    CHECK(built.error().code == error_codes::invalid_fingerprint);
    CHECK(fx.catalog.call_count() == 0);
}

// ============================================================================
// Staging Sweep
// ============================================================================

TEST_CASE("buffer_builder: sweep drops only staging tables", "[buffer][builder]") {
    builder_fixture fx;
    fx.seed_catalog();
    auto filter = canonical(score_filter());
    auto built = fx.builder.build(filter, fx.catalog);
    REQUIRE(built.is_ok());

    auto orphan = staging_table_name(filter.fingerprint, make_generation_token());
    REQUIRE(create_buffer_table(*fx.db, orphan).is_ok());
    REQUIRE(fx.staging_tables().size() == 1);

    auto swept = fx.builder.sweep_orphaned_staging_tables();
    REQUIRE(swept.is_ok());
    CHECK(swept.value() == 1);
    CHECK(fx.staging_tables().empty());

    auto exists = fx.db->table_exists(built.value().table_name);
    REQUIRE(exists.is_ok());
    CHECK(exists.value());
}

// ============================================================================
// Predicates
// ============================================================================

TEST_CASE("buffer_builder: make_catalog_predicates", "[buffer][builder]") {
    SECTION("date-only end date covers the whole day") {
        filter_spec spec;
        spec.start_date = "2024-06-01";
        spec.end_date = "2024-06-01";

        auto predicates = make_catalog_predicates(spec);
        REQUIRE(predicates.is_ok());
        REQUIRE(predicates.value().created_from.has_value());
        REQUIRE(predicates.value().created_until.has_value());
        auto span = *predicates.value().created_until -
                    *predicates.value().created_from;
        CHECK(span == std::chrono::hours(24) - std::chrono::microseconds(1));
    }

    SECTION("date-time end date is taken as is") {
        filter_spec spec;
        spec.start_date = "2024-06-01T00:00:00Z";
        spec.end_date = "2024-06-01T12:00:00Z";

        auto predicates = make_catalog_predicates(spec);
        REQUIRE(predicates.is_ok());
        auto span = *predicates.value().created_until -
                    *predicates.value().created_from;
        CHECK(span == std::chrono::hours(12));
    }

    SECTION("classification maps to the nsfw flag") {
        filter_spec spec;
        spec.classification = classification_filter::sfw;
        auto sfw = make_catalog_predicates(spec);
        REQUIRE(sfw.is_ok());
        CHECK(sfw.value().nsfw == false);

        spec.classification = classification_filter::nsfw;
        auto nsfw = make_catalog_predicates(spec);
        REQUIRE(nsfw.is_ok());
        CHECK(nsfw.value().nsfw == true);

        spec.classification = classification_filter::all;
        auto all = make_catalog_predicates(spec);
        REQUIRE(all.is_ok());
        CHECK_FALSE(all.value().nsfw.has_value());
    }
}
