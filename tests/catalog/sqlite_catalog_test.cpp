/**
 * @file sqlite_catalog_test.cpp
 * @brief Unit tests for the SQLite media catalog
 */

#include <mediacache/buffer/buffer_cache_engine.hpp>
#include <mediacache/catalog/sqlite_catalog.hpp>
#include <mediacache/storage/cache_database.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace mediacache;
using namespace mediacache::catalog;
using mediacache::storage::cache_database;

namespace {

auto create_test_database() -> std::unique_ptr<cache_database> {
    auto result = cache_database::open(":memory:");
    REQUIRE(result.is_ok());
    return std::move(result.value());
}

auto day(int n) -> std::chrono::system_clock::time_point {
    // 2024-06-01T00:00:00Z plus n days
    return std::chrono::system_clock::time_point{} + std::chrono::seconds(1717200000) +
           std::chrono::hours(24 * n);
}

auto make_file(const std::string& name, const std::string& ext, int score,
               int created_day, bool nsfw = false) -> catalog_record {
    catalog_record record;
    record.filename = name + "." + ext;
    record.file_path = "/photos/" + record.filename;
    record.file_size = 1000 + score;
    record.file_type = ext == "mp4" ? "video" : "image";
    record.extension = ext;
    record.score = score;
    record.created_at = day(created_day);
    record.nsfw = nsfw;
    return record;
}

/// Catalog over a private in-memory database with a small fixed data set
struct catalog_fixture {
    std::unique_ptr<cache_database> db{create_test_database()};
    sqlite_catalog catalog{db->native_handle()};

    catalog_fixture() {
        REQUIRE(catalog.create_schema().is_ok());
        add(make_file("beach", "jpg", 5, 1), {"Sunset", "beach"});
        add(make_file("city", "png", 3, 2), {"night", "city"});
        add(make_file("forest", "jpg", 4, 3, true), {"forest", "sunset"});
        add(make_file("clip", "mp4", 2, 4), {"beach", "video"});
        add(make_file("empty", "gif", 0, 5), {});
    }

    void add(const catalog_record& record, const std::vector<std::string>& keywords) {
        auto id = catalog.insert(record, keywords);
        REQUIRE(id.is_ok());
    }

    auto names(const catalog_predicates& predicates) -> std::vector<std::string> {
        auto found = catalog.find(predicates);
        REQUIRE(found.is_ok());
        std::vector<std::string> result;
        for (const auto& record : found.value()) {
            result.push_back(record.filename);
        }
        return result;
    }
};

}  // namespace

// ============================================================================
// Insert
// ============================================================================

TEST_CASE("sqlite_catalog: insert and count", "[catalog]") {
    catalog_fixture fx;

    auto count = fx.catalog.count();
    REQUIRE(count.is_ok());
    CHECK(count.value() == 5);

    SECTION("explicit ids are kept") {
        auto record = make_file("fixed", "jpg", 1, 6);
        record.id = 500;
        auto id = fx.catalog.insert(record);
        REQUIRE(id.is_ok());
        CHECK(id.value() == 500);
    }

    SECTION("duplicate path is rejected and rolled back") {
        auto id = fx.catalog.insert(make_file("beach", "jpg", 1, 6), {"dup"});
        REQUIRE(id.is_err());
        CHECK(id.error().code == error_codes::storage_failure);

        auto after = fx.catalog.count();
        REQUIRE(after.is_ok());
        CHECK(after.value() == 5);
    }
}

TEST_CASE("sqlite_catalog: records round-trip optional columns", "[catalog]") {
    catalog_fixture fx;

    auto record = make_file("portrait", "JPG", 4, 7);
    record.width = 1080;
    record.height = 1920;
    record.original_created_at = day(-30);
    record.nsfw_score = 0.25;
    REQUIRE(fx.catalog.insert(record).is_ok());

    catalog_predicates predicates;
    predicates.file_types = {"jpg"};
    predicates.min_score = 4;
    predicates.created_from = day(7);

    auto found = fx.catalog.find(predicates);
    REQUIRE(found.is_ok());
    REQUIRE(found.value().size() == 1);

    const auto& stored = found.value()[0];
    CHECK(stored.extension == "jpg");
    CHECK(stored.width == 1080);
    CHECK(stored.height == 1920);
    CHECK(stored.created_at == day(7));
    CHECK(stored.original_created_at == day(-30));
    CHECK(stored.nsfw_score == 0.25);
}

// ============================================================================
// Predicates
// ============================================================================

TEST_CASE("sqlite_catalog: keyword matching", "[catalog]") {
    catalog_fixture fx;
    catalog_predicates predicates;
    predicates.sort = buffer::sort_field::name;
    predicates.direction = buffer::sort_direction::asc;

    SECTION("any keyword") {
        predicates.keywords = {"sunset", "night"};
        CHECK(fx.names(predicates) ==
              std::vector<std::string>{"beach.jpg", "city.png", "forest.jpg"});
    }

    SECTION("all keywords") {
        predicates.keywords = {"beach", "sunset"};
        predicates.match_all = true;
        CHECK(fx.names(predicates) == std::vector<std::string>{"beach.jpg"});
    }

    SECTION("substring match") {
        predicates.keywords = {"sun"};
        CHECK(fx.names(predicates) ==
              std::vector<std::string>{"beach.jpg", "forest.jpg"});
    }

    SECTION("no match") {
        predicates.keywords = {"mountain"};
        CHECK(fx.names(predicates).empty());
    }
}

TEST_CASE("sqlite_catalog: type, score, date and nsfw predicates", "[catalog]") {
    catalog_fixture fx;
    catalog_predicates predicates;
    predicates.sort = buffer::sort_field::name;
    predicates.direction = buffer::sort_direction::asc;

    SECTION("extension") {
        predicates.file_types = {"jpg", "gif"};
        CHECK(fx.names(predicates) ==
              std::vector<std::string>{"beach.jpg", "empty.gif", "forest.jpg"});
    }

    SECTION("file type column") {
        predicates.file_types = {"video"};
        CHECK(fx.names(predicates) == std::vector<std::string>{"clip.mp4"});
    }

    SECTION("inclusive score bounds") {
        predicates.min_score = 3;
        predicates.max_score = 4;
        CHECK(fx.names(predicates) ==
              std::vector<std::string>{"city.png", "forest.jpg"});
    }

    SECTION("inclusive date bounds") {
        predicates.created_from = day(2);
        predicates.created_until = day(4);
        CHECK(fx.names(predicates) ==
              std::vector<std::string>{"city.png", "clip.mp4", "forest.jpg"});
    }

    SECTION("nsfw flag") {
        predicates.nsfw = true;
        CHECK(fx.names(predicates) == std::vector<std::string>{"forest.jpg"});

        predicates.nsfw = false;
        CHECK(fx.names(predicates).size() == 4);
    }

    SECTION("combined") {
        predicates.keywords = {"beach"};
        predicates.file_types = {"jpg"};
        predicates.min_score = 5;
        CHECK(fx.names(predicates) == std::vector<std::string>{"beach.jpg"});
    }
}

// ============================================================================
// Sorting
// ============================================================================

TEST_CASE("sqlite_catalog: sort orders", "[catalog]") {
    catalog_fixture fx;
    catalog_predicates predicates;

    SECTION("date descending by default") {
        CHECK(fx.names(predicates) ==
              std::vector<std::string>{"empty.gif", "clip.mp4", "forest.jpg",
                                       "city.png", "beach.jpg"});
    }

    SECTION("date uses the original timestamp when present") {
        auto old = make_file("scan", "jpg", 1, 10);
        old.original_created_at = day(0);
        REQUIRE(fx.catalog.insert(old).is_ok());

        predicates.direction = buffer::sort_direction::asc;
        auto names = fx.names(predicates);
        REQUIRE_FALSE(names.empty());
        CHECK(names.front() == "scan.jpg");
    }

    SECTION("rating descending") {
        predicates.sort = buffer::sort_field::rating;
        CHECK(fx.names(predicates) ==
              std::vector<std::string>{"beach.jpg", "forest.jpg", "city.png",
                                       "clip.mp4", "empty.gif"});
    }

    SECTION("size ascending") {
        predicates.sort = buffer::sort_field::size;
        predicates.direction = buffer::sort_direction::asc;
        CHECK(fx.names(predicates) ==
              std::vector<std::string>{"empty.gif", "clip.mp4", "city.png",
                                       "forest.jpg", "beach.jpg"});
    }

    SECTION("ties are broken by id") {
        REQUIRE(fx.catalog.insert(make_file("twin", "jpg", 5, 8)).is_ok());
        predicates.sort = buffer::sort_field::rating;
        auto names = fx.names(predicates);
        REQUIRE(names.size() == 6);
        CHECK(names[0] == "twin.jpg");
        CHECK(names[1] == "beach.jpg");
    }
}

// ============================================================================
// Engine Integration
// ============================================================================

TEST_CASE("sqlite_catalog: buffers built from the catalog", "[catalog][engine]") {
    catalog_fixture fx;

    auto engine = buffer::buffer_cache_engine::open(":memory:", fx.catalog);
    REQUIRE(engine.is_ok());

    buffer::filter_spec spec;
    spec.keywords = {"SUNSET"};
    spec.file_types = {".JPG"};
    spec.classification = buffer::classification_filter::sfw;

    auto handle = engine.value()->get_or_create_buffer(spec);
    REQUIRE(handle.is_ok());
    CHECK(handle.value().item_count == 1);

    auto page = engine.value()->get_page(handle.value().fingerprint, std::nullopt, 10);
    REQUIRE(page.is_ok());
    REQUIRE(page.value().rows.size() == 1);
    CHECK(page.value().rows[0].filename == "beach.jpg");
    CHECK(page.value().rows[0].score == 5);

    SECTION("date range from the filter") {
        buffer::filter_spec ranged;
        ranged.start_date = "2024-06-03";
        ranged.end_date = "2024-06-04";

        auto range = engine.value()->get_or_create_buffer(ranged);
        REQUIRE(range.is_ok());
        CHECK(range.value().item_count == 2);
    }
}
