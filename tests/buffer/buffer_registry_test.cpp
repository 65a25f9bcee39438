/**
 * @file buffer_registry_test.cpp
 * @brief Unit tests for buffer_registry class
 */

#include <mediacache/buffer/buffer_registry.hpp>
#include <mediacache/storage/cache_database.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace mediacache;
using namespace mediacache::buffer;
using namespace mediacache::storage;

namespace {

auto create_test_database() -> std::unique_ptr<cache_database> {
    auto result = cache_database::open(":memory:");
    REQUIRE(result.is_ok());
    return std::move(result.value());
}

auto fingerprint(char c) -> std::string { return std::string(64, c); }

auto make_record(char c, int64_t items = 10) -> buffer_record {
    buffer_record record;
    record.fingerprint = fingerprint(c);
    record.table_name = "buffer_items_" + record.fingerprint;
    record.generation = "0001";
    record.item_count = items;
    record.size_bytes = items * 500;
    record.created_at = std::chrono::system_clock::now();
    record.filter_json = "{}";
    return record;
}

}  // namespace

TEST_CASE("buffer_registry: register and peek", "[buffer][registry]") {
    auto db = create_test_database();
    buffer_registry registry(db->native_handle());
    REQUIRE(registry.is_valid());

    REQUIRE(registry.register_buffer(make_record('a', 33)).is_ok());

    auto found = registry.peek(fingerprint('a'));
    REQUIRE(found.is_ok());
    REQUIRE(found.value().has_value());
    CHECK(found.value()->table_name == "buffer_items_" + fingerprint('a'));
    CHECK(found.value()->item_count == 33);
    CHECK(found.value()->size_bytes == 33 * 500);
    CHECK(found.value()->filter_json == "{}");

    auto missing = registry.peek(fingerprint('b'));
    REQUIRE(missing.is_ok());
    CHECK_FALSE(missing.value().has_value());
}

TEST_CASE("buffer_registry: register replaces an existing row", "[buffer][registry]") {
    auto db = create_test_database();
    buffer_registry registry(db->native_handle());

    REQUIRE(registry.register_buffer(make_record('a', 5)).is_ok());

    auto replacement = make_record('a', 7);
    replacement.generation = "0002";
    REQUIRE(registry.register_buffer(replacement).is_ok());

    auto all = registry.list_all();
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 1);
    CHECK(all.value()[0].generation == "0002");
    CHECK(all.value()[0].item_count == 7);
}

TEST_CASE("buffer_registry: invalid records are rejected", "[buffer][registry]") {
    auto db = create_test_database();
    buffer_registry registry(db->native_handle());

    buffer_record record;
    auto result = registry.register_buffer(record);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::invalid_argument);
}

TEST_CASE("buffer_registry: lookup bumps access time", "[buffer][registry]") {
    auto db = create_test_database();
    buffer_registry registry(db->native_handle());

    REQUIRE(registry.register_buffer(make_record('a')).is_ok());
    REQUIRE(registry.register_buffer(make_record('b')).is_ok());

    auto before = registry.peek(fingerprint('a'));
    REQUIRE(before.is_ok());

    auto hit = registry.lookup(fingerprint('a'));
    REQUIRE(hit.is_ok());
    REQUIRE(hit.value().has_value());
    CHECK(hit.value()->last_accessed_at > before.value()->last_accessed_at);

    // 'a' is now the most recent entry
    auto all = registry.list_all();
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 2);
    CHECK(all.value()[0].fingerprint == fingerprint('b'));
    CHECK(all.value()[1].fingerprint == fingerprint('a'));

    SECTION("peek does not bump") {
        auto peeked = registry.peek(fingerprint('b'));
        REQUIRE(peeked.is_ok());
        auto again = registry.list_all();
        REQUIRE(again.is_ok());
        CHECK(again.value()[0].fingerprint == fingerprint('b'));
    }

    SECTION("lookup of unknown fingerprint is empty") {
        auto miss = registry.lookup(fingerprint('c'));
        REQUIRE(miss.is_ok());
        CHECK_FALSE(miss.value().has_value());
    }
}

TEST_CASE("buffer_registry: access times never tie", "[buffer][registry]") {
    auto db = create_test_database();
    buffer_registry registry(db->native_handle());

    for (char c : std::string("abcdef")) {
        REQUIRE(registry.register_buffer(make_record(c)).is_ok());
    }
    for (int i = 0; i < 20; ++i) {
        REQUIRE(registry.lookup(fingerprint(i % 2 == 0 ? 'c' : 'e')).is_ok());
    }

    auto all = registry.list_all();
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 6);
    for (size_t i = 1; i < all.value().size(); ++i) {
        CHECK(all.value()[i - 1].last_accessed_at < all.value()[i].last_accessed_at);
    }
    CHECK(all.value().back().fingerprint == fingerprint('e'));
}

TEST_CASE("buffer_registry: aggregate", "[buffer][registry]") {
    auto db = create_test_database();
    buffer_registry registry(db->native_handle());

    SECTION("empty registry") {
        auto totals = registry.aggregate();
        REQUIRE(totals.is_ok());
        CHECK(totals.value().count == 0);
        CHECK(totals.value().total_items == 0);
        CHECK(totals.value().total_size_bytes == 0);
    }

    SECTION("sums over all rows") {
        REQUIRE(registry.register_buffer(make_record('a', 10)).is_ok());
        REQUIRE(registry.register_buffer(make_record('b', 20)).is_ok());

        auto totals = registry.aggregate();
        REQUIRE(totals.is_ok());
        CHECK(totals.value().count == 2);
        CHECK(totals.value().total_items == 30);
        CHECK(totals.value().total_size_bytes == 30 * 500);
    }
}

TEST_CASE("buffer_registry: remove and remove_all", "[buffer][registry]") {
    auto db = create_test_database();
    buffer_registry registry(db->native_handle());

    REQUIRE(registry.register_buffer(make_record('a')).is_ok());
    REQUIRE(registry.register_buffer(make_record('b')).is_ok());
    REQUIRE(registry.register_buffer(make_record('c')).is_ok());

    REQUIRE(registry.remove(fingerprint('b')).is_ok());
    REQUIRE(registry.remove(fingerprint('z')).is_ok());

    auto totals = registry.aggregate();
    REQUIRE(totals.is_ok());
    CHECK(totals.value().count == 2);

    auto removed = registry.remove_all();
    REQUIRE(removed.is_ok());
    CHECK(removed.value() == 2);

    auto all = registry.list_all();
    REQUIRE(all.is_ok());
    CHECK(all.value().empty());
}
