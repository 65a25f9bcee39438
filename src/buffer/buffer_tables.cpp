/**
 * @file buffer_tables.cpp
 * @brief Implementation of per-buffer table helpers
 */

#include <mediacache/buffer/buffer_tables.hpp>

#include <mediacache/buffer/filter_canonicalizer.hpp>
#include <mediacache/compat/format.hpp>
#include <mediacache/core/result.hpp>
#include <mediacache/core/timestamp.hpp>
#include <mediacache/storage/cache_database.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <random>

namespace mediacache::buffer {

using kcenon::common::ok;

namespace {

constexpr const char* kModule = "buffer_tables";

auto is_lower_hex(std::string_view text) noexcept -> bool {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

auto process_salt() -> uint32_t {
    static const uint32_t salt = [] {
        std::random_device rd;
        return static_cast<uint32_t>(rd());
    }();
    return salt;
}

auto invalid_name(std::string_view table_name) -> VoidResult {
    return cache_void_error(
        error_codes::invalid_argument,
        compat::format("'{}' is not a buffer table name", table_name), kModule);
}

}  // namespace

auto buffer_table_name(std::string_view fingerprint) -> std::string {
    return std::string(buffer_table_prefix) + std::string(fingerprint);
}

auto staging_table_name(std::string_view fingerprint, std::string_view generation)
    -> std::string {
    return buffer_table_name(fingerprint) + std::string(staging_marker) +
           std::string(generation);
}

auto make_generation_token() -> std::string {
    static std::atomic<uint32_t> counter{0};
    auto now = static_cast<uint64_t>(
        to_epoch_micros(std::chrono::system_clock::now()));
    auto sequence = counter.fetch_add(1, std::memory_order_relaxed) & 0xffffffu;
    return compat::format("{:014x}{:08x}{:06x}", now, process_salt(), sequence);
}

auto is_buffer_table_name(std::string_view name) noexcept -> bool {
    if (name.substr(0, buffer_table_prefix.size()) != buffer_table_prefix) {
        return false;
    }
    auto rest = name.substr(buffer_table_prefix.size());
    if (!is_valid_fingerprint(rest.substr(0, 64))) {
        return false;
    }
    rest = rest.substr(64);
    if (rest.empty()) {
        return true;
    }
    if (rest.substr(0, staging_marker.size()) != staging_marker) {
        return false;
    }
    return is_lower_hex(rest.substr(staging_marker.size()));
}

auto is_staging_table_name(std::string_view name) noexcept -> bool {
    return is_buffer_table_name(name) &&
           name.size() > buffer_table_prefix.size() + 64;
}

auto create_buffer_table(storage::cache_database& db, std::string_view table_name)
    -> VoidResult {
    if (!is_buffer_table_name(table_name)) {
        return invalid_name(table_name);
    }

    return db.execute(compat::format(R"(
        CREATE TABLE {} (
            id                  INTEGER PRIMARY KEY,
            media_file_id       INTEGER NOT NULL,
            filename            TEXT NOT NULL,
            file_path           TEXT NOT NULL,
            file_size           INTEGER NOT NULL DEFAULT 0,
            file_type           TEXT,
            extension           TEXT,
            score               INTEGER NOT NULL DEFAULT 0,
            width               INTEGER,
            height              INTEGER,
            created_at          INTEGER NOT NULL,
            original_created_at INTEGER,
            nsfw                INTEGER NOT NULL DEFAULT 0,
            nsfw_score          REAL
        );
    )", table_name));
}

auto create_buffer_indexes(storage::cache_database& db,
                           std::string_view table_name) -> VoidResult {
    if (!is_buffer_table_name(table_name)) {
        return invalid_name(table_name);
    }

    // Index names are derived from the staging name and survive the rename
    return db.execute(compat::format(R"(
        CREATE INDEX idx_{0}_created ON {0}(created_at DESC, id DESC);
        CREATE INDEX idx_{0}_ordering
            ON {0}(COALESCE(original_created_at, created_at) DESC, id DESC);
        CREATE INDEX idx_{0}_score ON {0}(score DESC, filename);
    )", table_name));
}

auto drop_buffer_table(storage::cache_database& db, std::string_view table_name)
    -> VoidResult {
    if (!is_buffer_table_name(table_name)) {
        return invalid_name(table_name);
    }
    return db.execute(compat::format("DROP TABLE IF EXISTS {};", table_name));
}

}  // namespace mediacache::buffer
