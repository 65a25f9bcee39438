/**
 * @file buffer_builder.cpp
 * @brief Implementation of buffer construction and publish
 */

#include <mediacache/buffer/buffer_builder.hpp>

#include <mediacache/buffer/buffer_tables.hpp>
#include <mediacache/compat/format.hpp>
#include <mediacache/core/timestamp.hpp>
#include <mediacache/integration/logger_adapter.hpp>
#include <mediacache/storage/cache_database.hpp>

#include <sqlite3.h>

#include <chrono>

namespace mediacache::buffer {

using integration::cache_event;
using integration::logger_adapter;

namespace {

constexpr const char* kModule = "buffer_builder";

auto bind_optional_int(sqlite3_stmt* stmt, int idx, const std::optional<int>& value)
    -> void {
    if (value) {
        sqlite3_bind_int(stmt, idx, *value);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

}  // namespace

auto make_catalog_predicates(const filter_spec& spec)
    -> Result<catalog::catalog_predicates> {
    catalog::catalog_predicates predicates;
    predicates.keywords = spec.keywords;
    predicates.match_all = spec.match_all;
    predicates.file_types = spec.file_types;
    predicates.min_score = spec.min_score;
    predicates.max_score = spec.max_score;
    predicates.sort = spec.sort;
    predicates.direction = spec.direction;

    if (spec.start_date) {
        auto start = parse_iso8601(*spec.start_date);
        if (!start) {
            return cache_error<catalog::catalog_predicates>(
                error_codes::invalid_filter,
                compat::format("Invalid start_date '{}'", *spec.start_date), kModule);
        }
        predicates.created_from = *start;
    }

    if (spec.end_date) {
        auto end = parse_iso8601(*spec.end_date);
        if (!end) {
            return cache_error<catalog::catalog_predicates>(
                error_codes::invalid_filter,
                compat::format("Invalid end_date '{}'", *spec.end_date), kModule);
        }
        if (is_date_only(*spec.end_date)) {
            *end += std::chrono::hours(24) - std::chrono::microseconds(1);
        }
        predicates.created_until = *end;
    }

    if (spec.classification == classification_filter::sfw) {
        predicates.nsfw = false;
    } else if (spec.classification == classification_filter::nsfw) {
        predicates.nsfw = true;
    }

    return ok(std::move(predicates));
}

buffer_builder::buffer_builder(storage::cache_database& db,
                               buffer_registry& registry, buffer_evictor& evictor,
                               const buffer_cache_config& config)
    : db_(db), registry_(registry), evictor_(evictor), config_(config) {}

auto buffer_builder::build(const canonical_filter& filter,
                           catalog::catalog_query& catalog, bool force_rebuild)
    -> Result<build_result> {
    const auto& fingerprint = filter.fingerprint;
    if (!is_valid_fingerprint(fingerprint)) {
        return cache_error<build_result>(
            error_codes::invalid_fingerprint,
            compat::format("'{}' is not a buffer fingerprint", fingerprint),
            kModule);
    }

    if (force_rebuild) {
        auto discarded = discard_existing(fingerprint);
        if (discarded.is_err()) {
            return Result<build_result>::err(discarded.error());
        }
    }

    auto predicates = make_catalog_predicates(filter.spec);
    if (predicates.is_err()) {
        return Result<build_result>::err(predicates.error());
    }

    auto started = std::chrono::steady_clock::now();

    auto records = catalog.find(predicates.value());
    if (records.is_err()) {
        logger_adapter::warn("Catalog query failed for buffer {}: {}", fingerprint,
                             records.error().message);
        logger_adapter::log_cache_event(cache_event::build_failed, fingerprint,
                                        {{"stage", "catalog"},
                                         {"error", records.error().message}});
        return cache_error<build_result>(
            error_codes::upstream_query_failure,
            compat::format("Catalog query failed: {}", records.error().message),
            kModule);
    }

    build_result built;
    built.generation = make_generation_token();
    built.table_name = buffer_table_name(fingerprint);
    built.item_count = static_cast<int64_t>(records.value().size());

    auto staging = staging_table_name(fingerprint, built.generation);

    auto loaded = load_staging(staging, records.value());
    if (loaded.is_err()) {
        drop_staging_best_effort(staging);
        logger_adapter::error("Failed to load buffer {}: {}", fingerprint,
                              loaded.error().message);
        logger_adapter::log_cache_event(cache_event::build_failed, fingerprint,
                                        {{"stage", "load"},
                                         {"error", loaded.error().message}});
        return cache_error<build_result>(
            error_codes::build_failed,
            compat::format("Failed to load buffer: {}", loaded.error().message),
            kModule);
    }

    auto published = publish(filter, staging, built);
    if (published.is_err()) {
        drop_staging_best_effort(staging);
        logger_adapter::error("Failed to publish buffer {}: {}", fingerprint,
                              published.error().message);
        logger_adapter::log_cache_event(cache_event::build_failed, fingerprint,
                                        {{"stage", "publish"},
                                         {"error", published.error().message}});
        return cache_error<build_result>(
            error_codes::publish_failed,
            compat::format("Failed to publish buffer: {}",
                           published.error().message),
            kModule);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    logger_adapter::info("Built buffer {} with {} items in {} ms (generation {})",
                         fingerprint, built.item_count, elapsed.count(),
                         built.generation);
    logger_adapter::log_cache_event(
        cache_event::buffer_built, fingerprint,
        {{"items", std::to_string(built.item_count)},
         {"generation", built.generation},
         {"elapsed_ms", std::to_string(elapsed.count())},
         {"forced", force_rebuild ? "true" : "false"}});

    auto evicted = evictor_.evict();
    if (evicted.is_err()) {
        logger_adapter::warn("Eviction after building {} failed: {}", fingerprint,
                             evicted.error().message);
    } else if (evicted.value().failures > 0) {
        logger_adapter::warn("Eviction after building {} left {} victims in place",
                             fingerprint, evicted.value().failures);
    }

    return ok(std::move(built));
}

auto buffer_builder::sweep_orphaned_staging_tables() -> Result<size_t> {
    auto tables = db_.list_tables(buffer_table_prefix);
    if (tables.is_err()) {
        return Result<size_t>::err(tables.error());
    }

    size_t dropped = 0;
    for (const auto& table : tables.value()) {
        if (!is_staging_table_name(table)) {
            continue;
        }
        auto result = drop_buffer_table(db_, table);
        if (result.is_err()) {
            logger_adapter::warn("Failed to drop staging table {}: {}", table,
                                 result.error().message);
            return Result<size_t>::err(result.error());
        }
        ++dropped;
    }

    if (dropped > 0) {
        logger_adapter::info("Swept {} orphaned staging tables", dropped);
        logger_adapter::log_cache_event(cache_event::staging_swept, "",
                                        {{"tables", std::to_string(dropped)}});
    }
    return ok(dropped);
}

auto buffer_builder::discard_existing(std::string_view fingerprint) -> VoidResult {
    auto discarded = remove_buffer(db_, registry_, buffer_table_name(fingerprint),
                                   fingerprint);
    if (discarded.is_err()) {
        return discarded;
    }

    logger_adapter::debug("Discarded buffer {} before rebuild", fingerprint);
    return ok();
}

auto buffer_builder::load_staging(
    std::string_view staging_table,
    const std::vector<catalog::catalog_record>& records) -> VoidResult {
    auto began = db_.begin_transaction();
    if (began.is_err()) {
        return began;
    }

    auto created = create_buffer_table(db_, staging_table);
    if (created.is_err()) {
        db_.rollback();
        return created;
    }

    auto sql = compat::format(R"(
        INSERT INTO {} (
            id, media_file_id, filename, file_path, file_size, file_type,
            extension, score, width, height, created_at, original_created_at,
            nsfw, nsfw_score
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )", staging_table);

    auto* db = db_.native_handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        auto message = compat::format("Failed to prepare insert: {}",
                                      sqlite3_errmsg(db));
        db_.rollback();
        return cache_void_error(error_codes::storage_failure, message, kModule);
    }

    int64_t row_id = 0;
    for (const auto& record : records) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        int idx = 1;
        sqlite3_bind_int64(stmt, idx++, ++row_id);
        sqlite3_bind_int64(stmt, idx++, record.id);
        sqlite3_bind_text(stmt, idx++, record.filename.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, idx++, record.file_path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, idx++, record.file_size);
        sqlite3_bind_text(stmt, idx++, record.file_type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, idx++, record.extension.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, idx++, record.score);
        bind_optional_int(stmt, idx++, record.width);
        bind_optional_int(stmt, idx++, record.height);
        sqlite3_bind_int64(stmt, idx++, to_epoch_micros(record.created_at));
        if (record.original_created_at) {
            sqlite3_bind_int64(stmt, idx++,
                               to_epoch_micros(*record.original_created_at));
        } else {
            sqlite3_bind_null(stmt, idx++);
        }
        sqlite3_bind_int(stmt, idx++, record.nsfw ? 1 : 0);
        if (record.nsfw_score) {
            sqlite3_bind_double(stmt, idx++, *record.nsfw_score);
        } else {
            sqlite3_bind_null(stmt, idx++);
        }

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            auto message = compat::format("Failed to insert row {}: {}", row_id,
                                          sqlite3_errmsg(db));
            sqlite3_finalize(stmt);
            db_.rollback();
            return cache_void_error(error_codes::storage_failure, message, kModule);
        }
    }
    sqlite3_finalize(stmt);

    auto indexed = create_buffer_indexes(db_, staging_table);
    if (indexed.is_err()) {
        db_.rollback();
        return indexed;
    }

    auto committed = db_.commit();
    if (committed.is_err()) {
        db_.rollback();
        return committed;
    }
    return ok();
}

auto buffer_builder::publish(const canonical_filter& filter,
                             std::string_view staging_table,
                             const build_result& built) -> VoidResult {
    auto began = db_.begin_transaction();
    if (began.is_err()) {
        return began;
    }

    auto step = drop_buffer_table(db_, built.table_name);
    if (step.is_ok()) {
        step = db_.execute(compat::format("ALTER TABLE {} RENAME TO {};",
                                          staging_table, built.table_name));
    }
    if (step.is_ok()) {
        buffer_record record;
        record.fingerprint = filter.fingerprint;
        record.table_name = built.table_name;
        record.generation = built.generation;
        record.item_count = built.item_count;
        record.size_bytes =
            built.item_count * static_cast<int64_t>(config_.estimated_row_bytes);
        record.created_at = std::chrono::system_clock::now();
        record.filter_json = filter.canonical_json;
        step = registry_.register_buffer(record);
    }
    if (step.is_err()) {
        db_.rollback();
        return step;
    }

    auto committed = db_.commit();
    if (committed.is_err()) {
        db_.rollback();
        return committed;
    }
    return ok();
}

void buffer_builder::drop_staging_best_effort(std::string_view staging_table) {
    auto dropped = drop_buffer_table(db_, staging_table);
    if (dropped.is_err()) {
        logger_adapter::error(
            "Staging table {} left behind, will be reclaimed by the next sweep: {}",
            staging_table, dropped.error().message);
    }
}

}  // namespace mediacache::buffer
