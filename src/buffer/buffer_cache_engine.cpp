/**
 * @file buffer_cache_engine.cpp
 * @brief Implementation of the buffer cache engine
 */

#include <mediacache/buffer/buffer_cache_engine.hpp>

#include <mediacache/buffer/buffer_tables.hpp>
#include <mediacache/buffer/filter_canonicalizer.hpp>
#include <mediacache/compat/format.hpp>
#include <mediacache/integration/logger_adapter.hpp>

namespace mediacache::buffer {

using integration::cache_event;
using integration::logger_adapter;

namespace {

constexpr const char* kModule = "buffer_cache_engine";

constexpr double kBytesPerMegabyte = 1024.0 * 1024.0;

}  // namespace

// ============================================================================
// Construction
// ============================================================================

auto buffer_cache_engine::open(std::string_view db_path,
                               catalog::catalog_query& catalog,
                               const buffer_cache_config& config,
                               const storage::cache_db_config& db_config)
    -> Result<std::unique_ptr<buffer_cache_engine>> {
    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<std::unique_ptr<buffer_cache_engine>>::err(valid.error());
    }

    auto db = storage::cache_database::open(db_path, db_config);
    if (db.is_err()) {
        logger_adapter::error("Failed to open cache database {}: {}", db_path,
                              db.error().message);
        return Result<std::unique_ptr<buffer_cache_engine>>::err(db.error());
    }

    logger_adapter::info(
        "Buffer cache opened at {} (max {} buffers, {} MB)", db_path,
        config.max_buffers, config.max_total_size_mb);

    return ok(std::make_unique<buffer_cache_engine>(std::move(db.value()), catalog,
                                                    config));
}

buffer_cache_engine::buffer_cache_engine(
    std::unique_ptr<storage::cache_database> db, catalog::catalog_query& catalog,
    const buffer_cache_config& config)
    : db_(std::move(db)),
      catalog_(catalog),
      config_(config),
      registry_(db_->native_handle()),
      evictor_(*db_, registry_, config_),
      builder_(*db_, registry_, evictor_, config_),
      paginator_(*db_, registry_, config_),
      ui_state_(db_->native_handle()) {}

buffer_cache_engine::~buffer_cache_engine() = default;

// ============================================================================
// Buffers
// ============================================================================

auto buffer_cache_engine::get_or_create_buffer(const filter_spec& spec,
                                               bool force_rebuild)
    -> Result<buffer_handle> {
    auto canonical = canonicalize(spec);
    if (canonical.is_err()) {
        logger_adapter::warn("Rejected filter: {}", canonical.error().message);
        return Result<buffer_handle>::err(canonical.error());
    }

    const auto& filter = canonical.value();

    if (!force_rebuild) {
        auto found = registry_.lookup(filter.fingerprint);
        if (found.is_err()) {
            logger_adapter::error("Registry lookup for {} failed: {}",
                                  filter.fingerprint, found.error().message);
            return Result<buffer_handle>::err(found.error());
        }
        if (found.value()) {
            const auto& record = *found.value();
            logger_adapter::info("Reusing buffer {} ({} items)", record.fingerprint,
                                 record.item_count);
            logger_adapter::log_cache_event(
                cache_event::buffer_reused, record.fingerprint,
                {{"items", std::to_string(record.item_count)},
                 {"generation", record.generation}});
            return ok(buffer_handle{record.fingerprint, record.item_count});
        }
    }

    auto built = builder_.build(filter, catalog_, force_rebuild);
    if (built.is_err()) {
        return Result<buffer_handle>::err(built.error());
    }

    return ok(buffer_handle{filter.fingerprint, built.value().item_count});
}

auto buffer_cache_engine::get_page(std::string_view fingerprint,
                                   const std::optional<page_cursor>& cursor,
                                   size_t limit) -> Result<buffer_page> {
    auto page = paginator_.page(fingerprint, cursor, limit);
    if (page.is_err() && page.error().code != error_codes::buffer_not_found) {
        logger_adapter::warn("Page request for {} failed: {}", fingerprint,
                             page.error().message);
    }
    return page;
}

auto buffer_cache_engine::delete_buffer(std::string_view fingerprint)
    -> VoidResult {
    if (!is_valid_fingerprint(fingerprint)) {
        return cache_void_error(
            error_codes::invalid_fingerprint,
            compat::format("'{}' is not a buffer fingerprint", fingerprint),
            kModule);
    }

    auto found = registry_.peek(fingerprint);
    if (found.is_err()) {
        return VoidResult(found.error());
    }

    auto table = found.value() ? found.value()->table_name
                               : buffer_table_name(fingerprint);

    auto removed = remove_buffer(*db_, registry_, table, fingerprint);
    if (removed.is_err()) {
        logger_adapter::error("Failed to delete buffer {}: {}", fingerprint,
                              removed.error().message);
        return removed;
    }

    if (found.value()) {
        logger_adapter::info("Deleted buffer {}", fingerprint);
        logger_adapter::log_cache_event(cache_event::buffer_deleted, fingerprint);
    }
    return ok();
}

auto buffer_cache_engine::clear_all_buffers() -> Result<size_t> {
    auto tables = db_->list_tables(buffer_table_prefix);
    if (tables.is_err()) {
        return Result<size_t>::err(tables.error());
    }

    size_t dropped = 0;
    for (const auto& table : tables.value()) {
        if (!is_buffer_table_name(table)) {
            continue;
        }
        auto result = drop_buffer_table(*db_, table);
        if (result.is_err()) {
            logger_adapter::error("Failed to drop buffer table {}: {}", table,
                                  result.error().message);
            return Result<size_t>::err(result.error());
        }
        ++dropped;
    }

    auto removed = registry_.remove_all();
    if (removed.is_err()) {
        logger_adapter::error("Failed to clear buffer registry: {}",
                              removed.error().message);
        return Result<size_t>::err(removed.error());
    }

    logger_adapter::info("Cleared {} buffer tables and {} registry rows", dropped,
                         removed.value());
    logger_adapter::log_cache_event(
        cache_event::buffers_cleared, "",
        {{"tables", std::to_string(dropped)},
         {"records", std::to_string(removed.value())}});
    return ok(dropped);
}

auto buffer_cache_engine::sweep_orphaned_staging_tables() -> Result<size_t> {
    return builder_.sweep_orphaned_staging_tables();
}

auto buffer_cache_engine::evict() -> Result<eviction_report> {
    return evictor_.evict();
}

// ============================================================================
// Diagnostics
// ============================================================================

auto buffer_cache_engine::get_stats() const -> Result<buffer_stats> {
    auto totals = registry_.aggregate();
    if (totals.is_err()) {
        return Result<buffer_stats>::err(totals.error());
    }

    buffer_stats stats;
    stats.buffer_count = totals.value().count;
    stats.total_items = totals.value().total_items;
    stats.total_size_mb =
        static_cast<double>(totals.value().total_size_bytes) / kBytesPerMegabyte;
    return ok(stats);
}

auto buffer_cache_engine::list_buffers() const
    -> Result<std::vector<buffer_record>> {
    return registry_.list_all();
}

auto buffer_cache_engine::find_buffer(std::string_view fingerprint) const
    -> Result<std::optional<buffer_record>> {
    return registry_.peek(fingerprint);
}

// ============================================================================
// UI State
// ============================================================================

auto buffer_cache_engine::save_ui_state(std::string_view key,
                                        const nlohmann::json& value) -> VoidResult {
    auto result = ui_state_.put(key, value);
    if (result.is_err()) {
        logger_adapter::warn("Failed to save UI state '{}': {}", key,
                             result.error().message);
    }
    return result;
}

auto buffer_cache_engine::get_ui_state(std::string_view key) const
    -> Result<std::optional<nlohmann::json>> {
    return ui_state_.get(key);
}

// ============================================================================
// Accessors
// ============================================================================

auto buffer_cache_engine::config() const noexcept -> const buffer_cache_config& {
    return config_;
}

auto buffer_cache_engine::database() noexcept -> storage::cache_database& {
    return *db_;
}

}  // namespace mediacache::buffer
