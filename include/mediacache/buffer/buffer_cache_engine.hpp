/**
 * @file buffer_cache_engine.hpp
 * @brief Entry point of the materialized filter-result buffer cache
 *
 * This file provides the buffer_cache_engine class which ties together
 * canonicalization, the registry, the builder, the paginator, the evictor
 * and the UI state store over one cache database.
 */

#pragma once

#include "buffer_builder.hpp"
#include "buffer_cache_config.hpp"
#include "buffer_evictor.hpp"
#include "buffer_record.hpp"
#include "buffer_registry.hpp"
#include "filter_spec.hpp"
#include "paginator.hpp"

#include <mediacache/catalog/catalog_query.hpp>
#include <mediacache/core/result.hpp>
#include <mediacache/storage/cache_database.hpp>
#include <mediacache/storage/ui_state_repository.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace mediacache::buffer {

/**
 * @brief Materialized filter-result cache over a media catalog
 *
 * A caller presents a filter_spec and receives a fingerprint; pages of the
 * snapshot are then read by fingerprint and cursor. Identical filters share
 * one buffer. Buffers are point-in-time snapshots until rebuilt.
 *
 * The engine owns its database connection and borrows the catalog, which
 * must outlive it.
 *
 * Thread Safety:
 * - NOT thread-safe. Serialize access externally, or open one engine per
 *   thread on the same file-backed database.
 *
 * @example
 * @code
 * sqlite_catalog catalog(catalog_db);
 * auto engine = buffer_cache_engine::open("/var/cache/media/buffers.db", catalog);
 * if (engine.is_err()) {
 *     return;
 * }
 * auto& cache = *engine.value();
 * cache.clear_all_buffers();
 *
 * filter_spec spec;
 * spec.min_score = 4;
 * auto handle = cache.get_or_create_buffer(spec);
 *
 * std::optional<page_cursor> cursor;
 * do {
 *     auto page = cache.get_page(handle.value().fingerprint, cursor, 100);
 *     if (page.is_err()) break;
 *     render(page.value().rows);
 *     cursor = page.value().next_cursor;
 * } while (cursor);
 * @endcode
 */
class buffer_cache_engine {
public:
    /**
     * @brief Open the cache database and create an engine over it
     *
     * @param db_path Database file, or ":memory:"
     * @param catalog Catalog the buffers are built from (borrowed)
     * @param config Budgets and page sizes
     * @param db_config SQLite tuning
     * @return Result containing the engine, or invalid_configuration /
     *         database errors
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   catalog::catalog_query& catalog,
                                   const buffer_cache_config& config = {},
                                   const storage::cache_db_config& db_config = {})
        -> Result<std::unique_ptr<buffer_cache_engine>>;

    /**
     * @brief Create an engine over an already open database
     */
    buffer_cache_engine(std::unique_ptr<storage::cache_database> db,
                        catalog::catalog_query& catalog,
                        const buffer_cache_config& config);

    ~buffer_cache_engine();

    buffer_cache_engine(const buffer_cache_engine&) = delete;
    auto operator=(const buffer_cache_engine&) -> buffer_cache_engine& = delete;
    buffer_cache_engine(buffer_cache_engine&&) = delete;
    auto operator=(buffer_cache_engine&&) -> buffer_cache_engine& = delete;

    // ========================================================================
    // Buffers
    // ========================================================================

    /**
     * @brief Return the buffer of a filter, building it on a miss
     *
     * A hit refreshes the buffer's access time and does not query the
     * catalog.
     *
     * @param spec Caller's filter
     * @param force_rebuild Rebuild from the catalog even if a buffer exists
     * @return Result containing fingerprint and item count
     */
    [[nodiscard]] auto get_or_create_buffer(const filter_spec& spec,
                                            bool force_rebuild = false)
        -> Result<buffer_handle>;

    /**
     * @brief Fetch one page of a buffer
     *
     * @see paginator::page
     */
    [[nodiscard]] auto get_page(std::string_view fingerprint,
                                const std::optional<page_cursor>& cursor,
                                size_t limit = 0) -> Result<buffer_page>;

    /**
     * @brief Drop one buffer's table and registry row
     *
     * Deleting an unknown fingerprint is not an error.
     */
    [[nodiscard]] auto delete_buffer(std::string_view fingerprint) -> VoidResult;

    /**
     * @brief Drop every buffer and staging table and empty the registry
     *
     * Intended for startup, before any other call.
     *
     * @return Result containing the number of dropped tables
     */
    [[nodiscard]] auto clear_all_buffers() -> Result<size_t>;

    /**
     * @brief Drop staging tables of interrupted builds
     *
     * @return Result containing the number of dropped tables
     */
    [[nodiscard]] auto sweep_orphaned_staging_tables() -> Result<size_t>;

    /**
     * @brief Run an eviction pass outside of a build
     */
    [[nodiscard]] auto evict() -> Result<eviction_report>;

    // ========================================================================
    // Diagnostics
    // ========================================================================

    [[nodiscard]] auto get_stats() const -> Result<buffer_stats>;

    /**
     * @brief All registry records, least recently accessed first
     */
    [[nodiscard]] auto list_buffers() const -> Result<std::vector<buffer_record>>;

    /**
     * @brief Registry record of one buffer without refreshing its access time
     */
    [[nodiscard]] auto find_buffer(std::string_view fingerprint) const
        -> Result<std::optional<buffer_record>>;

    // ========================================================================
    // UI State
    // ========================================================================

    [[nodiscard]] auto save_ui_state(std::string_view key,
                                     const nlohmann::json& value) -> VoidResult;

    [[nodiscard]] auto get_ui_state(std::string_view key) const
        -> Result<std::optional<nlohmann::json>>;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] auto config() const noexcept -> const buffer_cache_config&;

    [[nodiscard]] auto database() noexcept -> storage::cache_database&;

private:
    std::unique_ptr<storage::cache_database> db_;
    catalog::catalog_query& catalog_;
    buffer_cache_config config_;
    buffer_registry registry_;
    buffer_evictor evictor_;
    buffer_builder builder_;
    paginator paginator_;
    storage::ui_state_repository ui_state_;
};

}  // namespace mediacache::buffer
