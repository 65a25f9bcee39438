/**
 * @file buffer_builder.hpp
 * @brief Materializes catalog query results into buffer tables
 *
 * A build never writes to the published table of its fingerprint. Rows are
 * loaded into a private staging table which is then swapped in, together
 * with the registry row, by a single publish transaction:
 *
 *   1. query the catalog                 (failure: nothing created)
 *   2. staging table + bulk load + indexes, one transaction
 *   3. drop old table, rename staging, upsert registry, one transaction
 *   4. eviction pass                     (failure: logged only)
 */

#pragma once

#include "buffer_cache_config.hpp"
#include "buffer_evictor.hpp"
#include "buffer_record.hpp"
#include "buffer_registry.hpp"
#include "filter_canonicalizer.hpp"

#include <mediacache/catalog/catalog_query.hpp>
#include <mediacache/core/result.hpp>

#include <string_view>
#include <vector>

namespace mediacache::storage {
class cache_database;
}

namespace mediacache::buffer {

/**
 * @brief Translate a canonical filter into catalog predicates
 *
 * Date bounds are parsed; an end date without a time part covers the
 * whole day. Classification all and absent both leave the nsfw flag
 * unrestricted.
 *
 * @return Result containing the predicates, or invalid_filter if a date
 *         bound cannot be parsed
 */
[[nodiscard]] auto make_catalog_predicates(const filter_spec& spec)
    -> Result<catalog::catalog_predicates>;

/**
 * @brief Builds and publishes buffers
 *
 * Thread Safety: NOT thread-safe. Concurrent builds of one fingerprint from
 * separate connections use distinct staging tables and the last publish
 * wins.
 */
class buffer_builder {
public:
    buffer_builder(storage::cache_database& db, buffer_registry& registry,
                   buffer_evictor& evictor, const buffer_cache_config& config);

    /**
     * @brief Build (or rebuild) the buffer of a canonical filter
     *
     * @param filter Canonical filter; its fingerprint names the buffer
     * @param catalog Source of the rows
     * @param force_rebuild Drop the existing buffer and registry row first
     * @return Result containing the item count, published table name and
     *         generation, or upstream_query_failure, build_failed,
     *         publish_failed
     */
    [[nodiscard]] auto build(const canonical_filter& filter,
                             catalog::catalog_query& catalog,
                             bool force_rebuild = false) -> Result<build_result>;

    /**
     * @brief Drop staging tables left behind by interrupted builds
     *
     * Only call when no build is in flight on this database.
     *
     * @return Result containing the number of dropped tables
     */
    [[nodiscard]] auto sweep_orphaned_staging_tables() -> Result<size_t>;

private:
    [[nodiscard]] auto discard_existing(std::string_view fingerprint) -> VoidResult;

    [[nodiscard]] auto load_staging(std::string_view staging_table,
                                    const std::vector<catalog::catalog_record>& records)
        -> VoidResult;

    [[nodiscard]] auto publish(const canonical_filter& filter,
                               std::string_view staging_table,
                               const build_result& built) -> VoidResult;

    void drop_staging_best_effort(std::string_view staging_table);

    storage::cache_database& db_;
    buffer_registry& registry_;
    buffer_evictor& evictor_;
    const buffer_cache_config& config_;
};

}  // namespace mediacache::buffer
