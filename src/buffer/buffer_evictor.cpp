/**
 * @file buffer_evictor.cpp
 * @brief Implementation of LRU buffer eviction
 */

#include <mediacache/buffer/buffer_evictor.hpp>

#include <mediacache/buffer/buffer_tables.hpp>
#include <mediacache/compat/format.hpp>
#include <mediacache/integration/logger_adapter.hpp>
#include <mediacache/storage/cache_database.hpp>

namespace mediacache::buffer {

using integration::cache_event;
using integration::logger_adapter;

auto remove_buffer(storage::cache_database& db, buffer_registry& registry,
                   std::string_view table_name, std::string_view fingerprint)
    -> VoidResult {
    auto began = db.begin_transaction();
    if (began.is_err()) {
        return began;
    }

    auto removed = drop_buffer_table(db, table_name);
    if (removed.is_ok()) {
        removed = registry.remove(fingerprint);
    }
    if (removed.is_err()) {
        db.rollback();
        return removed;
    }

    auto committed = db.commit();
    if (committed.is_err()) {
        db.rollback();
        return committed;
    }
    return ok();
}

buffer_evictor::buffer_evictor(storage::cache_database& db,
                               buffer_registry& registry,
                               const buffer_cache_config& config)
    : db_(db), registry_(registry), config_(config) {}

auto buffer_evictor::within_budget(const buffer_aggregate& totals) const noexcept
    -> bool {
    return totals.count <= config_.max_buffers &&
           totals.total_size_bytes <= config_.max_total_bytes();
}

auto buffer_evictor::evict() -> Result<eviction_report> {
    eviction_report report;

    auto totals = registry_.aggregate();
    if (totals.is_err()) {
        return Result<eviction_report>::err(totals.error());
    }
    if (within_budget(totals.value())) {
        return ok(std::move(report));
    }

    auto records = registry_.list_all();
    if (records.is_err()) {
        return Result<eviction_report>::err(records.error());
    }

    auto remaining = totals.value();
    const auto& candidates = records.value();

    logger_adapter::info(
        "Buffer cache over budget ({} buffers, {} bytes), evicting",
        remaining.count, remaining.total_size_bytes);

    // candidates are oldest first; the last one is the most recent and stays
    for (size_t i = 0; i + 1 < candidates.size() && !within_budget(remaining); ++i) {
        const auto& victim = candidates[i];

        auto drop = remove_buffer(db_, registry_, victim.table_name,
                                  victim.fingerprint);

        if (drop.is_err()) {
            ++report.failures;
            report.errors.push_back(error_info{
                error_codes::eviction_failure,
                compat::format("Failed to evict buffer {}: {}", victim.fingerprint,
                               drop.error().message),
                "buffer_evictor"});
            logger_adapter::warn("{}", report.errors.back().message);
            logger_adapter::log_cache_event(
                cache_event::eviction_failed, victim.fingerprint,
                {{"error", drop.error().message}});
            continue;
        }

        remaining.count -= 1;
        remaining.total_items -= victim.item_count;
        remaining.total_size_bytes -= victim.size_bytes;
        report.evicted.push_back(victim.fingerprint);

        logger_adapter::info("Evicted buffer {} ({} items)", victim.fingerprint,
                             victim.item_count);
        logger_adapter::log_cache_event(
            cache_event::buffer_evicted, victim.fingerprint,
            {{"items", std::to_string(victim.item_count)},
             {"size_bytes", std::to_string(victim.size_bytes)}});
    }

    if (!within_budget(remaining)) {
        logger_adapter::warn(
            "Buffer cache still over budget after eviction ({} buffers, {} bytes)",
            remaining.count, remaining.total_size_bytes);
    }

    return ok(std::move(report));
}

}  // namespace mediacache::buffer
