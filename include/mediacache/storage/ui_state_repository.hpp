/**
 * @file ui_state_repository.hpp
 * @brief Repository for UI state persistence
 *
 * This file provides the ui_state_repository class, a small keyed document
 * store living in the cache database. Front ends use it to remember
 * transient state across restarts, e.g. which filter is currently active.
 */

#pragma once

#include <mediacache/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace mediacache::storage {

/**
 * @brief One stored UI state document
 *
 * Maps directly to the ui_state table.
 */
struct ui_state_entry {
    /// Caller-chosen key
    std::string key;

    /// Stored document (objects keep their keys sorted)
    nlohmann::json value;

    /// Last write time
    std::chrono::system_clock::time_point updated_at;
};

/**
 * @brief Repository for keyed UI state documents
 *
 * Writes replace the whole document; there is no versioning, expiry or
 * eviction.
 *
 * Thread Safety:
 * - This class is NOT thread-safe. External synchronization is required
 *   for concurrent access.
 *
 * @example
 * @code
 * ui_state_repository repo(db->native_handle());
 * repo.put("active_filter", {{"fingerprint", fp}, {"scroll", 120}});
 *
 * auto state = repo.get("active_filter");
 * if (state.is_ok() && state.value()) {
 *     auto fp = (*state.value())["fingerprint"].get<std::string>();
 * }
 * @endcode
 */
class ui_state_repository {
public:
    explicit ui_state_repository(sqlite3* db);
    ~ui_state_repository();

    ui_state_repository(const ui_state_repository&) = delete;
    auto operator=(const ui_state_repository&) -> ui_state_repository& = delete;
    ui_state_repository(ui_state_repository&&) noexcept;
    auto operator=(ui_state_repository&&) noexcept -> ui_state_repository&;

    /**
     * @brief Store a document under a key, replacing any previous value
     *
     * @param key Non-empty key
     * @param value Document to store
     * @return VoidResult indicating success or error
     */
    [[nodiscard]] auto put(std::string_view key, const nlohmann::json& value)
        -> VoidResult;

    /**
     * @brief Read the document stored under a key
     *
     * @param key The key to look up
     * @return Result containing the document, or std::nullopt if absent
     */
    [[nodiscard]] auto get(std::string_view key) const
        -> Result<std::optional<nlohmann::json>>;

    /**
     * @brief Read a stored entry including its update time
     */
    [[nodiscard]] auto find_entry(std::string_view key) const
        -> Result<std::optional<ui_state_entry>>;

    /**
     * @brief Delete the document stored under a key
     *
     * Removing an absent key is not an error.
     */
    [[nodiscard]] auto remove(std::string_view key) -> VoidResult;

    /**
     * @brief List all stored keys in ascending order
     */
    [[nodiscard]] auto keys() const -> Result<std::vector<std::string>>;

    [[nodiscard]] auto is_valid() const noexcept -> bool;

private:
    sqlite3* db_{nullptr};
};

}  // namespace mediacache::storage
