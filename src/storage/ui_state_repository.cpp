/**
 * @file ui_state_repository.cpp
 * @brief Implementation of the UI state repository
 */

#include <mediacache/storage/ui_state_repository.hpp>

#include <mediacache/compat/format.hpp>
#include <mediacache/core/result.hpp>
#include <mediacache/core/timestamp.hpp>

#include <sqlite3.h>

namespace mediacache::storage {

using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

constexpr const char* kModule = "ui_state_repository";

[[nodiscard]] std::string get_text_column(sqlite3_stmt* stmt, int col) {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

}  // namespace

ui_state_repository::ui_state_repository(sqlite3* db) : db_(db) {}

ui_state_repository::~ui_state_repository() = default;

ui_state_repository::ui_state_repository(ui_state_repository&&) noexcept = default;

auto ui_state_repository::operator=(ui_state_repository&&) noexcept
    -> ui_state_repository& = default;

VoidResult ui_state_repository::put(std::string_view key,
                                    const nlohmann::json& value) {
    if (!db_) {
        return VoidResult(kcenon::common::error_info{
            error_codes::storage_failure, "Database not initialized", kModule});
    }
    if (key.empty()) {
        return VoidResult(kcenon::common::error_info{
            error_codes::invalid_key, "UI state key must not be empty", kModule});
    }

    std::string document;
    try {
        document = value.dump();
    } catch (const nlohmann::json::type_error& e) {
        return VoidResult(kcenon::common::error_info{
            error_codes::serialization_error,
            "Failed to serialize UI state: " + std::string(e.what()), kModule});
    }

    static constexpr const char* sql = R"(
        INSERT INTO ui_state (key, value, updated_at)
        VALUES (?, ?, ?)
        ON CONFLICT(key) DO UPDATE SET
            value = excluded.value,
            updated_at = excluded.updated_at
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return VoidResult(kcenon::common::error_info{
            error_codes::storage_failure,
            "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)),
            kModule});
    }

    sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, document.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, to_epoch_micros(std::chrono::system_clock::now()));

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return VoidResult(kcenon::common::error_info{
            error_codes::storage_failure,
            "Failed to save UI state: " + std::string(sqlite3_errmsg(db_)),
            kModule});
    }

    return ok();
}

auto ui_state_repository::get(std::string_view key) const
    -> Result<std::optional<nlohmann::json>> {
    auto entry = find_entry(key);
    if (entry.is_err()) {
        return Result<std::optional<nlohmann::json>>::err(entry.error());
    }
    if (!entry.value()) {
        return ok(std::optional<nlohmann::json>{});
    }
    return ok(std::optional<nlohmann::json>{std::move(entry.value()->value)});
}

auto ui_state_repository::find_entry(std::string_view key) const
    -> Result<std::optional<ui_state_entry>> {
    if (!db_) {
        return make_error<std::optional<ui_state_entry>>(
            error_codes::storage_failure, "Database not initialized", kModule);
    }

    static constexpr const char* sql =
        "SELECT key, value, updated_at FROM ui_state WHERE key = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<std::optional<ui_state_entry>>(
            error_codes::storage_failure,
            "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)),
            kModule);
    }

    sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()),
                      SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return ok(std::optional<ui_state_entry>{});
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return make_error<std::optional<ui_state_entry>>(
            error_codes::storage_failure,
            "Failed to read UI state: " + std::string(sqlite3_errmsg(db_)),
            kModule);
    }

    ui_state_entry entry;
    entry.key = get_text_column(stmt, 0);
    auto document = get_text_column(stmt, 1);
    entry.updated_at = from_epoch_micros(sqlite3_column_int64(stmt, 2));
    sqlite3_finalize(stmt);

    auto parsed = nlohmann::json::parse(document, nullptr, false);
    if (parsed.is_discarded()) {
        return make_error<std::optional<ui_state_entry>>(
            error_codes::serialization_error,
            compat::format("Stored UI state '{}' is not valid JSON", entry.key),
            kModule);
    }
    entry.value = std::move(parsed);

    return ok(std::optional<ui_state_entry>{std::move(entry)});
}

VoidResult ui_state_repository::remove(std::string_view key) {
    if (!db_) {
        return VoidResult(kcenon::common::error_info{
            error_codes::storage_failure, "Database not initialized", kModule});
    }

    static constexpr const char* sql = "DELETE FROM ui_state WHERE key = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return VoidResult(kcenon::common::error_info{
            error_codes::storage_failure,
            "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)),
            kModule});
    }

    sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()),
                      SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return VoidResult(kcenon::common::error_info{
            error_codes::storage_failure,
            "Failed to delete UI state: " + std::string(sqlite3_errmsg(db_)),
            kModule});
    }

    return ok();
}

auto ui_state_repository::keys() const -> Result<std::vector<std::string>> {
    if (!db_) {
        return make_error<std::vector<std::string>>(
            error_codes::storage_failure, "Database not initialized", kModule);
    }

    static constexpr const char* sql = "SELECT key FROM ui_state ORDER BY key";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<std::vector<std::string>>(
            error_codes::storage_failure,
            "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)),
            kModule);
    }

    std::vector<std::string> result;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        result.push_back(get_text_column(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_error<std::vector<std::string>>(
            error_codes::storage_failure,
            "Failed to list UI state keys: " + std::string(sqlite3_errmsg(db_)),
            kModule);
    }
    return ok(std::move(result));
}

auto ui_state_repository::is_valid() const noexcept -> bool {
    return db_ != nullptr;
}

}  // namespace mediacache::storage
