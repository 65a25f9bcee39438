/**
 * @file buffer_registry.cpp
 * @brief Implementation of the buffer registry repository
 */

#include <mediacache/buffer/buffer_registry.hpp>

#include <mediacache/compat/format.hpp>
#include <mediacache/core/result.hpp>
#include <mediacache/core/timestamp.hpp>

#include <sqlite3.h>

namespace mediacache::buffer {

using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

constexpr const char* kModule = "buffer_registry";

constexpr const char* kSelectColumns = R"(
    SELECT fingerprint, table_name, generation, item_count, size_bytes,
           created_at, last_accessed_at, filter_json
    FROM buffer_registry
)";

auto get_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text =
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

auto parse_record_row(sqlite3_stmt* stmt) -> buffer_record {
    buffer_record record;
    record.fingerprint = get_text(stmt, 0);
    record.table_name = get_text(stmt, 1);
    record.generation = get_text(stmt, 2);
    record.item_count = sqlite3_column_int64(stmt, 3);
    record.size_bytes = sqlite3_column_int64(stmt, 4);
    record.created_at = from_epoch_micros(sqlite3_column_int64(stmt, 5));
    record.last_accessed_at = from_epoch_micros(sqlite3_column_int64(stmt, 6));
    record.filter_json = get_text(stmt, 7);
    return record;
}

}  // namespace

buffer_registry::buffer_registry(sqlite3* db) : db_(db) {}

buffer_registry::~buffer_registry() = default;

buffer_registry::buffer_registry(buffer_registry&&) noexcept = default;

auto buffer_registry::operator=(buffer_registry&&) noexcept
    -> buffer_registry& = default;

// ============================================================================
// Lookup
// ============================================================================

auto buffer_registry::lookup(std::string_view fingerprint)
    -> Result<std::optional<buffer_record>> {
    if (!db_) {
        return make_error<std::optional<buffer_record>>(
            error_codes::storage_failure, "Database not initialized", kModule);
    }

    static constexpr const char* sql = R"(
        UPDATE buffer_registry
        SET last_accessed_at = MAX(
            ?, (SELECT COALESCE(MAX(last_accessed_at), 0) + 1 FROM buffer_registry))
        WHERE fingerprint = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<std::optional<buffer_record>>(
            error_codes::storage_failure,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    sqlite3_bind_int64(stmt, 1, to_epoch_micros(std::chrono::system_clock::now()));
    sqlite3_bind_text(stmt, 2, fingerprint.data(),
                      static_cast<int>(fingerprint.size()), SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_error<std::optional<buffer_record>>(
            error_codes::storage_failure,
            compat::format("Failed to touch buffer: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    if (sqlite3_changes(db_) == 0) {
        return ok(std::optional<buffer_record>{});
    }

    return peek(fingerprint);
}

auto buffer_registry::peek(std::string_view fingerprint) const
    -> Result<std::optional<buffer_record>> {
    if (!db_) {
        return make_error<std::optional<buffer_record>>(
            error_codes::storage_failure, "Database not initialized", kModule);
    }

    auto sql = std::string(kSelectColumns) + " WHERE fingerprint = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<std::optional<buffer_record>>(
            error_codes::storage_failure,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    sqlite3_bind_text(stmt, 1, fingerprint.data(),
                      static_cast<int>(fingerprint.size()), SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return ok(std::optional<buffer_record>{});
    }
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return make_error<std::optional<buffer_record>>(
            error_codes::storage_failure,
            compat::format("Failed to read buffer record: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    auto record = parse_record_row(stmt);
    sqlite3_finalize(stmt);
    return ok(std::optional<buffer_record>{std::move(record)});
}

auto buffer_registry::list_all() const -> Result<std::vector<buffer_record>> {
    if (!db_) {
        return make_error<std::vector<buffer_record>>(
            error_codes::storage_failure, "Database not initialized", kModule);
    }

    auto sql = std::string(kSelectColumns) +
               " ORDER BY last_accessed_at ASC, fingerprint ASC";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<std::vector<buffer_record>>(
            error_codes::storage_failure,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    std::vector<buffer_record> records;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(parse_record_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_error<std::vector<buffer_record>>(
            error_codes::storage_failure,
            compat::format("Failed to list buffers: {}", sqlite3_errmsg(db_)),
            kModule);
    }
    return ok(std::move(records));
}

auto buffer_registry::aggregate() const -> Result<buffer_aggregate> {
    if (!db_) {
        return make_error<buffer_aggregate>(error_codes::storage_failure,
                                            "Database not initialized", kModule);
    }

    static constexpr const char* sql = R"(
        SELECT COUNT(*), COALESCE(SUM(item_count), 0), COALESCE(SUM(size_bytes), 0)
        FROM buffer_registry
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<buffer_aggregate>(
            error_codes::storage_failure,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    if (sqlite3_step(stmt) != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return make_error<buffer_aggregate>(
            error_codes::storage_failure,
            compat::format("Failed to aggregate buffers: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    buffer_aggregate result;
    result.count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    result.total_items = sqlite3_column_int64(stmt, 1);
    result.total_size_bytes = sqlite3_column_int64(stmt, 2);
    sqlite3_finalize(stmt);

    return ok(result);
}

// ============================================================================
// Modification
// ============================================================================

auto buffer_registry::register_buffer(const buffer_record& record) -> VoidResult {
    if (!db_) {
        return make_error<std::monostate>(error_codes::storage_failure,
                                          "Database not initialized", kModule);
    }
    if (!record.is_valid()) {
        return make_error<std::monostate>(
            error_codes::invalid_argument,
            "Buffer record requires a fingerprint and a table name", kModule);
    }

    static constexpr const char* sql = R"(
        INSERT INTO buffer_registry (
            fingerprint, table_name, generation, item_count, size_bytes,
            created_at, last_accessed_at, filter_json
        ) VALUES (
            ?, ?, ?, ?, ?, ?,
            MAX(?, (SELECT COALESCE(MAX(last_accessed_at), 0) + 1 FROM buffer_registry)),
            ?
        )
        ON CONFLICT(fingerprint) DO UPDATE SET
            table_name = excluded.table_name,
            generation = excluded.generation,
            item_count = excluded.item_count,
            size_bytes = excluded.size_bytes,
            created_at = excluded.created_at,
            last_accessed_at = excluded.last_accessed_at,
            filter_json = excluded.filter_json
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<std::monostate>(
            error_codes::storage_failure,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    int idx = 1;
    sqlite3_bind_text(stmt, idx++, record.fingerprint.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, record.table_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, idx++, record.generation.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, idx++, record.item_count);
    sqlite3_bind_int64(stmt, idx++, record.size_bytes);
    sqlite3_bind_int64(stmt, idx++, to_epoch_micros(record.created_at));
    sqlite3_bind_int64(stmt, idx++,
                       to_epoch_micros(std::chrono::system_clock::now()));
    sqlite3_bind_text(stmt, idx++, record.filter_json.c_str(), -1, SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_error<std::monostate>(
            error_codes::storage_failure,
            compat::format("Failed to register buffer: {}", sqlite3_errmsg(db_)),
            kModule);
    }
    return ok();
}

auto buffer_registry::remove(std::string_view fingerprint) -> VoidResult {
    if (!db_) {
        return make_error<std::monostate>(error_codes::storage_failure,
                                          "Database not initialized", kModule);
    }

    static constexpr const char* sql =
        "DELETE FROM buffer_registry WHERE fingerprint = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return make_error<std::monostate>(
            error_codes::storage_failure,
            compat::format("Failed to prepare statement: {}", sqlite3_errmsg(db_)),
            kModule);
    }

    sqlite3_bind_text(stmt, 1, fingerprint.data(),
                      static_cast<int>(fingerprint.size()), SQLITE_TRANSIENT);

    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_error<std::monostate>(
            error_codes::storage_failure,
            compat::format("Failed to remove buffer record: {}", sqlite3_errmsg(db_)),
            kModule);
    }
    return ok();
}

auto buffer_registry::remove_all() -> Result<size_t> {
    if (!db_) {
        return make_error<size_t>(error_codes::storage_failure,
                                  "Database not initialized", kModule);
    }

    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db_, "DELETE FROM buffer_registry;", nullptr, nullptr,
                           &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        return make_error<size_t>(
            error_codes::storage_failure,
            compat::format("Failed to clear buffer registry: {}", error), kModule);
    }
    return ok(static_cast<size_t>(sqlite3_changes(db_)));
}

auto buffer_registry::is_valid() const noexcept -> bool {
    return db_ != nullptr;
}

}  // namespace mediacache::buffer
