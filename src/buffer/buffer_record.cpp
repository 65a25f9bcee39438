/**
 * @file buffer_record.cpp
 * @brief Page cursor encoding
 */

#include <mediacache/buffer/buffer_record.hpp>

#include <mediacache/compat/format.hpp>
#include <mediacache/core/result.hpp>

#include <charconv>

namespace mediacache::buffer {

namespace {

auto parse_int64(std::string_view text, int64_t& out) -> bool {
    if (text.empty()) {
        return false;
    }
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

}  // namespace

auto page_cursor::encode() const -> std::string {
    return compat::format("{}:{}", ordering_value, row_id);
}

auto page_cursor::decode(std::string_view token)
    -> Result<page_cursor> {
    auto separator = token.find(':');
    page_cursor cursor;
    if (separator == std::string_view::npos ||
        !parse_int64(token.substr(0, separator), cursor.ordering_value) ||
        !parse_int64(token.substr(separator + 1), cursor.row_id) ||
        cursor.row_id <= 0) {
        return cache_error<page_cursor>(
            error_codes::invalid_cursor,
            compat::format("Malformed page cursor '{}'", token), "paginator");
    }
    return ok(cursor);
}

}  // namespace mediacache::buffer
