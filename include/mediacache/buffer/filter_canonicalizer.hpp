/**
 * @file filter_canonicalizer.hpp
 * @brief Filter normalization and fingerprinting
 *
 * A fingerprint is the lowercase hex SHA-256 of the key-sorted,
 * whitespace-free JSON serialization of a normalized filter_spec. It is
 * the primary key of a buffer.
 */

#pragma once

#include "filter_spec.hpp"

#include <mediacache/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mediacache::buffer {

/**
 * @brief A normalized filter together with its serialization and hash
 */
struct canonical_filter {
    /// Normalized specification (sorted, de-duplicated lists)
    filter_spec spec;

    /// Key-sorted, whitespace-free JSON of spec
    std::string canonical_json;

    /// 64 lowercase hex characters
    std::string fingerprint;
};

/**
 * @brief Normalize a filter and compute its fingerprint
 *
 * Keyword and type entries are trimmed and lower-cased, empty entries are
 * dropped, and the lists are sorted and de-duplicated. A leading '.' on a
 * type is removed. Empty date strings count as absent. Pure function.
 *
 * @param spec The caller's filter
 * @return Result containing the canonical filter, or invalid_filter when
 *         score or date bounds are malformed or inverted
 */
[[nodiscard]] auto canonicalize(const filter_spec& spec)
    -> Result<canonical_filter>;

/**
 * @brief Serialize a filter spec as it is hashed
 *
 * Absent fields are written as null.
 */
[[nodiscard]] auto to_json(const filter_spec& spec) -> nlohmann::json;

/**
 * @brief Rebuild a filter spec from its JSON form
 *
 * Accepts the output of to_json() as well as hand-written documents with
 * missing keys (treated as absent).
 */
[[nodiscard]] auto filter_spec_from_json(const nlohmann::json& json)
    -> Result<filter_spec>;

/**
 * @brief Lowercase hex SHA-256 of a string
 */
[[nodiscard]] auto sha256_hex(std::string_view data) -> Result<std::string>;

/**
 * @brief Check that text is a well-formed fingerprint
 */
[[nodiscard]] auto is_valid_fingerprint(std::string_view text) noexcept -> bool;

}  // namespace mediacache::buffer
