/**
 * @file catalog_query.hpp
 * @brief Interface to the primary media catalog
 *
 * The cache never reads the catalog's tables directly. A buffer build asks
 * a catalog_query for the records matching a normalized filter, in the
 * requested order, and snapshots them.
 */

#pragma once

#include <mediacache/buffer/filter_spec.hpp>

#include <mediacache/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mediacache::catalog {

/**
 * @brief One catalog entry as seen by the cache
 *
 * Display projection of a media file; the catalog may hold many more
 * columns.
 */
struct catalog_record {
    /// Catalog primary key
    int64_t id{0};

    std::string filename;
    std::string file_path;
    int64_t file_size{0};
    std::string file_type;

    /// Extension without the leading dot
    std::string extension;

    int score{0};
    std::optional<int> width;
    std::optional<int> height;

    /// Time the record entered the catalog
    std::chrono::system_clock::time_point created_at;

    /// Capture time taken from the file metadata, when known
    std::optional<std::chrono::system_clock::time_point> original_created_at;

    bool nsfw{false};
    std::optional<double> nsfw_score;
};

/**
 * @brief Predicates and ordering handed to the catalog
 *
 * Built from a canonical filter_spec. Lists are already trimmed,
 * lower-cased and de-duplicated; an empty list means no restriction.
 */
struct catalog_predicates {
    std::vector<std::string> keywords;

    /// true: every keyword must match, false: any keyword may match
    bool match_all{false};

    std::vector<std::string> file_types;

    std::optional<int> min_score;
    std::optional<int> max_score;

    /// Inclusive lower bound on created_at
    std::optional<std::chrono::system_clock::time_point> created_from;

    /// Inclusive upper bound on created_at
    std::optional<std::chrono::system_clock::time_point> created_until;

    /// Required nsfw flag; std::nullopt means both
    std::optional<bool> nsfw;

    buffer::sort_field sort{buffer::sort_field::date};
    buffer::sort_direction direction{buffer::sort_direction::desc};
};

/**
 * @brief Query capability of the primary media catalog
 *
 * Implementations report failures (including caller-side cancellation)
 * as errors; the cache propagates them unchanged.
 */
class catalog_query {
public:
    virtual ~catalog_query() = default;

    /**
     * @brief Find every record matching the predicates
     *
     * @param predicates Filter and sort order
     * @return Result containing the matching records in the requested order
     */
    [[nodiscard]] virtual auto find(const catalog_predicates& predicates)
        -> Result<std::vector<catalog_record>> = 0;
};

}  // namespace mediacache::catalog
