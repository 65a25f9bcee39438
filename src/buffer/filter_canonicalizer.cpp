/**
 * @file filter_canonicalizer.cpp
 * @brief Implementation of filter normalization and fingerprinting
 */

#include <mediacache/buffer/filter_canonicalizer.hpp>

#include <mediacache/compat/format.hpp>
#include <mediacache/core/result.hpp>
#include <mediacache/core/timestamp.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace mediacache::buffer {

using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

constexpr const char* kModule = "filter_canonicalizer";

struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

auto trim_lower(std::string_view value) -> std::string {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    std::string result(value.substr(begin, end - begin + 1));
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto normalize_list(const std::vector<std::string>& values, bool strip_dot)
    -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(values.size());
    for (const auto& value : values) {
        auto normalized = trim_lower(value);
        if (strip_dot && !normalized.empty() && normalized.front() == '.') {
            normalized.erase(0, 1);
        }
        if (!normalized.empty()) {
            result.push_back(std::move(normalized));
        }
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

auto normalize_date(const std::optional<std::string>& value)
    -> std::optional<std::string> {
    if (!value) {
        return std::nullopt;
    }
    auto begin = value->find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    auto end = value->find_last_not_of(" \t\r\n");
    return value->substr(begin, end - begin + 1);
}

template <typename T>
auto optional_to_json(const std::optional<T>& value) -> nlohmann::json {
    if (!value) {
        return nullptr;
    }
    return *value;
}

auto list_to_json(const std::vector<std::string>& values) -> nlohmann::json {
    if (values.empty()) {
        return nullptr;
    }
    return values;
}

auto read_string_list(const nlohmann::json& json, const char* key,
                      std::vector<std::string>& out) -> bool {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return true;
    }
    if (!it->is_array()) {
        return false;
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

auto read_optional_int(const nlohmann::json& json, const char* key,
                       std::optional<int>& out) -> bool {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return true;
    }
    if (!it->is_number_integer()) {
        return false;
    }
    out = it->get<int>();
    return true;
}

auto read_optional_string(const nlohmann::json& json, const char* key,
                          std::optional<std::string>& out) -> bool {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

}  // namespace

auto to_json(const filter_spec& spec) -> nlohmann::json {
    nlohmann::json json = nlohmann::json::object();
    json["keywords"] = list_to_json(spec.keywords);
    json["match_all"] = spec.match_all;
    json["file_types"] = list_to_json(spec.file_types);
    json["min_score"] = optional_to_json(spec.min_score);
    json["max_score"] = optional_to_json(spec.max_score);
    json["start_date"] = optional_to_json(spec.start_date);
    json["end_date"] = optional_to_json(spec.end_date);
    if (spec.classification) {
        json["classification"] = std::string(to_string(*spec.classification));
    } else {
        json["classification"] = nullptr;
    }
    json["sort_field"] = std::string(to_string(spec.sort));
    json["sort_direction"] = std::string(to_string(spec.direction));
    return json;
}

auto filter_spec_from_json(const nlohmann::json& json) -> Result<filter_spec> {
    if (!json.is_object()) {
        return make_error<filter_spec>(error_codes::invalid_filter,
                                       "Filter must be a JSON object", kModule);
    }

    filter_spec spec;
    std::optional<std::string> classification;
    std::optional<std::string> sort;
    std::optional<std::string> direction;

    auto match_it = json.find("match_all");
    if (match_it != json.end() && !match_it->is_null()) {
        if (!match_it->is_boolean()) {
            return make_error<filter_spec>(error_codes::invalid_filter,
                                           "match_all must be a boolean", kModule);
        }
        spec.match_all = match_it->get<bool>();
    }

    if (!read_string_list(json, "keywords", spec.keywords) ||
        !read_string_list(json, "file_types", spec.file_types) ||
        !read_optional_int(json, "min_score", spec.min_score) ||
        !read_optional_int(json, "max_score", spec.max_score) ||
        !read_optional_string(json, "start_date", spec.start_date) ||
        !read_optional_string(json, "end_date", spec.end_date) ||
        !read_optional_string(json, "classification", classification) ||
        !read_optional_string(json, "sort_field", sort) ||
        !read_optional_string(json, "sort_direction", direction)) {
        return make_error<filter_spec>(error_codes::invalid_filter,
                                       "Filter field has the wrong type", kModule);
    }

    if (classification) {
        auto parsed = parse_classification_filter(*classification);
        if (!parsed) {
            return make_error<filter_spec>(
                error_codes::invalid_filter,
                compat::format("Unknown classification filter '{}'", *classification),
                kModule);
        }
        spec.classification = parsed;
    }
    if (sort) {
        auto parsed = parse_sort_field(*sort);
        if (!parsed) {
            return make_error<filter_spec>(
                error_codes::invalid_filter,
                compat::format("Unknown sort field '{}'", *sort), kModule);
        }
        spec.sort = *parsed;
    }
    if (direction) {
        auto parsed = parse_sort_direction(*direction);
        if (!parsed) {
            return make_error<filter_spec>(
                error_codes::invalid_filter,
                compat::format("Unknown sort direction '{}'", *direction), kModule);
        }
        spec.direction = *parsed;
    }

    return ok(std::move(spec));
}

auto canonicalize(const filter_spec& spec) -> Result<canonical_filter> {
    canonical_filter result;
    auto& normalized = result.spec;

    normalized.keywords = normalize_list(spec.keywords, false);
    normalized.match_all = spec.match_all;
    normalized.file_types = normalize_list(spec.file_types, true);
    normalized.min_score = spec.min_score;
    normalized.max_score = spec.max_score;
    normalized.start_date = normalize_date(spec.start_date);
    normalized.end_date = normalize_date(spec.end_date);
    normalized.classification = spec.classification;
    normalized.sort = spec.sort;
    normalized.direction = spec.direction;

    if (normalized.min_score && normalized.max_score &&
        *normalized.min_score > *normalized.max_score) {
        return make_error<canonical_filter>(
            error_codes::invalid_filter,
            compat::format("min_score {} exceeds max_score {}",
                           *normalized.min_score, *normalized.max_score),
            kModule);
    }

    std::optional<time_point> start;
    std::optional<time_point> end;
    if (normalized.start_date) {
        start = parse_iso8601(*normalized.start_date);
        if (!start) {
            return make_error<canonical_filter>(
                error_codes::invalid_filter,
                compat::format("Invalid start_date '{}'", *normalized.start_date),
                kModule);
        }
    }
    if (normalized.end_date) {
        end = parse_iso8601(*normalized.end_date);
        if (!end) {
            return make_error<canonical_filter>(
                error_codes::invalid_filter,
                compat::format("Invalid end_date '{}'", *normalized.end_date),
                kModule);
        }
    }
    if (start && end && *start > *end) {
        return make_error<canonical_filter>(
            error_codes::invalid_filter, "start_date is after end_date", kModule);
    }

    // nlohmann::json objects are std::map backed, so dump() is key-sorted
    try {
        result.canonical_json = to_json(normalized).dump();
    } catch (const nlohmann::json::type_error& e) {
        return make_error<canonical_filter>(
            error_codes::invalid_filter,
            compat::format("Filter text is not valid UTF-8: {}", e.what()), kModule);
    }

    auto digest = sha256_hex(result.canonical_json);
    if (digest.is_err()) {
        return Result<canonical_filter>::err(digest.error());
    }
    result.fingerprint = std::move(digest.value());

    return ok(std::move(result));
}

auto sha256_hex(std::string_view data) -> Result<std::string> {
    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return make_error<std::string>(error_codes::internal_error,
                                       "Failed to allocate digest context", kModule);
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        return make_error<std::string>(error_codes::internal_error,
                                       "SHA-256 computation failed", kModule);
    }

    static constexpr char hex[] = "0123456789abcdef";
    std::string result;
    result.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        result.push_back(hex[digest[i] >> 4]);
        result.push_back(hex[digest[i] & 0x0f]);
    }
    return ok(std::move(result));
}

auto is_valid_fingerprint(std::string_view text) noexcept -> bool {
    if (text.size() != 64) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

}  // namespace mediacache::buffer
