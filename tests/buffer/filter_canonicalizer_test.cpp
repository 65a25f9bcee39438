/**
 * @file filter_canonicalizer_test.cpp
 * @brief Unit tests for filter normalization and fingerprinting
 */

#include <mediacache/buffer/filter_canonicalizer.hpp>
#include <mediacache/core/result.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace mediacache;
using namespace mediacache::buffer;

namespace {

auto fingerprint_of(const filter_spec& spec) -> std::string {
    auto result = canonicalize(spec);
    REQUIRE(result.is_ok());
    return result.value().fingerprint;
}

}  // namespace

// ============================================================================
// Normalization
// ============================================================================

TEST_CASE("filter_canonicalizer: keyword lists are normalized",
          "[buffer][canonicalizer]") {
    filter_spec spec;
    spec.keywords = {"  Dog", "cat", "", "CAT ", "dog"};
    spec.file_types = {".JPG", "png", " jpg"};

    auto result = canonicalize(spec);
    REQUIRE(result.is_ok());

    const auto& normalized = result.value().spec;
    CHECK(normalized.keywords == std::vector<std::string>{"cat", "dog"});
    CHECK(normalized.file_types == std::vector<std::string>{"jpg", "png"});
}

TEST_CASE("filter_canonicalizer: equivalent specs share a fingerprint",
          "[buffer][canonicalizer]") {
    filter_spec a;
    a.keywords = {"sunset", "beach"};
    a.file_types = {"jpg", "png"};
    a.min_score = 3;

    filter_spec b;
    b.keywords = {"Beach ", "sunset", "beach"};
    b.file_types = {"PNG", ".jpg"};
    b.min_score = 3;

    CHECK(fingerprint_of(a) == fingerprint_of(b));

    SECTION("empty list equals absent list") {
        filter_spec c;
        c.keywords = {" ", ""};
        CHECK(fingerprint_of(c) == fingerprint_of(filter_spec{}));
    }

    SECTION("empty date equals absent date") {
        filter_spec c;
        c.start_date = "";
        CHECK(fingerprint_of(c) == fingerprint_of(filter_spec{}));
    }
}

TEST_CASE("filter_canonicalizer: predicate changes change the fingerprint",
          "[buffer][canonicalizer]") {
    filter_spec base;
    base.keywords = {"cat"};
    auto base_fp = fingerprint_of(base);

    SECTION("match mode") {
        auto spec = base;
        spec.match_all = true;
        CHECK(fingerprint_of(spec) != base_fp);
    }

    SECTION("score bound") {
        auto spec = base;
        spec.min_score = 1;
        CHECK(fingerprint_of(spec) != base_fp);
    }

    SECTION("classification") {
        auto spec = base;
        spec.classification = classification_filter::sfw;
        CHECK(fingerprint_of(spec) != base_fp);
    }

    SECTION("sort field and direction") {
        auto by_name = base;
        by_name.sort = sort_field::name;
        auto ascending = base;
        ascending.direction = sort_direction::asc;
        CHECK(fingerprint_of(by_name) != base_fp);
        CHECK(fingerprint_of(ascending) != base_fp);
        CHECK(fingerprint_of(by_name) != fingerprint_of(ascending));
    }
}

TEST_CASE("filter_canonicalizer: canonical JSON is key-sorted and compact",
          "[buffer][canonicalizer]") {
    filter_spec spec;
    spec.keywords = {"b", "a"};
    spec.min_score = 4;

    auto result = canonicalize(spec);
    REQUIRE(result.is_ok());

    CHECK(result.value().canonical_json ==
          R"({"classification":null,"end_date":null,"file_types":null,)"
          R"("keywords":["a","b"],"match_all":false,"max_score":null,)"
          R"("min_score":4,"sort_direction":"desc","sort_field":"date",)"
          R"("start_date":null})");
}

TEST_CASE("filter_canonicalizer: fingerprint format", "[buffer][canonicalizer]") {
    auto fp = fingerprint_of(filter_spec{});
    CHECK(fp.size() == 64);
    CHECK(is_valid_fingerprint(fp));
    CHECK(fingerprint_of(filter_spec{}) == fp);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("filter_canonicalizer: invalid specs are rejected",
          "[buffer][canonicalizer]") {
    filter_spec spec;

    SECTION("min_score above max_score") {
        spec.min_score = 5;
        spec.max_score = 4;
    }

    SECTION("unparseable start date") {
        spec.start_date = "yesterday";
    }

    SECTION("unparseable end date") {
        spec.end_date = "2024-13-45";
    }

    SECTION("start after end") {
        spec.start_date = "2024-06-02";
        spec.end_date = "2024-06-01T23:59:59";
    }

    SECTION("keyword that is not UTF-8") {
        spec.keywords = {"caf\xe9"};
    }

    SECTION("file type that is not UTF-8") {
        spec.file_types = {"jp\xffg"};
    }

    auto result = canonicalize(spec);
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::invalid_filter);
}

TEST_CASE("filter_canonicalizer: equal score bounds are accepted",
          "[buffer][canonicalizer]") {
    filter_spec spec;
    spec.min_score = 4;
    spec.max_score = 4;
    spec.start_date = "2024-06-01";
    spec.end_date = "2024-06-01";
    CHECK(canonicalize(spec).is_ok());
}

// ============================================================================
// JSON Conversion
// ============================================================================

TEST_CASE("filter_canonicalizer: filter_spec_from_json", "[buffer][canonicalizer]") {
    SECTION("reads the canonical form back") {
        filter_spec spec;
        spec.keywords = {"cat"};
        spec.match_all = true;
        spec.max_score = 3;
        spec.end_date = "2024-01-31";
        spec.classification = classification_filter::nsfw;
        spec.sort = sort_field::rating;
        spec.direction = sort_direction::asc;

        auto parsed = filter_spec_from_json(to_json(spec));
        REQUIRE(parsed.is_ok());
        CHECK(fingerprint_of(parsed.value()) == fingerprint_of(spec));
    }

    SECTION("missing keys take defaults") {
        auto parsed = filter_spec_from_json(nlohmann::json{{"min_score", 2}});
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().min_score == 2);
        CHECK(parsed.value().sort == sort_field::date);
        CHECK(parsed.value().direction == sort_direction::desc);
        CHECK_FALSE(parsed.value().classification.has_value());
    }

    SECTION("wrong types are rejected") {
        auto parsed = filter_spec_from_json(nlohmann::json{{"keywords", "cat"}});
        REQUIRE(parsed.is_err());
        CHECK(parsed.error().code == error_codes::invalid_filter);
    }

    SECTION("unknown enum values are rejected") {
        auto parsed = filter_spec_from_json(nlohmann::json{{"sort_field", "color"}});
        REQUIRE(parsed.is_err());
        CHECK(parsed.error().code == error_codes::invalid_filter);
    }
}

TEST_CASE("filter_canonicalizer: sha256_hex known vector", "[buffer][canonicalizer]") {
    auto digest = sha256_hex("abc");
    REQUIRE(digest.is_ok());
    CHECK(digest.value() ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("filter_canonicalizer: is_valid_fingerprint", "[buffer][canonicalizer]") {
    CHECK(is_valid_fingerprint(std::string(64, 'a')));
    CHECK_FALSE(is_valid_fingerprint(std::string(63, 'a')));
    CHECK_FALSE(is_valid_fingerprint(std::string(64, 'A')));
    CHECK_FALSE(is_valid_fingerprint(std::string(63, 'a') + "g"));
    CHECK_FALSE(is_valid_fingerprint(""));
}
