/**
 * @file dicom_tag_test.cpp
 * @brief Unit tests for dicom_tag
 */

#include <catch2/catch_test_macros.hpp>
#include <unordered_set>

#include "medimg/core/dicom_tag.hpp"

using namespace medimg::core;

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("dicom_tag component constructor", "[dicom_tag][construction]") {
    const dicom_tag tag{0x0010, 0x0020};

    CHECK(tag.group() == 0x0010);
    CHECK(tag.element() == 0x0020);
    CHECK(tag.combined() == 0x00100020);
}

TEST_CASE("dicom_tag constexpr construction", "[dicom_tag][construction]") {
    constexpr dicom_tag tag{0x7FE0, 0x0010};
    static_assert(tag.group() == 0x7FE0);
    static_assert(tag.element() == 0x0010);
    static_assert(tag == tags::pixel_data);
}

// ============================================================================
// String conversion
// ============================================================================

TEST_CASE("dicom_tag to_string and to_hex use uppercase digits", "[dicom_tag][string]") {
    CHECK(tags::pixel_data.to_string() == "(7FE0,0010)");
    CHECK(tags::study_instance_uid.to_hex() == "0020000D");
    CHECK(dicom_tag{0x0000, 0x0000}.to_string() == "(0000,0000)");
}

TEST_CASE("dicom_tag from_string accepted forms", "[dicom_tag][string]") {
    SECTION("parenthesized") {
        auto tag = dicom_tag::from_string("(0010,0010)");
        REQUIRE(tag.has_value());
        CHECK(*tag == tags::patient_name);
    }

    SECTION("lowercase hex") {
        auto tag = dicom_tag::from_string("(7fe0,0010)");
        REQUIRE(tag.has_value());
        CHECK(*tag == tags::pixel_data);
    }

    SECTION("comma without parentheses") {
        auto tag = dicom_tag::from_string("0020,000D");
        REQUIRE(tag.has_value());
        CHECK(*tag == tags::study_instance_uid);
    }

    SECTION("compact") {
        auto tag = dicom_tag::from_string("00080060");
        REQUIRE(tag.has_value());
        CHECK(*tag == tags::modality);
    }

    SECTION("surrounding whitespace") {
        auto tag = dicom_tag::from_string("  (0028,0010)\t");
        REQUIRE(tag.has_value());
        CHECK(*tag == tags::rows);
    }
}

TEST_CASE("dicom_tag from_string rejects malformed input", "[dicom_tag][string]") {
    CHECK_FALSE(dicom_tag::from_string("").has_value());
    CHECK_FALSE(dicom_tag::from_string("(0010,001)").has_value());
    CHECK_FALSE(dicom_tag::from_string("(GGGG,0010)").has_value());
    CHECK_FALSE(dicom_tag::from_string("0010-0010").has_value());
    CHECK_FALSE(dicom_tag::from_string("001000100").has_value());
}

TEST_CASE("dicom_tag string roundtrip", "[dicom_tag][string]") {
    for (const auto tag : {tags::patient_name, tags::pixel_data, tags::transfer_syntax_uid}) {
        auto parsed = dicom_tag::from_string(tag.to_string());
        REQUIRE(parsed.has_value());
        CHECK(*parsed == tag);
    }
}

// ============================================================================
// Classification and ordering
// ============================================================================

TEST_CASE("dicom_tag classification", "[dicom_tag][classification]") {
    CHECK(tags::transfer_syntax_uid.is_meta_information());
    CHECK_FALSE(tags::patient_name.is_meta_information());

    CHECK(dicom_tag{0x0009, 0x0010}.is_private());
    CHECK(dicom_tag{0x0029, 0x1001}.is_private());
    CHECK_FALSE(dicom_tag{0x0008, 0x0010}.is_private());
    CHECK_FALSE(tags::pixel_data.is_private());
}

TEST_CASE("dicom_tag ordering follows group then element", "[dicom_tag][comparison]") {
    CHECK(tags::sop_instance_uid < tags::patient_name);
    CHECK(tags::rows < tags::columns);
    CHECK(tags::pixel_data > tags::bits_stored);
}

TEST_CASE("dicom_tag hashing", "[dicom_tag][hash]") {
    std::unordered_set<dicom_tag> seen{tags::rows, tags::columns, tags::rows};
    CHECK(seen.size() == 2);
    CHECK(seen.count(tags::columns) == 1);
}
