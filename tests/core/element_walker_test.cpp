/**
 * @file element_walker_test.cpp
 * @brief Unit tests for the explicit VR little endian element walk
 */

#include <catch2/catch_test_macros.hpp>

#include "medimg/core/element_walker.hpp"
#include "medimg/encoding/element_writer.hpp"

#include <array>
#include <vector>

using namespace medimg;
using namespace medimg::core;
using encoding::element_writer;
using encoding::vr_type;

// ============================================================================
// Container pre-check
// ============================================================================

TEST_CASE("is_valid_dicom checks length and marker", "[walker][container]") {
    SECTION("writer output is valid") {
        const auto bytes = element_writer{}.build();
        CHECK(bytes.size() == kDataSetOffset);
        CHECK(is_valid_dicom(bytes));
    }

    SECTION("short buffer") {
        const std::vector<uint8_t> bytes(131, 0);
        CHECK_FALSE(is_valid_dicom(bytes));
    }

    SECTION("zero-filled buffer has no marker") {
        const std::vector<uint8_t> bytes(200, 0);
        CHECK_FALSE(is_valid_dicom(bytes));
    }

    SECTION("lowercase marker") {
        auto bytes = element_writer{}.build();
        bytes[128] = 'd';
        CHECK_FALSE(is_valid_dicom(bytes));
    }
}

TEST_CASE("element_walker::create rejects a bad container", "[walker][container]") {
    const std::vector<uint8_t> bytes(200, 0);
    auto walker = element_walker::create(bytes);

    REQUIRE(walker.is_err());
    CHECK(walker.error().code == error_codes::malformed_container);
}

// ============================================================================
// Walking
// ============================================================================

TEST_CASE("element_walker yields elements in buffer order", "[walker]") {
    const std::array<uint8_t, 4> pixels{1, 2, 3, 4};
    const auto bytes = element_writer{}
                           .add_string(tags::patient_name, vr_type::PN, "DOE^JANE")
                           .add_uint16(tags::rows, 2)
                           .add_binary(tags::pixel_data, vr_type::OW, pixels)
                           .build();

    auto walker = element_walker::create(bytes);
    REQUIRE(walker.is_ok());

    std::vector<data_element> elements;
    for (const auto& element : walker.value()) {
        elements.push_back(element);
    }

    REQUIRE(elements.size() == 3);
    CHECK(walker.value().stop_reason() == walk_stop_reason::end_of_buffer);
    CHECK_FALSE(walker.value().last_error().has_value());

    SECTION("short header element") {
        const auto& name = elements[0];
        CHECK(name.tag == tags::patient_name);
        CHECK(name.vr == vr_type::PN);
        CHECK(name.offset == kDataSetOffset);
        CHECK(name.value_offset == kDataSetOffset + 8);
        CHECK(name.length == 8);
        CHECK(encoding::as_string(name.value) == "DOE^JANE");
    }

    SECTION("integer element") {
        CHECK(encoding::as_integer(elements[1].value) == 2);
    }

    SECTION("pixel data is referenced, not copied") {
        const auto& pixel = elements[2];
        CHECK(pixel.tag == tags::pixel_data);
        auto ref = encoding::as_binary(pixel.value);
        REQUIRE(ref.has_value());
        CHECK(ref->length == 4);
        CHECK(ref->offset == pixel.offset + 12);
        CHECK(pixel.next_offset == bytes.size());

        const auto view = encoding::bytes_of(bytes, *ref);
        CHECK(std::vector<uint8_t>(view.begin(), view.end()) ==
              std::vector<uint8_t>{1, 2, 3, 4});
    }
}

TEST_CASE("element_walker stops at a truncated element", "[walker][truncation]") {
    const std::array<uint8_t, 10> partial{};
    const auto bytes = element_writer{}
                           .add_string(tags::patient_id, vr_type::LO, "PAT001")
                           .add_header(tags::pixel_data, vr_type::OW, 100, partial)
                           .build();

    auto result = collect_elements(bytes);
    REQUIRE(result.is_ok());

    const auto& walk = result.value();
    REQUIRE(walk.elements.size() == 1);
    CHECK(walk.elements[0].tag == tags::patient_id);
    CHECK(walk.stop_reason == walk_stop_reason::truncated_element);
    REQUIRE(walk.stop_error.has_value());
    CHECK(walk.stop_error->code == error_codes::truncated_element);
}

TEST_CASE("element_walker stops at a truncated header", "[walker][truncation]") {
    const std::array<uint8_t, 5> stray{0x10, 0x00, 0x10, 0x00, 'P'};
    const auto bytes = element_writer{}
                           .add_string(tags::patient_id, vr_type::LO, "PAT001")
                           .add_raw(stray)
                           .build();

    auto result = collect_elements(bytes);
    REQUIRE(result.is_ok());
    CHECK(result.value().elements.size() == 1);
    CHECK(result.value().stop_reason == walk_stop_reason::truncated_header);
}

TEST_CASE("element_walker stops at an unknown VR", "[walker]") {
    const std::array<uint8_t, 8> bogus{0x10, 0x00, 0x20, 0x00, 'Z', 'Z', 0x02, 0x00};
    const auto bytes = element_writer{}
                           .add_string(tags::patient_name, vr_type::PN, "DOE")
                           .add_raw(bogus)
                           .add_string(tags::patient_sex, vr_type::CS, "F")
                           .build();

    auto result = collect_elements(bytes);
    REQUIRE(result.is_ok());
    CHECK(result.value().elements.size() == 1);
    CHECK(result.value().stop_reason == walk_stop_reason::unknown_vr);
    REQUIRE(result.value().stop_error.has_value());
    CHECK(result.value().stop_error->code == error_codes::unknown_vr);
}

TEST_CASE("element_walker stops at an undefined length", "[walker]") {
    const auto bytes = element_writer{}
                           .add_header(dicom_tag{0x0008, 0x1115}, vr_type::SQ, 0xFFFFFFFF)
                           .build();

    auto result = collect_elements(bytes);
    REQUIRE(result.is_ok());
    CHECK(result.value().elements.empty());
    CHECK(result.value().stop_reason == walk_stop_reason::undefined_length);
}

TEST_CASE("element_walker decode errors", "[walker][decode]") {
    const auto bytes = element_writer{}
                           .add_string(tags::study_date, vr_type::DA, "20241345")
                           .add_string(tags::patient_id, vr_type::LO, "PAT001")
                           .build();

    SECTION("skipped by default") {
        auto result = collect_elements(bytes);
        REQUIRE(result.is_ok());

        const auto& walk = result.value();
        REQUIRE(walk.elements.size() == 1);
        CHECK(walk.elements[0].tag == tags::patient_id);
        CHECK(walk.stop_reason == walk_stop_reason::end_of_buffer);
        REQUIRE(walk.decode_errors.size() == 1);
        CHECK(walk.decode_errors[0].tag == tags::study_date);
        CHECK(walk.decode_errors[0].error.code == error_codes::invalid_date);
    }

    SECTION("stop_on_decode_error ends the walk") {
        walker_options options;
        options.stop_on_decode_error = true;

        auto result = collect_elements(bytes, options);
        REQUIRE(result.is_ok());
        CHECK(result.value().elements.empty());
        CHECK(result.value().stop_reason == walk_stop_reason::decode_error);
    }
}

TEST_CASE("element_walker reset rewinds the cursor", "[walker]") {
    const auto bytes = element_writer{}
                           .add_string(tags::patient_id, vr_type::LO, "PAT001")
                           .add_string(tags::patient_sex, vr_type::CS, "F")
                           .build();

    auto walker = element_walker::create(bytes);
    REQUIRE(walker.is_ok());
    auto& w = walker.value();

    REQUIRE(w.next().has_value());
    REQUIRE(w.next().has_value());
    CHECK_FALSE(w.next().has_value());
    CHECK(w.finished());

    w.reset(kDataSetOffset);
    CHECK_FALSE(w.finished());
    auto first = w.next();
    REQUIRE(first.has_value());
    CHECK(first->tag == tags::patient_id);
}

TEST_CASE("element_walker on a header-only buffer", "[walker]") {
    const auto bytes = element_writer{}.build();

    auto result = collect_elements(bytes);
    REQUIRE(result.is_ok());
    CHECK(result.value().elements.empty());
    CHECK(result.value().stop_reason == walk_stop_reason::end_of_buffer);
}
