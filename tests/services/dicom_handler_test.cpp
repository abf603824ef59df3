/**
 * @file dicom_handler_test.cpp
 * @brief Unit tests for the dicom_handler decode facade
 */

#include <catch2/catch_test_macros.hpp>

#include "medimg/services/dicom_handler.hpp"

#include "../helpers/sample_buffers.hpp"
#include "../mocks/mock_logger.hpp"

#include <array>
#include <memory>
#include <vector>

using namespace medimg;
using namespace medimg::services;
using integration::log_level;
using integration::testing::mock_logger;

// ============================================================================
// parse_metadata
// ============================================================================

TEST_CASE("dicom_handler parse_metadata", "[handler]") {
    dicom_handler handler;

    SECTION("complete buffer") {
        const auto bytes = test::image_buffer();
        auto metadata = handler.parse_metadata(bytes);
        REQUIRE(metadata.is_ok());
        CHECK(metadata.value().patient.name == "DOE^JOHN");
        CHECK(metadata.value().study.date == "2024-01-15");
        CHECK(metadata.value().study.time == "14:30:45");
    }

    SECTION("zero-filled buffer is not a DICOM container") {
        const std::vector<uint8_t> bytes(200, 0);
        CHECK_FALSE(dicom_handler::is_valid_dicom(bytes));

        auto metadata = handler.parse_metadata(bytes);
        REQUIRE(metadata.is_err());
        CHECK(metadata.error().code == error_codes::malformed_container);
    }

    SECTION("truncated tail keeps earlier elements") {
        const std::array<uint8_t, 6> partial{};
        const auto bytes = test::study_writer()
                               .add_header(core::tags::pixel_data, encoding::vr_type::OW, 4096,
                                           partial)
                               .build();
        auto metadata = handler.parse_metadata(bytes);
        REQUIRE(metadata.is_ok());
        CHECK(metadata.value().study.instance_uid == test::kStudyUid);
        CHECK_FALSE(metadata.value().image.pixel_data.has_value());
    }
}

TEST_CASE("dicom_handler logs early walk termination", "[handler][logging]") {
    auto logger = std::make_shared<mock_logger>();
    dicom_handler handler(logger);

    const std::array<uint8_t, 3> stray{1, 2, 3};
    const auto bytes = test::study_writer().add_raw(stray).build();

    auto metadata = handler.parse_metadata(bytes, "stray.dcm");
    REQUIRE(metadata.is_ok());
    CHECK(logger->count(log_level::warn) == 1);
    CHECK(logger->contains("stray.dcm"));
}

// ============================================================================
// extract_image_data
// ============================================================================

TEST_CASE("dicom_handler extract_image_data", "[handler][image]") {
    dicom_handler handler;

    SECTION("pixel data and geometry") {
        const auto bytes = test::image_buffer(10, 10);
        auto image = handler.extract_image_data(bytes);
        REQUIRE(image.is_ok());

        const auto& data = image.value();
        CHECK(data.pixel_data.length == 100);
        CHECK(data.pixel_data.bytes.size() == 100);
        CHECK(data.pixel_data.offset + data.pixel_data.length == bytes.size());
        CHECK(data.pixel_data.bytes[5] == 5);
        CHECK(data.image_info.width == 10);
        CHECK(data.image_info.height == 10);
        CHECK(data.image_info.bits_allocated == 8);
        CHECK(data.image_info.pixel_data_length == 100);
        CHECK(data.metadata.sop_instance_uid == test::kSopUid);
    }

    SECTION("non-square image") {
        const auto bytes = test::image_buffer(4, 8);
        auto image = handler.extract_image_data(bytes);
        REQUIRE(image.is_ok());
        CHECK(image.value().image_info.height == 4);
        CHECK(image.value().image_info.width == 8);
        CHECK(image.value().pixel_data.length == 32);
    }

    SECTION("missing pixel data") {
        const auto bytes = test::study_writer().build();
        auto image = handler.extract_image_data(bytes);
        REQUIRE(image.is_err());
        CHECK(image.error().code == error_codes::missing_pixel_data);
    }

    SECTION("bad container") {
        const std::vector<uint8_t> bytes(64, 0);
        auto image = handler.extract_image_data(bytes);
        REQUIRE(image.is_err());
        CHECK(image.error().code == error_codes::malformed_container);
    }
}

// ============================================================================
// Files
// ============================================================================

TEST_CASE("dicom_handler file processing", "[handler][file]") {
    test::temp_directory dir("medimg_handler_test");
    const auto first = dir.path() / "first.dcm";
    const auto second = dir.path() / "second.dcm";
    const auto not_dicom = dir.path() / "notes.txt";
    test::write_file(first, test::image_buffer(10, 10));
    test::write_file(second, test::study_writer().build());
    test::write_file(not_dicom, std::vector<uint8_t>(200, 0));

    dicom_handler handler;

    SECTION("read_dicom_file") {
        auto bytes = handler.read_dicom_file(first);
        REQUIRE(bytes.is_ok());
        CHECK(dicom_handler::is_valid_dicom(bytes.value()));

        auto missing = handler.read_dicom_file(dir.path() / "missing.dcm");
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == error_codes::file_not_found);

        auto invalid = handler.read_dicom_file(not_dicom);
        REQUIRE(invalid.is_err());
        CHECK(invalid.error().code == error_codes::malformed_container);
    }

    SECTION("process_dicom_file") {
        const auto with_pixels = handler.process_dicom_file(first);
        CHECK(with_pixels.is_valid);
        CHECK(with_pixels.error.empty());
        REQUIRE(with_pixels.metadata.has_value());
        REQUIRE(with_pixels.image.has_value());
        CHECK(with_pixels.image->pixel_data_length == 100);
        CHECK(with_pixels.file_size > 100);

        const auto header_only = handler.process_dicom_file(second);
        CHECK(header_only.is_valid);
        CHECK_FALSE(header_only.image.has_value());

        const auto missing = handler.process_dicom_file(dir.path() / "missing.dcm");
        CHECK_FALSE(missing.is_valid);
        CHECK(missing.error_code == error_codes::file_not_found);
        CHECK_FALSE(missing.error.empty());
    }

    SECTION("batch keeps input order and isolates failures") {
        const std::vector<std::filesystem::path> paths{first, second, not_dicom};
        const auto results = handler.batch_process_dicom_files(paths);

        REQUIRE(results.size() == 3);
        CHECK(results[0].is_valid);
        CHECK(results[1].is_valid);
        CHECK_FALSE(results[2].is_valid);
        CHECK(results[2].file_path == not_dicom);
        CHECK(results[2].error_code == error_codes::malformed_container);
    }
}
