/**
 * @file cache_serializer_test.cpp
 * @brief Unit tests for cached value encodings
 */

#include <catch2/catch_test_macros.hpp>

#include "medimg/core/element_walker.hpp"
#include "medimg/core/metadata_assembler.hpp"
#include "medimg/services/cache/cache_serializer.hpp"

#include "../../helpers/sample_buffers.hpp"

#include <string>
#include <vector>

using namespace medimg;
using namespace medimg::services::cache;

TEST_CASE("cache_serializer preserves decoded metadata", "[cache][serializer]") {
    const auto bytes = test::image_buffer(4, 8);
    auto walk = core::collect_elements(bytes);
    REQUIRE(walk.is_ok());
    const auto metadata = core::metadata_assembler::assemble(walk.value().elements);
    REQUIRE(metadata.image.pixel_data.has_value());

    const auto encoded = cache_serializer<core::dicom_metadata>::serialize(metadata);
    auto decoded = cache_serializer<core::dicom_metadata>::deserialize(encoded);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == metadata);
    CHECK(decoded.value().present_fields == metadata.present_fields);
    CHECK(decoded.value().image.pixel_data->length == 32);
}

TEST_CASE("cache_serializer search results keep order", "[cache][serializer]") {
    const std::vector<std::string> results{"1.2.3", "", "1.2.4"};
    auto decoded = cache_serializer<std::vector<std::string>>::deserialize(
        cache_serializer<std::vector<std::string>>::serialize(results));
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == results);
}

TEST_CASE("cache_serializer rejects the wrong type", "[cache][serializer]") {
    const auto text = cache_serializer<std::string>::serialize("DOE^JOHN");

    auto as_bytes = cache_serializer<std::vector<uint8_t>>::deserialize(text);
    REQUIRE(as_bytes.is_err());
    CHECK(as_bytes.error().code == error_codes::serialization_error);

    auto as_metadata = cache_serializer<core::dicom_metadata>::deserialize(text);
    REQUIRE(as_metadata.is_err());
    CHECK(as_metadata.error().code == error_codes::serialization_error);
}

TEST_CASE("cache_serializer rejects truncated input", "[cache][serializer]") {
    core::dicom_metadata metadata;
    metadata.study.instance_uid = test::kStudyUid;
    metadata.patient.name = "DOE^JOHN";
    auto encoded = cache_serializer<core::dicom_metadata>::serialize(metadata);
    encoded.resize(encoded.size() / 2);

    auto decoded = cache_serializer<core::dicom_metadata>::deserialize(encoded);
    REQUIRE(decoded.is_err());
    CHECK(decoded.error().code == error_codes::serialization_error);

    CHECK(cache_serializer<std::string>::deserialize({}).is_err());
}

TEST_CASE("cache_serializer raw bytes", "[cache][serializer]") {
    const std::vector<uint8_t> pixels{0, 1, 2, 255};
    const auto encoded = cache_serializer<std::vector<uint8_t>>::serialize(pixels);
    CHECK(encoded.size() > pixels.size());

    auto decoded = cache_serializer<std::vector<uint8_t>>::deserialize(encoded);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value() == pixels);
}
