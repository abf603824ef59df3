/**
 * @file vr_decoder_test.cpp
 * @brief Unit tests for VR payload decoding
 */

#include <catch2/catch_test_macros.hpp>

#include "medimg/encoding/byte_order.hpp"
#include "medimg/encoding/vr_decoder.hpp"

#include <array>
#include <string_view>
#include <vector>

using namespace medimg;
using namespace medimg::encoding;

namespace {

auto bytes_of_text(std::string_view text) -> std::vector<uint8_t> {
    return {text.begin(), text.end()};
}

}  // namespace

// ============================================================================
// Dates and times
// ============================================================================

TEST_CASE("decode_date converts DA to ISO", "[decoder][date]") {
    auto iso = decode_date("20240115");
    REQUIRE(iso.is_ok());
    CHECK(iso.value() == "2024-01-15");

    SECTION("leap day") {
        CHECK(decode_date("20240229").is_ok());
        CHECK(decode_date("20230229").is_err());
        CHECK(decode_date("19000229").is_err());
        CHECK(decode_date("20000229").is_ok());
    }

    SECTION("malformed") {
        for (auto raw : {"2024-01-15", "2024011", "202401150", "2024AB15", "20241301",
                         "20240100", "20240431"}) {
            auto result = decode_date(raw);
            REQUIRE(result.is_err());
            CHECK(result.error().code == error_codes::invalid_date);
        }
    }
}

TEST_CASE("decode_time converts TM to ISO", "[decoder][time]") {
    auto iso = decode_time("143045");
    REQUIRE(iso.is_ok());
    CHECK(iso.value() == "14:30:45");

    SECTION("fraction is dropped") {
        auto fractional = decode_time("143045.123456");
        REQUIRE(fractional.is_ok());
        CHECK(fractional.value() == "14:30:45");
    }

    SECTION("malformed") {
        for (auto raw : {"1430", "14:30:45", "250000", "236000", "235960", "143045.",
                         "143045.1234567", "143045x1"}) {
            auto result = decode_time(raw);
            REQUIRE(result.is_err());
            CHECK(result.error().code == error_codes::invalid_time);
        }
    }
}

TEST_CASE("is_calendar_date", "[decoder][date]") {
    STATIC_REQUIRE(is_calendar_date(2024, 2, 29));
    STATIC_REQUIRE_FALSE(is_calendar_date(2023, 2, 29));
    STATIC_REQUIRE_FALSE(is_calendar_date(2024, 0, 1));
    STATIC_REQUIRE_FALSE(is_calendar_date(2024, 6, 31));
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_CASE("decode text strategies", "[decoder][text]") {
    SECTION("trailing padding is stripped") {
        auto value = decode(vr_type::LO, bytes_of_text("PAT001  "));
        REQUIRE(value.is_ok());
        CHECK(as_string(value.value()) == "PAT001");
    }

    SECTION("UI keeps leading content and drops NUL pad") {
        const std::vector<uint8_t> raw{'1', '.', '2', '.', '3', '\0'};
        auto value = decode(vr_type::UI, raw);
        REQUIRE(value.is_ok());
        CHECK(as_string(value.value()) == "1.2.3");
    }

    SECTION("person name keeps component separators") {
        auto value = decode(vr_type::PN, bytes_of_text("DOE^JOHN^^^ "));
        REQUIRE(value.is_ok());
        CHECK(as_string(value.value()) == "DOE^JOHN^^^");
    }

    SECTION("all-padding value is null") {
        auto value = decode(vr_type::SH, bytes_of_text("    "));
        REQUIRE(value.is_ok());
        CHECK(is_null(value.value()));
    }

    SECTION("empty payload is null") {
        auto value = decode(vr_type::DA, {});
        REQUIRE(value.is_ok());
        CHECK(is_null(value.value()));
    }
}

TEST_CASE("decode date and time values", "[decoder]") {
    auto date = decode(vr_type::DA, bytes_of_text("20240115"));
    REQUIRE(date.is_ok());
    REQUIRE(std::holds_alternative<date_value>(date.value()));
    CHECK(std::get<date_value>(date.value()).iso == "2024-01-15");

    auto time = decode(vr_type::TM, bytes_of_text("143045"));
    REQUIRE(time.is_ok());
    CHECK(as_string(time.value()) == "14:30:45");

    auto bad = decode(vr_type::DA, bytes_of_text("20241399"));
    REQUIRE(bad.is_err());
    CHECK(bad.error().code == error_codes::invalid_date);
}

TEST_CASE("decode integer values", "[decoder][integer]") {
    SECTION("US") {
        std::vector<uint8_t> raw;
        write_le16(raw, 512);
        auto value = decode(vr_type::US, raw);
        REQUIRE(value.is_ok());
        CHECK(as_integer(value.value()) == 512);
    }

    SECTION("SS is sign-extended") {
        std::vector<uint8_t> raw;
        write_le16(raw, 0xFFFE);
        auto value = decode(vr_type::SS, raw);
        REQUIRE(value.is_ok());
        CHECK(as_integer(value.value()) == -2);
    }

    SECTION("UL and SL") {
        std::vector<uint8_t> raw;
        write_le32(raw, 0xFFFFFFFF);
        CHECK(as_integer(decode(vr_type::UL, raw).value()) == 4294967295LL);
        CHECK(as_integer(decode(vr_type::SL, raw).value()) == -1);
    }

    SECTION("multi-valued yields the first value") {
        std::vector<uint8_t> raw;
        write_le16(raw, 8);
        write_le16(raw, 16);
        CHECK(as_integer(decode(vr_type::US, raw).value()) == 8);
    }

    SECTION("short payload") {
        const std::vector<uint8_t> raw{0x01};
        auto value = decode(vr_type::UL, raw);
        REQUIRE(value.is_err());
        CHECK(value.error().code == error_codes::invalid_numeric_width);
    }

    SECTION("IS text parses as integer") {
        auto value = decode(vr_type::IS, bytes_of_text("-42 "));
        REQUIRE(value.is_ok());
        CHECK(as_integer(value.value()) == -42);
        CHECK_FALSE(as_integer(decode(vr_type::IS, bytes_of_text("4x")).value()).has_value());
    }
}

TEST_CASE("decode binary values as references", "[decoder][binary]") {
    const std::array<uint8_t, 4> raw{9, 8, 7, 6};
    auto value = decode(vr_type::OB, raw, 300);
    REQUIRE(value.is_ok());

    auto ref = as_binary(value.value());
    REQUIRE(ref.has_value());
    CHECK(ref->offset == 300);
    CHECK(ref->length == 4);
    CHECK(binary_ref::kind() == "pixel_data");
    CHECK(describe(value.value()) == "<pixel_data 4 bytes @300>");
}

TEST_CASE("decode_at bounds the payload", "[decoder]") {
    std::vector<uint8_t> buffer(16, 0);
    write_le16(buffer, 77);

    auto inside = decode_at(vr_type::US, buffer, 16, 2);
    REQUIRE(inside.is_ok());
    CHECK(as_integer(inside.value()) == 77);

    auto outside = decode_at(vr_type::US, buffer, 17, 2);
    REQUIRE(outside.is_err());
    CHECK(outside.error().code == error_codes::truncated_element);
}

TEST_CASE("bytes_of rejects out-of-range references", "[decoder][binary]") {
    const std::vector<uint8_t> buffer{1, 2, 3};
    CHECK(bytes_of(buffer, binary_ref{1, 2}).size() == 2);
    CHECK(bytes_of(buffer, binary_ref{2, 5}).empty());
    CHECK(bytes_of(buffer, binary_ref{10, 0}).empty());
}

TEST_CASE("byte_order little endian helpers", "[encoding][byte_order]") {
    std::vector<uint8_t> buffer;
    write_le16(buffer, 0x1234);
    write_le32(buffer, 0xAABBCCDD);
    write_le64(buffer, 0x0102030405060708ULL);

    CHECK(buffer[0] == 0x34);
    CHECK(buffer[1] == 0x12);
    CHECK(read_le16(buffer, 0) == 0x1234);
    CHECK(read_le32(buffer, 2) == 0xAABBCCDD);
    CHECK(read_le64(buffer, 6) == 0x0102030405060708ULL);
}
