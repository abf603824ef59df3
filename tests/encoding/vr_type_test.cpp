/**
 * @file vr_type_test.cpp
 * @brief Unit tests for vr_type helpers
 */

#include <catch2/catch_test_macros.hpp>

#include "medimg/encoding/vr_type.hpp"

using namespace medimg::encoding;

TEST_CASE("vr_type string conversion", "[encoding][vr_type]") {
    SECTION("to_string") {
        CHECK(to_string(vr_type::PN) == "PN");
        CHECK(to_string(vr_type::UI) == "UI");
        CHECK(to_string(vr_type::OW) == "OW");
    }

    SECTION("from_string") {
        CHECK(from_string("DA") == vr_type::DA);
        CHECK(from_string("US") == vr_type::US);
        CHECK_FALSE(from_string("ZZ").has_value());
        CHECK_FALSE(from_string("da").has_value());
        CHECK_FALSE(from_string("PNX").has_value());
        CHECK_FALSE(from_string("").has_value());
    }
}

TEST_CASE("vr_type enum values match ASCII encoding", "[encoding][vr_type]") {
    CHECK(static_cast<uint16_t>(vr_type::PN) == (('P' << 8) | 'N'));
    CHECK(static_cast<uint16_t>(vr_type::OB) == (('O' << 8) | 'B'));
}

TEST_CASE("vr_type decode strategies", "[encoding][vr_type]") {
    CHECK(decode_strategy_of(vr_type::PN) == decode_strategy::person_name);
    CHECK(decode_strategy_of(vr_type::DA) == decode_strategy::date);
    CHECK(decode_strategy_of(vr_type::TM) == decode_strategy::time);

    for (auto vr : {vr_type::US, vr_type::UL, vr_type::SS, vr_type::SL}) {
        CHECK(decode_strategy_of(vr) == decode_strategy::integer);
    }
    for (auto vr : {vr_type::CS, vr_type::LO, vr_type::UI, vr_type::IS, vr_type::SH}) {
        CHECK(decode_strategy_of(vr) == decode_strategy::text);
    }
    for (auto vr : {vr_type::OB, vr_type::OW, vr_type::UN, vr_type::SQ, vr_type::FD}) {
        CHECK(decode_strategy_of(vr) == decode_strategy::binary);
    }
}

TEST_CASE("vr_type 32-bit length in explicit VR", "[encoding][vr_type]") {
    for (auto vr : {vr_type::OB, vr_type::OW, vr_type::SQ, vr_type::UN, vr_type::UT,
                    vr_type::UC, vr_type::UR}) {
        CHECK(has_explicit_32bit_length(vr));
    }
    for (auto vr : {vr_type::PN, vr_type::US, vr_type::DA, vr_type::UI, vr_type::LO}) {
        CHECK_FALSE(has_explicit_32bit_length(vr));
    }
}

TEST_CASE("vr_type integer widths and padding", "[encoding][vr_type]") {
    CHECK(integer_width(vr_type::US) == 2);
    CHECK(integer_width(vr_type::SL) == 4);
    CHECK(integer_width(vr_type::LO) == 0);
    CHECK(is_signed_integer(vr_type::SS));
    CHECK_FALSE(is_signed_integer(vr_type::UL));

    CHECK(padding_char(vr_type::UI) == '\0');
    CHECK(padding_char(vr_type::PN) == ' ');
    CHECK(padding_char(vr_type::LO) == ' ');
    CHECK(padding_char(vr_type::OB) == '\0');
}

TEST_CASE("vr_type constexpr evaluation", "[encoding][vr_type]") {
    static_assert(from_string("OW") == vr_type::OW);
    static_assert(has_explicit_32bit_length(vr_type::OB));
    static_assert(integer_width(vr_type::UL) == 4);
    SUCCEED();
}
