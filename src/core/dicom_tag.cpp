/**
 * @file dicom_tag.cpp
 * @brief dicom_tag parsing and formatting
 */

#include "medimg/core/dicom_tag.hpp"

#include <array>

namespace medimg::core {

namespace {

constexpr std::array<char, 16> kHexDigits = {
    '0', '1', '2', '3', '4', '5', '6', '7',
    '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

constexpr auto hex_value(char ch) noexcept -> int {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    return -1;
}

auto parse_hex4(std::string_view digits) noexcept -> std::optional<uint16_t> {
    if (digits.size() != 4) {
        return std::nullopt;
    }
    uint16_t value = 0;
    for (char ch : digits) {
        const int nibble = hex_value(ch);
        if (nibble < 0) {
            return std::nullopt;
        }
        value = static_cast<uint16_t>((value << 4) | nibble);
    }
    return value;
}

void append_hex4(std::string& out, uint16_t value) {
    out += kHexDigits[(value >> 12) & 0xF];
    out += kHexDigits[(value >> 8) & 0xF];
    out += kHexDigits[(value >> 4) & 0xF];
    out += kHexDigits[value & 0xF];
}

auto trim_blank(std::string_view str) noexcept -> std::string_view {
    while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
        str.remove_prefix(1);
    }
    while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) {
        str.remove_suffix(1);
    }
    return str;
}

}  // namespace

auto dicom_tag::from_string(std::string_view str) -> std::optional<dicom_tag> {
    str = trim_blank(str);

    if (str.size() == 11 && str.front() == '(' && str.back() == ')') {
        str = str.substr(1, 9);
    }

    std::string_view group_digits;
    std::string_view element_digits;
    if (str.size() == 9 && str[4] == ',') {
        group_digits = str.substr(0, 4);
        element_digits = str.substr(5, 4);
    } else if (str.size() == 8) {
        group_digits = str.substr(0, 4);
        element_digits = str.substr(4, 4);
    } else {
        return std::nullopt;
    }

    const auto group = parse_hex4(group_digits);
    const auto element = parse_hex4(element_digits);
    if (!group || !element) {
        return std::nullopt;
    }
    return dicom_tag{*group, *element};
}

auto dicom_tag::to_string() const -> std::string {
    std::string result;
    result.reserve(11);
    result += '(';
    append_hex4(result, group());
    result += ',';
    append_hex4(result, element());
    result += ')';
    return result;
}

auto dicom_tag::to_hex() const -> std::string {
    std::string result;
    result.reserve(8);
    append_hex4(result, group());
    append_hex4(result, element());
    return result;
}

}  // namespace medimg::core
