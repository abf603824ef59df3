/**
 * @file vr_decoder.hpp
 * @brief Decoding of element payloads into typed values
 *
 * One decode function per decode_strategy; decode() dispatches on the VR
 * exactly once. All functions are pure and safe to call concurrently.
 *
 * Decoding rules:
 * - PN: text with '^' component separators kept verbatim
 * - DA: "YYYYMMDD" -> "YYYY-MM-DD", calendar-checked
 * - TM: "HHMMSS[.F{1,6}]" -> "HH:MM:SS"
 * - US/UL/SS/SL: little-endian fixed width
 * - binary VRs: offset/length reference into the source, never copied
 * - an empty payload decodes to null for every VR
 */

#pragma once

#include "medimg/core/result.hpp"
#include "medimg/encoding/vr_type.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace medimg::encoding {

// =============================================================================
// Decoded value alternatives
// =============================================================================

struct text_value {
    std::string text;

    [[nodiscard]] auto operator==(const text_value&) const -> bool = default;
};

/// ISO-8601 calendar date, "YYYY-MM-DD"
struct date_value {
    std::string iso;

    [[nodiscard]] auto operator==(const date_value&) const -> bool = default;
};

/// "HH:MM:SS"; any fractional seconds in the source are dropped
struct time_value {
    std::string iso;

    [[nodiscard]] auto operator==(const time_value&) const -> bool = default;
};

struct integer_value {
    int64_t value{0};

    [[nodiscard]] auto operator==(const integer_value&) const -> bool = default;
};

/**
 * @brief Reference to a binary payload inside the decoded buffer
 *
 * The bytes stay in the caller's buffer; resolve them with
 * bytes_of(buffer, ref) while the buffer is alive.
 */
struct binary_ref {
    std::size_t offset{0};
    std::size_t length{0};

    [[nodiscard]] static constexpr auto kind() noexcept -> std::string_view {
        return "pixel_data";
    }

    [[nodiscard]] auto operator==(const binary_ref&) const -> bool = default;
};

/**
 * @brief Tagged union over decoded payloads; monostate is the null value
 */
using decoded_value = std::variant<std::monostate, text_value, date_value,
                                   time_value, integer_value, binary_ref>;

// =============================================================================
// Accessors
// =============================================================================

[[nodiscard]] inline auto is_null(const decoded_value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief Text of a text, date or time value
 */
[[nodiscard]] auto as_string(const decoded_value& value) -> std::optional<std::string>;

/**
 * @brief Integer value, or the parsed form of an integer string (IS)
 */
[[nodiscard]] auto as_integer(const decoded_value& value) -> std::optional<int64_t>;

[[nodiscard]] auto as_binary(const decoded_value& value) noexcept
    -> std::optional<binary_ref>;

/**
 * @brief Bytes a binary_ref points at, empty when out of range
 */
[[nodiscard]] auto bytes_of(std::span<const uint8_t> buffer, const binary_ref& ref) noexcept
    -> std::span<const uint8_t>;

/**
 * @brief Short human-readable rendering for logs and CLI output
 */
[[nodiscard]] auto describe(const decoded_value& value) -> std::string;

// =============================================================================
// Decoding
// =============================================================================

/**
 * @brief Decode a payload according to its VR
 *
 * @param vr Value representation of the element
 * @param bytes Payload bytes
 * @param source_offset Offset of bytes[0] in the enclosing buffer, recorded
 *        in binary references
 * @return The decoded value, or invalid_date / invalid_time /
 *         invalid_numeric_width
 */
[[nodiscard]] auto decode(vr_type vr, std::span<const uint8_t> bytes,
                          std::size_t source_offset = 0) -> Result<decoded_value>;

/**
 * @brief Decode the payload at [offset, offset + length) of a buffer
 *
 * Fails with truncated_element when the declared length runs past the end
 * of the buffer.
 */
[[nodiscard]] auto decode_at(vr_type vr, std::span<const uint8_t> buffer,
                             std::size_t offset, std::size_t length)
    -> Result<decoded_value>;

/**
 * @brief "YYYYMMDD" -> "YYYY-MM-DD"
 */
[[nodiscard]] auto decode_date(std::string_view raw) -> Result<std::string>;

/**
 * @brief "HHMMSS[.FFFFFF]" -> "HH:MM:SS"
 */
[[nodiscard]] auto decode_time(std::string_view raw) -> Result<std::string>;

/**
 * @brief Gregorian calendar check (leap years included)
 */
[[nodiscard]] constexpr auto is_calendar_date(int year, int month, int day) noexcept
    -> bool {
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }
    constexpr int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    const int limit = (month == 2 && leap) ? 29 : days_in_month[month - 1];
    return day <= limit;
}

}  // namespace medimg::encoding
