/**
 * @file vr_decoder.cpp
 * @brief Payload decoding for each decode_strategy
 */

#include "medimg/encoding/vr_decoder.hpp"
#include "medimg/encoding/byte_order.hpp"
#include "medimg/compat/format.hpp"

#include <charconv>

namespace medimg::encoding {

namespace {

auto as_chars(std::span<const uint8_t> bytes) noexcept -> std::string_view {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

auto is_digits(std::string_view str) noexcept -> bool {
    if (str.empty()) {
        return false;
    }
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

auto to_int(std::string_view digits) noexcept -> int {
    int value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
    }
    return value;
}

auto strip_trailing_padding(std::string_view str) noexcept -> std::string_view {
    while (!str.empty() && (str.back() == ' ' || str.back() == '\0')) {
        str.remove_suffix(1);
    }
    return str;
}

auto strip_leading_spaces(std::string_view str) noexcept -> std::string_view {
    while (!str.empty() && str.front() == ' ') {
        str.remove_prefix(1);
    }
    return str;
}

// ---------------------------------------------------------------------------
// Per-strategy decoders
// ---------------------------------------------------------------------------

auto decode_text(vr_type vr, std::string_view raw) -> decoded_value {
    auto text = strip_trailing_padding(raw);
    if (vr != vr_type::UI) {
        text = strip_leading_spaces(text);
    }
    if (text.empty()) {
        return std::monostate{};
    }
    return text_value{std::string{text}};
}

auto decode_person_name(std::string_view raw) -> decoded_value {
    // Only the even-length pad is removed; '^' groups and any internal
    // spacing stay untouched.
    const auto text = strip_trailing_padding(raw);
    if (text.empty()) {
        return std::monostate{};
    }
    return text_value{std::string{text}};
}

auto decode_date_value(std::string_view raw) -> Result<decoded_value> {
    const auto text = strip_leading_spaces(strip_trailing_padding(raw));
    if (text.empty()) {
        return Result<decoded_value>::ok(std::monostate{});
    }
    auto iso = decode_date(text);
    if (iso.is_err()) {
        return Result<decoded_value>::err(iso.error());
    }
    return Result<decoded_value>::ok(date_value{std::move(iso.value())});
}

auto decode_time_value(std::string_view raw) -> Result<decoded_value> {
    const auto text = strip_leading_spaces(strip_trailing_padding(raw));
    if (text.empty()) {
        return Result<decoded_value>::ok(std::monostate{});
    }
    auto iso = decode_time(text);
    if (iso.is_err()) {
        return Result<decoded_value>::err(iso.error());
    }
    return Result<decoded_value>::ok(time_value{std::move(iso.value())});
}

auto decode_integer(vr_type vr, std::span<const uint8_t> bytes)
    -> Result<decoded_value> {
    const auto width = integer_width(vr);
    if (bytes.size() < width) {
        return medimg_error<decoded_value>(
            error_codes::invalid_numeric_width,
            compat::format("{} value needs {} bytes, got {}",
                           to_string(vr), width, bytes.size()));
    }

    // Multi-valued elements (VM > 1) yield their first value.
    int64_t value = 0;
    if (width == 2) {
        const auto raw = read_le16(bytes, 0);
        value = is_signed_integer(vr) ? static_cast<int64_t>(static_cast<int16_t>(raw))
                                      : static_cast<int64_t>(raw);
    } else {
        const auto raw = read_le32(bytes, 0);
        value = is_signed_integer(vr) ? static_cast<int64_t>(static_cast<int32_t>(raw))
                                      : static_cast<int64_t>(raw);
    }
    return Result<decoded_value>::ok(integer_value{value});
}

}  // namespace

// =============================================================================
// Accessors
// =============================================================================

auto as_string(const decoded_value& value) -> std::optional<std::string> {
    if (const auto* text = std::get_if<text_value>(&value)) {
        return text->text;
    }
    if (const auto* date = std::get_if<date_value>(&value)) {
        return date->iso;
    }
    if (const auto* time = std::get_if<time_value>(&value)) {
        return time->iso;
    }
    return std::nullopt;
}

auto as_integer(const decoded_value& value) -> std::optional<int64_t> {
    if (const auto* number = std::get_if<integer_value>(&value)) {
        return number->value;
    }
    if (const auto* text = std::get_if<text_value>(&value)) {
        // Integer String (IS) values arrive as text, possibly signed.
        std::string_view digits = strip_leading_spaces(text->text);
        if (!digits.empty() && digits.front() == '+') {
            digits.remove_prefix(1);
        }
        int64_t parsed = 0;
        const auto* first = digits.data();
        const auto* last = digits.data() + digits.size();
        const auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (ec == std::errc{} && ptr == last && first != last) {
            return parsed;
        }
    }
    return std::nullopt;
}

auto as_binary(const decoded_value& value) noexcept -> std::optional<binary_ref> {
    if (const auto* ref = std::get_if<binary_ref>(&value)) {
        return *ref;
    }
    return std::nullopt;
}

auto bytes_of(std::span<const uint8_t> buffer, const binary_ref& ref) noexcept
    -> std::span<const uint8_t> {
    if (ref.offset > buffer.size() || ref.length > buffer.size() - ref.offset) {
        return {};
    }
    return buffer.subspan(ref.offset, ref.length);
}

auto describe(const decoded_value& value) -> std::string {
    struct visitor {
        auto operator()(std::monostate) const -> std::string { return "(null)"; }
        auto operator()(const text_value& v) const -> std::string { return v.text; }
        auto operator()(const date_value& v) const -> std::string { return v.iso; }
        auto operator()(const time_value& v) const -> std::string { return v.iso; }
        auto operator()(const integer_value& v) const -> std::string {
            return std::to_string(v.value);
        }
        auto operator()(const binary_ref& v) const -> std::string {
            return compat::format("<{} {} bytes @{}>", binary_ref::kind(), v.length,
                                  v.offset);
        }
    };
    return std::visit(visitor{}, value);
}

// =============================================================================
// Date / time
// =============================================================================

auto decode_date(std::string_view raw) -> Result<std::string> {
    if (raw.size() != 8 || !is_digits(raw)) {
        return medimg_error<std::string>(
            error_codes::invalid_date,
            compat::format("DA value must be 8 digits YYYYMMDD, got '{}'", raw));
    }

    const int year = to_int(raw.substr(0, 4));
    const int month = to_int(raw.substr(4, 2));
    const int day = to_int(raw.substr(6, 2));
    if (!is_calendar_date(year, month, day)) {
        return medimg_error<std::string>(
            error_codes::invalid_date,
            compat::format("DA value '{}' is not a calendar date", raw));
    }

    std::string iso;
    iso.reserve(10);
    iso.append(raw.substr(0, 4)).append(1, '-');
    iso.append(raw.substr(4, 2)).append(1, '-');
    iso.append(raw.substr(6, 2));
    return Result<std::string>::ok(std::move(iso));
}

auto decode_time(std::string_view raw) -> Result<std::string> {
    auto fail = [raw](std::string_view reason) {
        return medimg_error<std::string>(
            error_codes::invalid_time,
            compat::format("TM value '{}' {}", raw, reason));
    };

    if (raw.size() < 6 || !is_digits(raw.substr(0, 6))) {
        return fail("must start with HHMMSS");
    }
    if (raw.size() > 6) {
        const auto fraction = raw.substr(6);
        if (fraction.front() != '.' || fraction.size() < 2 || fraction.size() > 7 ||
            !is_digits(fraction.substr(1))) {
            return fail("has a malformed fractional part");
        }
    }

    const int hours = to_int(raw.substr(0, 2));
    const int minutes = to_int(raw.substr(2, 2));
    const int seconds = to_int(raw.substr(4, 2));
    if (hours > 23 || minutes > 59 || seconds > 59) {
        return fail("is out of range");
    }

    std::string iso;
    iso.reserve(8);
    iso.append(raw.substr(0, 2)).append(1, ':');
    iso.append(raw.substr(2, 2)).append(1, ':');
    iso.append(raw.substr(4, 2));
    return Result<std::string>::ok(std::move(iso));
}

// =============================================================================
// Dispatch
// =============================================================================

auto decode(vr_type vr, std::span<const uint8_t> bytes, std::size_t source_offset)
    -> Result<decoded_value> {
    if (bytes.empty()) {
        return Result<decoded_value>::ok(std::monostate{});
    }

    switch (decode_strategy_of(vr)) {
        case decode_strategy::text:
            return Result<decoded_value>::ok(decode_text(vr, as_chars(bytes)));
        case decode_strategy::person_name:
            return Result<decoded_value>::ok(decode_person_name(as_chars(bytes)));
        case decode_strategy::date:
            return decode_date_value(as_chars(bytes));
        case decode_strategy::time:
            return decode_time_value(as_chars(bytes));
        case decode_strategy::integer:
            return decode_integer(vr, bytes);
        case decode_strategy::binary:
            return Result<decoded_value>::ok(binary_ref{source_offset, bytes.size()});
    }
    return Result<decoded_value>::ok(std::monostate{});
}

auto decode_at(vr_type vr, std::span<const uint8_t> buffer, std::size_t offset,
               std::size_t length) -> Result<decoded_value> {
    if (offset > buffer.size() || length > buffer.size() - offset) {
        return medimg_error<decoded_value>(
            error_codes::truncated_element,
            compat::format("{} value of {} bytes at offset {} exceeds buffer of {} bytes",
                           to_string(vr), length, offset, buffer.size()));
    }
    return decode(vr, buffer.subspan(offset, length), offset);
}

}  // namespace medimg::encoding
