#ifndef MEDIMG_ENCODING_VR_TYPE_HPP
#define MEDIMG_ENCODING_VR_TYPE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace medimg::encoding {

/**
 * @brief DICOM Value Representation codes.
 *
 * Each enumerator holds the two ASCII characters of the code packed
 * big-endian (first character in the high byte), so the value read from
 * the wire maps onto the enum without a lookup table.
 *
 * @see DICOM PS3.5 Section 6.2 - Value Representation (VR)
 */
enum class vr_type : uint16_t {
    AE = 0x4145,
    AS = 0x4153,
    AT = 0x4154,
    CS = 0x4353,
    DA = 0x4441,
    DS = 0x4453,
    DT = 0x4454,
    FD = 0x4644,
    FL = 0x464C,
    IS = 0x4953,
    LO = 0x4C4F,
    LT = 0x4C54,
    OB = 0x4F42,
    OD = 0x4F44,
    OF = 0x4F46,
    OL = 0x4F4C,
    OV = 0x4F56,
    OW = 0x4F57,
    PN = 0x504E,
    SH = 0x5348,
    SL = 0x534C,
    SQ = 0x5351,
    SS = 0x5353,
    ST = 0x5354,
    SV = 0x5356,
    TM = 0x544D,
    UC = 0x5543,
    UI = 0x5549,
    UL = 0x554C,
    UN = 0x554E,
    UR = 0x5552,
    US = 0x5553,
    UT = 0x5554,
    UV = 0x5556,
};

/**
 * @brief How the payload of an element is turned into a decoded_value.
 *
 * Every vr_type maps to exactly one strategy through decode_strategy_of().
 */
enum class decode_strategy {
    text,         ///< Character data, trailing padding removed
    person_name,  ///< Character data, component separators kept verbatim
    date,         ///< YYYYMMDD -> YYYY-MM-DD
    time,         ///< HHMMSS[.F] -> HH:MM:SS
    integer,      ///< Little-endian fixed-width integer
    binary,       ///< Offset/length reference into the source buffer
};

[[nodiscard]] constexpr std::string_view to_string(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::AE: return "AE";
        case vr_type::AS: return "AS";
        case vr_type::AT: return "AT";
        case vr_type::CS: return "CS";
        case vr_type::DA: return "DA";
        case vr_type::DS: return "DS";
        case vr_type::DT: return "DT";
        case vr_type::FD: return "FD";
        case vr_type::FL: return "FL";
        case vr_type::IS: return "IS";
        case vr_type::LO: return "LO";
        case vr_type::LT: return "LT";
        case vr_type::OB: return "OB";
        case vr_type::OD: return "OD";
        case vr_type::OF: return "OF";
        case vr_type::OL: return "OL";
        case vr_type::OV: return "OV";
        case vr_type::OW: return "OW";
        case vr_type::PN: return "PN";
        case vr_type::SH: return "SH";
        case vr_type::SL: return "SL";
        case vr_type::SQ: return "SQ";
        case vr_type::SS: return "SS";
        case vr_type::ST: return "ST";
        case vr_type::SV: return "SV";
        case vr_type::TM: return "TM";
        case vr_type::UC: return "UC";
        case vr_type::UI: return "UI";
        case vr_type::UL: return "UL";
        case vr_type::UN: return "UN";
        case vr_type::UR: return "UR";
        case vr_type::US: return "US";
        case vr_type::UT: return "UT";
        case vr_type::UV: return "UV";
    }
    return "??";
}

/**
 * @brief Strategy used to decode a VR's payload.
 *
 * The switch has no default so that adding an enumerator without a
 * strategy is caught by -Wswitch.
 */
[[nodiscard]] constexpr decode_strategy decode_strategy_of(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::PN:
            return decode_strategy::person_name;
        case vr_type::DA:
            return decode_strategy::date;
        case vr_type::TM:
            return decode_strategy::time;
        case vr_type::US:
        case vr_type::UL:
        case vr_type::SS:
        case vr_type::SL:
            return decode_strategy::integer;
        case vr_type::AE:
        case vr_type::AS:
        case vr_type::CS:
        case vr_type::DS:
        case vr_type::DT:
        case vr_type::IS:
        case vr_type::LO:
        case vr_type::LT:
        case vr_type::SH:
        case vr_type::ST:
        case vr_type::UC:
        case vr_type::UI:
        case vr_type::UR:
        case vr_type::UT:
            return decode_strategy::text;
        case vr_type::AT:
        case vr_type::FD:
        case vr_type::FL:
        case vr_type::OB:
        case vr_type::OD:
        case vr_type::OF:
        case vr_type::OL:
        case vr_type::OV:
        case vr_type::OW:
        case vr_type::SQ:
        case vr_type::SV:
        case vr_type::UN:
        case vr_type::UV:
            return decode_strategy::binary;
    }
    return decode_strategy::binary;
}

/**
 * @brief Parse the two ASCII characters of a VR code
 * @return The VR, or nullopt for codes this codec does not know
 */
[[nodiscard]] constexpr std::optional<vr_type> from_string(std::string_view str) noexcept {
    if (str.size() != 2) {
        return std::nullopt;
    }

    const auto code = static_cast<uint16_t>(
        (static_cast<uint16_t>(static_cast<unsigned char>(str[0])) << 8) |
        static_cast<uint16_t>(static_cast<unsigned char>(str[1])));
    const auto candidate = static_cast<vr_type>(code);

    if (to_string(candidate) == "??") {
        return std::nullopt;
    }
    return candidate;
}

/**
 * @brief VRs whose explicit-VR header is 2 reserved bytes + 4-byte length
 *
 * @see DICOM PS3.5 Section 7.1.2
 */
[[nodiscard]] constexpr bool has_explicit_32bit_length(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::OB: case vr_type::OD: case vr_type::OF:
        case vr_type::OL: case vr_type::OV: case vr_type::OW:
        case vr_type::SQ: case vr_type::SV: case vr_type::UC:
        case vr_type::UN: case vr_type::UR: case vr_type::UT:
        case vr_type::UV:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Byte width of one value of an integer VR, 0 for anything else
 */
[[nodiscard]] constexpr std::size_t integer_width(vr_type vr) noexcept {
    switch (vr) {
        case vr_type::US: case vr_type::SS: return 2;
        case vr_type::UL: case vr_type::SL: return 4;
        default: return 0;
    }
}

[[nodiscard]] constexpr bool is_signed_integer(vr_type vr) noexcept {
    return vr == vr_type::SS || vr == vr_type::SL;
}

/**
 * @brief Pad byte used to bring a value to even length
 *
 * UI and binary payloads pad with NUL, other text with a space.
 */
[[nodiscard]] constexpr char padding_char(vr_type vr) noexcept {
    switch (decode_strategy_of(vr)) {
        case decode_strategy::text:
            return vr == vr_type::UI ? '\0' : ' ';
        case decode_strategy::person_name:
        case decode_strategy::date:
        case decode_strategy::time:
            return ' ';
        case decode_strategy::integer:
        case decode_strategy::binary:
            return '\0';
    }
    return '\0';
}

}  // namespace medimg::encoding

#endif  // MEDIMG_ENCODING_VR_TYPE_HPP
