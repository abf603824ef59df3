/**
 * @file dicom_tag.hpp
 * @brief DICOM tag (group, element) value type and well-known tag constants
 *
 * Tags are stored as a single 32-bit value (group << 16 | element) so
 * comparison and hashing cost one integer operation.
 *
 * @see DICOM PS3.5 Section 7.1 - Data Elements
 */

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace medimg::core {

/**
 * @brief Identifies a data element by (group, element)
 *
 * @example
 * @code
 * constexpr dicom_tag patient_name{0x0010, 0x0010};
 * auto parsed = dicom_tag::from_string("(7fe0,0010)");  // case-insensitive
 * std::string key = parsed->to_hex();                   // "7FE00010"
 * @endcode
 */
class dicom_tag {
public:
    constexpr dicom_tag() noexcept : combined_{0} {}

    constexpr dicom_tag(uint16_t group, uint16_t element) noexcept
        : combined_{static_cast<uint32_t>(group) << 16 | element} {}

    explicit constexpr dicom_tag(uint32_t combined) noexcept
        : combined_{combined} {}

    /**
     * @brief Parse a tag from text
     *
     * Accepted forms: "(GGGG,EEEE)", "GGGG,EEEE" and "GGGGEEEE". Hex
     * digits may be either case; surrounding whitespace is ignored.
     *
     * @return The tag, or nullopt when the text is not a tag
     */
    [[nodiscard]] static auto from_string(std::string_view str)
        -> std::optional<dicom_tag>;

    [[nodiscard]] constexpr auto group() const noexcept -> uint16_t {
        return static_cast<uint16_t>(combined_ >> 16);
    }

    [[nodiscard]] constexpr auto element() const noexcept -> uint16_t {
        return static_cast<uint16_t>(combined_ & 0xFFFF);
    }

    [[nodiscard]] constexpr auto combined() const noexcept -> uint32_t {
        return combined_;
    }

    /**
     * @brief File meta information group (0002,xxxx)
     */
    [[nodiscard]] constexpr auto is_meta_information() const noexcept -> bool {
        return group() == 0x0002;
    }

    /**
     * @brief Odd groups above 0x0008 are reserved for private use
     */
    [[nodiscard]] constexpr auto is_private() const noexcept -> bool {
        const auto grp = group();
        return (grp & 1) != 0 && grp > 0x0008;
    }

    /**
     * @brief "(GGGG,EEEE)" with uppercase hex digits
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /**
     * @brief Canonical compact form "GGGGEEEE" with uppercase hex digits
     */
    [[nodiscard]] auto to_hex() const -> std::string;

    [[nodiscard]] constexpr auto operator<=>(const dicom_tag& other) const noexcept
        -> std::strong_ordering = default;

    [[nodiscard]] constexpr auto operator==(const dicom_tag& other) const noexcept
        -> bool = default;

private:
    uint32_t combined_;
};

/**
 * @namespace tags
 * @brief Tags the codec understands
 */
namespace tags {

// File meta information
inline constexpr dicom_tag transfer_syntax_uid{0x0002, 0x0010};

// SOP common
inline constexpr dicom_tag sop_class_uid{0x0008, 0x0016};
inline constexpr dicom_tag sop_instance_uid{0x0008, 0x0018};

// Study / series dates and identification
inline constexpr dicom_tag study_date{0x0008, 0x0020};
inline constexpr dicom_tag series_date{0x0008, 0x0021};
inline constexpr dicom_tag study_time{0x0008, 0x0030};
inline constexpr dicom_tag series_time{0x0008, 0x0031};
inline constexpr dicom_tag accession_number{0x0008, 0x0050};
inline constexpr dicom_tag modality{0x0008, 0x0060};
inline constexpr dicom_tag study_description{0x0008, 0x1030};
inline constexpr dicom_tag series_description{0x0008, 0x103E};

// Patient
inline constexpr dicom_tag patient_name{0x0010, 0x0010};
inline constexpr dicom_tag patient_id{0x0010, 0x0020};
inline constexpr dicom_tag patient_birth_date{0x0010, 0x0030};
inline constexpr dicom_tag patient_sex{0x0010, 0x0040};

// Relationship
inline constexpr dicom_tag study_instance_uid{0x0020, 0x000D};
inline constexpr dicom_tag series_instance_uid{0x0020, 0x000E};
inline constexpr dicom_tag series_number{0x0020, 0x0011};
inline constexpr dicom_tag instance_number{0x0020, 0x0013};
inline constexpr dicom_tag number_of_study_related_series{0x0020, 0x1206};
inline constexpr dicom_tag number_of_study_related_instances{0x0020, 0x1208};
inline constexpr dicom_tag number_of_series_related_instances{0x0020, 0x1209};

// Image pixel
inline constexpr dicom_tag rows{0x0028, 0x0010};
inline constexpr dicom_tag columns{0x0028, 0x0011};
inline constexpr dicom_tag bits_allocated{0x0028, 0x0100};
inline constexpr dicom_tag bits_stored{0x0028, 0x0101};
inline constexpr dicom_tag pixel_data{0x7FE0, 0x0010};

}  // namespace tags

}  // namespace medimg::core

template <>
struct std::hash<medimg::core::dicom_tag> {
    [[nodiscard]] auto operator()(const medimg::core::dicom_tag& tag) const noexcept
        -> size_t {
        return std::hash<uint32_t>{}(tag.combined());
    }
};
