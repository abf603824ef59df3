/**
 * @file dicom_metadata.hpp
 * @brief Assembled patient/study/series/image record and its projections
 *
 * A dicom_metadata value is produced once per decode by the
 * metadata_assembler and is not modified afterwards. Fields never carry
 * "absent" state: missing text fields hold a sentinel ("Unknown" or empty)
 * and missing numeric fields hold 0, with has() reporting which fields the
 * source buffer actually supplied.
 *
 * The *_record structures are the flat shapes used by the validator and
 * by callers that build records outside the decode path (for example from
 * a database row or a web form).
 */

#pragma once

#include "medimg/core/tag_dictionary.hpp"
#include "medimg/encoding/vr_decoder.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace medimg::core {

/// Sentinel stored in descriptive text fields the buffer did not supply
inline constexpr std::string_view kUnknownValue = "Unknown";

struct patient_info {
    std::string name;        ///< PN, '^' component separators preserved
    std::string id;
    std::string birth_date;  ///< YYYY-MM-DD or empty
    std::string sex;

    auto operator==(const patient_info&) const -> bool = default;
};

struct study_info {
    std::string instance_uid;
    std::string date;        ///< YYYY-MM-DD or empty
    std::string time;        ///< HH:MM:SS or empty
    std::string description;
    std::string accession_number;
    int64_t number_of_series{0};
    int64_t number_of_instances{0};

    auto operator==(const study_info&) const -> bool = default;
};

struct series_info {
    std::string instance_uid;
    std::string date;
    std::string time;
    std::string description;
    std::string modality;    ///< Canonical upper-case code or empty
    int64_t series_number{0};
    int64_t number_of_instances{0};

    auto operator==(const series_info&) const -> bool = default;
};

struct image_info {
    int64_t instance_number{0};
    int64_t rows{0};
    int64_t columns{0};
    int64_t bits_allocated{0};
    int64_t bits_stored{0};

    /// Location of the pixel data element inside the decoded buffer
    std::optional<encoding::binary_ref> pixel_data;

    auto operator==(const image_info&) const -> bool = default;
};

/**
 * @brief Structured metadata of one DICOM object
 */
struct dicom_metadata {
    patient_info patient;
    study_info study;
    series_info series;
    image_info image;

    std::string sop_instance_uid;
    std::string sop_class_uid;
    std::string transfer_syntax_uid;

    /// Bit per metadata_field that the source buffer supplied
    uint32_t present_fields{0};

    [[nodiscard]] auto has(metadata_field field) const noexcept -> bool {
        return (present_fields & field_bit(field)) != 0;
    }

    void mark_present(metadata_field field) noexcept { present_fields |= field_bit(field); }

    [[nodiscard]] static constexpr auto field_bit(metadata_field field) noexcept -> uint32_t {
        return uint32_t{1} << static_cast<uint32_t>(field);
    }

    auto operator==(const dicom_metadata&) const -> bool = default;
};

// =============================================================================
// Flat records
// =============================================================================

/**
 * @brief Study-level record
 */
struct study_record {
    std::string study_instance_uid;
    std::string patient_id;
    std::string patient_name;
    std::string study_date;         ///< YYYYMMDD or YYYY-MM-DD
    std::string study_time;         ///< Optional; empty when unknown
    std::string study_description;
    std::string modality;
    std::string accession_number;
    std::optional<std::string> specialty;
    int64_t series_count{0};
    int64_t instance_count{0};
};

/**
 * @brief Series-level record
 */
struct series_record {
    std::string series_instance_uid;
    std::string study_instance_uid;
    std::string modality;
    std::string series_description;
    std::optional<int64_t> series_number;
    int64_t instance_count{0};
};

/**
 * @brief Instance-level record; image attributes are optional
 */
struct instance_record {
    std::string sop_instance_uid;
    std::string sop_class_uid;
    std::string series_instance_uid;
    int64_t instance_number{0};
    std::optional<int64_t> rows;
    std::optional<int64_t> columns;
    std::optional<int64_t> bits_allocated;
    std::optional<int64_t> bits_stored;
};

}  // namespace medimg::core
