/**
 * @file tag_dictionary.hpp
 * @brief Compile-time mapping from tag to the metadata field it fills
 *
 * The dictionary only lists the tags that the metadata assembler folds
 * into a dicom_metadata record. Lookups are by strongly typed dicom_tag,
 * so there is no case handling of hex strings at call sites; text input
 * goes through dicom_tag::from_string() once.
 *
 * @see DICOM PS3.6 - Data Dictionary
 */

#pragma once

#include "medimg/core/dicom_tag.hpp"
#include "medimg/encoding/vr_type.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace medimg::core {

/**
 * @brief Semantic field a dictionary tag maps to
 */
enum class metadata_field {
    patient_name,
    patient_id,
    patient_birth_date,
    patient_sex,
    study_date,
    study_time,
    study_description,
    study_instance_uid,
    accession_number,
    series_date,
    series_time,
    series_description,
    series_instance_uid,
    series_number,
    modality,
    sop_class_uid,
    sop_instance_uid,
    instance_number,
    number_of_study_related_series,
    number_of_study_related_instances,
    number_of_series_related_instances,
    rows,
    columns,
    bits_allocated,
    bits_stored,
    transfer_syntax_uid,
    pixel_data,
};

/**
 * @brief One dictionary row
 */
struct tag_entry {
    dicom_tag tag;
    metadata_field field;
    encoding::vr_type vr;       ///< VR the field is expected to carry
    std::string_view keyword;   ///< camelCase field name, e.g. "patientName"
};

/**
 * @brief Static tag dictionary
 *
 * @example
 * @code
 * if (auto entry = tag_dictionary::lookup(tags::rows)) {
 *     // entry->field == metadata_field::rows
 * }
 * auto by_name = tag_dictionary::find_by_keyword("studyInstanceUID");
 * @endcode
 */
class tag_dictionary {
public:
    tag_dictionary() = delete;

    /**
     * @brief Find the entry for a tag
     * @return The entry, or nullopt for tags outside the dictionary
     */
    [[nodiscard]] static auto lookup(dicom_tag tag) noexcept
        -> std::optional<tag_entry>;

    /**
     * @brief Find the entry for a field keyword (exact, case-sensitive)
     */
    [[nodiscard]] static auto find_by_keyword(std::string_view keyword) noexcept
        -> std::optional<tag_entry>;

    /**
     * @brief Find the entry for a field
     */
    [[nodiscard]] static auto find_by_field(metadata_field field) noexcept
        -> std::optional<tag_entry>;

    [[nodiscard]] static auto contains(dicom_tag tag) noexcept -> bool;

    /**
     * @brief All entries, sorted by tag
     */
    [[nodiscard]] static auto entries() noexcept -> std::span<const tag_entry>;
};

/**
 * @brief camelCase keyword of a field
 */
[[nodiscard]] auto to_string(metadata_field field) noexcept -> std::string_view;

}  // namespace medimg::core
