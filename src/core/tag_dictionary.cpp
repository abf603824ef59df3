/**
 * @file tag_dictionary.cpp
 * @brief Tag dictionary table and lookups
 */

#include "medimg/core/tag_dictionary.hpp"

#include <algorithm>
#include <array>

namespace medimg::core {

namespace {

using VR = encoding::vr_type;
using F = metadata_field;

// Sorted by tag; checked at compile time below.
// clang-format off
constexpr std::array kEntries = {
    tag_entry{tags::transfer_syntax_uid,                F::transfer_syntax_uid,                VR::UI, "transferSyntaxUID"},
    tag_entry{tags::sop_class_uid,                      F::sop_class_uid,                      VR::UI, "sopClassUID"},
    tag_entry{tags::sop_instance_uid,                   F::sop_instance_uid,                   VR::UI, "sopInstanceUID"},
    tag_entry{tags::study_date,                         F::study_date,                         VR::DA, "studyDate"},
    tag_entry{tags::series_date,                        F::series_date,                        VR::DA, "seriesDate"},
    tag_entry{tags::study_time,                         F::study_time,                         VR::TM, "studyTime"},
    tag_entry{tags::series_time,                        F::series_time,                        VR::TM, "seriesTime"},
    tag_entry{tags::accession_number,                   F::accession_number,                   VR::SH, "accessionNumber"},
    tag_entry{tags::modality,                           F::modality,                           VR::CS, "modality"},
    tag_entry{tags::study_description,                  F::study_description,                  VR::LO, "studyDescription"},
    tag_entry{tags::series_description,                 F::series_description,                 VR::LO, "seriesDescription"},
    tag_entry{tags::patient_name,                       F::patient_name,                       VR::PN, "patientName"},
    tag_entry{tags::patient_id,                         F::patient_id,                         VR::LO, "patientId"},
    tag_entry{tags::patient_birth_date,                 F::patient_birth_date,                 VR::DA, "patientBirthDate"},
    tag_entry{tags::patient_sex,                        F::patient_sex,                        VR::CS, "patientSex"},
    tag_entry{tags::study_instance_uid,                 F::study_instance_uid,                 VR::UI, "studyInstanceUID"},
    tag_entry{tags::series_instance_uid,                F::series_instance_uid,                VR::UI, "seriesInstanceUID"},
    tag_entry{tags::series_number,                      F::series_number,                      VR::IS, "seriesNumber"},
    tag_entry{tags::instance_number,                    F::instance_number,                    VR::IS, "instanceNumber"},
    tag_entry{tags::number_of_study_related_series,     F::number_of_study_related_series,     VR::IS, "numberOfStudyRelatedSeries"},
    tag_entry{tags::number_of_study_related_instances,  F::number_of_study_related_instances,  VR::IS, "numberOfStudyRelatedInstances"},
    tag_entry{tags::number_of_series_related_instances, F::number_of_series_related_instances, VR::IS, "numberOfSeriesRelatedInstances"},
    tag_entry{tags::rows,                               F::rows,                               VR::US, "rows"},
    tag_entry{tags::columns,                            F::columns,                            VR::US, "columns"},
    tag_entry{tags::bits_allocated,                     F::bits_allocated,                     VR::US, "bitsAllocated"},
    tag_entry{tags::bits_stored,                        F::bits_stored,                        VR::US, "bitsStored"},
    tag_entry{tags::pixel_data,                         F::pixel_data,                         VR::OW, "pixelData"},
};
// clang-format on

constexpr auto is_sorted_unique() -> bool {
    for (std::size_t i = 1; i < kEntries.size(); ++i) {
        if (!(kEntries[i - 1].tag < kEntries[i].tag)) {
            return false;
        }
    }
    return true;
}

static_assert(is_sorted_unique(), "tag dictionary must be sorted by tag without duplicates");

}  // namespace

auto tag_dictionary::lookup(dicom_tag tag) noexcept -> std::optional<tag_entry> {
    const auto it = std::lower_bound(
        kEntries.begin(), kEntries.end(), tag,
        [](const tag_entry& entry, dicom_tag key) { return entry.tag < key; });
    if (it == kEntries.end() || it->tag != tag) {
        return std::nullopt;
    }
    return *it;
}

auto tag_dictionary::find_by_keyword(std::string_view keyword) noexcept
    -> std::optional<tag_entry> {
    const auto it = std::find_if(
        kEntries.begin(), kEntries.end(),
        [keyword](const tag_entry& entry) { return entry.keyword == keyword; });
    if (it == kEntries.end()) {
        return std::nullopt;
    }
    return *it;
}

auto tag_dictionary::find_by_field(metadata_field field) noexcept
    -> std::optional<tag_entry> {
    const auto it = std::find_if(
        kEntries.begin(), kEntries.end(),
        [field](const tag_entry& entry) { return entry.field == field; });
    if (it == kEntries.end()) {
        return std::nullopt;
    }
    return *it;
}

auto tag_dictionary::contains(dicom_tag tag) noexcept -> bool {
    return lookup(tag).has_value();
}

auto tag_dictionary::entries() noexcept -> std::span<const tag_entry> {
    return {kEntries.data(), kEntries.size()};
}

auto to_string(metadata_field field) noexcept -> std::string_view {
    if (auto entry = tag_dictionary::find_by_field(field)) {
        return entry->keyword;
    }
    return "unknown";
}

}  // namespace medimg::core
