/**
 * @file metadata_assembler.hpp
 * @brief Folds a decoded element sequence into a dicom_metadata record
 *
 * For each element whose tag resolves through the tag_dictionary the
 * decoded value is written into the matching field. The first non-null
 * occurrence of a tag wins; later duplicates and tags outside the
 * dictionary are ignored. build() fills every missing field with its
 * sentinel so the result has no absent state.
 */

#pragma once

#include "medimg/core/dicom_metadata.hpp"
#include "medimg/core/element_walker.hpp"

#include <cstddef>
#include <span>

namespace medimg::core {

class metadata_assembler {
public:
    /**
     * @brief Fold one element
     * @return true if the element filled a field, false if it was ignored
     */
    auto add(const data_element& element) -> bool;

    /**
     * @brief Produce the record with sentinels applied
     */
    [[nodiscard]] auto build() const -> dicom_metadata;

    /**
     * @brief Number of elements that filled a field
     */
    [[nodiscard]] auto accepted_count() const noexcept -> std::size_t { return accepted_; }

    /**
     * @brief Fold a complete element sequence
     */
    [[nodiscard]] static auto assemble(std::span<const data_element> elements)
        -> dicom_metadata;

private:
    dicom_metadata record_;
    std::size_t accepted_{0};
};

/**
 * @brief Project metadata onto the study-level record
 *
 * Fields the buffer did not supply are empty in the projection, so the
 * validator reports them instead of accepting the "Unknown" sentinel.
 */
[[nodiscard]] auto to_study_record(const dicom_metadata& metadata) -> study_record;

[[nodiscard]] auto to_series_record(const dicom_metadata& metadata) -> series_record;

[[nodiscard]] auto to_instance_record(const dicom_metadata& metadata) -> instance_record;

}  // namespace medimg::core
