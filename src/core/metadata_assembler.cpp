/**
 * @file metadata_assembler.cpp
 * @brief First-occurrence-wins fold of decoded elements
 */

#include "medimg/core/metadata_assembler.hpp"

#include <algorithm>
#include <cctype>

namespace medimg::core {

namespace {

auto to_upper(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

auto text_slot(dicom_metadata& m, metadata_field field) -> std::string* {
    switch (field) {
        case metadata_field::patient_name: return &m.patient.name;
        case metadata_field::patient_id: return &m.patient.id;
        case metadata_field::patient_birth_date: return &m.patient.birth_date;
        case metadata_field::patient_sex: return &m.patient.sex;
        case metadata_field::study_date: return &m.study.date;
        case metadata_field::study_time: return &m.study.time;
        case metadata_field::study_description: return &m.study.description;
        case metadata_field::study_instance_uid: return &m.study.instance_uid;
        case metadata_field::accession_number: return &m.study.accession_number;
        case metadata_field::series_date: return &m.series.date;
        case metadata_field::series_time: return &m.series.time;
        case metadata_field::series_description: return &m.series.description;
        case metadata_field::series_instance_uid: return &m.series.instance_uid;
        case metadata_field::modality: return &m.series.modality;
        case metadata_field::sop_class_uid: return &m.sop_class_uid;
        case metadata_field::sop_instance_uid: return &m.sop_instance_uid;
        case metadata_field::transfer_syntax_uid: return &m.transfer_syntax_uid;
        default: return nullptr;
    }
}

auto integer_slot(dicom_metadata& m, metadata_field field) -> int64_t* {
    switch (field) {
        case metadata_field::series_number: return &m.series.series_number;
        case metadata_field::instance_number: return &m.image.instance_number;
        case metadata_field::number_of_study_related_series: return &m.study.number_of_series;
        case metadata_field::number_of_study_related_instances:
            return &m.study.number_of_instances;
        case metadata_field::number_of_series_related_instances:
            return &m.series.number_of_instances;
        case metadata_field::rows: return &m.image.rows;
        case metadata_field::columns: return &m.image.columns;
        case metadata_field::bits_allocated: return &m.image.bits_allocated;
        case metadata_field::bits_stored: return &m.image.bits_stored;
        default: return nullptr;
    }
}

void fill_unknown(std::string& field) {
    if (field.empty()) {
        field = kUnknownValue;
    }
}

auto supplied(const dicom_metadata& m, metadata_field field, const std::string& value)
    -> std::string {
    return m.has(field) ? value : std::string{};
}

}  // namespace

// =============================================================================
// metadata_assembler
// =============================================================================

auto metadata_assembler::add(const data_element& element) -> bool {
    const auto entry = tag_dictionary::lookup(element.tag);
    if (!entry || record_.has(entry->field) || encoding::is_null(element.value)) {
        return false;
    }

    const auto field = entry->field;
    if (field == metadata_field::pixel_data) {
        const auto ref = encoding::as_binary(element.value);
        if (!ref) {
            return false;
        }
        record_.image.pixel_data = *ref;
    } else if (auto* text = text_slot(record_, field)) {
        auto value = encoding::as_string(element.value);
        if (!value) {
            return false;
        }
        *text = field == metadata_field::modality ? to_upper(std::move(*value))
                                                  : std::move(*value);
    } else if (auto* number = integer_slot(record_, field)) {
        const auto value = encoding::as_integer(element.value);
        if (!value) {
            return false;
        }
        *number = *value;
    } else {
        return false;
    }

    record_.mark_present(field);
    ++accepted_;
    return true;
}

auto metadata_assembler::build() const -> dicom_metadata {
    auto result = record_;
    fill_unknown(result.patient.name);
    fill_unknown(result.patient.id);
    fill_unknown(result.patient.sex);
    fill_unknown(result.study.description);
    fill_unknown(result.series.description);
    return result;
}

auto metadata_assembler::assemble(std::span<const data_element> elements) -> dicom_metadata {
    metadata_assembler assembler;
    for (const auto& element : elements) {
        assembler.add(element);
    }
    return assembler.build();
}

// =============================================================================
// Projections
// =============================================================================

auto to_study_record(const dicom_metadata& metadata) -> study_record {
    study_record record;
    record.study_instance_uid = metadata.study.instance_uid;
    record.patient_id = supplied(metadata, metadata_field::patient_id, metadata.patient.id);
    record.patient_name =
        supplied(metadata, metadata_field::patient_name, metadata.patient.name);
    record.study_date = metadata.study.date;
    record.study_time = metadata.study.time;
    record.study_description =
        supplied(metadata, metadata_field::study_description, metadata.study.description);
    record.modality = metadata.series.modality;
    record.accession_number = metadata.study.accession_number;
    record.series_count = metadata.study.number_of_series;
    record.instance_count = metadata.study.number_of_instances;
    return record;
}

auto to_series_record(const dicom_metadata& metadata) -> series_record {
    series_record record;
    record.series_instance_uid = metadata.series.instance_uid;
    record.study_instance_uid = metadata.study.instance_uid;
    record.modality = metadata.series.modality;
    record.series_description = supplied(metadata, metadata_field::series_description,
                                         metadata.series.description);
    if (metadata.has(metadata_field::series_number)) {
        record.series_number = metadata.series.series_number;
    }
    record.instance_count = metadata.series.number_of_instances;
    return record;
}

auto to_instance_record(const dicom_metadata& metadata) -> instance_record {
    instance_record record;
    record.sop_instance_uid = metadata.sop_instance_uid;
    record.sop_class_uid = metadata.sop_class_uid;
    record.series_instance_uid = metadata.series.instance_uid;
    record.instance_number = metadata.image.instance_number;

    auto optional_of = [&metadata](metadata_field field, int64_t value) {
        return metadata.has(field) ? std::optional<int64_t>{value} : std::nullopt;
    };
    record.rows = optional_of(metadata_field::rows, metadata.image.rows);
    record.columns = optional_of(metadata_field::columns, metadata.image.columns);
    record.bits_allocated =
        optional_of(metadata_field::bits_allocated, metadata.image.bits_allocated);
    record.bits_stored = optional_of(metadata_field::bits_stored, metadata.image.bits_stored);
    return record;
}

}  // namespace medimg::core
