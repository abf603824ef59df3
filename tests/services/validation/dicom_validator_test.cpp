/**
 * @file dicom_validator_test.cpp
 * @brief Unit tests for field checks and record validation
 */

#include <catch2/catch_test_macros.hpp>

#include "medimg/core/element_walker.hpp"
#include "medimg/core/metadata_assembler.hpp"
#include "medimg/services/validation/dicom_validator.hpp"

#include "../../helpers/sample_buffers.hpp"

#include <algorithm>
#include <string>

using namespace medimg;
using namespace medimg::services::validation;

namespace {

auto valid_study() -> core::study_record {
    core::study_record study;
    study.study_instance_uid = "1.2.840.10008.1.2.3";
    study.patient_id = "PAT-001";
    study.patient_name = "DOE^JOHN";
    study.study_date = "20240115";
    study.study_time = "143045";
    study.study_description = "CT CHEST";
    study.modality = "CT";
    study.accession_number = "ACC0001";
    return study;
}

auto has_finding(const validation_result& result, std::string_view field) -> bool {
    return std::any_of(result.findings.begin(), result.findings.end(),
                       [field](const validation_finding& f) { return f.field == field; });
}

}  // namespace

// ============================================================================
// Field checks
// ============================================================================

TEST_CASE("validate_uid grammar", "[validator][uid]") {
    CHECK(validate_uid("1.2.840.10008.1.2.1"));
    CHECK(validate_uid("1"));
    CHECK(validate_uid(std::string(64, '1')));

    CHECK_FALSE(validate_uid(""));
    CHECK_FALSE(validate_uid(std::string(65, '1')));
    CHECK_FALSE(validate_uid(".1.2"));
    CHECK_FALSE(validate_uid("1.2."));
    CHECK_FALSE(validate_uid("1..2"));
    CHECK_FALSE(validate_uid("1.2.a"));
    CHECK_FALSE(validate_uid("1.2 .3"));

    CHECK(validate_study_instance_uid(test::kStudyUid));
    CHECK(validate_sop_instance_uid(test::kSopUid));
}

TEST_CASE("validate_patient_id", "[validator][patient]") {
    CHECK(validate_patient_id("PAT001"));
    CHECK(validate_patient_id("pat_01-A"));
    CHECK(validate_patient_id("  PAT001  "));
    CHECK_FALSE(validate_patient_id(""));
    CHECK_FALSE(validate_patient_id("   "));
    CHECK_FALSE(validate_patient_id("PAT 001"));
    CHECK_FALSE(validate_patient_id("PAT/001"));
    CHECK_FALSE(validate_patient_id(std::string(65, 'A')));
}

TEST_CASE("modality codes", "[validator][modality]") {
    CHECK(validate_modality("CT"));
    CHECK(validate_modality("mr"));
    CHECK(canonical_modality(" us ") == "US");
    CHECK_FALSE(validate_modality("XX"));
    CHECK_FALSE(validate_modality(""));
    CHECK(std::find(known_modalities().begin(), known_modalities().end(), "RTSTRUCT") !=
          known_modalities().end());
}

TEST_CASE("DICOM date and time checks", "[validator][datetime]") {
    CHECK(validate_dicom_date("20240115"));
    CHECK(validate_dicom_date("2024-01-15"));
    CHECK(validate_dicom_date("20240229"));
    CHECK_FALSE(validate_dicom_date("20230229"));
    CHECK_FALSE(validate_dicom_date("18991231"));
    CHECK_FALSE(validate_dicom_date("21010101"));
    CHECK_FALSE(validate_dicom_date("2024/01/15"));

    CHECK(validate_dicom_time("143045"));
    CHECK(validate_dicom_time("14:30:45"));
    CHECK(validate_dicom_time("143045.5"));
    CHECK_FALSE(validate_dicom_time("246000"));
    CHECK_FALSE(validate_dicom_time("1430"));
    CHECK_FALSE(validate_dicom_time("143045."));
}

TEST_CASE("medical specialties", "[validator][specialty]") {
    CHECK(validate_medical_specialty("radiology"));
    CHECK(validate_medical_specialty("primary-care"));
    CHECK_FALSE(validate_medical_specialty("Radiology"));
    CHECK(known_specialties().size() == 10);
}

TEST_CASE("sanitize_patient_name", "[validator][patient]") {
    CHECK(sanitize_patient_name("  doe^john  ") == "DOE^JOHN");
    CHECK(sanitize_patient_name("O'Brien;  DROP\tTABLE") == "OBRIEN DROP TABLE");
    CHECK(sanitize_patient_name("<script>") == "SCRIPT");
    CHECK(sanitize_patient_name("") == "");
}

// ============================================================================
// Records
// ============================================================================

TEST_CASE("dicom_validator validate_study", "[validator][study]") {
    dicom_validator validator;

    SECTION("valid study") {
        const auto result = validator.validate_study(valid_study());
        CHECK(result.is_valid);
        CHECK_FALSE(result.has_errors());
    }

    SECTION("every missing field is reported") {
        const auto result = validator.validate_study(core::study_record{});
        CHECK_FALSE(result.is_valid);
        CHECK(has_finding(result, "studyInstanceUID"));
        CHECK(has_finding(result, "patientId"));
        CHECK(has_finding(result, "patientName"));
        CHECK(has_finding(result, "studyDate"));
        CHECK(has_finding(result, "modality"));
        CHECK(result.has_warnings());
        CHECK(result.findings.front().code == "STUDY-001");
    }

    SECTION("unknown specialty") {
        auto study = valid_study();
        study.specialty = "astrology";
        const auto result = validator.validate_study(study);
        CHECK_FALSE(result.is_valid);
        CHECK(has_finding(result, "specialty"));
    }

    SECTION("required specialty and study time") {
        validation_options options;
        options.require_specialty = true;
        options.require_study_time = true;
        dicom_validator strict(options);

        auto study = valid_study();
        study.study_time.clear();
        const auto result = strict.validate_study(study);
        CHECK(result.error_count() == 2);
    }

    SECTION("strict mode turns warnings into failures") {
        auto study = valid_study();
        study.accession_number.clear();
        CHECK(validator.validate_study(study).is_valid);

        validation_options options;
        options.strict_mode = true;
        validator.set_options(options);
        const auto result = validator.validate_study(study);
        CHECK_FALSE(result.is_valid);
        CHECK(result.warning_count() == 1);
    }
}

TEST_CASE("dicom_validator validate_series", "[validator][series]") {
    dicom_validator validator;

    core::series_record series;
    series.series_instance_uid = test::kSeriesUid;
    series.study_instance_uid = test::kStudyUid;
    series.modality = "mr";
    series.series_number = 3;
    CHECK(validator.validate_series(series).is_valid);

    series.series_number = 0;
    series.instance_count = -1;
    series.study_instance_uid.clear();
    const auto result = validator.validate_series(series);
    CHECK(result.error_count() == 3);
    CHECK(has_finding(result, "seriesNumber"));
    CHECK(has_finding(result, "studyInstanceUID"));
    CHECK(result.findings.front().code.starts_with("SERIES-"));
}

TEST_CASE("dicom_validator validate_instance", "[validator][instance]") {
    dicom_validator validator;

    core::instance_record instance;
    instance.sop_instance_uid = "1.2.3.4";
    instance.sop_class_uid = test::kCtImageStorage;
    instance.series_instance_uid = "1.2.3";
    instance.instance_number = 1;
    instance.rows = 512;
    instance.columns = 512;
    instance.bits_allocated = 16;
    instance.bits_stored = 12;
    CHECK(validator.validate_instance(instance).is_valid);

    SECTION("bad geometry") {
        instance.rows = 0;
        instance.bits_allocated = 12;
        instance.bits_stored = 16;
        const auto result = validator.validate_instance(instance);
        CHECK_FALSE(result.is_valid);
        CHECK(has_finding(result, "rows"));
        CHECK(has_finding(result, "bitsAllocated"));
        CHECK(has_finding(result, "bitsStored"));
    }

    SECTION("image attributes are optional") {
        instance.rows.reset();
        instance.columns.reset();
        instance.bits_allocated.reset();
        instance.bits_stored.reset();
        CHECK(validator.validate_instance(instance).is_valid);
    }
}

TEST_CASE("dicom_validator validate_metadata of a decoded buffer", "[validator][metadata]") {
    dicom_validator validator;
    const auto bytes = test::image_buffer();
    auto walk = core::collect_elements(bytes);
    REQUIRE(walk.is_ok());
    const auto metadata = core::metadata_assembler::assemble(walk.value().elements);

    const auto result = validator.validate_metadata(metadata);
    CHECK(result.is_valid);
    CHECK(to_void_result(result).is_ok());

    SECTION("missing identifiers fail with validation_failure") {
        auto broken = metadata;
        broken.study.instance_uid = "1..2";
        const auto failed = validator.validate_metadata(broken);
        CHECK_FALSE(failed.is_valid);

        auto as_error = to_void_result(failed);
        REQUIRE(as_error.is_err());
        CHECK(as_error.error().code == error_codes::validation_failure);
    }

    SECTION("shared fields are reported once") {
        auto broken = metadata;
        broken.series.modality = "XX";
        const auto failed = validator.validate_metadata(broken);
        CHECK(std::count_if(failed.findings.begin(), failed.findings.end(),
                            [](const auto& f) { return f.field == "modality"; }) == 1);
    }
}

TEST_CASE("dicom_validator orders and reports", "[validator][workflow]") {
    dicom_validator validator;

    imaging_order order;
    order.patient_id = "PAT001";
    order.modality = "MR";
    order.priority = "stat";
    order.specialty = "neurology";
    order.procedure_description = "MRI BRAIN";
    CHECK(validator.validate_order(order).is_valid);

    order.priority = "asap";
    order.study_instance_uid = "not-a-uid";
    const auto bad_order = validator.validate_order(order);
    CHECK(bad_order.error_count() == 2);

    radiology_report report;
    report.study_instance_uid = "1.2.3";
    report.findings = "No acute findings";
    report.impression = "Normal";
    report.status = "final";
    CHECK(validator.validate_report(report).is_valid);

    report.status = "draft";
    report.impression = " ";
    CHECK(validator.validate_report(report).error_count() == 2);
}

TEST_CASE("dicom_validator search parameters", "[validator][search]") {
    dicom_validator validator;

    SECTION("valid filters are sanitized") {
        search_parameters params;
        params.patient_id = " PAT001 ";
        params.modalities = std::vector<std::string>{"ct", "MR"};
        params.study_date = date_range{"2024-01-01", "20240131"};
        params.limit = 50;

        const auto result = validator.validate_search_parameters(params);
        CHECK(result.is_valid);
        CHECK(result.sanitized.patient_id == "PAT001");
        REQUIRE(result.sanitized.modalities.has_value());
        CHECK(*result.sanitized.modalities == std::vector<std::string>{"CT", "MR"});
        CHECK(result.sanitized.limit == 50);
    }

    SECTION("invalid filters are dropped and reported") {
        search_parameters params;
        params.modalities = std::vector<std::string>{"CT", "ZZ"};
        params.limit = 5000;
        params.offset = -1;
        params.study_date = date_range{"20240201", "20240101"};

        const auto result = validator.validate_search_parameters(params);
        CHECK_FALSE(result.is_valid);
        CHECK(result.sanitized.modalities == std::vector<std::string>{"CT"});
        CHECK_FALSE(result.sanitized.limit.has_value());
        CHECK_FALSE(result.sanitized.offset.has_value());
        CHECK_FALSE(result.sanitized.study_date.has_value());
        CHECK(result.findings.front().code == "SEARCH-001");
    }
}
