/**
 * @file dicom_validator.cpp
 * @brief Implementation of field and record validation
 */

#include "medimg/services/validation/dicom_validator.hpp"
#include "medimg/compat/format.hpp"
#include "medimg/encoding/vr_decoder.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace medimg::services::validation {

using namespace medimg::core;

namespace {

constexpr std::size_t kMaxUidLength = 64;
constexpr std::size_t kMaxPatientIdLength = 64;
constexpr int kMinYear = 1900;
constexpr int kMaxYear = 2100;
constexpr int64_t kMaxSearchLimit = 1000;

constexpr std::array<std::string_view, 46> kModalities = {
    "AU",  "BI",   "CD",      "CR",       "CT",      "DD",     "DG",       "DX",
    "ECG", "EPS",  "ES",      "GM",       "HC",      "HD",     "IO",       "IVUS",
    "KO",  "LS",   "MG",      "MR",       "NM",      "OP",     "OT",       "PR",
    "PT",  "PX",   "REG",     "RESP",     "RF",      "RG",     "RTDOSE",   "RTIMAGE",
    "RTPLAN", "RTRECORD", "RTSTRUCT", "SEG", "SM", "SMR", "SR", "ST",
    "TG",  "US",   "XA",      "XC",       "DOC",     "OPT",
};

constexpr std::array<std::string_view, 10> kSpecialties = {
    "radiology",   "cardiology",       "orthopedics", "neurology", "oncology",
    "pulmonology", "gastroenterology", "pediatrics",  "emergency", "primary-care",
};

constexpr std::array<std::string_view, 3> kOrderPriorities = {"routine", "urgent", "stat"};

constexpr std::array<std::string_view, 3> kReportStatuses = {"preliminary", "final",
                                                             "amended"};

template <std::size_t N>
auto contains(const std::array<std::string_view, N>& set, std::string_view value) noexcept
    -> bool {
    return std::find(set.begin(), set.end(), value) != set.end();
}

auto is_space(char c) noexcept -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto is_digit(char c) noexcept -> bool {
    return c >= '0' && c <= '9';
}

auto trim(std::string_view str) noexcept -> std::string_view {
    while (!str.empty() && is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

auto is_blank(std::string_view str) noexcept -> bool {
    return trim(str).empty();
}

auto all_digits(std::string_view str) noexcept -> bool {
    return !str.empty() && std::all_of(str.begin(), str.end(), is_digit);
}

auto two_digits(std::string_view str, std::size_t pos) noexcept -> int {
    return (str[pos] - '0') * 10 + (str[pos + 1] - '0');
}

auto fraction_ok(std::string_view rest) noexcept -> bool {
    if (rest.empty()) {
        return true;
    }
    return rest.front() == '.' && rest.size() >= 2 && rest.size() <= 7 &&
           all_digits(rest.substr(1));
}

/// YYYY-MM-DD -> YYYYMMDD, anything else unchanged
auto compact_date(std::string_view date) -> std::string {
    std::string out;
    out.reserve(date.size());
    for (char c : date) {
        if (c != '-') {
            out.push_back(c);
        }
    }
    return out;
}

class finding_sink {
public:
    finding_sink(validation_result& result, std::string_view prefix)
        : result_(result), prefix_(prefix) {}

    void error(std::string_view field, std::string message) {
        add(validation_severity::error, field, std::move(message));
    }

    void warning(std::string_view field, std::string message) {
        add(validation_severity::warning, field, std::move(message));
    }

private:
    void add(validation_severity severity, std::string_view field, std::string message) {
        result_.findings.push_back(validation_finding{
            severity, std::string{field}, std::move(message),
            compat::format("{}-{:03}", prefix_, ++counter_)});
    }

    validation_result& result_;
    std::string_view prefix_;
    int counter_{0};
};

void append(validation_result& into, const validation_result& from) {
    into.findings.insert(into.findings.end(), from.findings.begin(), from.findings.end());
}

}  // namespace

// =============================================================================
// validation_result Implementation
// =============================================================================

auto validation_result::errors() const -> std::vector<std::string> {
    std::vector<std::string> messages;
    for (const auto& f : findings) {
        if (f.severity == validation_severity::error) {
            messages.push_back(f.message);
        }
    }
    return messages;
}

bool validation_result::has_errors() const noexcept {
    return error_count() > 0;
}

bool validation_result::has_warnings() const noexcept {
    return warning_count() > 0;
}

size_t validation_result::error_count() const noexcept {
    return static_cast<size_t>(std::count_if(findings.begin(), findings.end(), [](const auto& f) {
        return f.severity == validation_severity::error;
    }));
}

size_t validation_result::warning_count() const noexcept {
    return static_cast<size_t>(std::count_if(findings.begin(), findings.end(), [](const auto& f) {
        return f.severity == validation_severity::warning;
    }));
}

std::string validation_result::summary() const {
    std::ostringstream oss;
    oss << "Validation " << (is_valid ? "PASSED" : "FAILED");
    oss << " - " << error_count() << " error(s), " << warning_count() << " warning(s)";
    return oss.str();
}

auto to_void_result(const validation_result& result) -> VoidResult {
    if (result.is_valid) {
        return ok();
    }
    std::string details;
    for (const auto& message : result.errors()) {
        if (!details.empty()) {
            details += "; ";
        }
        details += message;
    }
    return medimg_void_error(error_codes::validation_failure, result.summary(), details);
}

// =============================================================================
// Field checks
// =============================================================================

auto validate_uid(std::string_view uid) noexcept -> bool {
    if (uid.empty() || uid.size() > kMaxUidLength) {
        return false;
    }
    bool component_has_digit = false;
    for (char c : uid) {
        if (c == '.') {
            if (!component_has_digit) {
                return false;
            }
            component_has_digit = false;
        } else if (is_digit(c)) {
            component_has_digit = true;
        } else {
            return false;
        }
    }
    return component_has_digit;
}

auto validate_study_instance_uid(std::string_view uid) noexcept -> bool {
    return validate_uid(uid);
}

auto validate_series_instance_uid(std::string_view uid) noexcept -> bool {
    return validate_uid(uid);
}

auto validate_sop_instance_uid(std::string_view uid) noexcept -> bool {
    return validate_uid(uid);
}

auto validate_patient_id(std::string_view patient_id) noexcept -> bool {
    const auto id = trim(patient_id);
    if (id.empty() || id.size() > kMaxPatientIdLength) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
    });
}

auto canonical_modality(std::string_view modality) -> std::optional<std::string> {
    std::string upper{trim(modality)};
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (!contains(kModalities, upper)) {
        return std::nullopt;
    }
    return upper;
}

auto validate_modality(std::string_view modality) -> bool {
    return canonical_modality(modality).has_value();
}

auto known_modalities() noexcept -> std::span<const std::string_view> {
    return kModalities;
}

auto validate_dicom_date(std::string_view date) noexcept -> bool {
    int year = 0;
    int month = 0;
    int day = 0;
    if (date.size() == 8 && all_digits(date)) {
        year = two_digits(date, 0) * 100 + two_digits(date, 2);
        month = two_digits(date, 4);
        day = two_digits(date, 6);
    } else if (date.size() == 10 && date[4] == '-' && date[7] == '-' &&
               all_digits(date.substr(0, 4)) && all_digits(date.substr(5, 2)) &&
               all_digits(date.substr(8, 2))) {
        year = two_digits(date, 0) * 100 + two_digits(date, 2);
        month = two_digits(date, 5);
        day = two_digits(date, 8);
    } else {
        return false;
    }
    if (year < kMinYear || year > kMaxYear) {
        return false;
    }
    return encoding::is_calendar_date(year, month, day);
}

auto validate_dicom_time(std::string_view time) noexcept -> bool {
    int hours = 0;
    int minutes = 0;
    int seconds = 0;
    std::string_view rest;
    if (time.size() >= 8 && time[2] == ':' && time[5] == ':') {
        if (!all_digits(time.substr(0, 2)) || !all_digits(time.substr(3, 2)) ||
            !all_digits(time.substr(6, 2))) {
            return false;
        }
        hours = two_digits(time, 0);
        minutes = two_digits(time, 3);
        seconds = two_digits(time, 6);
        rest = time.substr(8);
    } else if (time.size() >= 6 && all_digits(time.substr(0, 6))) {
        hours = two_digits(time, 0);
        minutes = two_digits(time, 2);
        seconds = two_digits(time, 4);
        rest = time.substr(6);
    } else {
        return false;
    }
    return fraction_ok(rest) && hours <= 23 && minutes <= 59 && seconds <= 59;
}

auto validate_medical_specialty(std::string_view specialty) noexcept -> bool {
    return contains(kSpecialties, specialty);
}

auto known_specialties() noexcept -> std::span<const std::string_view> {
    return kSpecialties;
}

auto sanitize_patient_name(std::string_view name) -> std::string {
    std::string out;
    out.reserve(name.size());
    bool pending_space = false;
    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (uc >= 0x80 || (std::isalnum(uc) == 0 && c != '_' && c != '^')) {
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::toupper(uc)));
    }
    return out;
}

// =============================================================================
// dicom_validator Implementation
// =============================================================================

dicom_validator::dicom_validator(const validation_options& options) : options_(options) {}

const validation_options& dicom_validator::options() const noexcept {
    return options_;
}

void dicom_validator::set_options(const validation_options& options) {
    options_ = options;
}

void dicom_validator::finalize(validation_result& result) const {
    result.is_valid = true;
    for (const auto& finding : result.findings) {
        if (finding.severity == validation_severity::error ||
            (options_.strict_mode && finding.severity == validation_severity::warning)) {
            result.is_valid = false;
            break;
        }
    }
}

validation_result dicom_validator::validate_study(const study_record& study) const {
    validation_result result;
    finding_sink sink{result, "STUDY"};

    if (!validate_study_instance_uid(study.study_instance_uid)) {
        sink.error("studyInstanceUID", "Invalid or missing Study Instance UID");
    }
    if (!validate_patient_id(study.patient_id)) {
        sink.error("patientId", "Invalid or missing Patient ID");
    }
    if (is_blank(study.patient_name)) {
        sink.error("patientName", "Patient name is required");
    }
    if (is_blank(study.study_description)) {
        sink.error("studyDescription", "Study description is required");
    }
    if (!validate_dicom_date(study.study_date)) {
        sink.error("studyDate", "Invalid or missing study date");
    }
    if (study.study_time.empty()) {
        if (options_.require_study_time) {
            sink.error("studyTime", "Study time is required");
        }
    } else if (!validate_dicom_time(study.study_time)) {
        sink.error("studyTime", "Invalid study time format");
    }
    if (!validate_modality(study.modality)) {
        sink.error("modality", "Invalid or missing modality");
    }
    if (study.specialty) {
        if (!validate_medical_specialty(*study.specialty)) {
            sink.error("specialty", compat::format("Unknown medical specialty '{}'",
                                                   *study.specialty));
        }
    } else if (options_.require_specialty) {
        sink.error("specialty", "Medical specialty is required");
    }
    if (study.series_count < 0) {
        sink.error("numberOfStudyRelatedSeries", "Series count must be a non-negative number");
    }
    if (study.instance_count < 0) {
        sink.error("numberOfStudyRelatedInstances",
                   "Instance count must be a non-negative number");
    }
    if (is_blank(study.accession_number)) {
        sink.warning("accessionNumber", "Accession number is empty");
    }

    finalize(result);
    return result;
}

validation_result dicom_validator::validate_series(const series_record& series) const {
    validation_result result;
    finding_sink sink{result, "SERIES"};

    if (!validate_series_instance_uid(series.series_instance_uid)) {
        sink.error("seriesInstanceUID", "Invalid or missing Series Instance UID");
    }
    if (!validate_study_instance_uid(series.study_instance_uid)) {
        sink.error("studyInstanceUID", "Invalid or missing Study Instance UID");
    }
    if (!validate_modality(series.modality)) {
        sink.error("modality", "Invalid or missing modality");
    }
    if (series.series_number && *series.series_number < 1) {
        sink.error("seriesNumber", "Series number must be at least 1");
    }
    if (series.instance_count < 0) {
        sink.error("numberOfSeriesRelatedInstances",
                   "Instance count must be a non-negative number");
    }

    finalize(result);
    return result;
}

validation_result dicom_validator::validate_instance(const instance_record& instance) const {
    validation_result result;
    finding_sink sink{result, "INSTANCE"};

    if (!validate_sop_instance_uid(instance.sop_instance_uid)) {
        sink.error("sopInstanceUID", "Invalid or missing SOP Instance UID");
    }
    if (!validate_series_instance_uid(instance.series_instance_uid)) {
        sink.error("seriesInstanceUID", "Invalid or missing Series Instance UID");
    }
    if (is_blank(instance.sop_class_uid)) {
        sink.error("sopClassUID", "SOP Class UID is required");
    }
    if (instance.instance_number < 1) {
        sink.error("instanceNumber", "Instance number must be at least 1");
    }
    if (instance.rows && *instance.rows <= 0) {
        sink.error("rows", "Rows must be a positive number");
    }
    if (instance.columns && *instance.columns <= 0) {
        sink.error("columns", "Columns must be a positive number");
    }
    if (instance.bits_allocated) {
        const auto bits = *instance.bits_allocated;
        if (bits != 8 && bits != 16 && bits != 32) {
            sink.error("bitsAllocated", "Bits allocated must be 8, 16, or 32");
        }
    }
    if (instance.bits_stored && instance.bits_allocated &&
        *instance.bits_stored > *instance.bits_allocated) {
        sink.error("bitsStored", "Bits stored cannot exceed bits allocated");
    }

    finalize(result);
    return result;
}

validation_result dicom_validator::validate_metadata(const dicom_metadata& metadata) const {
    validation_result result;
    append(result, validate_study(to_study_record(metadata)));
    append(result, validate_series(to_series_record(metadata)));
    append(result, validate_instance(to_instance_record(metadata)));

    // Study and series share some fields; keep the first report of each.
    std::vector<validation_finding> unique;
    for (auto& finding : result.findings) {
        const bool seen = std::any_of(unique.begin(), unique.end(), [&](const auto& f) {
            return f.field == finding.field && f.message == finding.message;
        });
        if (!seen) {
            unique.push_back(std::move(finding));
        }
    }
    result.findings = std::move(unique);

    if (metadata.has(metadata_field::number_of_series_related_instances) &&
        metadata.series.number_of_instances < 1) {
        result.findings.push_back(validation_finding{
            validation_severity::error, "numberOfSeriesRelatedInstances",
            "A populated series must hold at least one instance", "SERIES-100"});
    }

    finalize(result);
    return result;
}

validation_result dicom_validator::validate_order(const imaging_order& order) const {
    validation_result result;
    finding_sink sink{result, "ORDER"};

    if (!validate_patient_id(order.patient_id)) {
        sink.error("patientId", "Invalid or missing Patient ID");
    }
    if (!validate_modality(order.modality)) {
        sink.error("modality", "Invalid or missing modality");
    }
    if (!contains(kOrderPriorities, order.priority)) {
        sink.error("priority", compat::format("Priority must be routine, urgent, or stat, got '{}'",
                                              order.priority));
    }
    if (!validate_medical_specialty(order.specialty)) {
        sink.error("specialty", "Invalid or missing medical specialty");
    }
    if (is_blank(order.procedure_description)) {
        sink.error("procedureDescription", "Procedure description is required");
    }
    if (!order.study_instance_uid.empty() &&
        !validate_study_instance_uid(order.study_instance_uid)) {
        sink.error("studyInstanceUID", "Invalid Study Instance UID");
    }

    finalize(result);
    return result;
}

validation_result dicom_validator::validate_report(const radiology_report& report) const {
    validation_result result;
    finding_sink sink{result, "REPORT"};

    if (!validate_study_instance_uid(report.study_instance_uid)) {
        sink.error("studyInstanceUID", "Invalid or missing Study Instance UID");
    }
    if (!report.patient_id.empty() && !validate_patient_id(report.patient_id)) {
        sink.error("patientId", "Invalid Patient ID");
    }
    if (is_blank(report.findings)) {
        sink.error("findings", "Findings are required");
    }
    if (is_blank(report.impression)) {
        sink.error("impression", "Impression is required");
    }
    if (!contains(kReportStatuses, report.status)) {
        sink.error("status", compat::format(
                                 "Status must be preliminary, final, or amended, got '{}'",
                                 report.status));
    }

    finalize(result);
    return result;
}

search_validation_result
dicom_validator::validate_search_parameters(const search_parameters& params) const {
    search_validation_result result;
    finding_sink sink{result, "SEARCH"};
    auto& out = result.sanitized;

    if (params.patient_id) {
        if (validate_patient_id(*params.patient_id)) {
            out.patient_id = std::string{trim(*params.patient_id)};
        } else {
            sink.error("patientId", "Invalid Patient ID format");
        }
    }

    if (params.patient_name) {
        const auto name = trim(*params.patient_name);
        if (!name.empty()) {
            out.patient_name = std::string{name};
        } else {
            sink.error("patientName", "Patient name must be a non-empty string");
        }
    }

    if (params.study_date) {
        date_range range;
        if (params.study_date->from) {
            if (validate_dicom_date(*params.study_date->from)) {
                range.from = params.study_date->from;
            } else {
                sink.error("studyDate", "Invalid from date format");
            }
        }
        if (params.study_date->to) {
            if (validate_dicom_date(*params.study_date->to)) {
                range.to = params.study_date->to;
            } else {
                sink.error("studyDate", "Invalid to date format");
            }
        }
        if (range.from && range.to && compact_date(*range.from) > compact_date(*range.to)) {
            sink.error("studyDate", "From date must not be after to date");
        } else if (range.from || range.to) {
            out.study_date = std::move(range);
        }
    }

    if (params.modalities) {
        std::vector<std::string> valid;
        for (const auto& modality : *params.modalities) {
            if (auto canonical = canonical_modality(modality)) {
                valid.push_back(std::move(*canonical));
            }
        }
        if (valid.size() != params.modalities->size()) {
            sink.error("modality", "Some modalities are invalid");
        }
        if (!valid.empty()) {
            out.modalities = std::move(valid);
        }
    }

    if (params.specialties) {
        std::vector<std::string> valid;
        for (const auto& specialty : *params.specialties) {
            if (validate_medical_specialty(specialty)) {
                valid.push_back(specialty);
            }
        }
        if (valid.size() != params.specialties->size()) {
            sink.error("specialty", "Some specialties are invalid");
        }
        if (!valid.empty()) {
            out.specialties = std::move(valid);
        }
    }

    if (params.limit) {
        if (*params.limit < 1 || *params.limit > kMaxSearchLimit) {
            sink.error("limit", "Limit must be a number between 1 and 1000");
        } else {
            out.limit = params.limit;
        }
    }

    if (params.offset) {
        if (*params.offset < 0) {
            sink.error("offset", "Offset must be a non-negative number");
        } else {
            out.offset = params.offset;
        }
    }

    if (params.accession_number) {
        const auto accession = trim(*params.accession_number);
        if (!accession.empty()) {
            out.accession_number = std::string{accession};
        } else {
            sink.error("accessionNumber", "Accession number must be a non-empty string");
        }
    }

    if (params.study_description) {
        const auto description = trim(*params.study_description);
        if (!description.empty()) {
            out.study_description = std::string{description};
        } else {
            sink.error("studyDescription", "Study description must be a non-empty string");
        }
    }

    finalize(result);
    return result;
}

}  // namespace medimg::services::validation
