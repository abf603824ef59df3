/**
 * @file dicom_validator.hpp
 * @brief Field and record validation for decoded DICOM metadata
 *
 * Field checks are free functions returning bool. Record checks live on
 * dicom_validator and return a validation_result listing every violation;
 * content that fails validation is an expected outcome and is reported as
 * data, never thrown.
 *
 * @see DICOM PS3.5 Section 9 - Unique Identifiers (UIDs)
 * @see DICOM PS3.5 Section 6.2 - Value Representation (DA, TM)
 */

#ifndef MEDIMG_SERVICES_VALIDATION_DICOM_VALIDATOR_HPP
#define MEDIMG_SERVICES_VALIDATION_DICOM_VALIDATOR_HPP

#include "medimg/core/dicom_metadata.hpp"
#include "medimg/core/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace medimg::services::validation {

// =============================================================================
// Validation Result Types
// =============================================================================

/**
 * @brief Severity level of validation findings
 */
enum class validation_severity {
    error,      ///< Record is not acceptable
    warning,    ///< Record is acceptable but incomplete
    info        ///< Informational
};

/**
 * @brief Single validation finding
 */
struct validation_finding {
    validation_severity severity;
    std::string field;      ///< Offending field, e.g. "studyInstanceUID"
    std::string message;    ///< Human-readable description
    std::string code;       ///< Machine-readable code, e.g. "STUDY-001"
};

/**
 * @brief Result of record validation
 */
struct validation_result {
    bool is_valid{true};
    std::vector<validation_finding> findings;

    /**
     * @brief Messages of all error-severity findings
     */
    [[nodiscard]] auto errors() const -> std::vector<std::string>;

    [[nodiscard]] bool has_errors() const noexcept;
    [[nodiscard]] bool has_warnings() const noexcept;
    [[nodiscard]] size_t error_count() const noexcept;
    [[nodiscard]] size_t warning_count() const noexcept;

    /**
     * @brief Get a formatted summary string
     */
    [[nodiscard]] std::string summary() const;
};

/**
 * @brief Convert a failed validation into a validation_failure error
 */
[[nodiscard]] auto to_void_result(const validation_result& result) -> VoidResult;

// =============================================================================
// Records validated outside the decode path
// =============================================================================

struct imaging_order {
    std::string patient_id;
    std::string modality;
    std::string priority;               ///< routine, urgent or stat
    std::string specialty;
    std::string procedure_description;
    std::string study_instance_uid;     ///< Optional; checked when set
};

struct radiology_report {
    std::string study_instance_uid;
    std::string patient_id;             ///< Optional; checked when set
    std::string findings;
    std::string impression;
    std::string status;                 ///< preliminary, final or amended
};

struct date_range {
    std::optional<std::string> from;    ///< YYYYMMDD or YYYY-MM-DD
    std::optional<std::string> to;
};

/**
 * @brief Study search filters; unset members are not filtered on
 */
struct search_parameters {
    std::optional<std::string> patient_id;
    std::optional<std::string> patient_name;
    std::optional<std::vector<std::string>> modalities;
    std::optional<std::vector<std::string>> specialties;
    std::optional<date_range> study_date;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    std::optional<std::string> accession_number;
    std::optional<std::string> study_description;

    auto operator==(const search_parameters&) const -> bool = default;
};

/**
 * @brief Validation findings plus the filters that survived sanitizing
 */
struct search_validation_result : validation_result {
    search_parameters sanitized;
};

// =============================================================================
// Field checks
// =============================================================================

/**
 * @brief UID grammar: digits in dot-separated components, 1-64 chars
 *
 * Rejects empty components (leading, trailing or consecutive dots).
 */
[[nodiscard]] auto validate_uid(std::string_view uid) noexcept -> bool;

[[nodiscard]] auto validate_study_instance_uid(std::string_view uid) noexcept -> bool;
[[nodiscard]] auto validate_series_instance_uid(std::string_view uid) noexcept -> bool;
[[nodiscard]] auto validate_sop_instance_uid(std::string_view uid) noexcept -> bool;

/**
 * @brief 1-64 of [A-Za-z0-9_-] after trimming surrounding whitespace
 */
[[nodiscard]] auto validate_patient_id(std::string_view patient_id) noexcept -> bool;

/**
 * @brief Upper-case form of a known modality code, matched case-insensitively
 */
[[nodiscard]] auto canonical_modality(std::string_view modality) -> std::optional<std::string>;

[[nodiscard]] auto validate_modality(std::string_view modality) -> bool;

/**
 * @brief All modality codes accepted by validate_modality()
 */
[[nodiscard]] auto known_modalities() noexcept -> std::span<const std::string_view>;

/**
 * @brief YYYYMMDD or YYYY-MM-DD, year 1900-2100, real calendar date
 */
[[nodiscard]] auto validate_dicom_date(std::string_view date) noexcept -> bool;

/**
 * @brief HHMMSS[.F{1,6}] or HH:MM:SS[.F{1,6}] with H<=23, M,S<=59
 */
[[nodiscard]] auto validate_dicom_time(std::string_view time) noexcept -> bool;

[[nodiscard]] auto validate_medical_specialty(std::string_view specialty) noexcept -> bool;

[[nodiscard]] auto known_specialties() noexcept -> std::span<const std::string_view>;

/**
 * @brief Normalize a patient name for storage and logging
 *
 * Keeps word characters, whitespace and '^', collapses whitespace runs to
 * one space, trims and upper-cases. Never apply to values compared against
 * externally supplied identifiers.
 */
[[nodiscard]] auto sanitize_patient_name(std::string_view name) -> std::string;

// =============================================================================
// Validation Options
// =============================================================================

struct validation_options {
    /// Report a missing study specialty as an error
    bool require_specialty = false;

    /// Require the study time when validating studies
    bool require_study_time = false;

    /// Strict mode - treat warnings as errors
    bool strict_mode = false;
};

// =============================================================================
// Record validator
// =============================================================================

/**
 * @brief Validator for study, series, instance, order and report records
 *
 * @example
 * @code
 * dicom_validator validator;
 * auto result = validator.validate_metadata(metadata);
 * if (!result.is_valid) {
 *     for (const auto& message : result.errors()) {
 *         std::cerr << message << "\n";
 *     }
 * }
 * @endcode
 */
class dicom_validator {
public:
    dicom_validator() = default;

    explicit dicom_validator(const validation_options& options);

    [[nodiscard]] validation_result validate_study(const core::study_record& study) const;

    [[nodiscard]] validation_result validate_series(const core::series_record& series) const;

    [[nodiscard]] validation_result
    validate_instance(const core::instance_record& instance) const;

    /**
     * @brief Aggregate study, series and instance checks of one record
     *
     * The series that holds a decoded instance is populated, so a supplied
     * series instance count must be at least 1.
     */
    [[nodiscard]] validation_result
    validate_metadata(const core::dicom_metadata& metadata) const;

    [[nodiscard]] validation_result validate_order(const imaging_order& order) const;

    [[nodiscard]] validation_result validate_report(const radiology_report& report) const;

    [[nodiscard]] search_validation_result
    validate_search_parameters(const search_parameters& params) const;

    [[nodiscard]] const validation_options& options() const noexcept;

    void set_options(const validation_options& options);

private:
    void finalize(validation_result& result) const;

    validation_options options_;
};

}  // namespace medimg::services::validation

#endif  // MEDIMG_SERVICES_VALIDATION_DICOM_VALIDATOR_HPP
