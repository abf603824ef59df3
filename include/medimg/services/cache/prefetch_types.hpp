/**
 * @file prefetch_types.hpp
 * @brief Rules, candidates and results for speculative cache population
 *
 * A prefetch rule is a structured predicate over study metadata. Rules are
 * stateless values; prefetch_engine owns their evaluation order.
 */

#pragma once

#include "medimg/core/dicom_metadata.hpp"
#include "medimg/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace medimg::services::cache {

// =============================================================================
// Prefetch Rule
// =============================================================================

/// Predicate deciding whether a study matches a rule
using prefetch_condition = std::function<bool(const core::dicom_metadata&)>;

/**
 * @brief Rule describing which studies to load ahead of demand
 */
struct prefetch_rule {
    std::string name;
    prefetch_condition condition;
    int priority{0};                       ///< Higher runs first
    std::size_t max_images{50};            ///< Fetches scheduled per run of this rule
    bool enabled{true};
    std::optional<std::string> specialty;  ///< Restricts the rule to candidates of this specialty
};

// =============================================================================
// Condition factories
// =============================================================================

/**
 * @brief Matches studies whose series modality equals the code
 *        (case-insensitive)
 */
[[nodiscard]] auto modality_is(std::string modality) -> prefetch_condition;

[[nodiscard]] auto modality_in(std::vector<std::string> modalities) -> prefetch_condition;

/**
 * @brief Matches studies dated no more than days before reference
 *
 * Studies without a parseable YYYY-MM-DD study date never match. A study
 * dated after reference matches.
 */
[[nodiscard]] auto study_within(
    std::chrono::days days,
    std::chrono::system_clock::time_point reference = std::chrono::system_clock::now())
    -> prefetch_condition;

/// True when every condition matches; true for an empty list
[[nodiscard]] auto all_of(std::vector<prefetch_condition> conditions) -> prefetch_condition;

/// True when any condition matches; false for an empty list
[[nodiscard]] auto any_of(std::vector<prefetch_condition> conditions) -> prefetch_condition;

/**
 * @brief Built-in rule set
 *
 * - recent_studies: studies from the last 7 days, priority 1, 50 images
 * - urgent_radiology: CT, MR or CR studies from the last day, priority 2,
 *   20 images
 */
[[nodiscard]] auto default_rules() -> std::vector<prefetch_rule>;

// =============================================================================
// Working set
// =============================================================================

/**
 * @brief A known study and the image files that belong to it
 */
struct prefetch_candidate {
    core::dicom_metadata study;
    std::vector<std::filesystem::path> images;
    std::optional<std::string> specialty;
};

/// Source of image file contents; defaults to dicom_handler::read_dicom_file
using image_loader =
    std::function<Result<std::vector<uint8_t>>(const std::filesystem::path&)>;

/**
 * @brief Configuration for prefetch_engine
 */
struct prefetch_engine_config {
    /// Upper bound on fetches in flight at once
    std::size_t max_concurrent_fetches{4};

    /// Also store the metadata of every matched study
    bool cache_study_metadata{true};
};

// =============================================================================
// Results
// =============================================================================

/**
 * @brief Outcome of one rule within a run
 */
struct rule_report {
    std::string rule_name;
    std::size_t studies_matched{0};
    std::size_t images_scheduled{0};
    std::size_t images_cached{0};
    std::size_t failures{0};
};

/**
 * @brief Outcome of prefetch_engine::execute()
 */
struct prefetch_result {
    std::vector<rule_report> rules;   ///< Executed rules, in execution order
    std::size_t rules_skipped{0};     ///< Disabled rules
    std::size_t studies_cached{0};
    std::size_t images_cached{0};
    std::size_t failures{0};
    std::chrono::milliseconds elapsed{0};
};

}  // namespace medimg::services::cache
