/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the medimg codec and cache
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for medimg, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace medimg {

/**
 * @brief Result type alias for medimg operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief medimg-specific error codes
 *
 * Error code range: -900 to -999
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int medimg_base = -900;

    // Container errors (-900 to -919)
    constexpr int malformed_container = medimg_base - 0;
    constexpr int file_not_found = medimg_base - 1;
    constexpr int file_read_error = medimg_base - 2;
    constexpr int file_write_error = medimg_base - 3;

    // Element errors (-920 to -939)
    constexpr int truncated_element = medimg_base - 20;
    constexpr int invalid_numeric_width = medimg_base - 21;
    constexpr int unknown_vr = medimg_base - 22;
    constexpr int invalid_date = medimg_base - 23;
    constexpr int invalid_time = medimg_base - 24;
    constexpr int missing_pixel_data = medimg_base - 25;

    // Validation errors (-940 to -949)
    constexpr int validation_failure = medimg_base - 40;

    // Cache errors (-950 to -969)
    constexpr int not_found = medimg_base - 50;
    constexpr int cache_backend_error = medimg_base - 51;
    constexpr int serialization_error = medimg_base - 52;
    constexpr int invalid_configuration = medimg_base - 53;

    // Prefetch errors (-970 to -979)
    constexpr int prefetch_disabled = medimg_base - 70;
    constexpr int fetch_failed = medimg_base - 71;
} // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a medimg error result with module context
 * @tparam T The result value type
 * @param code Error code from medimg::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> medimg_error(int code, const std::string& message,
                              const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "medimg");
    }
    return kcenon::common::make_error<T>(code, message, "medimg", details);
}

/**
 * @brief Create a medimg void error result
 * @param code Error code from medimg::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult medimg_void_error(int code, const std::string& message,
                                    const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "medimg"});
    }
    return VoidResult(error_info{code, message, "medimg", details});
}

} // namespace medimg

/**
 * @brief Return early if expression is an error
 */
#define MEDIMG_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error
 */
#define MEDIMG_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)
