/**
 * @file time.hpp
 * @brief Portable wall-clock helpers used for audit records and cache entries
 *
 * Wraps the POSIX/Windows split between gmtime_r and gmtime_s, and provides
 * the millisecond epoch conversions that cache backends persist.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace medimg::compat {

/**
 * @brief Thread-safe UTC conversion
 * @return result on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Milliseconds since the Unix epoch
 */
[[nodiscard]] inline auto to_unix_millis(
    std::chrono::system_clock::time_point tp) noexcept -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

/**
 * @brief Inverse of to_unix_millis()
 */
[[nodiscard]] inline auto from_unix_millis(std::int64_t millis) noexcept
    -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{millis})};
}

/**
 * @brief Format a time point as "YYYY-MM-DDTHH:MM:SS.mmmZ"
 */
[[nodiscard]] inline auto format_iso8601_utc(
    std::chrono::system_clock::time_point tp) -> std::string {
    const auto time_val = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        tp.time_since_epoch()) %
                    1000;

    std::tm tm_val{};
    if (gmtime_safe(&time_val, &tm_val) == nullptr) {
        return {};
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace medimg::compat
