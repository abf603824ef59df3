/**
 * @file logger_adapter.hpp
 * @brief Application and audit logging on top of logger_system
 *
 * A process-wide facade: initialize() once, log anywhere. Besides leveled
 * messages it writes a JSON-lines audit trail (audit.json) recording every
 * decode, cache mutation and prefetch run. Patient names never reach the
 * logs unsanitized.
 *
 * @see kcenon/logger/core/logger.h
 */

#pragma once

#include <medimg/compat/format.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace medimg::integration {

// ─────────────────────────────────────────────────────
// Levels and outcomes
// ─────────────────────────────────────────────────────

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse "trace".."off" (case-insensitive; "warning" is accepted)
 */
[[nodiscard]] auto parse_log_level(std::string_view text) -> std::optional<log_level>;

[[nodiscard]] auto to_string(log_level level) -> std::string_view;

/**
 * @enum decode_outcome
 * @brief Result of decoding one buffer, as recorded in the audit trail
 */
enum class decode_outcome {
    success,
    malformed_container,
    file_not_found,
    read_failure,
    missing_pixel_data
};

/**
 * @enum invalidation_reason
 * @brief Why a cache entry left the cache
 */
enum class invalidation_reason {
    explicit_remove,
    study_invalidated,
    expired,
    evicted,
    cleared
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for medimg.log and audit.json
    std::filesystem::path log_directory{"logs"};

    log_level min_level{log_level::info};

    bool enable_console{true};

    bool enable_file{true};

    /// Write the JSON-lines audit trail
    bool enable_audit_log{true};

    /// Rotate medimg.log after this many megabytes
    std::size_t max_file_size_mb{50};

    /// Rotated files kept
    std::size_t max_files{5};

    bool async_mode{true};

    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Process-wide logging facade
 *
 * Before initialize() and after shutdown() every call is a no-op, which
 * keeps library code usable from tests that never configure logging.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/medimg";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Cache opened with {} entries", count);
 * logger_adapter::log_cache_write("study:1.2.3", 512, std::chrono::seconds{3600}, true);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the writers
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(medimg::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, medimg::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(medimg::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, medimg::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(medimg::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, medimg::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(medimg::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, medimg::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(medimg::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, medimg::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(medimg::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, medimg::compat::format(fmt, std::forward<Args>(args)...));
    }

    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record the decode of one buffer or file (DICOM_DECODE)
     *
     * @param source File path or a caller-chosen buffer label
     * @param patient_name Raw patient name; sanitized before writing
     * @param study_uid Study Instance UID, empty when unknown
     * @param sop_instance_uid SOP Instance UID, empty when unknown
     * @param outcome Decode outcome
     */
    static void log_decode(const std::string& source,
                           const std::string& patient_name,
                           const std::string& study_uid,
                           const std::string& sop_instance_uid,
                           decode_outcome outcome);

    /**
     * @brief Record a cache write (CACHE_WRITE)
     */
    static void log_cache_write(const std::string& key,
                                std::size_t size_bytes,
                                std::chrono::seconds ttl,
                                bool stored);

    /**
     * @brief Record a cache entry leaving the cache (CACHE_INVALIDATE)
     */
    static void log_cache_invalidate(const std::string& key, invalidation_reason reason);

    /**
     * @brief Record one prefetch rule execution (PREFETCH)
     */
    static void log_prefetch_run(const std::string& rule_name,
                                 std::size_t matched_studies,
                                 std::size_t images_cached,
                                 std::size_t failures);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    [[nodiscard]] static auto decode_outcome_to_string(decode_outcome outcome) -> std::string;
    [[nodiscard]] static auto reason_to_string(invalidation_reason reason) -> std::string;

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace medimg::integration
