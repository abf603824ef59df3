/**
 * @file logger_adapter.cpp
 * @brief logger_system backed implementation of logger_adapter
 */

#include <medimg/integration/logger_adapter.hpp>
#include <medimg/compat/time.hpp>
#include <medimg/services/validation/dicom_validator.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>

namespace medimg::integration {

namespace {

auto to_kcenon_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warn;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::fatal;
        case log_level::off: return kcenon::logger::log_level::off;
    }
    return kcenon::logger::log_level::off;
}

auto escape_json(const std::string& str) -> std::string {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

}  // namespace

auto parse_log_level(std::string_view text) -> std::optional<log_level> {
    std::string lower{text};
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;
    if (lower == "fatal") return log_level::fatal;
    if (lower == "off") return log_level::off;
    return std::nullopt;
}

auto to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        case log_level::off: return "OFF";
    }
    return "OFF";
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
            if (ec) {
                // Fall back to console-only logging.
                config_.enable_file = false;
                config_.enable_audit_log = false;
            }
        }

        logger_ = std::make_unique<kcenon::logger::logger>(config_.async_mode,
                                                           config_.buffer_size);
        logger_->set_min_level(to_kcenon_level(config_.min_level));

        if (config_.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config_.enable_file) {
            const auto log_path = config_.log_directory / "medimg.log";
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(), config_.max_file_size_mb * 1024 * 1024,
                config_.max_files));
        }

        logger_->start();

        if (config_.enable_audit_log) {
            audit_log_path_ = config_.log_directory / "audit.json";
        }
        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            return;
        }
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool { return initialized_.load(); }

    void log(log_level level, const std::string& message) {
        std::lock_guard lock(mutex_);
        if (!initialized_ || !logger_ || !is_level_enabled(level)) {
            return;
        }
        logger_->log(to_kcenon_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return initialized_.load() && level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        std::lock_guard lock(mutex_);
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(to_kcenon_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level { return min_level_.load(); }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_log(const std::string& event_type,
                         const std::string& outcome,
                         const std::map<std::string, std::string>& fields) {
        if (!initialized_ || !config_.enable_audit_log) {
            return;
        }

        std::ostringstream json;
        json << "{\"timestamp\":\""
             << compat::format_iso8601_utc(std::chrono::system_clock::now()) << "\"";
        json << ",\"event_type\":\"" << escape_json(event_type) << "\"";
        json << ",\"outcome\":\"" << escape_json(outcome) << "\"";
        for (const auto& [key, value] : fields) {
            json << ",\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
        }
        json << "}\n";

        std::lock_guard lock(audit_mutex_);
        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            return;
        }
        file << json.str();
    }

private:
    mutable std::mutex mutex_;
    std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Lifecycle and standard logging
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() {
    pimpl_->shutdown();
}

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() {
    pimpl_->flush();
}

// =============================================================================
// Audit Trail
// =============================================================================

void logger_adapter::log_decode(const std::string& source,
                                const std::string& patient_name,
                                const std::string& study_uid,
                                const std::string& sop_instance_uid,
                                decode_outcome outcome) {
    const auto outcome_str = decode_outcome_to_string(outcome);
    const auto name = services::validation::sanitize_patient_name(patient_name);

    if (outcome == decode_outcome::success) {
        debug("Decoded {}: study={} instance={}", source, study_uid, sop_instance_uid);
    } else {
        warn("Decode of {} failed: {}", source, outcome_str);
    }

    std::map<std::string, std::string> fields = {{"source", source}};
    if (!name.empty()) {
        fields["patient_name"] = name;
    }
    if (!study_uid.empty()) {
        fields["study_uid"] = study_uid;
    }
    if (!sop_instance_uid.empty()) {
        fields["sop_instance_uid"] = sop_instance_uid;
    }
    fields["status"] = outcome_str;

    write_audit_log("DICOM_DECODE", outcome == decode_outcome::success ? "success" : "failure",
                    fields);
}

void logger_adapter::log_cache_write(const std::string& key,
                                     std::size_t size_bytes,
                                     std::chrono::seconds ttl,
                                     bool stored) {
    if (stored) {
        trace("Cache write {} ({} bytes, ttl {}s)", key, size_bytes, ttl.count());
    } else {
        warn("Cache write {} ({} bytes) was not stored", key, size_bytes);
    }

    write_audit_log("CACHE_WRITE", stored ? "success" : "failure",
                    {{"key", key},
                     {"size_bytes", std::to_string(size_bytes)},
                     {"ttl_seconds", std::to_string(ttl.count())}});
}

void logger_adapter::log_cache_invalidate(const std::string& key, invalidation_reason reason) {
    const auto reason_str = reason_to_string(reason);
    debug("Cache entry {} removed: {}", key, reason_str);

    write_audit_log("CACHE_INVALIDATE", "success", {{"key", key}, {"reason", reason_str}});
}

void logger_adapter::log_prefetch_run(const std::string& rule_name,
                                      std::size_t matched_studies,
                                      std::size_t images_cached,
                                      std::size_t failures) {
    if (failures == 0) {
        info("Prefetch rule '{}': {} studies matched, {} images cached", rule_name,
             matched_studies, images_cached);
    } else {
        warn("Prefetch rule '{}': {} studies matched, {} images cached, {} failed", rule_name,
             matched_studies, images_cached, failures);
    }

    write_audit_log("PREFETCH", failures == 0 ? "success" : "partial",
                    {{"rule", rule_name},
                     {"matched_studies", std::to_string(matched_studies)},
                     {"images_cached", std::to_string(images_cached)},
                     {"failures", std::to_string(failures)}});
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

// =============================================================================
// Private Helpers
// =============================================================================

void logger_adapter::write_audit_log(const std::string& event_type,
                                     const std::string& outcome,
                                     const std::map<std::string, std::string>& fields) {
    pimpl_->write_audit_log(event_type, outcome, fields);
}

auto logger_adapter::decode_outcome_to_string(decode_outcome outcome) -> std::string {
    switch (outcome) {
        case decode_outcome::success: return "Success";
        case decode_outcome::malformed_container: return "MalformedContainer";
        case decode_outcome::file_not_found: return "FileNotFound";
        case decode_outcome::read_failure: return "ReadFailure";
        case decode_outcome::missing_pixel_data: return "MissingPixelData";
    }
    return "Unknown";
}

auto logger_adapter::reason_to_string(invalidation_reason reason) -> std::string {
    switch (reason) {
        case invalidation_reason::explicit_remove: return "removed";
        case invalidation_reason::study_invalidated: return "study_invalidated";
        case invalidation_reason::expired: return "expired";
        case invalidation_reason::evicted: return "evicted";
        case invalidation_reason::cleared: return "cleared";
    }
    return "unknown";
}

}  // namespace medimg::integration
