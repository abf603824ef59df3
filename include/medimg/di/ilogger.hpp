/**
 * @file ilogger.hpp
 * @brief Logger interface injected into handler, cache and prefetch services
 *
 * Services take a std::shared_ptr<ILogger>; production code passes a
 * LoggerService (forwarding to logger_adapter), tests pass a NullLogger or
 * a recording implementation of their own.
 */

#pragma once

#include <medimg/integration/logger_adapter.hpp>
#include <medimg/compat/format.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace medimg::di {

// =============================================================================
// Logger Interface
// =============================================================================

/**
 * @brief Sink for the operational log lines of the medimg services
 *
 * Audit records (decode, cache write, invalidation, prefetch runs) do not
 * go through this interface; they are written by logger_adapter directly.
 * Implementations must be thread-safe since prefetch fetches log from pool
 * workers. The *_fmt helpers skip formatting when the level is disabled.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void trace(std::string_view message) = 0;
    virtual void debug(std::string_view message) = 0;
    virtual void info(std::string_view message) = 0;
    virtual void warn(std::string_view message) = 0;
    virtual void error(std::string_view message) = 0;

    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    // =========================================================================
    // Formatted Logging
    // =========================================================================

    template <typename... Args>
    void trace_fmt(medimg::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::trace)) {
            trace(medimg::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void debug_fmt(medimg::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::debug)) {
            debug(medimg::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info_fmt(medimg::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::info)) {
            info(medimg::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn_fmt(medimg::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::warn)) {
            warn(medimg::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error_fmt(medimg::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::error)) {
            error(medimg::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;
    ILogger(ILogger&&) = default;
    ILogger& operator=(ILogger&&) = default;
};

// =============================================================================
// Null Logger Implementation
// =============================================================================

/**
 * @brief No-op logger used when nothing is injected
 */
class NullLogger final : public ILogger {
public:
    void trace(std::string_view /*message*/) override {}
    void debug(std::string_view /*message*/) override {}
    void info(std::string_view /*message*/) override {}
    void warn(std::string_view /*message*/) override {}
    void error(std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(integration::log_level /*level*/) const noexcept override {
        return false;
    }
};

// =============================================================================
// Logger Service Implementation
// =============================================================================

/**
 * @brief ILogger forwarding to the process-wide logger_adapter
 *
 * A non-empty component is written as a "[component] " prefix so cache,
 * prefetch and decode lines can be told apart in one log file.
 *
 * @example
 * @code
 * auto cache_log = std::make_shared<di::LoggerService>("cache");
 * cache_log->warn("sqlite busy");  // "[cache] sqlite busy"
 * @endcode
 */
class LoggerService final : public ILogger {
public:
    LoggerService() = default;
    explicit LoggerService(std::string component) : component_(std::move(component)) {}

    void trace(std::string_view message) override {
        forward(integration::log_level::trace, message);
    }
    void debug(std::string_view message) override {
        forward(integration::log_level::debug, message);
    }
    void info(std::string_view message) override { forward(integration::log_level::info, message); }
    void warn(std::string_view message) override { forward(integration::log_level::warn, message); }
    void error(std::string_view message) override {
        forward(integration::log_level::error, message);
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }

    [[nodiscard]] auto component() const noexcept -> const std::string& { return component_; }

    /**
     * @brief The line as written to logger_adapter
     */
    [[nodiscard]] auto decorate(std::string_view message) const -> std::string {
        if (component_.empty()) {
            return std::string{message};
        }
        std::string line;
        line.reserve(component_.size() + 3 + message.size());
        line.append("[").append(component_).append("] ").append(message);
        return line;
    }

private:
    void forward(integration::log_level level, std::string_view message) {
        if (!is_enabled(level)) {
            return;
        }
        integration::logger_adapter::log(level, decorate(message));
    }

    std::string component_;
};

/**
 * @brief Shared NullLogger instance
 */
[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace medimg::di
