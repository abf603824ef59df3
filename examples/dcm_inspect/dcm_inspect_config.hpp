/**
 * @file dcm_inspect_config.hpp
 * @brief Command line options of the dcm_inspect utility
 */

#pragma once

#include "medimg/core/result.hpp"
#include "medimg/integration/logger_adapter.hpp"
#include "medimg/services/cache/cache_service.hpp"

#include <charconv>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace medimg::tools {

/**
 * @brief Parsed dcm_inspect options
 */
struct dcm_inspect_config {
    std::vector<std::filesystem::path> paths;
    services::cache::cache_service_config cache;
    integration::log_level log_level{integration::log_level::warn};
    std::filesystem::path log_directory;   ///< Empty disables the log file
    bool validate{false};
    bool show_help{false};
};

/**
 * @brief Parse argv into a dcm_inspect_config
 *
 * `--help` stops parsing and sets show_help; no path is required then.
 *
 * @return The options, or invalid_configuration naming the bad argument
 */
[[nodiscard]] inline auto parse_arguments(int argc, const char* const argv[])
    -> Result<dcm_inspect_config> {
    dcm_inspect_config config;
    auto fail = [](const std::string& message) {
        return medimg_error<dcm_inspect_config>(error_codes::invalid_configuration, message);
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return Result<dcm_inspect_config>::ok(std::move(config));
        } else if (arg == "--validate") {
            config.validate = true;
        } else if (arg == "--cache-dir" || arg == "--backend" || arg == "--ttl" ||
                   arg == "--max-size" || arg == "--log-level" || arg == "--log-dir") {
            if (!has_value) {
                return fail("Missing value for " + std::string(arg));
            }
            const std::string_view value = argv[++i];

            if (arg == "--cache-dir") {
                config.cache.cache_directory = std::filesystem::path(value);
                config.cache.database_path =
                    (std::filesystem::path(value) / "medimg-cache.db").string();
            } else if (arg == "--backend") {
                auto kind = services::cache::parse_backend_kind(value);
                if (kind.is_err()) {
                    return fail(kind.error().message);
                }
                config.cache.backend = kind.value();
            } else if (arg == "--ttl") {
                long long seconds = 0;
                const auto* end = value.data() + value.size();
                auto [ptr, ec] = std::from_chars(value.data(), end, seconds);
                if (ec != std::errc{} || ptr != end || seconds < 0) {
                    return fail("Invalid TTL '" + std::string(value) + "'");
                }
                config.cache.default_ttl = std::chrono::seconds{seconds};
            } else if (arg == "--max-size") {
                auto size = services::cache::parse_size(value);
                if (size.is_err()) {
                    return fail(size.error().message);
                }
                config.cache.max_cache_size = size.value();
            } else if (arg == "--log-level") {
                auto level = integration::parse_log_level(value);
                if (!level) {
                    return fail("Unknown log level '" + std::string(value) + "'");
                }
                config.log_level = *level;
            } else {
                config.log_directory = std::filesystem::path(value);
            }
        } else if (!arg.empty() && arg.front() == '-') {
            return fail("Unknown option '" + std::string(arg) + "'");
        } else {
            config.paths.emplace_back(arg);
        }
    }

    if (config.paths.empty()) {
        return fail("No path specified");
    }
    return Result<dcm_inspect_config>::ok(std::move(config));
}

}  // namespace medimg::tools
