/**
 * @file ilogger_test.cpp
 * @brief Unit tests for ILogger interface and implementations
 */

#include <medimg/di/ilogger.hpp>
#include <medimg/services/cache/cache_service.hpp>
#include <medimg/services/dicom_handler.hpp>

#include "../mocks/mock_logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

using namespace medimg::di;
using medimg::integration::log_level;
using medimg::integration::testing::mock_logger;

// =============================================================================
// NullLogger
// =============================================================================

TEST_CASE("NullLogger is a no-op implementation", "[di][logger][null]") {
    NullLogger logger;
    logger.trace("trace");
    logger.debug("debug");
    logger.info("info");
    logger.warn("warn");
    logger.error("error");
    logger.info_fmt("formatted {}", 42);
    logger.trace_fmt("formatted {}", 43);

    for (auto level : {log_level::trace, log_level::info, log_level::error}) {
        CHECK_FALSE(logger.is_enabled(level));
    }
}

TEST_CASE("null_logger() returns singleton instance", "[di][logger][null]") {
    auto first = null_logger();
    auto second = null_logger();
    REQUIRE(first != nullptr);
    CHECK(first.get() == second.get());
}

// =============================================================================
// LoggerService
// =============================================================================

TEST_CASE("LoggerService delegates to logger_adapter", "[di][logger][service]") {
    medimg::integration::logger_adapter::shutdown();
    LoggerService service;

    SECTION("Nothing is enabled before initialization") {
        CHECK_FALSE(service.is_enabled(log_level::error));
        service.error("dropped");
    }

    SECTION("Enabled levels follow the adapter") {
        medimg::integration::logger_config config;
        config.enable_console = false;
        config.enable_file = false;
        config.enable_audit_log = false;
        config.async_mode = false;
        config.min_level = log_level::warn;
        medimg::integration::logger_adapter::initialize(config);

        CHECK_FALSE(service.is_enabled(log_level::info));
        CHECK(service.is_enabled(log_level::warn));
        service.warn_fmt("cache {} unavailable", "sqlite");

        medimg::integration::logger_adapter::shutdown();
    }
}

TEST_CASE("LoggerService component prefix", "[di][logger][service]") {
    CHECK(LoggerService{}.decorate("decoded 3 files") == "decoded 3 files");

    LoggerService prefetch("prefetch");
    CHECK(prefetch.component() == "prefetch");
    CHECK(prefetch.decorate("rule recent_studies cached 4 images") ==
          "[prefetch] rule recent_studies cached 4 images");
}

// =============================================================================
// Formatted logging
// =============================================================================

TEST_CASE("ILogger formatted logging with mock_logger", "[di][logger][format]") {
    mock_logger logger;

    logger.info_fmt("Cached {} of {} studies", 3, 4);
    logger.warn_fmt("Entry {} expired", "study:1.2.3");
    REQUIRE(logger.entries().size() == 2);
    CHECK(logger.entries()[0].second == "Cached 3 of 4 studies");
    CHECK(logger.count(log_level::warn) == 1);

    SECTION("Disabled levels are not formatted") {
        logger.set_min_level(log_level::error);
        logger.debug_fmt("skipped {}", 1);
        logger.info_fmt("skipped {}", 2);
        logger.error_fmt("kept {}", 3);
        CHECK(logger.entries().size() == 3);
        CHECK(logger.contains("kept 3"));
        CHECK_FALSE(logger.contains("skipped"));
    }
}

// =============================================================================
// Injection
// =============================================================================

TEST_CASE("services accept an injected logger", "[di][logger][services]") {
    auto logger = std::make_shared<mock_logger>();

    SECTION("cache_service") {
        medimg::services::cache::cache_service_config config;
        auto cache = medimg::services::cache::cache_service::create(config, logger);
        REQUIRE(cache.is_ok());
        CHECK(logger->contains("memory backend"));
    }

    SECTION("dicom_handler") {
        medimg::services::dicom_handler handler(logger);
        auto result = handler.process_dicom_file("/nonexistent/medimg/file.dcm");
        CHECK_FALSE(result.is_valid);
        CHECK(logger->contains("Processing DICOM file"));
    }

    SECTION("null logger is used when none is given") {
        medimg::services::dicom_handler handler;
        auto result = handler.process_dicom_file("/nonexistent/medimg/file.dcm");
        CHECK_FALSE(result.is_valid);
        CHECK(logger->entries().empty());
    }
}
