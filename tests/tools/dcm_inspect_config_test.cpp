/**
 * @file dcm_inspect_config_test.cpp
 * @brief Unit tests for dcm_inspect argument parsing
 */

#include <catch2/catch_test_macros.hpp>

#include "dcm_inspect_config.hpp"

#include <array>

using namespace medimg;
using medimg::tools::parse_arguments;

namespace {

template <std::size_t N>
auto parse(const std::array<const char*, N>& argv) {
    return parse_arguments(static_cast<int>(N), argv.data());
}

}  // namespace

TEST_CASE("dcm_inspect defaults", "[tools][dcm_inspect]") {
    const std::array<const char*, 2> argv{"dcm_inspect", "scan.dcm"};
    auto config = parse(argv);
    REQUIRE(config.is_ok());

    const auto& options = config.value();
    REQUIRE(options.paths.size() == 1);
    CHECK(options.paths[0] == "scan.dcm");
    CHECK(options.cache.backend == services::cache::cache_backend_kind::memory);
    CHECK(options.cache.default_ttl == std::chrono::seconds{3600});
    CHECK(options.log_level == integration::log_level::warn);
    CHECK(options.log_directory.empty());
    CHECK_FALSE(options.validate);
    CHECK_FALSE(options.show_help);
}

TEST_CASE("dcm_inspect cache options", "[tools][dcm_inspect]") {
    const std::array<const char*, 12> argv{"dcm_inspect", "--backend",  "sqlite",
                                           "--cache-dir", "/tmp/medimg", "--ttl",
                                           "60",          "--max-size", "512MB",
                                           "--validate",  "a.dcm",      "b.dcm"};
    auto config = parse(argv);
    REQUIRE(config.is_ok());

    const auto& options = config.value();
    CHECK(options.paths.size() == 2);
    CHECK(options.validate);
    CHECK(options.cache.backend == services::cache::cache_backend_kind::sqlite);
    CHECK(options.cache.cache_directory == "/tmp/medimg");
    CHECK(options.cache.database_path ==
          (std::filesystem::path("/tmp/medimg") / "medimg-cache.db").string());
    CHECK(options.cache.default_ttl == std::chrono::seconds{60});
    CHECK(options.cache.max_cache_size == 512ULL * 1024 * 1024);
}

TEST_CASE("dcm_inspect logging options", "[tools][dcm_inspect]") {
    const std::array<const char*, 6> argv{"dcm_inspect", "--log-level", "DEBUG",
                                          "--log-dir",   "logs",        "dir"};
    auto config = parse(argv);
    REQUIRE(config.is_ok());
    CHECK(config.value().log_level == integration::log_level::debug);
    CHECK(config.value().log_directory == "logs");
}

TEST_CASE("dcm_inspect help needs no path", "[tools][dcm_inspect]") {
    const std::array<const char*, 3> argv{"dcm_inspect", "--bogus-later", "-h"};
    auto config = parse(argv);
    REQUIRE(config.is_err());

    const std::array<const char*, 3> help{"dcm_inspect", "-h", "--bogus-later"};
    auto parsed = parse(help);
    REQUIRE(parsed.is_ok());
    CHECK(parsed.value().show_help);
}

TEST_CASE("dcm_inspect rejects bad arguments", "[tools][dcm_inspect]") {
    SECTION("no path") {
        const std::array<const char*, 2> argv{"dcm_inspect", "--validate"};
        auto config = parse(argv);
        REQUIRE(config.is_err());
        CHECK(config.error().code == error_codes::invalid_configuration);
    }

    SECTION("missing value") {
        const std::array<const char*, 3> argv{"dcm_inspect", "scan.dcm", "--ttl"};
        CHECK(parse(argv).is_err());
    }

    SECTION("negative ttl") {
        const std::array<const char*, 4> argv{"dcm_inspect", "--ttl", "-5", "scan.dcm"};
        CHECK(parse(argv).is_err());
    }

    SECTION("unknown backend") {
        const std::array<const char*, 4> argv{"dcm_inspect", "--backend", "redis", "scan.dcm"};
        CHECK(parse(argv).is_err());
    }

    SECTION("unknown log level") {
        const std::array<const char*, 4> argv{"dcm_inspect", "--log-level", "loud", "scan.dcm"};
        CHECK(parse(argv).is_err());
    }

    SECTION("bad size") {
        const std::array<const char*, 4> argv{"dcm_inspect", "--max-size", "lots", "scan.dcm"};
        CHECK(parse(argv).is_err());
    }
}
