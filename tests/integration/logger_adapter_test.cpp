/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter and the LoggerService bridge
 */

#include <dental/integration/logger_adapter.hpp>
#include <dental/di/ilogger.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using namespace dental;
using namespace dental::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Logger configuration that writes nowhere
 */
auto quiet_config(log_level min_level) -> logger_config {
    logger_config config;
    config.log_directory =
        std::filesystem::temp_directory_path() / "dental_logger_test";
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = false;
    config.async_mode = false;
    return config;
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() { logger_adapter::shutdown(); }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;
};

}  // namespace

// =============================================================================
// Level Name Tests
// =============================================================================

TEST_CASE("logger_adapter: parse_log_level accepts every level name",
          "[integration][logger]") {
    CHECK(logger_adapter::parse_log_level("trace") == log_level::trace);
    CHECK(logger_adapter::parse_log_level("debug") == log_level::debug);
    CHECK(logger_adapter::parse_log_level("info") == log_level::info);
    CHECK(logger_adapter::parse_log_level("warn") == log_level::warn);
    CHECK(logger_adapter::parse_log_level("error") == log_level::error);
    CHECK(logger_adapter::parse_log_level("fatal") == log_level::fatal);
    CHECK(logger_adapter::parse_log_level("off") == log_level::off);
}

TEST_CASE("logger_adapter: parse_log_level aliases and case",
          "[integration][logger]") {
    SECTION("warning is an alias for warn") {
        CHECK(logger_adapter::parse_log_level("warning") == log_level::warn);
        CHECK(logger_adapter::parse_log_level("WARNING") == log_level::warn);
    }

    SECTION("mixed case") {
        CHECK(logger_adapter::parse_log_level("WaRn") == log_level::warn);
        CHECK(logger_adapter::parse_log_level("INFO") == log_level::info);
        CHECK(logger_adapter::parse_log_level("Debug") == log_level::debug);
    }

    SECTION("unknown names") {
        CHECK_FALSE(logger_adapter::parse_log_level("loud").has_value());
        CHECK_FALSE(logger_adapter::parse_log_level("").has_value());
        CHECK_FALSE(logger_adapter::parse_log_level("warn ").has_value());
    }
}

// =============================================================================
// Lifecycle Tests
// =============================================================================

TEST_CASE("logger_adapter: initialize and shutdown", "[integration][logger]") {
    REQUIRE_FALSE(logger_adapter::is_initialized());
    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::fatal));

    logger_adapter::initialize(quiet_config(log_level::info));
    CHECK(logger_adapter::is_initialized());

    // Messages at any level are accepted without writers
    logger_adapter::log(log_level::info, "Clinic database opened");
    logger_adapter::log(log_level::trace, "filtered");

    logger_adapter::shutdown();
    CHECK_FALSE(logger_adapter::is_initialized());
    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::fatal));

    // Logging after shutdown is dropped
    logger_adapter::log(log_level::error, "after shutdown");
}

TEST_CASE("logger_adapter: second initialize keeps the first configuration",
          "[integration][logger]") {
    logger_test_fixture fixture(quiet_config(log_level::error));

    logger_adapter::initialize(quiet_config(log_level::trace));

    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::warn));
    CHECK(logger_adapter::is_level_enabled(log_level::error));
}

// =============================================================================
// LoggerService Tests
// =============================================================================

TEST_CASE("LoggerService: level filtering follows the adapter",
          "[integration][logger][di]") {
    di::LoggerService service;

    SECTION("nothing is enabled before initialize") {
        CHECK_FALSE(service.is_enabled(log_level::error));
    }

    SECTION("minimum level warn") {
        logger_test_fixture fixture(quiet_config(log_level::warn));

        CHECK_FALSE(service.is_enabled(log_level::trace));
        CHECK_FALSE(service.is_enabled(log_level::debug));
        CHECK_FALSE(service.is_enabled(log_level::info));
        CHECK(service.is_enabled(log_level::warn));
        CHECK(service.is_enabled(log_level::error));
        CHECK(service.is_enabled(log_level::fatal));
        CHECK_FALSE(service.is_enabled(log_level::off));

        service.warn("Store failure");
        service.info_fmt("Opened {} patients", 3);
    }

    SECTION("minimum level off disables everything") {
        logger_test_fixture fixture(quiet_config(log_level::off));

        CHECK_FALSE(service.is_enabled(log_level::fatal));
        CHECK_FALSE(service.is_enabled(log_level::off));
    }
}
