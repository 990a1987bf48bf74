/**
 * @file logger_adapter.hpp
 * @brief Application logging on top of logger_system
 *
 * This file provides the logger_adapter class, the single process-wide sink
 * for clinic diagnostics. Records are written to the console and to a
 * rotating file in the configured log directory.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace dental::integration {

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
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{10};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Process-wide logger backed by logger_system
 *
 * Messages logged before initialize() or after shutdown() are dropped.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "logs";
 * logger_adapter::initialize(config);
 *
 * if (logger_adapter::is_level_enabled(log_level::info)) {
 *     logger_adapter::log(log_level::info, "Clinic database opened");
 * }
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Creates the log directory when file output is enabled. A second call
     * without an intervening shutdown() is ignored.
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the logger
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     *
     * Always false while the logger is not initialized.
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Level Names
    // ─────────────────────────────────────────────────────

    /**
     * @brief Parse a level name, ignoring case
     *
     * Accepts trace, debug, info, warn, warning, error, fatal and off.
     *
     * @return The level, or std::nullopt for an unknown name
     */
    [[nodiscard]] static auto parse_log_level(std::string_view name)
        -> std::optional<log_level>;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace dental::integration
