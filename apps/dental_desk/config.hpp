/**
 * @file config.hpp
 * @brief Configuration management for the dental_desk application
 *
 * Settings come from three layers, lowest precedence first: built-in
 * defaults, an optional YAML file (--config), and command-line options.
 */

#ifndef DENTAL_APPS_DENTAL_DESK_CONFIG_HPP
#define DENTAL_APPS_DENTAL_DESK_CONFIG_HPP

#include <dental/core/result.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dental::desk {

/// Error code for unreadable or inconsistent configuration
constexpr int config_error = error_codes::dental_base - 60;

/**
 * @brief Database configuration
 */
struct database_settings {
    /// Path to SQLite database file
    std::filesystem::path path{"./dentistry_clinic.db"};

    /// Enable WAL (Write-Ahead Logging) journal mode
    bool wal_mode{true};
};

/**
 * @brief Logging configuration
 */
struct logging_settings {
    /// Log level: trace, debug, info, warn, error, fatal, off
    std::string level{"info"};

    /// Directory for the rotating log file
    std::filesystem::path directory{"logs"};

    /// Enable console output
    bool console{true};

    /// Enable file output
    bool file{true};
};

/// Longest accepted refresh interval (one day)
inline constexpr std::chrono::seconds max_refresh_interval{86400};

/**
 * @brief Periodic refresh configuration
 */
struct reminder_settings {
    /// Interval between refresh cycles
    std::chrono::seconds refresh_interval{60};

    /// Run the periodic refresh at all
    bool enabled{true};
};

/**
 * @brief Choices offered on the appointment form
 */
struct clinic_settings {
    std::vector<std::string> dentists{"Mohamed", "Essam", "Noha"};

    std::vector<std::string> treatments{"Cleaning", "Filling",    "Extraction",
                                        "Whitening", "Implant",   "Root Canal",
                                        "Crown",     "Other"};
};

/**
 * @brief Complete application configuration
 */
struct desk_config {
    database_settings database;
    logging_settings logging;
    reminder_settings reminders;
    clinic_settings clinic;

    /// --help was given; nothing else should run
    bool show_help{false};

    /**
     * @brief Print usage information to stdout
     */
    static void print_help();

    /**
     * @brief Build the configuration from command-line arguments
     *
     * A --config file is applied first, regardless of its position, so
     * that every other option overrides it.
     *
     * @return The configuration, or a config_error describing the problem
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[])
        -> Result<desk_config>;

    /**
     * @brief Apply a YAML configuration file on top of @p base
     */
    [[nodiscard]] static auto load_file(const std::filesystem::path& path,
                                        const desk_config& base)
        -> Result<desk_config>;

    /**
     * @brief Apply YAML text on top of @p base
     */
    [[nodiscard]] static auto load_from_string(std::string_view yaml_content,
                                               const desk_config& base)
        -> Result<desk_config>;

    /**
     * @brief Check cross-field constraints
     */
    [[nodiscard]] auto validate() const -> VoidResult;
};

}  // namespace dental::desk

#endif  // DENTAL_APPS_DENTAL_DESK_CONFIG_HPP
