/**
 * @file config.cpp
 * @brief Configuration management implementation for dental_desk
 */

#include "config.hpp"

#include <dental/compat/format.hpp>
#include <dental/integration/logger_adapter.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <variant>

namespace dental::desk {

using kcenon::common::ok;

namespace {

/**
 * @brief Minimal YAML reader for the configuration file
 *
 * Handles:
 * - Key-value pairs
 * - Nested sections (with indentation)
 * - Simple lists (- item syntax)
 * - Comments (# lines)
 * - Quoted strings
 *
 * Values are addressed by dotted path, e.g. "logging.level".
 */
class yaml_document {
public:
    explicit yaml_document(std::string_view content) { parse(content); }

    [[nodiscard]] auto get_string(const std::string& path) const
        -> std::optional<std::string> {
        auto it = values_.find(path);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] auto get_list(const std::string& path) const
        -> std::optional<std::vector<std::string>> {
        auto it = lists_.find(path);
        if (it == lists_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    void parse(std::string_view content) {
        std::istringstream stream{std::string(content)};
        std::string line;
        std::vector<std::pair<int, std::string>> path_stack;
        std::string current_list_path;

        while (std::getline(stream, line)) {
            if (line.empty() || line.find_first_not_of(" \t\r\n") == std::string::npos) {
                continue;
            }

            auto non_ws = line.find_first_not_of(" \t");
            if (non_ws != std::string::npos && line[non_ws] == '#') {
                continue;
            }

            int indent = 0;
            for (char c : line) {
                if (c == ' ') indent++;
                else if (c == '\t') indent += 2;
                else break;
            }

            auto trimmed = trim(line);

            if (trimmed.starts_with("- ")) {
                auto item = strip_quotes(trim(trimmed.substr(2)));
                if (!current_list_path.empty()) {
                    lists_[current_list_path].push_back(item);
                }
                continue;
            }

            current_list_path.clear();

            auto colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) continue;

            std::string key = trim(trimmed.substr(0, colon_pos));
            std::string value = (colon_pos + 1 < trimmed.size())
                                    ? trim(trimmed.substr(colon_pos + 1))
                                    : "";

            while (!path_stack.empty() && path_stack.back().first >= indent) {
                path_stack.pop_back();
            }

            std::string full_path;
            for (const auto& [_, segment] : path_stack) {
                full_path += segment + ".";
            }
            full_path += key;

            if (value.empty()) {
                // Section header, or the key of a block list
                path_stack.emplace_back(indent, key);
                current_list_path = full_path;
            } else {
                values_[full_path] = strip_quotes(value);
            }
        }
    }

    [[nodiscard]] static auto trim(std::string_view str) -> std::string {
        auto start = str.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = str.find_last_not_of(" \t\r\n");
        return std::string(str.substr(start, end - start + 1));
    }

    [[nodiscard]] static auto strip_quotes(std::string_view str) -> std::string {
        if (str.length() >= 2) {
            if ((str.front() == '"' && str.back() == '"') ||
                (str.front() == '\'' && str.back() == '\'')) {
                return std::string(str.substr(1, str.length() - 2));
            }
        }
        return std::string(str);
    }

    std::map<std::string, std::string> values_;
    std::map<std::string, std::vector<std::string>> lists_;
};

auto config_failure(std::string message) -> error_info {
    return error_info{config_error, std::move(message), "config"};
}

auto parse_bool(std::string_view key, std::string value) -> Result<bool> {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    return Result<bool>(config_failure(
        compat::format("{}: expected a boolean, got '{}'", key, value)));
}

auto parse_interval(std::string_view key, std::string_view value)
    -> Result<std::chrono::seconds> {
    long long seconds = 0;
    const auto* first = value.data();
    const auto* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, seconds);
    if (ec != std::errc{} || ptr != last || seconds <= 0 ||
        seconds > max_refresh_interval.count()) {
        return Result<std::chrono::seconds>(config_failure(compat::format(
            "{}: expected between 1 and {} seconds, got '{}'", key,
            max_refresh_interval.count(), value)));
    }
    return std::chrono::seconds{seconds};
}

auto check_log_level(std::string_view key, std::string_view value) -> VoidResult {
    if (!integration::logger_adapter::parse_log_level(value).has_value()) {
        return VoidResult(config_failure(compat::format(
            "{}: invalid log level '{}' (valid: trace, debug, info, warn, "
            "error, fatal, off)",
            key, value)));
    }
    return ok();
}

}  // namespace

// =============================================================================
// Help
// =============================================================================

void desk_config::print_help() {
    std::cout << R"(
dental_desk - Dental Clinic Records

Usage: dental_desk [OPTIONS]

Options:
  --config <file>           YAML configuration file
  --db-path <path>          SQLite database path (default: ./dentistry_clinic.db)
  --log-level <level>       Log level: trace, debug, info, warn, error, fatal, off
                            (default: info)
  --log-dir <path>          Directory for dental_desk.log (default: logs)
  --refresh-interval <sec>  Seconds between record refreshes, 1 to 86400 (default: 60)
  --no-reminders            Disable the periodic refresh
  --help, -h                Show this help message

Examples:
  # Start with default settings
  dental_desk

  # Use a clinic database on a shared drive
  dental_desk --db-path /srv/clinic/dentistry_clinic.db

  # Load settings from a file, but log verbosely
  dental_desk --config dental_desk.yaml --log-level debug

)";
}

// =============================================================================
// Command Line
// =============================================================================

auto desk_config::parse_args(int argc, char* argv[]) -> Result<desk_config> {
    desk_config config;

    // First pass: help and the configuration file
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            return config;
        }

        if (arg == "--config") {
            if (i + 1 >= argc) {
                return Result<desk_config>(
                    config_failure("--config requires a value"));
            }
            auto loaded = load_file(argv[++i], config);
            if (loaded.is_err()) {
                return loaded;
            }
            config = std::move(loaded.value());
        }
    }

    // Second pass: options override the file
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--config") {
            ++i;
            continue;
        }

        if (arg == "--no-reminders") {
            config.reminders.enabled = false;
            continue;
        }

        if (arg == "--db-path" || arg == "--log-level" || arg == "--log-dir" ||
            arg == "--refresh-interval") {
            if (i + 1 >= argc) {
                return Result<desk_config>(
                    config_failure(compat::format("{} requires a value", arg)));
            }
            const std::string_view value = argv[++i];

            if (arg == "--db-path") {
                config.database.path = std::string(value);
            } else if (arg == "--log-level") {
                auto valid = check_log_level(arg, value);
                if (valid.is_err()) {
                    return Result<desk_config>(valid.error());
                }
                config.logging.level = std::string(value);
            } else if (arg == "--log-dir") {
                config.logging.directory = std::string(value);
            } else {
                auto interval = parse_interval(arg, value);
                if (interval.is_err()) {
                    return Result<desk_config>(interval.error());
                }
                config.reminders.refresh_interval = interval.value();
            }
            continue;
        }

        return Result<desk_config>(config_failure(compat::format(
            "Unknown option: {} (use --help for usage information)", arg)));
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<desk_config>(valid.error());
    }
    return config;
}

// =============================================================================
// YAML File
// =============================================================================

auto desk_config::load_file(const std::filesystem::path& path,
                            const desk_config& base) -> Result<desk_config> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<desk_config>(config_failure(
            "Failed to open configuration file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str(), base);
}

auto desk_config::load_from_string(std::string_view yaml_content,
                                   const desk_config& base)
    -> Result<desk_config> {
    yaml_document yaml(yaml_content);
    desk_config config = base;

    // Database
    if (auto path = yaml.get_string("database.path")) {
        config.database.path = *path;
    }
    if (auto wal = yaml.get_string("database.wal_mode")) {
        auto value = parse_bool("database.wal_mode", *wal);
        if (value.is_err()) return Result<desk_config>(value.error());
        config.database.wal_mode = value.value();
    }

    // Logging
    if (auto level = yaml.get_string("logging.level")) {
        auto valid = check_log_level("logging.level", *level);
        if (valid.is_err()) return Result<desk_config>(valid.error());
        config.logging.level = *level;
    }
    if (auto directory = yaml.get_string("logging.directory")) {
        config.logging.directory = *directory;
    }
    if (auto console = yaml.get_string("logging.console")) {
        auto value = parse_bool("logging.console", *console);
        if (value.is_err()) return Result<desk_config>(value.error());
        config.logging.console = value.value();
    }
    if (auto file = yaml.get_string("logging.file")) {
        auto value = parse_bool("logging.file", *file);
        if (value.is_err()) return Result<desk_config>(value.error());
        config.logging.file = value.value();
    }

    // Reminders
    if (auto interval = yaml.get_string("reminders.refresh_interval_seconds")) {
        auto value = parse_interval("reminders.refresh_interval_seconds", *interval);
        if (value.is_err()) return Result<desk_config>(value.error());
        config.reminders.refresh_interval = value.value();
    }
    if (auto enabled = yaml.get_string("reminders.enabled")) {
        auto value = parse_bool("reminders.enabled", *enabled);
        if (value.is_err()) return Result<desk_config>(value.error());
        config.reminders.enabled = value.value();
    }

    // Clinic choices
    if (auto dentists = yaml.get_list("clinic.dentists")) {
        config.clinic.dentists = std::move(*dentists);
    }
    if (auto treatments = yaml.get_list("clinic.treatments")) {
        config.clinic.treatments = std::move(*treatments);
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<desk_config>(valid.error());
    }
    return config;
}

// =============================================================================
// Validation
// =============================================================================

auto desk_config::validate() const -> VoidResult {
    if (database.path.empty()) {
        return VoidResult(config_failure("database.path must not be empty"));
    }
    if (reminders.refresh_interval.count() <= 0 ||
        reminders.refresh_interval > max_refresh_interval) {
        return VoidResult(config_failure(compat::format(
            "reminders.refresh_interval_seconds must be between 1 and {}",
            max_refresh_interval.count())));
    }
    if (clinic.dentists.empty()) {
        return VoidResult(config_failure("clinic.dentists must list at least one dentist"));
    }
    if (clinic.treatments.empty()) {
        return VoidResult(
            config_failure("clinic.treatments must list at least one treatment"));
    }
    return ok();
}

}  // namespace dental::desk
