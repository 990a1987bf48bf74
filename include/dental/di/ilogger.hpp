/**
 * @file ilogger.hpp
 * @brief Logger interface for dependency injection
 *
 * This file provides the ILogger interface and implementations (NullLogger,
 * LoggerService). Services receive an ILogger at construction instead of
 * reaching for a process-wide logger, so tests can inject a recording mock.
 */

#pragma once

#include <dental/compat/format.hpp>
#include <dental/integration/logger_adapter.hpp>

#include <memory>
#include <string_view>
#include <utility>

namespace dental::di {

// =============================================================================
// Logger Interface
// =============================================================================

/**
 * @brief Abstract logger interface for dependency injection
 *
 * Thread Safety:
 * - All methods must be thread-safe in concrete implementations
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    // =========================================================================
    // Log Level Methods
    // =========================================================================

    virtual void trace(std::string_view message) = 0;
    virtual void debug(std::string_view message) = 0;
    virtual void info(std::string_view message) = 0;
    virtual void warn(std::string_view message) = 0;
    virtual void error(std::string_view message) = 0;
    virtual void fatal(std::string_view message) = 0;

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    // =========================================================================
    // Formatted Logging (Convenience Templates)
    // =========================================================================

    template <typename... Args>
    void debug_fmt(dental::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::debug)) {
            debug(dental::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info_fmt(dental::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::info)) {
            info(dental::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warn_fmt(dental::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::warn)) {
            warn(dental::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error_fmt(dental::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(integration::log_level::error)) {
            error(dental::compat::format(fmt, std::forward<Args>(args)...));
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
 * @brief No-op logger implementation for default injection
 */
class NullLogger final : public ILogger {
public:
    NullLogger() = default;
    ~NullLogger() override = default;

    void trace(std::string_view /*message*/) override {}
    void debug(std::string_view /*message*/) override {}
    void info(std::string_view /*message*/) override {}
    void warn(std::string_view /*message*/) override {}
    void error(std::string_view /*message*/) override {}
    void fatal(std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(integration::log_level /*level*/) const noexcept override {
        return false;
    }
};

// =============================================================================
// Logger Service Implementation
// =============================================================================

/**
 * @brief Default implementation of ILogger using logger_adapter
 *
 * Thread Safety:
 * - All methods are thread-safe (delegates to thread-safe logger_adapter)
 */
class LoggerService final : public ILogger {
public:
    LoggerService() = default;
    ~LoggerService() override = default;

    void trace(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::trace, std::string{message});
    }

    void debug(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::debug, std::string{message});
    }

    void info(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::info, std::string{message});
    }

    void warn(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::warn, std::string{message});
    }

    void error(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::error, std::string{message});
    }

    void fatal(std::string_view message) override {
        integration::logger_adapter::log(integration::log_level::fatal, std::string{message});
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }
};

// =============================================================================
// Global Null Logger Instance
// =============================================================================

/**
 * @brief Get a shared null logger instance
 */
[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace dental::di
