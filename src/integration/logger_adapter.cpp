/**
 * @file logger_adapter.cpp
 * @brief Implementation of the application logging adapter
 */

#include <dental/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>

namespace dental::integration {

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

        if (config.enable_file) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
            if (ec) {
                // Without a directory only the console writer is usable
                config_.enable_file = false;
            }
        }

        logger_ = std::make_unique<kcenon::logger::logger>(
            config.async_mode, config.buffer_size);

        logger_->set_min_level(convert_log_level(config.min_level));

        if (config_.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config_.enable_file) {
            auto log_path = config_.log_directory / "dental_desk.log";
            auto writer = std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(),
                config_.max_file_size_mb * 1024 * 1024,  // Convert MB to bytes
                config_.max_files);
            logger_->add_writer(std::move(writer));
        }

        logger_->start();

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

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        std::lock_guard lock(mutex_);

        if (!initialized_ || !logger_) {
            return;
        }

        if (!is_level_enabled(level)) {
            return;
        }

        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return initialized_.load() && level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    mutable std::mutex mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

// =============================================================================
// Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

// =============================================================================
// Level Names
// =============================================================================

auto logger_adapter::parse_log_level(std::string_view name)
    -> std::optional<log_level> {
    std::string lower(name);
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

}  // namespace dental::integration
