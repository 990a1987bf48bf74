/**
 * @file reminder_service.cpp
 * @brief Implementation of the recurring refresh task
 */

#include <dental/workflow/reminder_service.hpp>

#include <utility>

namespace dental::workflow {

// ============================================================================
// Construction
// ============================================================================

reminder_service::reminder_service(services::clinic_service& clinic,
                                   const reminder_service_config& config)
    : clinic_(clinic), config_(config) {
    if (!config_.today) {
        config_.today = [] { return core::today(); };
    }
    if (config_.auto_start) {
        start();
    }
}

reminder_service::~reminder_service() {
    stop();
}

// ============================================================================
// Lifecycle Management
// ============================================================================

void reminder_service::start() {
    std::lock_guard lock(mutex_);

    if (running_.load()) {
        return;  // Already running
    }

    stop_requested_.store(false);
    running_.store(true);

    next_cycle_time_ =
        std::chrono::steady_clock::now() + config_.refresh_interval;

    worker_thread_ = std::thread([this]() { run_loop(); });
}

void reminder_service::stop() {
    {
        std::lock_guard lock(mutex_);

        if (!running_.load()) {
            return;  // Not running
        }

        stop_requested_.store(true);
    }

    cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    running_.store(false);
}

auto reminder_service::is_running() const noexcept -> bool {
    return running_.load();
}

// ============================================================================
// Manual Operations
// ============================================================================

auto reminder_service::run_cycle() -> Result<services::refresh_summary> {
    reminder_service_config::date_provider today;
    {
        std::lock_guard lock(mutex_);
        today = config_.today;
    }

    auto result = clinic_.refresh(today());
    if (result.is_ok()) {
        std::lock_guard lock(mutex_);
        last_summary_ = result.value();
    }
    return result;
}

void reminder_service::trigger_cycle() {
    std::lock_guard lock(mutex_);

    if (!running_.load()) {
        return;
    }

    next_cycle_time_ = std::chrono::steady_clock::now();
    cv_.notify_all();
}

// ============================================================================
// Statistics
// ============================================================================

auto reminder_service::get_last_summary() const
    -> std::optional<services::refresh_summary> {
    std::lock_guard lock(mutex_);
    return last_summary_;
}

auto reminder_service::cycles_completed() const noexcept -> std::size_t {
    return cycles_count_.load();
}

// ============================================================================
// Configuration
// ============================================================================

void reminder_service::set_refresh_interval(std::chrono::seconds interval) {
    std::lock_guard lock(mutex_);
    config_.refresh_interval = interval;
}

auto reminder_service::get_refresh_interval() const -> std::chrono::seconds {
    std::lock_guard lock(mutex_);
    return config_.refresh_interval;
}

// ============================================================================
// Internal Methods
// ============================================================================

void reminder_service::run_loop() {
    while (!stop_requested_.load()) {
        std::unique_lock lock(mutex_);

        cv_.wait_until(lock, next_cycle_time_, [this]() {
            return stop_requested_.load() ||
                   std::chrono::steady_clock::now() >= next_cycle_time_;
        });

        if (stop_requested_.load()) {
            break;
        }

        // Release lock during the refresh
        lock.unlock();

        auto result = run_cycle();

        lock.lock();
        cycles_count_++;

        next_cycle_time_ =
            std::chrono::steady_clock::now() + config_.refresh_interval;

        auto on_complete = config_.on_cycle_complete;
        auto on_error = config_.on_cycle_error;
        lock.unlock();

        if (result.is_ok()) {
            if (on_complete) {
                on_complete(result.value());
            }
        } else if (on_error) {
            on_error(result.error());
        }
    }
}

}  // namespace dental::workflow
