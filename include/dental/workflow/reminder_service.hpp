/**
 * @file reminder_service.hpp
 * @brief Recurring refresh and same-day appointment check
 *
 * This file provides the reminder_service class which periodically asks the
 * clinic service to re-read its records and count today's appointments.
 * The task is cancellable: stop() wakes the worker and joins it.
 */

#pragma once

#include <dental/core/clinic_date.hpp>
#include <dental/core/result.hpp>
#include <dental/services/clinic_service.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace dental::workflow {

/**
 * @brief Configuration for the reminder service
 */
struct reminder_service_config {
    /// Interval between refresh cycles
    std::chrono::seconds refresh_interval{60};

    /// Whether to start automatically on construction
    bool auto_start{false};

    /// Callback invoked after each successful cycle
    using cycle_callback =
        std::function<void(const services::refresh_summary& summary)>;
    cycle_callback on_cycle_complete;

    /// Callback invoked when a cycle fails
    using error_callback = std::function<void(const error_info& error)>;
    error_callback on_cycle_error;

    /// Source of "today"; defaults to the local calendar date
    using date_provider = std::function<core::clinic_date()>;
    date_provider today;
};

/**
 * @brief Cancellable recurring refresh task
 *
 * The first cycle runs one interval after start(). Cycles only read from
 * the store.
 *
 * Thread Safety:
 * - All methods are thread-safe
 * - Callbacks run on the worker thread
 *
 * @example
 * @code
 * reminder_service_config config;
 * config.refresh_interval = std::chrono::seconds{60};
 *
 * reminder_service reminders{clinic, config};
 * reminders.start();
 *
 * // On shutdown
 * reminders.stop();
 * @endcode
 */
class reminder_service {
public:
    /**
     * @brief Construct the reminder service
     *
     * @param clinic Clinic service to refresh; must outlive this object
     * @param config Service configuration
     */
    explicit reminder_service(services::clinic_service& clinic,
                              const reminder_service_config& config = {});

    /**
     * @brief Destructor - stops the worker
     */
    ~reminder_service();

    reminder_service(const reminder_service&) = delete;
    reminder_service& operator=(const reminder_service&) = delete;
    reminder_service(reminder_service&&) = delete;
    reminder_service& operator=(reminder_service&&) = delete;

    // =========================================================================
    // Lifecycle Management
    // =========================================================================

    /**
     * @brief Start the background worker; no-op if already running
     */
    void start();

    /**
     * @brief Cancel the recurring task and join the worker
     *
     * A cycle already in progress completes first. No-op if not running.
     */
    void stop();

    [[nodiscard]] auto is_running() const noexcept -> bool;

    // =========================================================================
    // Manual Operations
    // =========================================================================

    /**
     * @brief Run one refresh cycle on the calling thread
     */
    [[nodiscard]] auto run_cycle() -> Result<services::refresh_summary>;

    /**
     * @brief Wake the worker to run a cycle now
     *
     * Only works if the service is running.
     */
    void trigger_cycle();

    // =========================================================================
    // Statistics
    // =========================================================================

    /**
     * @brief Summary of the last successful cycle, if any
     */
    [[nodiscard]] auto get_last_summary() const
        -> std::optional<services::refresh_summary>;

    /**
     * @brief Number of cycles run by the worker (successful or not)
     */
    [[nodiscard]] auto cycles_completed() const noexcept -> std::size_t;

    // =========================================================================
    // Configuration
    // =========================================================================

    /**
     * @note Takes effect at the next cycle
     */
    void set_refresh_interval(std::chrono::seconds interval);

    [[nodiscard]] auto get_refresh_interval() const -> std::chrono::seconds;

private:
    /**
     * @brief Background thread main loop
     */
    void run_loop();

    services::clinic_service& clinic_;
    reminder_service_config config_;

    std::thread worker_thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};

    std::optional<services::refresh_summary> last_summary_;
    std::atomic<std::size_t> cycles_count_{0};

    /// Time of next scheduled cycle
    std::chrono::steady_clock::time_point next_cycle_time_;
};

}  // namespace dental::workflow
