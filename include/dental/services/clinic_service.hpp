/**
 * @file clinic_service.hpp
 * @brief Form-level clinic workflows over the records database
 *
 * This file provides the clinic_service class. It accepts raw text as typed
 * into a form, validates it, and only then calls into clinic_database. Each
 * public method is one user action: it runs to completion under the
 * service mutex and either fully succeeds or leaves the store untouched.
 */

#pragma once

#include <dental/core/clinic_date.hpp>
#include <dental/core/result.hpp>
#include <dental/di/ilogger.hpp>
#include <dental/storage/appointment_record.hpp>
#include <dental/storage/clinic_database.hpp>
#include <dental/storage/patient_record.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dental::services {

/**
 * @brief Raw patient fields as entered on a form
 */
struct patient_form {
    std::string name;
    std::string phone;
    std::string treatment_type;
    /// Serialized teeth selection ("LL1, UR2")
    std::string teeth_location;
};

/**
 * @brief Raw appointment fields as entered on a form
 */
struct appointment_form {
    /// YYYY-MM-DD; blank means today
    std::string date;
    std::string treatment_type;
    std::string dentist;
    /// Blank means unspecified
    std::string fee;
    std::string notes;
};

/**
 * @brief Outcome of the combined add-patient-and-appointment action
 */
struct saved_visit {
    storage::patient_record patient;
    storage::appointment_record appointment;
};

/**
 * @brief Outcome of one periodic refresh
 */
struct refresh_summary {
    core::clinic_date date{};
    std::size_t patient_count{0};
    std::size_t appointments_today{0};
};

/**
 * @brief Clinic workflows with input validation and logging
 *
 * Validation failures are returned before the store is touched. Store
 * failures are logged at error level; the database has already rolled the
 * unit of work back by then.
 *
 * Thread Safety: All methods are thread-safe. Calls are serialized on an
 * internal mutex so the periodic refresh can share the connection with the
 * console thread.
 */
class clinic_service {
public:
    /**
     * @brief Construct the service
     *
     * @param database Open records database; must outlive the service
     * @param logger Logger for diagnostics (null means NullLogger)
     */
    explicit clinic_service(storage::clinic_database& database,
                            std::shared_ptr<di::ILogger> logger = nullptr);

    clinic_service(const clinic_service&) = delete;
    clinic_service& operator=(const clinic_service&) = delete;

    // =========================================================================
    // User Actions
    // =========================================================================

    /**
     * @brief Add or update a patient and book an appointment in one step
     *
     * The patient keyed by phone is created or overwritten, then the
     * appointment is attached to it, inside a single unit of work.
     */
    [[nodiscard]] auto add_patient_with_appointment(const patient_form& patient,
                                                    const appointment_form& visit)
        -> Result<saved_visit>;

    /**
     * @brief Overwrite name, treatment type and teeth of an existing patient
     *
     * The phone field selects the patient; it is not changed.
     */
    [[nodiscard]] auto modify_patient(const patient_form& patient)
        -> Result<storage::patient_record>;

    /**
     * @brief Delete a patient and all of its appointments
     *
     * @return Number of appointments removed
     */
    [[nodiscard]] auto delete_patient(std::string_view phone)
        -> Result<std::size_t>;

    /**
     * @brief Look up a patient by (raw) phone number
     */
    [[nodiscard]] auto find_patient(std::string_view phone)
        -> Result<std::optional<storage::patient_record>>;

    /**
     * @brief Search records; a blank term lists everything
     */
    [[nodiscard]] auto search(std::string_view term)
        -> Result<std::vector<storage::patient_with_appointments>>;

    // =========================================================================
    // Reminders
    // =========================================================================

    /**
     * @brief Appointments scheduled on @p date
     */
    [[nodiscard]] auto reminders_on(const core::clinic_date& date)
        -> Result<std::vector<storage::appointment_reminder>>;

    /**
     * @brief Human-readable reminder lines for @p date
     *
     * Yields a single "No appointments scheduled for today." line when
     * nothing is booked.
     */
    [[nodiscard]] auto reminder_lines(const core::clinic_date& date)
        -> Result<std::vector<std::string>>;

    /**
     * @brief Re-read the record set and count the appointments on @p date
     *
     * Read-only. Logs the number of appointments at info level when there
     * is at least one.
     */
    [[nodiscard]] auto refresh(const core::clinic_date& date)
        -> Result<refresh_summary>;

    /**
     * @brief Format one reminder line
     */
    [[nodiscard]] static auto format_reminder(
        const storage::appointment_reminder& reminder) -> std::string;

private:
    /**
     * @brief Log a failed action at a level matching its error kind
     */
    void report_failure(std::string_view action, const error_info& error);

    storage::clinic_database& database_;
    std::shared_ptr<di::ILogger> logger_;
    std::mutex mutex_;
};

}  // namespace dental::services
