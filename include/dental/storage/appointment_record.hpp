/**
 * @file appointment_record.hpp
 * @brief Appointment record data structures for database operations
 */

#pragma once

#include <dental/core/clinic_date.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace dental::storage {

/**
 * @brief Appointment record from the database
 *
 * Maps directly to the appointments table. Every appointment belongs to
 * exactly one patient through patient_pk.
 */
struct appointment_record {
    /// Primary key (auto-generated)
    int64_t pk{0};

    /// Foreign key to the owning patient
    int64_t patient_pk{0};

    /// Scheduled calendar date
    core::clinic_date date{};

    /// Treatment performed at this visit (required)
    std::string treatment_type;

    /// Dentist name (required)
    std::string dentist;

    /// Fee, unspecified when empty; never negative
    std::optional<double> fee;

    /// Free-text notes (optional)
    std::string notes;

    /// Record creation timestamp
    std::chrono::system_clock::time_point created_at;

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return patient_pk > 0 && date.ok() && !treatment_type.empty() &&
               !dentist.empty() && (!fee.has_value() || *fee >= 0.0);
    }
};

/**
 * @brief Same-day reminder entry
 *
 * An appointment paired with the owning patient's display fields.
 */
struct appointment_reminder {
    appointment_record appointment;

    /// Owning patient's name
    std::string patient_name;

    /// Owning patient's phone number
    std::string patient_phone;
};

}  // namespace dental::storage
