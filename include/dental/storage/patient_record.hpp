/**
 * @file patient_record.hpp
 * @brief Patient record data structures for database operations
 *
 * Provides the patient_record structure mapped onto the patients table and
 * the patient_with_appointments aggregate returned by searches.
 */

#pragma once

#include "appointment_record.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace dental::storage {

/**
 * @brief Patient record from the database
 *
 * The phone number is the natural business key: it is unique across the
 * table and every lookup from the presentation surface goes through it.
 * Optional text fields use the empty string for "absent" and are stored as
 * NULL.
 */
struct patient_record {
    /// Primary key (auto-generated)
    int64_t pk{0};

    /// Patient name (required)
    std::string name;

    /// Phone number, optional '+' followed by 8-15 digits (unique)
    std::string phone;

    /// General treatment label for the patient (optional)
    std::string treatment_type;

    /// Serialized teeth selection, e.g. "LL1, UR4" (optional)
    std::string teeth_location;

    /// Record creation timestamp
    std::chrono::system_clock::time_point created_at;

    /// Record last update timestamp
    std::chrono::system_clock::time_point updated_at;

    /**
     * @brief Check if this record has the required fields
     *
     * @return true if name and phone are not empty
     */
    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return !name.empty() && !phone.empty();
    }
};

/**
 * @brief A patient together with the appointments it owns
 *
 * Appointments are ordered by date ascending.
 */
struct patient_with_appointments {
    patient_record patient;
    std::vector<appointment_record> appointments;
};

}  // namespace dental::storage
