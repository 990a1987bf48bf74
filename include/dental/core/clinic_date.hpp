/**
 * @file clinic_date.hpp
 * @brief Calendar date helpers for appointment scheduling
 *
 * Appointment dates carry no time of day. They are represented with
 * std::chrono::year_month_day and persisted as ISO "YYYY-MM-DD" text, which
 * keeps lexicographic and chronological order identical in SQL.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace dental::core {

/// Appointment calendar date
using clinic_date = std::chrono::year_month_day;

/**
 * @brief Parse an ISO date ("YYYY-MM-DD")
 *
 * @param text Date text, surrounding whitespace allowed
 * @return The date, or std::nullopt if malformed or not a real calendar day
 */
[[nodiscard]] auto parse_date(std::string_view text)
    -> std::optional<clinic_date>;

/**
 * @brief Format a date as "YYYY-MM-DD"
 */
[[nodiscard]] auto format_date(const clinic_date& date) -> std::string;

/**
 * @brief Today's date in the local time zone
 */
[[nodiscard]] auto today() -> clinic_date;

}  // namespace dental::core
