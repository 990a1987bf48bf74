/**
 * @file validation.hpp
 * @brief Input validation for patient and appointment form fields
 *
 * These checks run before any store access. The validate_* functions return
 * the accepted value or std::nullopt; the check_* functions wrap the same
 * rules into a Result carrying a validation error code and a message fit for
 * display.
 */

#pragma once

#include "result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace dental::core {

/**
 * @brief Validate a phone number
 *
 * Accepts an optional leading '+' followed by 8 to 15 ASCII digits and
 * nothing else.
 *
 * @param phone Candidate phone number (not trimmed)
 * @return The phone number if valid, std::nullopt otherwise
 */
[[nodiscard]] auto validate_phone(std::string_view phone)
    -> std::optional<std::string>;

/**
 * @brief Validate an appointment fee
 *
 * The whole string (surrounding whitespace allowed) must parse as a finite
 * floating-point number that is >= 0.
 *
 * @param fee Candidate fee text
 * @return The parsed fee, or std::nullopt for negative or non-numeric input
 */
[[nodiscard]] auto validate_fee(std::string_view fee) -> std::optional<double>;

/// Strip leading and trailing whitespace
[[nodiscard]] auto trim(std::string_view text) -> std::string;

/**
 * @brief Trim and validate a phone number
 * @return The trimmed phone number or an invalid_phone error
 */
[[nodiscard]] auto check_phone(std::string_view phone) -> Result<std::string>;

/**
 * @brief Parse an optional fee field
 *
 * Blank input means "unspecified" and yields an empty optional; anything
 * else must pass validate_fee.
 *
 * @return The optional fee or an invalid_fee error
 */
[[nodiscard]] auto check_optional_fee(std::string_view fee)
    -> Result<std::optional<double>>;

/**
 * @brief Trim a required text field and reject it when empty
 *
 * @param value Raw field text
 * @param message Message reported when the field is empty
 * @return The trimmed value or a missing_required_field error
 */
[[nodiscard]] auto check_required(std::string_view value,
                                  std::string_view message)
    -> Result<std::string>;

}  // namespace dental::core
