/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for the clinic records core
 *
 * Integrates with common_system's Result pattern. Every fallible operation
 * in the core returns Result<T> or VoidResult; the error_info carries one of
 * the codes below so that a presentation surface can tell a validation
 * failure from a missing record or a store failure.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>

#include <string_view>

namespace dental {

/**
 * @brief Result type alias for clinic operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief Clinic-specific error codes
 *
 * Error code range: -700 to -759
 */
namespace error_codes {

constexpr int dental_base = -700;

// Validation errors (-700 to -719): reported before any store access
constexpr int validation_failed = dental_base - 0;
constexpr int invalid_phone = dental_base - 1;
constexpr int invalid_fee = dental_base - 2;
constexpr int missing_required_field = dental_base - 3;
constexpr int invalid_date = dental_base - 4;

// Lookup errors (-720 to -739)
constexpr int patient_not_found = dental_base - 20;

// Store errors (-740 to -759): the unit of work has been rolled back
constexpr int database_open_error = dental_base - 40;
constexpr int database_query_error = dental_base - 41;
constexpr int database_transaction_error = dental_base - 42;
constexpr int database_constraint_error = dental_base - 43;
constexpr int database_schema_error = dental_base - 44;

}  // namespace error_codes

/**
 * @brief Coarse category of a failure, used to choose the user-facing reaction
 */
enum class error_kind {
    validation,
    not_found,
    store
};

/**
 * @brief Map an error code onto its category
 *
 * Codes outside the validation and lookup ranges (including raw SQLite
 * result codes) are treated as store failures.
 */
[[nodiscard]] constexpr auto classify_error(int code) noexcept -> error_kind {
    if (code <= error_codes::validation_failed &&
        code > error_codes::patient_not_found) {
        return error_kind::validation;
    }
    if (code <= error_codes::patient_not_found &&
        code > error_codes::database_open_error) {
        return error_kind::not_found;
    }
    return error_kind::store;
}

[[nodiscard]] inline auto classify_error(const error_info& info) noexcept
    -> error_kind {
    return classify_error(info.code);
}

[[nodiscard]] constexpr auto to_string(error_kind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case error_kind::validation:
            return "ValidationError";
        case error_kind::not_found:
            return "NotFoundError";
        case error_kind::store:
            return "StoreError";
    }
    return "StoreError";
}

}  // namespace dental
