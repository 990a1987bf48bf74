/**
 * @file validation_test.cpp
 * @brief Unit tests for form field validation and error classification
 */

#include <dental/core/result.hpp>
#include <dental/core/validation.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace dental;
using namespace dental::core;

// ============================================================================
// Phone Validation
// ============================================================================

TEST_CASE("validate_phone: accepts optional plus and 8-15 digits",
          "[core][validation]") {
    const std::vector<std::string> valid = {
        "+201234567890", "12345678", "+12345678", "123456789012345",
        "+123456789012345", "01000000000"};

    for (const auto& phone : valid) {
        INFO("phone: " << phone);
        auto result = validate_phone(phone);
        REQUIRE(result.has_value());
        CHECK(*result == phone);
    }
}

TEST_CASE("validate_phone: rejects malformed numbers", "[core][validation]") {
    const std::vector<std::string> invalid = {
        "123",        "12345678a",        "1234567",          "1234567890123456",
        "++12345678", "+",                "",                 "1234 5678",
        "12-345-678", "+1234567a9",       "12345678+",        " 12345678"};

    for (const auto& phone : invalid) {
        INFO("phone: '" << phone << "'");
        CHECK_FALSE(validate_phone(phone).has_value());
    }
}

TEST_CASE("check_phone: trims before validating", "[core][validation]") {
    auto result = check_phone("  +201234567890 \t");

    REQUIRE(result.is_ok());
    CHECK(result.value() == "+201234567890");
}

TEST_CASE("check_phone: reports invalid_phone", "[core][validation]") {
    auto result = check_phone("123");

    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::invalid_phone);
    CHECK(result.error().message == "Invalid phone number.");
    CHECK(classify_error(result.error()) == error_kind::validation);
}

// ============================================================================
// Fee Validation
// ============================================================================

TEST_CASE("validate_fee: parses non-negative numbers", "[core][validation]") {
    auto fee = validate_fee("25.5");
    REQUIRE(fee.has_value());
    CHECK(*fee == 25.5);

    CHECK(validate_fee("0") == 0.0);
    CHECK(validate_fee("100") == 100.0);
    CHECK(validate_fee(" 12.75 ") == 12.75);
    CHECK(validate_fee("+3") == 3.0);
    CHECK(validate_fee("1e2") == 100.0);
}

TEST_CASE("validate_fee: rejects negative or non-numeric input",
          "[core][validation]") {
    CHECK_FALSE(validate_fee("-1").has_value());
    CHECK_FALSE(validate_fee("-0.01").has_value());
    CHECK_FALSE(validate_fee("abc").has_value());
    CHECK_FALSE(validate_fee("12abc").has_value());
    CHECK_FALSE(validate_fee("1,5").has_value());
    CHECK_FALSE(validate_fee("").has_value());
    CHECK_FALSE(validate_fee("inf").has_value());
    CHECK_FALSE(validate_fee("nan").has_value());
}

TEST_CASE("check_optional_fee: blank means unspecified", "[core][validation]") {
    auto blank = check_optional_fee("   ");
    REQUIRE(blank.is_ok());
    CHECK_FALSE(blank.value().has_value());

    auto given = check_optional_fee("40");
    REQUIRE(given.is_ok());
    REQUIRE(given.value().has_value());
    CHECK(*given.value() == 40.0);
}

TEST_CASE("check_optional_fee: invalid text is a validation error",
          "[core][validation]") {
    auto result = check_optional_fee("-5");

    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::invalid_fee);
    CHECK(classify_error(result.error()) == error_kind::validation);
}

// ============================================================================
// Required Fields
// ============================================================================

TEST_CASE("check_required: trims and rejects empty values",
          "[core][validation]") {
    auto ok_value = check_required("  Ann  ", "Patient name cannot be empty.");
    REQUIRE(ok_value.is_ok());
    CHECK(ok_value.value() == "Ann");

    auto missing = check_required(" \t ", "Patient name cannot be empty.");
    REQUIRE(missing.is_err());
    CHECK(missing.error().code == error_codes::missing_required_field);
    CHECK(missing.error().message == "Patient name cannot be empty.");
}

// ============================================================================
// Error Classification
// ============================================================================

TEST_CASE("classify_error: maps code ranges to error kinds",
          "[core][result]") {
    CHECK(classify_error(error_codes::validation_failed) == error_kind::validation);
    CHECK(classify_error(error_codes::invalid_date) == error_kind::validation);
    CHECK(classify_error(error_codes::patient_not_found) == error_kind::not_found);
    CHECK(classify_error(error_codes::database_query_error) == error_kind::store);
    CHECK(classify_error(error_codes::database_constraint_error) == error_kind::store);

    // Raw SQLite result codes are store failures
    CHECK(classify_error(19) == error_kind::store);
    CHECK(classify_error(-1) == error_kind::store);
}

TEST_CASE("to_string: names the error kinds", "[core][result]") {
    CHECK(to_string(error_kind::validation) == "ValidationError");
    CHECK(to_string(error_kind::not_found) == "NotFoundError");
    CHECK(to_string(error_kind::store) == "StoreError");
}
