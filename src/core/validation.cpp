/**
 * @file validation.cpp
 * @brief Implementation of form field validation
 */

#include <dental/core/validation.hpp>

#include <charconv>
#include <cmath>
#include <regex>

namespace dental::core {

using kcenon::common::make_error;

namespace {

constexpr std::string_view whitespace = " \t\r\n\f\v";

}  // namespace

auto trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(whitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(whitespace);
    return std::string(text.substr(start, end - start + 1));
}

auto validate_phone(std::string_view phone) -> std::optional<std::string> {
    static const std::regex pattern(R"(\+?[0-9]{8,15})");

    std::string candidate(phone);
    if (!std::regex_match(candidate, pattern)) {
        return std::nullopt;
    }
    return candidate;
}

auto validate_fee(std::string_view fee) -> std::optional<double> {
    auto text = trim(fee);
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }
    if (digits.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const auto* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }

    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

auto check_phone(std::string_view phone) -> Result<std::string> {
    auto valid = validate_phone(trim(phone));
    if (!valid) {
        return make_error<std::string>(error_codes::invalid_phone,
                                       "Invalid phone number.", "validation");
    }
    return std::move(*valid);
}

auto check_optional_fee(std::string_view fee)
    -> Result<std::optional<double>> {
    if (trim(fee).empty()) {
        return std::optional<double>{};
    }

    auto value = validate_fee(fee);
    if (!value) {
        return make_error<std::optional<double>>(
            error_codes::invalid_fee,
            "Fee must be a non-negative number.", "validation");
    }
    return value;
}

auto check_required(std::string_view value, std::string_view message)
    -> Result<std::string> {
    auto trimmed = trim(value);
    if (trimmed.empty()) {
        return make_error<std::string>(error_codes::missing_required_field,
                                       std::string(message), "validation");
    }
    return trimmed;
}

}  // namespace dental::core
