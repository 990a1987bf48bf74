/**
 * @file clinic_date_test.cpp
 * @brief Unit tests for calendar date helpers
 */

#include <dental/core/clinic_date.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace dental::core;
using namespace std::chrono;

TEST_CASE("parse_date: reads ISO calendar dates", "[core][date]") {
    auto date = parse_date("2024-03-15");

    REQUIRE(date.has_value());
    CHECK(date->year() == year{2024});
    CHECK(date->month() == March);
    CHECK(date->day() == day{15});
}

TEST_CASE("parse_date: tolerates surrounding whitespace", "[core][date]") {
    auto date = parse_date("  2023-12-01 ");

    REQUIRE(date.has_value());
    CHECK(*date == year{2023} / December / 1);
}

TEST_CASE("parse_date: rejects malformed or impossible dates", "[core][date]") {
    CHECK_FALSE(parse_date("").has_value());
    CHECK_FALSE(parse_date("2024/03/15").has_value());
    CHECK_FALSE(parse_date("2024-3-15").has_value());
    CHECK_FALSE(parse_date("15-03-2024").has_value());
    CHECK_FALSE(parse_date("2024-13-01").has_value());
    CHECK_FALSE(parse_date("2023-02-29").has_value());
    CHECK_FALSE(parse_date("-024-01-01").has_value());
    CHECK_FALSE(parse_date("2024-01-0a").has_value());
    CHECK_FALSE(parse_date("2024-01-01T10").has_value());
}

TEST_CASE("parse_date: accepts leap days", "[core][date]") {
    CHECK(parse_date("2024-02-29").has_value());
}

TEST_CASE("format_date: zero-pads month and day", "[core][date]") {
    CHECK(format_date(year{2024} / January / 5) == "2024-01-05");
    CHECK(format_date(year{1999} / December / 31) == "1999-12-31");
}

TEST_CASE("format_date: inverse of parse_date", "[core][date]") {
    auto date = parse_date("2025-07-04");

    REQUIRE(date.has_value());
    CHECK(format_date(*date) == "2025-07-04");
}

TEST_CASE("today: is a valid date", "[core][date]") {
    auto now = today();

    CHECK(now.ok());
    CHECK(parse_date(format_date(now)) == now);
}
