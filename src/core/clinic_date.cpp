/**
 * @file clinic_date.cpp
 * @brief Implementation of calendar date helpers
 */

#include <dental/core/clinic_date.hpp>

#include <dental/compat/time.hpp>
#include <dental/core/validation.hpp>

#include <cstdio>
#include <ctime>

namespace dental::core {

auto parse_date(std::string_view text) -> std::optional<clinic_date> {
    auto trimmed = trim(text);
    if (trimmed.size() != 10 || trimmed[4] != '-' || trimmed[7] != '-') {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < trimmed.size(); ++i) {
        if (i != 4 && i != 7 && (trimmed[i] < '0' || trimmed[i] > '9')) {
            return std::nullopt;
        }
    }

    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (std::sscanf(trimmed.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3) {
        return std::nullopt;
    }

    clinic_date date{std::chrono::year{y}, std::chrono::month{m},
                     std::chrono::day{d}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

auto format_date(const clinic_date& date) -> std::string {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buf;
}

auto today() -> clinic_date {
    auto now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());

    std::tm tm{};
    if (compat::localtime_safe(&now, &tm) == nullptr) {
        return clinic_date{std::chrono::floor<std::chrono::days>(
            std::chrono::system_clock::now())};
    }

    return clinic_date{std::chrono::year{tm.tm_year + 1900},
                       std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
                       std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
}

}  // namespace dental::core
