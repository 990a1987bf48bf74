/**
 * @file time.hpp
 * @brief Compatibility header for thread-safe calendar time conversion
 *
 * POSIX provides localtime_r(time_t*, tm*) while Windows provides
 * localtime_s(tm*, time_t*). Both are wrapped behind one signature.
 */

#pragma once

#include <ctime>

namespace dental::compat {

/**
 * @brief Thread-safe local time conversion
 *
 * @param time Pointer to the time_t value to convert
 * @param result Pointer to the tm structure to store the result
 * @return result on success, nullptr on failure
 */
inline std::tm* localtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return localtime_s(result, time) == 0 ? result : nullptr;
#else
    return localtime_r(time, result);
#endif
}

}  // namespace dental::compat
