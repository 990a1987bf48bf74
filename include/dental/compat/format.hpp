/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Provides a single formatting entry point that works whether or not the
 * standard library ships <format>. Detection relies on the __cpp_lib_format
 * feature test macro, with explicit checks for Apple Clang and MSVC.
 *
 * Usage:
 *   #include <dental/compat/format.hpp>
 *   auto s = dental::compat::format("Patient '{}' saved", name);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define DENTAL_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define DENTAL_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define DENTAL_HAS_STD_FORMAT 1
#else
    #define DENTAL_HAS_STD_FORMAT 0
#endif

#if DENTAL_HAS_STD_FORMAT
    #include <format>
    namespace dental::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    // libstdc++ before GCC 13 has no <format>
    #include <fmt/format.h>
    namespace dental::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
