/**
 * @file format.hpp
 * @brief std::format / fmt::format selection
 *
 * std::format is used when the standard library advertises it through
 * __cpp_lib_format; otherwise the fmt library provides the same API.
 *
 * Usage:
 *   #include <medimg/compat/format.hpp>
 *   auto key = medimg::compat::format("study:{}", uid);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define MEDIMG_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define MEDIMG_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define MEDIMG_HAS_STD_FORMAT 1
#else
    #define MEDIMG_HAS_STD_FORMAT 0
#endif

#if MEDIMG_HAS_STD_FORMAT
    #include <format>
    namespace medimg::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace medimg::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
