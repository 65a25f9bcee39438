/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Uses std::format when the standard library provides it (detected through
 * __cpp_lib_format) and falls back to the fmt library otherwise.
 *
 * Usage:
 *   #include <mediacache/compat/format.hpp>
 *   auto s = mediacache::compat::format("buffer {} has {} rows", fp, n);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define MEDIACACHE_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define MEDIACACHE_HAS_STD_FORMAT 1
#else
    #define MEDIACACHE_HAS_STD_FORMAT 0
#endif

#if MEDIACACHE_HAS_STD_FORMAT
    #include <format>
    namespace mediacache::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace mediacache::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
