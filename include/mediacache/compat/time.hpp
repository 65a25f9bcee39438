/**
 * @file time.hpp
 * @brief Compatibility header for cross-platform UTC time functions
 *
 * POSIX and Windows disagree on the names and argument order of the
 * thread-safe UTC conversion functions. This header hides the difference.
 */

#pragma once

#include <ctime>

namespace mediacache::compat {

/**
 * @brief Thread-safe time_t to UTC broken-down time
 *
 * @return Pointer to result on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Inverse of gmtime_safe (broken-down UTC time to time_t)
 */
inline std::time_t timegm_safe(std::tm* tm) {
#if defined(_WIN32) || defined(_WIN64)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

}  // namespace mediacache::compat
