/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the media buffer cache
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for mediacache, integrating with common_system's Result
 * pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace mediacache {

/**
 * @brief Result type alias for cache operations
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
 * @brief mediacache error codes
 *
 * Error code range: -900 to -999
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int mediacache_base = -900;

    // Lookup errors (-900 to -909)
    constexpr int buffer_not_found = mediacache_base - 0;

    // Argument errors (-910 to -919)
    constexpr int invalid_filter = mediacache_base - 10;
    constexpr int invalid_fingerprint = mediacache_base - 11;
    constexpr int invalid_cursor = mediacache_base - 12;
    constexpr int invalid_key = mediacache_base - 13;
    constexpr int invalid_configuration = mediacache_base - 14;

    // Catalog errors (-920 to -929)
    constexpr int upstream_query_failure = mediacache_base - 20;

    // Storage errors (-930 to -949)
    constexpr int storage_failure = mediacache_base - 30;
    constexpr int database_open_error = mediacache_base - 31;
    constexpr int database_migration_error = mediacache_base - 32;
    constexpr int database_transaction_error = mediacache_base - 33;
    constexpr int serialization_error = mediacache_base - 34;

    // Buffer lifecycle errors (-950 to -969)
    constexpr int build_failed = mediacache_base - 50;
    constexpr int publish_failed = mediacache_base - 51;
    constexpr int eviction_failure = mediacache_base - 52;
} // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a mediacache error result with module context
 * @tparam T The result value type
 * @param code Error code from mediacache::error_codes
 * @param message Error message
 * @param module Component reporting the error
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> cache_error(int code, const std::string& message,
                             const std::string& module = "mediacache") {
    return kcenon::common::make_error<T>(code, message, module);
}

/**
 * @brief Create a mediacache void error result
 */
inline VoidResult cache_void_error(int code, const std::string& message,
                                   const std::string& module = "mediacache") {
    return VoidResult(error_info{code, message, module});
}

} // namespace mediacache
