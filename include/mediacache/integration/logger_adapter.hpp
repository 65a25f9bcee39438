/**
 * @file logger_adapter.hpp
 * @brief Adapter for cache logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with the buffer cache. It supports standard application logging and a
 * structured event trail for buffer lifecycle events (build, reuse,
 * eviction, deletion, startup clearing).
 */

#pragma once

#include <mediacache/compat/format.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace mediacache::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @enum cache_event
 * @brief Buffer lifecycle events written to the event trail
 */
enum class cache_event {
    buffer_built,
    buffer_reused,
    buffer_evicted,
    buffer_deleted,
    buffers_cleared,
    staging_swept,
    build_failed,
    eviction_failed
};

/**
 * @brief Convert a cache event to its trail name
 */
[[nodiscard]] auto to_string(cache_event event) -> std::string_view;

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the structured cache event trail (cache_events.json)
    bool enable_event_log{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{50};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Process-wide logging facade over logger_system
 *
 * Until initialize() is called every logging call is a no-op, so library
 * code may log unconditionally and unit tests need no logger setup.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/mediacache";
 * config.min_level = log_level::debug;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Created buffer {} with {} items", fp, count);
 * logger_adapter::log_cache_event(cache_event::buffer_built, fp,
 *                                 {{"item_count", "33"}});
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    static void initialize(const logger_config& config);

    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::trace)) {
            log(log_level::trace, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void debug(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            log(log_level::debug, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void info(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::info)) {
            log(log_level::info, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void warn(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::warn)) {
            log(log_level::warn, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void error(compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::error)) {
            log(log_level::error, compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a level would be written
     *
     * Always false before initialize().
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Cache Event Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Append one buffer lifecycle event to the event trail
     *
     * Writes a single JSON line with timestamp, event name, fingerprint and
     * the extra fields. Does nothing unless enable_event_log is set.
     *
     * @param event The lifecycle event
     * @param fingerprint Fingerprint of the affected buffer (may be empty)
     * @param fields Additional string fields
     */
    static void log_cache_event(cache_event event,
                                std::string_view fingerprint,
                                const std::map<std::string, std::string>& fields = {});

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace mediacache::integration
