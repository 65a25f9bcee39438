/**
 * @file timestamp.cpp
 * @brief Implementation of timestamp conversions
 */

#include <mediacache/core/timestamp.hpp>

#include <mediacache/compat/time.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace mediacache {

auto is_date_only(std::string_view text) noexcept -> bool {
    if (text.size() != 10) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) {
            if (text[i] != '-') return false;
        } else if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

auto parse_iso8601(std::string_view text) -> std::optional<time_point> {
    if (text.size() < 10) {
        return std::nullopt;
    }

    std::string str(text);
    if (!str.empty() && (str.back() == 'Z' || str.back() == 'z')) {
        str.pop_back();
    }

    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int consumed = 0;

    if (is_date_only(str)) {
        if (std::sscanf(str.c_str(), "%4d-%2d-%2d", &year, &month, &day) != 3) {
            return std::nullopt;
        }
    } else {
        if (str.size() < 19 || (str[10] != 'T' && str[10] != ' ')) {
            return std::nullopt;
        }
        if (std::sscanf(str.c_str(), "%4d-%2d-%2d%*c%2d:%2d:%2d%n",
                        &year, &month, &day, &hour, &minute, &second,
                        &consumed) != 6 ||
            consumed != 19) {
            return std::nullopt;
        }
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 60) {
        return std::nullopt;
    }

    // Fractional seconds, up to microsecond precision
    int64_t micros = 0;
    if (str.size() > 19) {
        if (str[19] != '.') {
            return std::nullopt;
        }
        int64_t scale = 100000;
        for (std::size_t i = 20; i < str.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
                return std::nullopt;
            }
            if (scale > 0) {
                micros += (str[i] - '0') * scale;
                scale /= 10;
            }
        }
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    auto seconds = compat::timegm_safe(&tm);
    if (seconds == static_cast<std::time_t>(-1) && year != 1969) {
        return std::nullopt;
    }
    // timegm normalizes out-of-range days (e.g. Feb 31), reject those
    if (tm.tm_mday != day || tm.tm_mon != month - 1) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(seconds) +
           std::chrono::microseconds(micros);
}

auto format_iso8601(time_point tp) -> std::string {
    auto micros = to_epoch_micros(tp);
    auto seconds = micros / 1000000;
    auto fraction = micros % 1000000;
    if (fraction < 0) {
        fraction += 1000000;
        seconds -= 1;
    }

    auto time = static_cast<std::time_t>(seconds);
    std::tm tm{};
    if (compat::gmtime_safe(&time, &tm) == nullptr) {
        return "";
    }

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char result[48];
    std::snprintf(result, sizeof(result), "%s.%06dZ", buf,
                  static_cast<int>(fraction));
    return result;
}

}  // namespace mediacache
