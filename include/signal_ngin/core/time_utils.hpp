#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include "signal_ngin/core/types.hpp"

namespace signal_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

inline int64_t to_epoch_ms(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

/**
 * @brief Format a timestamp as UTC ISO-8601 with millisecond precision
 * @param ts Timestamp to format
 * @return String such as 2024-05-01T12:00:00.250Z
 */
inline std::string to_iso8601(const Timestamp& ts) {
    int64_t ms = to_epoch_ms(ts);
    int64_t millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    std::time_t seconds = static_cast<std::time_t>((ms - millis) / 1000);

    std::tm result{};
    if (!safe_gmtime(&seconds, &result)) {
        return std::to_string(ms);
    }

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &result);
    char full[40];
    std::snprintf(full, sizeof(full), "%s.%03dZ", buffer, static_cast<int>(millis));
    return std::string(full);
}

/**
 * @brief Get current time as a string with specified format
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result{};

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace signal_ngin
