// include/trend_engine/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>
#include "trend_engine/core/types.hpp"

namespace trend_engine {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
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

/**
 * @brief Format a bar timestamp in UTC
 * @param ts Timestamp to format
 * @param format strftime format, ISO date-time by default
 */
inline std::string format_timestamp(const Timestamp& ts, const char* format = "%Y-%m-%d %H:%M:%S") {
    auto time_c = std::chrono::system_clock::to_time_t(ts);
    std::tm result{};
    safe_gmtime(&time_c, &result);

    char buffer[64];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Seconds since the Unix epoch, used for JSON output
 */
inline long long to_epoch_seconds(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_seconds(long long seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

}  // namespace core
}  // namespace trend_engine
