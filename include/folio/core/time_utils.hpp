#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>
#include "folio/core/types.hpp"

namespace folio {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
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
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
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
 * @brief Format a timestamp in UTC
 *
 * @param ts Timestamp to format
 * @param format Format string compatible with strftime
 * @return Formatted time string, empty on conversion failure
 */
inline std::string format_utc(const Timestamp& ts, const char* format = "%Y-%m-%d %H:%M:%S") {
    auto tt = std::chrono::system_clock::to_time_t(ts);
    std::tm result;
    if (safe_gmtime(&tt, &result) == nullptr) {
        return "";
    }

    char buffer[64];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Calendar month key (YYYY-MM, UTC) of a timestamp
 */
inline std::string month_key(const Timestamp& ts) {
    return format_utc(ts, "%Y-%m");
}

/**
 * @brief Build a UTC timestamp from calendar fields
 *
 * Uses the days-from-civil conversion so no timezone state is consulted.
 */
inline Timestamp make_utc_timestamp(int year, unsigned month, unsigned day, int hour = 0,
                                    int minute = 0, int second = 0) {
    year -= month <= 2 ? 1 : 0;
    const int era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    const long long days = static_cast<long long>(era) * 146097 + static_cast<long long>(doe) - 719468;

    const long long seconds = days * 86400LL + hour * 3600LL + minute * 60LL + second;
    return Timestamp(std::chrono::seconds(seconds));
}

}  // namespace core
}  // namespace folio
