#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>

namespace riskgate {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
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
 * @brief Format a time point with a strftime pattern
 * @param tp Time point to format
 * @param format strftime-compatible format string
 * @param use_local_time Local time when true, UTC otherwise
 */
inline std::string format_time(std::chrono::system_clock::time_point tp, const char* format,
                               bool use_local_time = false) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm time_info{};
    std::tm* ok = use_local_time ? safe_localtime(&t, &time_info) : safe_gmtime(&t, &time_info);
    if (ok == nullptr) {
        return "";
    }
    char buffer[64];
    std::size_t written = std::strftime(buffer, sizeof(buffer), format, &time_info);
    return std::string(buffer, written);
}

/**
 * @brief UTC ISO-8601 timestamp, second resolution ("2024-01-31T12:00:00Z")
 */
inline std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    return format_time(tp, "%Y-%m-%dT%H:%M:%SZ");
}

}  // namespace core
}  // namespace riskgate
