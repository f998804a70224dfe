#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace sm::util {

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    std::tm tm{};
    gmtime_r(&ts, &tm);
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::time_t parseTimestampFromString(const std::string& iso) {
    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);
    return timegm(&tm);
}

inline std::time_t now() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

inline std::string getCurrentTimestamp() { return timestampToString(now()); }

}
