#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace mg::util {

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&ts), "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string getCurrentTimestamp() {
    return timestampToString(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

// Local time with milliseconds, e.g. 20250114T093012345; used in backup names
inline std::string getCompactTimestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t now_c = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&now_c, &tm);
    char buffer[16];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%S", &tm);

    std::ostringstream oss;
    oss << buffer << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

} // namespace mg::util
