#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace TaskFleet {

// Local wall-clock time, second resolution. Used for message and task timestamps.
inline std::string format_local_time(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buffer[32];
    size_t n = std::strftime(buffer, sizeof(buffer), fmt, &tm_buf);
    return std::string(buffer, n);
}

/// `YYYY-MM-DDTHH:MM:SS`
inline std::string now_timestamp() {
    return format_local_time(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%S");
}

/// `YYYYmmdd_HHMMSS`, used inside generated message ids.
inline std::string now_compact_stamp() {
    return format_local_time(std::chrono::system_clock::now(), "%Y%m%d_%H%M%S");
}

} // namespace TaskFleet
