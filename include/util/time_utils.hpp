#pragma once

/**
 * Time utilities
 *
 * Wall-clock timestamps for log entries and log file names.
 */

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace pipeview {
namespace util {

/**
 * Returns current wall-clock time in nanoseconds since Unix epoch.
 */
inline uint64_t wall_clock_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()
    ).count();
}

/**
 * Local time formatted as YYYYMMDD-HHMMSS, suitable for file names.
 */
inline std::string file_timestamp(std::time_t when) {
    std::tm local{};
    localtime_r(&when, &local);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &local);
    return buf;
}

inline std::string file_timestamp() {
    return file_timestamp(std::time(nullptr));
}

}  // namespace util
}  // namespace pipeview
