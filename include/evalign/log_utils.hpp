#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace evalign {
namespace log_utils {

// "850 ms", "12.4 s", "3m 07s", "1h 02m 07s"
inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    std::ostringstream oss;
    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t seconds = total_seconds % 60;
    const int64_t minutes = (total_seconds / 60) % 60;
    const int64_t hours = total_seconds / 3600;
    if (hours > 0) {
        oss << hours << "h " << std::setw(2) << std::setfill('0') << minutes << "m ";
    } else {
        oss << minutes << "m ";
    }
    oss << std::setw(2) << std::setfill('0') << seconds << "s";
    return oss.str();
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// 71.428 -> "71.4%"
inline std::string format_pct(double pct) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << pct << "%";
    return oss.str();
}

}  // namespace log_utils
}  // namespace evalign
