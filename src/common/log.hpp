#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace gem2bgef {

    // Timestamped progress line on stderr: "[2025-01-01 12:00:00.123] msg"
    void log_msg(const std::string& msg);

    // Same, tagged "[warn]".
    void log_warn(const std::string& msg);

    // Suppress log_msg output (warnings are always printed).
    void set_log_quiet(bool quiet);

    // "850 ms", "12.3 s", "4m 10s", "1h 2m 3s"
    std::string format_duration_ms(int64_t ms);

    inline std::string format_elapsed(std::chrono::steady_clock::time_point start) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        return format_duration_ms(ms);
    }

} // namespace gem2bgef
