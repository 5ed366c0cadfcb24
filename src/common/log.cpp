#include "common/log.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace gem2bgef {

    static bool g_quiet = false;

    static std::string timestamp_now() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm tm_buf{};
        localtime_r(&t, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setw(3) << std::setfill('0') << ms;
        return oss.str();
    }

    void log_msg(const std::string& msg) {
        if (g_quiet) return;
        std::cerr << "[" << timestamp_now() << "] " << msg << "\n";
    }

    void log_warn(const std::string& msg) {
        std::cerr << "[" << timestamp_now() << "] [warn] " << msg << "\n";
    }

    void set_log_quiet(bool quiet) { g_quiet = quiet; }

    std::string format_duration_ms(int64_t ms) {
        if (ms < 0) ms = 0;
        if (ms < 1000) return std::to_string(ms) + " ms";

        const int64_t total_seconds = ms / 1000;
        if (total_seconds < 60) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1) << (static_cast<double>(ms) / 1000.0) << " s";
            return oss.str();
        }

        const int64_t seconds = total_seconds % 60;
        const int64_t total_minutes = total_seconds / 60;
        if (total_minutes < 60) {
            return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
        }

        const int64_t minutes = total_minutes % 60;
        const int64_t hours = total_minutes / 60;
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m " +
            std::to_string(seconds) + "s";
    }

} // namespace gem2bgef
