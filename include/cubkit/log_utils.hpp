#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace cubkit {
namespace log_utils {

inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) {
        return std::to_string(ms) + " ms";
    }

    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << (static_cast<double>(ms) / 1000.0) << " s";
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

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// Verbose progress lines on stderr: "[cubkit] <step> ... (<elapsed>)"
class StepLogger {
public:
    explicit StepLogger(bool verbose)
        : verbose_(verbose), start_(std::chrono::steady_clock::now()) {}

    bool verbose() const { return verbose_; }

    void step(const std::string& msg) {
        if (!verbose_) return;
        const auto now = std::chrono::steady_clock::now();
        std::cerr << "[cubkit] " << msg << " (" << format_elapsed(last_, now) << ")\n";
        last_ = now;
    }

    void done() const {
        if (!verbose_) return;
        std::cerr << "[cubkit] Total time: "
                  << format_elapsed(start_, std::chrono::steady_clock::now()) << "\n";
    }

private:
    bool verbose_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point last_ = start_;
};

}  // namespace log_utils
}  // namespace cubkit
