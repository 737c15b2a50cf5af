#pragma once

#include <utils/logger.hpp>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>

namespace Bliss {

/**
 * @brief Steady-clock stopwatch for tool-level timings.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : start_(Clock::now()) {}

    void reset() { start_ = Clock::now(); }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    /// "12.3ms" below one second, "4.56s" above.
    std::string elapsed_str() const {
        std::ostringstream ss;
        double ms = elapsed_ms();
        if (ms < 1000.0) ss << std::fixed << std::setprecision(1) << ms << "ms";
        else ss << std::fixed << std::setprecision(2) << ms / 1000.0 << "s";
        return ss.str();
    }

private:
    Clock::time_point start_;
};

/**
 * @brief Logs "<label> took <elapsed>" when it goes out of scope.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label) : label_(std::move(label)) {}
    ~ScopedTimer() { Logger::info(label_ + " took " + timer_.elapsed_str()); }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string label_;
    Timer timer_;
};

} // namespace Bliss
