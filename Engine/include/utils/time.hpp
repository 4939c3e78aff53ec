#pragma once

#include <chrono>

namespace Stanchion {

/**
 * @brief High-resolution timer and wall-clock helpers.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Get elapsed milliseconds since last reset or construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

    /**
     * @brief Seconds since the Unix epoch, used for record timestamps.
     */
    static double now_epoch() {
        using namespace std::chrono;
        return duration<double>(system_clock::now().time_since_epoch()).count();
    }

private:
    TimePoint start_;
};

} // namespace Stanchion
