#pragma once
#include <chrono>

namespace ladder {

// Wall-clock stopwatch for phase timings in the summary lines.
class Timer {
public:
    using clock = std::chrono::steady_clock;

    Timer() { reset(); }

    void reset() { start_ = clock::now(); }

    double ms() const {
        return std::chrono::duration<double, std::milli>(clock::now() - start_).count();
    }

    double sec() const {
        return std::chrono::duration<double>(clock::now() - start_).count();
    }

    // Seconds since the last lap (or construction), then restart.
    double lap_sec() {
        const auto now = clock::now();
        const double s = std::chrono::duration<double>(now - start_).count();
        start_ = now;
        return s;
    }

private:
    clock::time_point start_{};
};

} // namespace ladder
