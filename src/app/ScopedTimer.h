#pragma once

#include <chrono>

class ScopedTimer {
public:
    using clock_t = std::chrono::steady_clock;

    ScopedTimer() = default;

    // in seconds, with millisecond precision
    double elapsed() const noexcept {
        return static_cast<double>(elapsedMs().count()) / 1000.0;
    }

    std::chrono::milliseconds elapsedMs() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock_t::now() - start_time_);
    }

private:
    clock_t::time_point start_time_{clock_t::now()};
};
