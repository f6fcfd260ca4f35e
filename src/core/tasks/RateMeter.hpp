#pragma once

#include <chrono>
#include <cstdint>
#include <deque>

namespace collector::core::tasks {

/**
 * Sliding-window transfer rate. Feed it the cumulative byte count as it
 * grows; rate() is bytes/sec over the samples inside the window.
 */
class RateMeter {
public:
    using SteadyClock = std::chrono::steady_clock;

    explicit RateMeter(std::chrono::milliseconds window) : m_window(window) {}

    void sample(SteadyClock::time_point now, uint64_t cumulativeBytes);
    double rate() const;
    void reset();

private:
    struct Sample {
        SteadyClock::time_point time;
        uint64_t bytes;
    };

    std::chrono::milliseconds m_window;
    std::deque<Sample> m_samples;
};

} // namespace collector::core::tasks
