#include "RateMeter.hpp"

namespace collector::core::tasks {

void RateMeter::sample(SteadyClock::time_point now, uint64_t cumulativeBytes) {
    // A retried unit restarts its in-flight count; start a new window
    if (!m_samples.empty() && cumulativeBytes < m_samples.back().bytes) {
        m_samples.clear();
    }

    m_samples.push_back({now, cumulativeBytes});

    // Keep one sample at or beyond the window edge as the baseline
    while (m_samples.size() > 2 && now - m_samples[1].time >= m_window) {
        m_samples.pop_front();
    }
}

double RateMeter::rate() const {
    if (m_samples.size() < 2) {
        return 0.0;
    }

    const Sample& first = m_samples.front();
    const Sample& last = m_samples.back();
    auto elapsed = std::chrono::duration<double>(last.time - first.time).count();
    if (elapsed <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(last.bytes - first.bytes) / elapsed;
}

void RateMeter::reset() {
    m_samples.clear();
}

} // namespace collector::core::tasks
