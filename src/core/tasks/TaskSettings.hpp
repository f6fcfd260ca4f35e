#pragma once

#include <chrono>

namespace collector::core {
class Config;
}

namespace collector::core::tasks {

/**
 * Snapshot of the task engine's tunables, read once from Config.
 */
struct TaskSettings {
    // Retry policy, applied per unit (and to listing)
    int retryLimit = 3;
    std::chrono::milliseconds backoffBase{1000};
    std::chrono::milliseconds backoffMax{30000};

    // Minimum spacing of in-flight progress updates
    std::chrono::milliseconds progressInterval{250};
    std::chrono::milliseconds rateWindow{5000};

    // Orphan reaper
    std::chrono::milliseconds orphanThreshold{std::chrono::hours(1)};
    std::chrono::milliseconds sweepInterval{std::chrono::minutes(1)};
    std::chrono::milliseconds reaperGrace{5000};
    bool exemptActiveTransfers = true;

    /**
     * Backoff before retry number `attempt` (1-based): base * 2^(attempt-1),
     * capped at backoffMax
     */
    std::chrono::milliseconds backoffFor(int attempt) const;

    static TaskSettings fromConfig(const Config& config);
};

} // namespace collector::core::tasks
