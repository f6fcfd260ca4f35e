#include "TaskSettings.hpp"
#include "../Config.hpp"

#include <algorithm>

namespace collector::core::tasks {

std::chrono::milliseconds TaskSettings::backoffFor(int attempt) const {
    if (attempt <= 0) {
        return std::chrono::milliseconds(0);
    }

    auto delay = backoffBase;
    for (int i = 1; i < attempt && delay < backoffMax; ++i) {
        delay *= 2;
    }
    return std::min(delay, backoffMax);
}

TaskSettings TaskSettings::fromConfig(const Config& config) {
    using std::chrono::milliseconds;

    // Negative durations in the file read as zero
    auto millis = [&config](const char* key, milliseconds fallback) {
        return milliseconds(std::max<int64_t>(0, config.get<int64_t>(key, fallback.count())));
    };

    TaskSettings settings;
    settings.retryLimit = std::max(0, config.get<int>("downloads.retryLimit", settings.retryLimit));
    settings.backoffBase = millis("downloads.backoffBaseMs", settings.backoffBase);
    settings.backoffMax = millis("downloads.backoffMaxMs", settings.backoffMax);
    settings.progressInterval = millis("downloads.progressIntervalMs", settings.progressInterval);
    settings.rateWindow = millis("downloads.rateWindowMs", settings.rateWindow);

    settings.orphanThreshold = millis("reaper.orphanThresholdMs", settings.orphanThreshold);
    settings.sweepInterval = millis("reaper.sweepIntervalMs", settings.sweepInterval);
    settings.reaperGrace = millis("reaper.graceMs", settings.reaperGrace);
    settings.exemptActiveTransfers = config.get<bool>("reaper.exemptActiveTransfers", settings.exemptActiveTransfers);

    return settings;
}

} // namespace collector::core::tasks
