#include "OrphanReaper.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

namespace collector::core::tasks {

OrphanReaper::OrphanReaper(TaskRegistry& registry,
                           CancellationController& cancellation,
                           DownloadExecutor& executor,
                           TaskBridge& bridge,
                           TaskSettings settings)
    : m_registry(registry)
    , m_cancellation(cancellation)
    , m_executor(executor)
    , m_bridge(bridge)
    , m_settings(std::move(settings)) {
}

OrphanReaper::~OrphanReaper() {
    stop();
}

bool OrphanReaper::isOrphan(const TaskState& state, TimePoint now) const {
    if (state.status != TaskStatus::Running || !state.startedAt) {
        return false;
    }
    if (state.progressPercent != 0) {
        return false;
    }
    return now - *state.startedAt > m_settings.orphanThreshold;
}

SweepReport OrphanReaper::sweep(TimePoint now) {
    SweepReport report;

    for (const TaskState& state : m_registry.getAll()) {
        ++report.examined;

        if (!isOrphan(state, now)) {
            continue;
        }

        if (m_settings.exemptActiveTransfers && state.lastActivityAt &&
            now - *state.lastActivityAt <= m_settings.orphanThreshold) {
            Logger::instance().debug("Task {} has made no progress but is still transferring, not reaping",
                                     state.taskId);
            ++report.exempted;
            continue;
        }

        try {
            reap(state, report);
        } catch (const std::exception& e) {
            ++report.errors;
            Logger::instance().error("Reaping task {} failed: {}", state.taskId, e.what());
        }
    }

    if (report.removed > 0 || report.reaped > 0 || report.errors > 0) {
        Logger::instance().info("Orphan sweep: {} examined, {} removed, {} reaped, {} error(s)",
                                report.examined, report.removed, report.reaped, report.errors);
    }
    return report;
}

void OrphanReaper::reap(const TaskState& state, SweepReport& report) {
    const std::string& id = state.taskId;
    Logger::instance().warn("Task {} looks orphaned (running with no progress since {}), cancelling",
                            id, utils::StringUtils::formatIsoTimestamp(*state.startedAt));

    m_cancellation.signal(id);
    bool stopped = m_executor.awaitTermination(id, m_settings.reaperGrace);

    auto current = m_registry.get(id);
    if (!current || current->generation != state.generation) {
        // Cleaned up or restarted while we waited
        return;
    }

    if (current->isTerminal()) {
        if (m_registry.remove(id) == RemoveResult::Ok) {
            m_bridge.forget(id);
            ++report.removed;
            Logger::instance().info("Orphaned task {} stopped as {} and was removed",
                                    id, taskStatusToString(current->status));
        }
        return;
    }

    ErrorDetail detail;
    detail.code = error_codes::Reaped;
    detail.message = stopped
        ? "No progress within the orphan threshold"
        : "No progress within the orphan threshold; executor did not stop within the grace period";
    detail.item = current->currentItem;

    auto failed = m_registry.upsert(id, state.generation, [&](TaskState& s) {
        s.status = TaskStatus::Failed;
        s.errorDetail = detail;
        s.transferRate = 0.0;
    });

    if (!failed) {
        // Went terminal after the re-read; left for cleanup
        return;
    }

    ++report.reaped;
    Logger::instance().error("Task {} reaped: {}", id, detail.message);
    m_bridge.publish(*failed);
}

void OrphanReaper::start() {
    if (m_running.exchange(true)) {
        return;
    }

    m_thread = std::thread([this] { loop(); });
    Logger::instance().debug("Orphan reaper started (threshold {}ms, every {}ms)",
                             m_settings.orphanThreshold.count(), m_settings.sweepInterval.count());
}

void OrphanReaper::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running.exchange(false)) {
            return;
        }
    }
    m_condition.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void OrphanReaper::loop() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (m_running) {
        m_condition.wait_for(lock, m_settings.sweepInterval, [this] { return !m_running.load(); });
        if (!m_running) {
            break;
        }

        lock.unlock();
        sweep(Clock::now());
        lock.lock();
    }
}

} // namespace collector::core::tasks
