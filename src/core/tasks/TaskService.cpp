#include "TaskService.hpp"
#include "../Logger.hpp"

#include <thread>

namespace collector::core::tasks {

std::string cancelResultToString(CancelResult result) {
    switch (result) {
        case CancelResult::Ok:       return "ok";
        case CancelResult::NotFound: return "not_found";
        default:                     return "unknown";
    }
}

std::string cleanupResultToString(CleanupResult result) {
    switch (result) {
        case CleanupResult::Ok:           return "ok";
        case CleanupResult::NotFound:     return "not_found";
        case CleanupResult::StillRunning: return "still_running";
        default:                          return "unknown";
    }
}

TaskService::TaskService(TaskSettings settings,
                         transfer::TransferFactory transferFactory,
                         transfer::WriterFactory writerFactory,
                         EventBus& bus)
    : m_settings(std::move(settings))
    , m_bridge(m_registry, bus)
    , m_executor(m_registry, m_cancellation, m_bridge, m_settings,
                 std::move(transferFactory), std::move(writerFactory))
    , m_reaper(m_registry, m_cancellation, m_executor, m_bridge, m_settings) {
}

TaskService::~TaskService() {
    shutdown();
}

StartResult TaskService::startTask(const std::string& id, const JobSpec& spec) {
    return m_executor.start(id, spec);
}

std::optional<TaskState> TaskService::getProgress(const std::string& id) const {
    return m_bridge.snapshot(id);
}

std::vector<TaskState> TaskService::getAllProgress() const {
    return m_bridge.snapshotAll();
}

CancelResult TaskService::cancelTask(const std::string& id) {
    auto state = m_registry.get(id);
    if (!state) {
        return CancelResult::NotFound;
    }

    if (state->isTerminal()) {
        Logger::instance().debug("Cancel of {} ignored, already {}", id, taskStatusToString(state->status));
        return CancelResult::Ok;
    }

    // NotFound here means the run released its token after the read above
    if (m_cancellation.signal(id) == SignalResult::Ok) {
        Logger::instance().info("Cancellation requested for {}", id);
    }
    return CancelResult::Ok;
}

size_t TaskService::cancelAll() {
    size_t signaled = 0;
    for (const TaskState& state : m_registry.getAll()) {
        if (state.isLive() && m_cancellation.signal(state.taskId) == SignalResult::Ok) {
            ++signaled;
        }
    }
    Logger::instance().info("Cancellation requested for {} task(s)", signaled);
    return signaled;
}

CleanupResult TaskService::cleanupTask(const std::string& id) {
    switch (m_registry.remove(id)) {
        case RemoveResult::Ok:
            m_bridge.forget(id);
            Logger::instance().info("Task {} cleaned up", id);
            return CleanupResult::Ok;
        case RemoveResult::StillRunning:
            Logger::instance().warn("Cleanup of {} refused, task is still live", id);
            return CleanupResult::StillRunning;
        case RemoveResult::NotFound:
        default:
            return CleanupResult::NotFound;
    }
}

std::unique_ptr<EventStream> TaskService::subscribe(size_t capacity) {
    return m_bridge.subscribe(capacity);
}

TaskListener TaskService::listen(TaskEventCallback callback) {
    return m_bridge.listen(std::move(callback));
}

void TaskService::unlisten(const TaskListener& listener) {
    m_bridge.unlisten(listener);
}

bool TaskService::waitForIdle(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        bool live = false;
        for (const TaskState& state : m_registry.getAll()) {
            if (state.isLive()) {
                live = true;
                break;
            }
        }
        if (!live) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void TaskService::startReaper() {
    m_reaper.start();
}

void TaskService::shutdown() {
    m_reaper.stop();
    m_executor.shutdown();
}

} // namespace collector::core::tasks
