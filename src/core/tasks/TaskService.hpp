#pragma once

/**
 * TaskService.hpp
 *
 * Command surface of the task engine. Owns the registry, cancellation
 * controller, bridge, executor and reaper of one engine instance.
 */

#include "CancellationController.hpp"
#include "DownloadExecutor.hpp"
#include "OrphanReaper.hpp"
#include "TaskBridge.hpp"
#include "TaskRegistry.hpp"
#include "TaskSettings.hpp"
#include "../EventBus.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace collector::core::tasks {

enum class CancelResult {
    Ok,
    NotFound
};

enum class CleanupResult {
    Ok,
    NotFound,
    StillRunning
};

std::string cancelResultToString(CancelResult result);
std::string cleanupResultToString(CleanupResult result);

class TaskService {
public:
    TaskService(TaskSettings settings,
                transfer::TransferFactory transferFactory,
                transfer::WriterFactory writerFactory,
                EventBus& bus = EventBus::instance());
    ~TaskService();

    TaskService(const TaskService&) = delete;
    TaskService& operator=(const TaskService&) = delete;

    StartResult startTask(const std::string& id, const JobSpec& spec);
    std::optional<TaskState> getProgress(const std::string& id) const;
    std::vector<TaskState> getAllProgress() const;

    /**
     * Request a cooperative stop. Returns as soon as the request is
     * recorded; a task that is already terminal is left as it is.
     */
    CancelResult cancelTask(const std::string& id);

    /**
     * Cancel every live task
     * @return Number of tasks signaled
     */
    size_t cancelAll();

    /**
     * Remove a terminal task's entry
     */
    CleanupResult cleanupTask(const std::string& id);

    std::unique_ptr<EventStream> subscribe(size_t capacity = TaskBridge::kDefaultStreamCapacity);
    TaskListener listen(TaskEventCallback callback);
    void unlisten(const TaskListener& listener);

    /**
     * Block until no task is live or `timeout` elapses
     * @return true if every task is terminal
     */
    bool waitForIdle(std::chrono::milliseconds timeout) const;

    void startReaper();

    /**
     * Stop the reaper, cancel every live task and join the workers.
     * Idempotent; the service answers queries afterwards but accepts no
     * new tasks.
     */
    void shutdown();

    const TaskSettings& settings() const { return m_settings; }
    OrphanReaper& reaper() { return m_reaper; }
    DownloadExecutor& executor() { return m_executor; }

private:
    TaskSettings m_settings;
    TaskRegistry m_registry;
    CancellationController m_cancellation;
    TaskBridge m_bridge;
    DownloadExecutor m_executor;
    OrphanReaper m_reaper;
};

} // namespace collector::core::tasks
