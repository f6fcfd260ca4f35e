#pragma once

/**
 * OrphanReaper.hpp
 *
 * Periodic sweep for tasks that sit in Running without ever moving.
 */

#include "CancellationController.hpp"
#include "DownloadExecutor.hpp"
#include "TaskBridge.hpp"
#include "TaskRegistry.hpp"
#include "TaskSettings.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace collector::core::tasks {

struct SweepReport {
    size_t examined = 0;
    size_t exempted = 0;
    size_t removed = 0;  // executor stopped within the grace period
    size_t reaped = 0;   // force-marked Failed with code "reaped"
    size_t errors = 0;
};

/**
 * OrphanReaper
 *
 * A task is an orphan when it is Running, started more than
 * orphanThreshold before `now` and still reports 0% progress. With
 * exemptActiveTransfers set, a task whose last in-flight byte activity
 * lies within the threshold is left alone (a single large item that is
 * still moving).
 *
 * For each orphan: signal its token, wait up to reaperGrace for its run
 * to return, then remove the entry if it reached a terminal state or
 * mark it Failed ("reaped") otherwise. A failure on one id is logged and
 * the sweep moves on.
 */
class OrphanReaper {
public:
    OrphanReaper(TaskRegistry& registry,
                 CancellationController& cancellation,
                 DownloadExecutor& executor,
                 TaskBridge& bridge,
                 TaskSettings settings);
    ~OrphanReaper();

    OrphanReaper(const OrphanReaper&) = delete;
    OrphanReaper& operator=(const OrphanReaper&) = delete;

    SweepReport sweep(TimePoint now);

    bool isOrphan(const TaskState& state, TimePoint now) const;

    /**
     * Run sweep() every sweepInterval on a background thread
     */
    void start();
    void stop();
    bool isRunning() const { return m_running.load(); }

private:
    void reap(const TaskState& state, SweepReport& report);
    void loop();

    TaskRegistry& m_registry;
    CancellationController& m_cancellation;
    DownloadExecutor& m_executor;
    TaskBridge& m_bridge;
    TaskSettings m_settings;

    std::thread m_thread;
    std::mutex m_mutex;
    std::condition_variable m_condition;
    std::atomic<bool> m_running{false};
};

} // namespace collector::core::tasks
