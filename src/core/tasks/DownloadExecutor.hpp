#pragma once

/**
 * DownloadExecutor.hpp
 *
 * Runs one job per task id on its own thread, driving a transfer
 * capability item by item and recording progress in the registry.
 */

#include "CancellationController.hpp"
#include "RateMeter.hpp"
#include "TaskBridge.hpp"
#include "TaskRegistry.hpp"
#include "TaskSettings.hpp"
#include "../transfer/TransferCapability.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace collector::core::tasks {

enum class StartResult {
    Accepted,
    AlreadyRunning
};

std::string startResultToString(StartResult result);

/**
 * DownloadExecutor
 *
 * Run loop of one job:
 * - resolve the capability and list the items (retried like a unit)
 * - Pending -> Running with item count and byte total
 * - per item: check the cancellation token, fetch into a fresh writer
 *   with bounded retries, then apply the item's bytes and count in one
 *   registry update
 * - finish as Completed, Cancelled or Failed, publish the completed
 *   event and release the token
 *
 * Byte counters only move when an item commits, so a cancelled or
 * failed item contributes nothing. While an item is in flight, rate and
 * activity time are refreshed at most once per progressInterval.
 *
 * Every write carries the generation issued at start; when the registry
 * rejects one (entry reaped, cleaned up or replaced) the run stops
 * without touching state again.
 */
class DownloadExecutor {
public:
    DownloadExecutor(TaskRegistry& registry,
                     CancellationController& cancellation,
                     TaskBridge& bridge,
                     TaskSettings settings,
                     transfer::TransferFactory transferFactory,
                     transfer::WriterFactory writerFactory);

    /**
     * Cancels and joins everything still running
     */
    ~DownloadExecutor();

    DownloadExecutor(const DownloadExecutor&) = delete;
    DownloadExecutor& operator=(const DownloadExecutor&) = delete;

    /**
     * Register a Pending entry for id, publish it and launch its run.
     * The run does not touch the entry before the Pending event is out.
     * @throws std::runtime_error after shutdown()
     * @throws std::system_error if no thread could be started; the entry
     *         is then left Failed with code "internal"
     */
    StartResult start(const std::string& id, const JobSpec& spec);

    /**
     * Wait until the run currently owning id has returned.
     * @return true if it returned within `timeout` (or nothing runs for id)
     */
    bool awaitTermination(const std::string& id, std::chrono::milliseconds timeout);

    /**
     * Signal every run and wait for all of them to return. Idempotent.
     */
    void shutdown();

    /**
     * Number of runs that have not returned yet
     */
    size_t activeCount() const;

    const TaskSettings& settings() const { return m_settings; }

private:
    struct RunContext {
        std::string id;
        uint64_t generation = 0;
        JobSpec spec;
        CancellationTokenPtr token;

        RateMeter rate;
        RateMeter::SteadyClock::time_point lastReport{};

        std::optional<uint64_t> totalBytes;
        uint64_t totalItems = 0;
        uint64_t transferredBytes = 0;
        uint64_t completedItems = 0;

        // Item being worked on and attempts spent on it, for errorDetail
        std::optional<std::string> item;
        int attempts = 0;

        bool abandoned = false;

        explicit RunContext(std::chrono::milliseconds rateWindow) : rate(rateWindow) {}
    };

    struct Handle {
        uint64_t generation = 0;
        std::shared_future<void> done;
    };

    void run(RunContext& ctx);
    void execute(RunContext& ctx, transfer::TransferCapability& capability);

    /**
     * Call `attempt` until it succeeds, retrying TransientTransferError
     * with backoff.
     * @return false if cancellation was signaled during a backoff wait
     * @throws RetriesExhaustedError once retryLimit retries have failed
     */
    bool withRetry(RunContext& ctx, const std::function<void()>& attempt);

    uint64_t fetchOnce(RunContext& ctx, transfer::TransferCapability& capability,
                       const transfer::TransferItem& item, const std::filesystem::path& target);

    void reportActivity(RunContext& ctx, uint64_t inFlightBytes);
    int percentOf(const RunContext& ctx) const;

    /**
     * Apply a mutation for this run and publish the result.
     * @return false (and marks the run abandoned) if the registry refused it
     */
    bool update(RunContext& ctx, const TaskRegistry::Mutation& mutation);

    void finishCompleted(RunContext& ctx);
    void finishCancelled(RunContext& ctx);
    void finishFailed(RunContext& ctx, const std::string& code, const std::string& message);

    void pruneHandles();
    std::shared_future<void> launch(std::shared_ptr<RunContext> ctx, std::shared_future<void> published);

    TaskRegistry& m_registry;
    CancellationController& m_cancellation;
    TaskBridge& m_bridge;
    TaskSettings m_settings;
    transfer::TransferFactory m_transferFactory;
    transfer::WriterFactory m_writerFactory;

    mutable std::mutex m_startMutex;
    std::unordered_map<std::string, Handle> m_handles;
    // Runs whose id was restarted while they were still unwinding
    std::vector<std::shared_future<void>> m_retired;
    bool m_stopped = false;
};

} // namespace collector::core::tasks
