#pragma once

/**
 * TaskRegistry.hpp
 *
 * Concurrent map of task id -> TaskState. Single source of truth for
 * every observer; the push path only ever mirrors what is stored here.
 */

#include "TaskState.hpp"

#include <array>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace collector::core::tasks {

enum class RemoveResult {
    Ok,
    NotFound,
    StillRunning
};

/**
 * TaskRegistry - sharded lock table
 *
 * Ids hash onto a fixed number of shards, each with its own mutex, so
 * writers for unrelated ids do not serialize behind one lock. All
 * mutations of one id happen under its shard lock, which gives a total
 * order per id.
 *
 * The registry enforces the record invariants itself:
 * - a terminal status is never changed; mutations of a terminal entry
 *   are rejected
 * - progressPercent never decreases and stays below 100 unless the
 *   status is Completed (Completed forces 100)
 * - completedAt is stamped exactly once, on the terminal transition
 * - transferredBytes never exceeds a known totalBytes
 */
class TaskRegistry {
public:
    using Mutation = std::function<void(TaskState&)>;

    TaskRegistry() = default;

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * Install a fresh Pending entry for id.
     * Succeeds when no entry exists or the existing one is terminal (it is
     * replaced wholesale by a new generation).
     * @return The new entry, or nullopt if a live entry already exists
     */
    std::optional<TaskState> insertFresh(const std::string& id);

    /**
     * Apply a mutation to the entry of the given generation.
     * The mutation runs under the shard lock and must not call back into
     * the registry.
     * @return Post-mutation snapshot, or nullopt if the entry is missing,
     *         belongs to another generation or is already terminal
     */
    std::optional<TaskState> upsert(const std::string& id, uint64_t generation,
                                    const Mutation& mutation);

    std::optional<TaskState> get(const std::string& id) const;

    /**
     * Snapshot of all entries, ordered by task id
     */
    std::vector<TaskState> getAll() const;

    /**
     * Remove a terminal entry. Live entries are refused with StillRunning.
     */
    RemoveResult remove(const std::string& id);

    size_t size() const;

private:
    static constexpr size_t kShardCount = 16;

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, TaskState> entries;
    };

    Shard& shardFor(const std::string& id);
    const Shard& shardFor(const std::string& id) const;

    static void enforceInvariants(const TaskState& before, TaskState& after);

    std::array<Shard, kShardCount> m_shards;
    std::atomic<uint64_t> m_nextGeneration{0};
    std::atomic<uint64_t> m_nextRevision{0};
};

} // namespace collector::core::tasks
