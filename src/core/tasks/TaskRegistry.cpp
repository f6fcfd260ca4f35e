#include "TaskRegistry.hpp"
#include "../Logger.hpp"

#include <algorithm>

namespace collector::core::tasks {

TaskRegistry::Shard& TaskRegistry::shardFor(const std::string& id) {
    return m_shards[std::hash<std::string>{}(id) % kShardCount];
}

const TaskRegistry::Shard& TaskRegistry::shardFor(const std::string& id) const {
    return m_shards[std::hash<std::string>{}(id) % kShardCount];
}

std::optional<TaskState> TaskRegistry::insertFresh(const std::string& id) {
    Shard& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(id);
    if (it != shard.entries.end() && it->second.isLive()) {
        return std::nullopt;
    }

    TaskState fresh;
    fresh.taskId = id;
    fresh.generation = ++m_nextGeneration;
    fresh.revision = ++m_nextRevision;
    fresh.status = TaskStatus::Pending;

    if (it != shard.entries.end()) {
        Logger::instance().debug("Replacing terminal entry {} ({}) with generation {}",
                                 id, taskStatusToString(it->second.status), fresh.generation);
        it->second = fresh;
    } else {
        shard.entries.emplace(id, fresh);
    }

    return fresh;
}

std::optional<TaskState> TaskRegistry::upsert(const std::string& id, uint64_t generation,
                                              const Mutation& mutation) {
    Shard& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(id);
    if (it == shard.entries.end() || it->second.generation != generation) {
        return std::nullopt;
    }

    TaskState& current = it->second;
    if (current.isTerminal()) {
        return std::nullopt;
    }

    TaskState next = current;
    mutation(next);
    enforceInvariants(current, next);
    next.revision = ++m_nextRevision;
    current = std::move(next);

    return current;
}

std::optional<TaskState> TaskRegistry::get(const std::string& id) const {
    const Shard& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(id);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TaskState> TaskRegistry::getAll() const {
    std::vector<TaskState> result;

    for (const Shard& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [id, state] : shard.entries) {
            result.push_back(state);
        }
    }

    std::sort(result.begin(), result.end(), [](const TaskState& a, const TaskState& b) {
        return a.taskId < b.taskId;
    });
    return result;
}

RemoveResult TaskRegistry::remove(const std::string& id) {
    Shard& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.entries.find(id);
    if (it == shard.entries.end()) {
        return RemoveResult::NotFound;
    }
    if (it->second.isLive()) {
        return RemoveResult::StillRunning;
    }

    shard.entries.erase(it);
    return RemoveResult::Ok;
}

size_t TaskRegistry::size() const {
    size_t total = 0;
    for (const Shard& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

void TaskRegistry::enforceInvariants(const TaskState& before, TaskState& after) {
    after.taskId = before.taskId;
    after.generation = before.generation;

    // Running never falls back to Pending
    if (before.status == TaskStatus::Running && after.status == TaskStatus::Pending) {
        after.status = TaskStatus::Running;
    }

    if (after.status == TaskStatus::Running && !after.startedAt) {
        after.startedAt = nowMillis();
    }

    if (after.status == TaskStatus::Completed) {
        after.progressPercent = 100;
    } else {
        after.progressPercent = std::clamp(std::max(after.progressPercent, before.progressPercent), 0, 99);
    }

    if (after.isTerminal()) {
        if (!after.completedAt) {
            after.completedAt = nowMillis();
        }
    } else {
        after.completedAt.reset();
    }

    if (after.totalBytes && after.transferredBytes > *after.totalBytes) {
        after.totalBytes = after.transferredBytes;
    }
    if (after.completedItems > after.totalItems) {
        after.totalItems = after.completedItems;
    }
    if (after.transferRate < 0.0) {
        after.transferRate = 0.0;
    }
}

} // namespace collector::core::tasks
