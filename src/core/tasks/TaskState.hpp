#pragma once

/**
 * TaskState.hpp
 *
 * Per-task progress record, job description and their JSON wire shape.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace collector::core::tasks {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * Current wall time truncated to milliseconds, the precision the
 * wire format carries.
 */
TimePoint nowMillis();

enum class TaskStatus {
    Pending,
    Running,
    Completed,
    Cancelled,
    Failed
};

std::string taskStatusToString(TaskStatus status);
TaskStatus stringToTaskStatus(const std::string& str);

inline bool isTerminal(TaskStatus status) {
    return status == TaskStatus::Completed ||
           status == TaskStatus::Cancelled ||
           status == TaskStatus::Failed;
}

// ErrorDetail codes
namespace error_codes {
    inline constexpr const char* Fatal = "fatal";
    inline constexpr const char* RetriesExhausted = "retries_exhausted";
    inline constexpr const char* Reaped = "reaped";
    inline constexpr const char* Internal = "internal";
}

struct ErrorDetail {
    std::string code;
    std::string message;
    std::optional<std::string> item;
    int attempts = 0;

    bool operator==(const ErrorDetail& other) const {
        return code == other.code && message == other.message &&
               item == other.item && attempts == other.attempts;
    }

    nlohmann::json toJson() const;
    static ErrorDetail fromJson(const nlohmann::json& j);
};

/**
 * What to transfer. `source` is a locator understood by the transfer
 * factory (s3://bucket/prefix, file:///dir or a plain directory path);
 * `destination` is the local root the items are written below.
 */
struct JobSpec {
    std::string source;
    std::string destination;
    std::string label;

    nlohmann::json toJson() const;
    static JobSpec fromJson(const nlohmann::json& j);
};

/**
 * Snapshot of one task as held by the registry.
 *
 * `generation` identifies which start() produced the entry; writes carry
 * it so a stale executor can never touch a newer entry of the same id.
 * `revision` grows with every committed change across the registry and
 * orders published snapshots. `lastActivityAt` is refreshed by in-flight
 * byte activity and is only consulted by the orphan reaper. None of the
 * three is part of the wire shape.
 */
struct TaskState {
    std::string taskId;
    uint64_t generation = 0;
    uint64_t revision = 0;

    TaskStatus status = TaskStatus::Pending;
    int progressPercent = 0;

    std::optional<uint64_t> totalBytes;
    uint64_t transferredBytes = 0;
    double transferRate = 0.0;

    std::optional<std::string> currentItem;
    uint64_t totalItems = 0;
    uint64_t completedItems = 0;

    std::optional<ErrorDetail> errorDetail;

    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
    std::optional<TimePoint> lastActivityAt;

    bool isTerminal() const { return tasks::isTerminal(status); }
    bool isLive() const { return !isTerminal(); }

    nlohmann::json toJson() const;
    static TaskState fromJson(const nlohmann::json& j);
};

} // namespace collector::core::tasks
