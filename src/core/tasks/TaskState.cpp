#include "TaskState.hpp"
#include "../../utils/StringUtils.hpp"

#include <stdexcept>

namespace collector::core::tasks {

using utils::StringUtils;

TimePoint nowMillis() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

std::string taskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Cancelled: return "cancelled";
        case TaskStatus::Failed:    return "failed";
    }
    return "pending";
}

TaskStatus stringToTaskStatus(const std::string& str) {
    if (str == "pending") return TaskStatus::Pending;
    if (str == "running") return TaskStatus::Running;
    if (str == "completed") return TaskStatus::Completed;
    if (str == "cancelled") return TaskStatus::Cancelled;
    if (str == "failed") return TaskStatus::Failed;
    throw std::invalid_argument("Unknown task status: " + str);
}

namespace {

nlohmann::json timeToJson(const std::optional<TimePoint>& time) {
    if (!time) return nullptr;
    return StringUtils::formatIsoTimestamp(*time);
}

std::optional<TimePoint> timeFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    auto parsed = StringUtils::parseIsoTimestamp(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("Malformed timestamp in ") + key);
    }
    return parsed;
}

template<typename T>
std::optional<T> optionalFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<T>();
}

} // namespace

// -- ErrorDetail --

nlohmann::json ErrorDetail::toJson() const {
    return {
        {"code", code},
        {"message", message},
        {"item", item ? nlohmann::json(*item) : nlohmann::json(nullptr)},
        {"attempts", attempts}
    };
}

ErrorDetail ErrorDetail::fromJson(const nlohmann::json& j) {
    ErrorDetail detail;
    detail.code = j.value("code", "");
    detail.message = j.value("message", "");
    detail.item = optionalFromJson<std::string>(j, "item");
    detail.attempts = j.value("attempts", 0);
    return detail;
}

// -- JobSpec --

nlohmann::json JobSpec::toJson() const {
    return {
        {"source", source},
        {"destination", destination},
        {"label", label}
    };
}

JobSpec JobSpec::fromJson(const nlohmann::json& j) {
    JobSpec spec;
    spec.source = j.at("source").get<std::string>();
    spec.destination = j.at("destination").get<std::string>();
    spec.label = j.value("label", "");
    return spec;
}

// -- TaskState --

nlohmann::json TaskState::toJson() const {
    return {
        {"task_id", taskId},
        {"status", taskStatusToString(status)},
        {"progress_percent", progressPercent},
        {"total_bytes", totalBytes ? nlohmann::json(*totalBytes) : nlohmann::json(nullptr)},
        {"transferred_bytes", transferredBytes},
        {"transfer_rate", transferRate},
        {"current_item", currentItem ? nlohmann::json(*currentItem) : nlohmann::json(nullptr)},
        {"total_items", totalItems},
        {"completed_items", completedItems},
        {"error_detail", errorDetail ? errorDetail->toJson() : nlohmann::json(nullptr)},
        {"started_at", timeToJson(startedAt)},
        {"completed_at", timeToJson(completedAt)}
    };
}

TaskState TaskState::fromJson(const nlohmann::json& j) {
    TaskState state;
    state.taskId = j.at("task_id").get<std::string>();
    state.status = stringToTaskStatus(j.at("status").get<std::string>());
    state.progressPercent = j.value("progress_percent", 0);
    state.totalBytes = optionalFromJson<uint64_t>(j, "total_bytes");
    state.transferredBytes = j.value("transferred_bytes", uint64_t{0});
    state.transferRate = j.value("transfer_rate", 0.0);
    state.currentItem = optionalFromJson<std::string>(j, "current_item");
    state.totalItems = j.value("total_items", uint64_t{0});
    state.completedItems = j.value("completed_items", uint64_t{0});
    if (j.contains("error_detail") && !j.at("error_detail").is_null()) {
        state.errorDetail = ErrorDetail::fromJson(j.at("error_detail"));
    }
    state.startedAt = timeFromJson(j, "started_at");
    state.completedAt = timeFromJson(j, "completed_at");
    return state;
}

} // namespace collector::core::tasks
