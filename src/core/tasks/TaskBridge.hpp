#pragma once

/**
 * TaskBridge.hpp
 *
 * Push and pull access to task state for observers. Push goes through
 * the EventBus and may be lost; pull reads the registry directly and is
 * what a reconnecting observer reconciles against.
 */

#include "TaskRegistry.hpp"
#include "../EventBus.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace collector::core::tasks {

namespace events {
    inline constexpr const char* Progress = "download-progress";
    inline constexpr const char* Completed = "download-completed";
}

struct TaskEvent {
    enum class Kind {
        Progress,
        Completed
    };

    Kind kind = Kind::Progress;
    TaskState state;
};

/**
 * One observer's view of the event stream.
 *
 * Events are buffered up to `capacity`; when an observer falls behind,
 * the oldest buffered events are dropped (and counted), never the
 * publisher blocked. Destroying the stream unsubscribes it. A new
 * subscription only sees events published after it was made, so
 * observers pair it with TaskBridge::snapshotAll().
 */
class EventStream {
public:
    EventStream(EventBus& bus, size_t capacity);
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /**
     * Wait up to `timeout` for the next event
     * @return The event, or nullopt on timeout or once closed and drained
     */
    std::optional<TaskEvent> next(std::chrono::milliseconds timeout);

    /**
     * Stop receiving; wakes any blocked next()
     */
    void close();

    bool isClosed() const;
    uint64_t dropped() const;

private:
    struct Channel {
        mutable std::mutex mutex;
        std::condition_variable condition;
        std::deque<TaskEvent> events;
        size_t capacity = 0;
        uint64_t dropped = 0;
        bool closed = false;

        void push(TaskEvent event);
    };

    EventBus& m_bus;
    std::shared_ptr<Channel> m_channel;
    SubscriptionPtr m_progressSubscription;
    SubscriptionPtr m_completedSubscription;
};

using TaskEventCallback = std::function<void(const TaskEvent&)>;

/**
 * Pair of bus subscriptions made by TaskBridge::listen()
 */
struct TaskListener {
    SubscriptionPtr progress;
    SubscriptionPtr completed;
};

class TaskBridge {
public:
    static constexpr size_t kDefaultStreamCapacity = 1024;

    TaskBridge(const TaskRegistry& registry, EventBus& bus);

    TaskBridge(const TaskBridge&) = delete;
    TaskBridge& operator=(const TaskBridge&) = delete;

    /**
     * Emit `state` as a progress event, or as a completed event when it is
     * terminal. Call only with a snapshot the registry already holds.
     *
     * Publishing is serialized, and a snapshot older (by revision) than
     * the last one emitted for its id is dropped, so observers never see
     * an id move backwards. Snapshots with revision 0 are always emitted.
     * @return false if the snapshot was stale and dropped
     */
    bool publish(const TaskState& state);

    /**
     * Drop the ordering record of a removed id
     */
    void forget(const std::string& id);

    std::unique_ptr<EventStream> subscribe(size_t capacity = kDefaultStreamCapacity);

    /**
     * Callback form of subscribe(). The callback receives both progress
     * and completed events on the publishing thread. It may call back into
     * the task service, but must not block on events another thread has
     * yet to publish.
     */
    TaskListener listen(TaskEventCallback callback);
    void unlisten(const TaskListener& listener);

    std::vector<TaskState> snapshotAll() const;
    std::optional<TaskState> snapshot(const std::string& id) const;

private:
    const TaskRegistry& m_registry;
    EventBus& m_bus;

    // Recursive: a listener may start a task, which publishes again
    std::recursive_mutex m_publishMutex;
    std::unordered_map<std::string, uint64_t> m_lastRevision;
};

} // namespace collector::core::tasks
