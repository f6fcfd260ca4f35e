#include "TaskBridge.hpp"
#include "../Logger.hpp"

namespace collector::core::tasks {

// -- EventStream --

void EventStream::Channel::push(TaskEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        while (capacity > 0 && events.size() >= capacity) {
            events.pop_front();
            ++dropped;
        }
        events.push_back(std::move(event));
    }
    condition.notify_one();
}

EventStream::EventStream(EventBus& bus, size_t capacity)
    : m_bus(bus)
    , m_channel(std::make_shared<Channel>()) {
    m_channel->capacity = capacity;

    // Callbacks hold the channel, not the stream: the bus may still be
    // delivering a copied callback while the stream is destroyed
    auto channel = m_channel;
    m_progressSubscription = m_bus.subscribe(events::Progress, [channel](const json& payload) {
        channel->push({TaskEvent::Kind::Progress, TaskState::fromJson(payload)});
    });
    m_completedSubscription = m_bus.subscribe(events::Completed, [channel](const json& payload) {
        channel->push({TaskEvent::Kind::Completed, TaskState::fromJson(payload)});
    });
}

EventStream::~EventStream() {
    close();
}

std::optional<TaskEvent> EventStream::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_channel->mutex);
    m_channel->condition.wait_for(lock, timeout, [this] {
        return !m_channel->events.empty() || m_channel->closed;
    });

    if (m_channel->events.empty()) {
        return std::nullopt;
    }

    TaskEvent event = std::move(m_channel->events.front());
    m_channel->events.pop_front();
    return event;
}

void EventStream::close() {
    m_bus.unsubscribe(m_progressSubscription);
    m_bus.unsubscribe(m_completedSubscription);

    {
        std::lock_guard<std::mutex> lock(m_channel->mutex);
        m_channel->closed = true;
    }
    m_channel->condition.notify_all();
}

bool EventStream::isClosed() const {
    std::lock_guard<std::mutex> lock(m_channel->mutex);
    return m_channel->closed;
}

uint64_t EventStream::dropped() const {
    std::lock_guard<std::mutex> lock(m_channel->mutex);
    return m_channel->dropped;
}

// -- TaskBridge --

TaskBridge::TaskBridge(const TaskRegistry& registry, EventBus& bus)
    : m_registry(registry)
    , m_bus(bus) {
}

bool TaskBridge::publish(const TaskState& state) {
    std::lock_guard<std::recursive_mutex> lock(m_publishMutex);

    if (state.revision != 0) {
        uint64_t& last = m_lastRevision[state.taskId];
        if (state.revision <= last) {
            Logger::instance().trace("Dropping stale snapshot of {} (revision {} <= {})",
                                     state.taskId, state.revision, last);
            return false;
        }
        last = state.revision;
    }

    const char* event = state.isTerminal() ? events::Completed : events::Progress;
    Logger::instance().trace("Publishing {} for {} ({}%)", event, state.taskId, state.progressPercent);
    m_bus.emit(event, state.toJson());
    return true;
}

void TaskBridge::forget(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(m_publishMutex);
    m_lastRevision.erase(id);
}

std::unique_ptr<EventStream> TaskBridge::subscribe(size_t capacity) {
    return std::make_unique<EventStream>(m_bus, capacity);
}

TaskListener TaskBridge::listen(TaskEventCallback callback) {
    auto shared = std::make_shared<TaskEventCallback>(std::move(callback));

    TaskListener listener;
    listener.progress = m_bus.subscribe(events::Progress, [shared](const json& payload) {
        (*shared)({TaskEvent::Kind::Progress, TaskState::fromJson(payload)});
    });
    listener.completed = m_bus.subscribe(events::Completed, [shared](const json& payload) {
        (*shared)({TaskEvent::Kind::Completed, TaskState::fromJson(payload)});
    });
    return listener;
}

void TaskBridge::unlisten(const TaskListener& listener) {
    m_bus.unsubscribe(listener.progress);
    m_bus.unsubscribe(listener.completed);
}

std::vector<TaskState> TaskBridge::snapshotAll() const {
    return m_registry.getAll();
}

std::optional<TaskState> TaskBridge::snapshot(const std::string& id) const {
    return m_registry.get(id);
}

} // namespace collector::core::tasks
