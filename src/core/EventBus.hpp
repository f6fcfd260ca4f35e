#pragma once

/**
 * EventBus.hpp
 *
 * Thread-safe event bus for decoupled communication between components.
 * Named events carry JSON payloads; task progress is published here and
 * consumed by the task bridge.
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <functional>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <string>
#include <memory>
#include <atomic>

namespace collector::core {

using json = nlohmann::json;
using EventCallback = std::function<void(const json&)>;

/**
 * Event subscription handle
 */
class Subscription {
public:
    Subscription(uint64_t id, const std::string& event)
        : m_id(id), m_event(event), m_active(true) {}

    uint64_t getId() const { return m_id; }
    const std::string& getEvent() const { return m_event; }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::string m_event;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * EventBus - publish/subscribe with JSON payloads
 *
 * Callbacks run synchronously on the emitting thread, outside the bus
 * lock, in subscription order. A subscriber that throws is logged and
 * skipped; the remaining subscribers still receive the event.
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * Process-wide bus used by the application
     */
    static EventBus& instance() {
        static EventBus instance;
        return instance;
    }

    /**
     * Subscribe to an event
     * @param event Event name
     * @param callback Callback function
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(const std::string& event, EventCallback callback) {
        std::lock_guard<std::mutex> lock(m_mutex);

        uint64_t id = m_nextId++;
        auto subscription = std::make_shared<Subscription>(id, event);

        m_subscribers[event].push_back({id, std::move(callback), subscription});

        return subscription;
    }

    void unsubscribe(const SubscriptionPtr& subscription) {
        if (!subscription) return;

        subscription->cancel();

        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_subscribers.find(subscription->getEvent());
        if (it == m_subscribers.end()) return;

        auto& subscribers = it->second;
        subscribers.erase(
            std::remove_if(subscribers.begin(), subscribers.end(),
                [id = subscription->getId()](const SubscriberEntry& entry) {
                    return entry.id == id;
                }),
            subscribers.end()
        );
    }

    /**
     * Emit an event
     * @param event Event name
     * @param data Event data
     */
    void emit(const std::string& event, const json& data = json::object()) {
        std::vector<std::pair<SubscriptionPtr, EventCallback>> callbacks;

        {
            std::lock_guard<std::mutex> lock(m_mutex);

            auto it = m_subscribers.find(event);
            if (it != m_subscribers.end()) {
                for (const auto& entry : it->second) {
                    if (entry.subscription->isActive()) {
                        callbacks.emplace_back(entry.subscription, entry.callback);
                    }
                }
            }
        }

        // Call callbacks outside of lock
        for (const auto& [subscription, callback] : callbacks) {
            if (!subscription->isActive()) continue;
            try {
                callback(data);
            } catch (const std::exception& e) {
                Logger::instance().error("Subscriber of '{}' threw: {}", event, e.what());
            }
        }
    }

    size_t getSubscriberCount(const std::string& event) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_subscribers.find(event);
        return it != m_subscribers.end() ? it->second.size() : 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscribers.clear();
    }

private:
    struct SubscriberEntry {
        uint64_t id;
        EventCallback callback;
        SubscriptionPtr subscription;
    };

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::vector<SubscriberEntry>> m_subscribers;
    std::atomic<uint64_t> m_nextId{0};
};

} // namespace collector::core
