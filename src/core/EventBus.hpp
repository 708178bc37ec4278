#pragma once

/**
 * EventBus.hpp
 *
 * Thread-safe event bus between the queue engine and the presentation layer.
 * Supports publish/subscribe with JSON payloads.
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace soulsync::core {

using json = nlohmann::json;
using EventCallback = std::function<void(const json&)>;

/**
 * Event names published by the engine
 */
namespace events {
    inline constexpr const char* QueueUpdated = "queue.updated";
    inline constexpr const char* QueueSizeChanged = "queue.size_changed";
    inline constexpr const char* DownloadCancelled = "download.cancelled";
    inline constexpr const char* DownloadRetried = "download.retried";
    inline constexpr const char* DownloadOrganized = "download.organized";
    inline constexpr const char* QueueCleared = "queue.cleared";
}

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
 * EventBus - Thread-safe publish/subscribe event system
 *
 * Callbacks run on the publishing thread, outside the bus lock. A subscriber
 * that needs a specific thread (a UI loop) must marshal the payload itself.
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

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

    /**
     * Unsubscribe from an event
     * @param subscription Subscription handle
     */
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
        std::vector<std::pair<EventCallback, SubscriptionPtr>> callbacks;

        {
            std::lock_guard<std::mutex> lock(m_mutex);

            auto it = m_subscribers.find(event);
            if (it != m_subscribers.end()) {
                for (const auto& entry : it->second) {
                    if (entry.subscription->isActive()) {
                        callbacks.emplace_back(entry.callback, entry.subscription);
                    }
                }
            }
        }

        for (const auto& [callback, subscription] : callbacks) {
            if (!subscription->isActive()) continue;
            try {
                callback(data);
            } catch (const std::exception& e) {
                Logger::instance().error("Subscriber of '{}' threw: {}", event, e.what());
            }
        }
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

} // namespace soulsync::core
