#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace chordrelay {

using EventHandler = std::function<void(const Event&)>;

// Synchronous in-process fan-out of turn lifecycle events.
class EventBus {
public:
    // Tag that matches every published event.
    static constexpr const char* kAnyTag = "*";

    // Subscribe to events with a given tag. Subscriptions last as long as the bus.
    void subscribe(const std::string& tag, EventHandler handler);

    // Publish an event synchronously: tag subscribers first, then wildcard
    // subscribers, each group in registration order. Handlers run without
    // the bus lock held.
    void publish(const Event& event);

private:
    void collect(const std::string& tag, std::vector<EventHandler>& out) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<EventHandler>> handlers_;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
void subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Publish only when a bus is wired in.
inline void publish_if(EventBus* bus, const Event& event) {
    if (bus) bus->publish(event);
}

} // namespace chordrelay
