#include "event_bus.hpp"

namespace chordrelay {

void EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[tag].push_back(std::move(handler));
}

void EventBus::collect(const std::string& tag, std::vector<EventHandler>& out) const {
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return;
    out.insert(out.end(), it->second.begin(), it->second.end());
}

void EventBus::publish(const Event& event) {
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        collect(event.type_tag, to_call);
        collect(kAnyTag, to_call);
    }
    for (const auto& handler : to_call) {
        handler(event);
    }
}

} // namespace chordrelay
