#include "events/EventBus.hpp"
#include "util/Logger.hpp"

#include <algorithm>

namespace cadence::events {

EventBus::SubscriptionId EventBus::subscribe(Event::Type type, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_[type].push_back({id, std::move(handler)});
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [type, subs] : subscribers_) {
        std::erase_if(subs, [id](const Subscription& s) { return s.id == id; });
    }
}

void EventBus::publish(const Event& event) {
    util::Logger::debug("EventBus: Publishing event " + std::to_string(static_cast<int>(event.type)));

    // Copied so a handler may subscribe or unsubscribe while running
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(event.type);
        if (it != subscribers_.end()) {
            for (const auto& sub : it->second) {
                handlers.push_back(sub.handler);
            }
        }
    }

    for (const auto& handler : handlers) {
        handler(event);
    }
}

}  // namespace cadence::events
