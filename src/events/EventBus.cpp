#include "events/EventBus.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace halo::events {

EventBus::SubscriptionId EventBus::subscribe(Event::Type type, Handler handler) {
    halo::util::Logger::debug("EventBus: Subscribing to event type " +
        std::to_string(static_cast<int>(type)));

    SubscriptionId id = next_id_++;
    subscribers_[type].push_back({id, std::move(handler)});
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    for (auto& [type, subs] : subscribers_) {
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [id](const Subscription& s) { return s.id == id; }),
                   subs.end());
    }
}

void EventBus::publish(const Event& event) {
    halo::util::Logger::debug("EventBus: Publishing event type " +
        std::to_string(static_cast<int>(event.type)) + " (generation " +
        std::to_string(event.generation) + ")");

    // Copy handlers so a handler may subscribe or unsubscribe while we dispatch
    std::vector<Subscription> handlers;
    auto it = subscribers_.find(event.type);
    if (it != subscribers_.end()) {
        handlers = it->second;
    }

    for (const auto& sub : handlers) {
        sub.handler(event);
    }
}

}  // namespace halo::events
