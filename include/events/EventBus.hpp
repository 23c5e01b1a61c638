#pragma once

#include "model/OverlayState.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <vector>

namespace halo::events {

struct Event {
    enum class Type {
        Presented,       // is_presented false -> true
        ContentChanged,  // show while already presented
        Dismissed,       // is_presented true -> false
    };
    Type type;
    model::HUDVariant variant = model::HUDVariant::Loading;
    std::uint64_t generation = 0;
};

/**
 * Publish/subscribe channel between the PresentationController and its
 * observers. Lives on the UI thread; handlers run synchronously in
 * subscription order.
 */
class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(Event::Type type, Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(const Event& event);

private:
    struct Subscription {
        SubscriptionId id;
        Handler handler;
    };

    std::map<Event::Type, std::vector<Subscription>> subscribers_;
    SubscriptionId next_id_ = 1;
};

}  // namespace halo::events
