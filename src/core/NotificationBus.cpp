// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "core/NotificationBus.hpp"

namespace Lanwatch::Core {

    NotificationBus::~NotificationBus() {
        close();
    }

    void NotificationBus::notifyAll(const std::string& event, const Json::Value& payload) {
        std::lock_guard<std::mutex> lock(publishMutex);
        published++;
        bus.get_subscriber().on_next(Notification{event, payload});
    }

    rxcpp::composite_subscription NotificationBus::observe(std::function<void(const Notification&)> observer) {
        rxcpp::composite_subscription subscription;
        lifetime.add(subscription);

        bus.get_observable()
            .subscribe(subscription, [observer](const Notification& n) {
                observer(n);
            });

        return subscription;
    }

    void NotificationBus::close() {
        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }
    }

} // namespace Lanwatch::Core
