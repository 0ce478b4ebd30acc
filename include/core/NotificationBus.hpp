// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_NOTIFICATION_BUS_HPP
#define LANWATCH_NOTIFICATION_BUS_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include "rxcpp/rx.hpp"

#include "core/NotificationChannel.hpp"

namespace Lanwatch::Core {

    /**
     * @brief Egy kimenő esemény a buszon
     */
    struct Notification {
        std::string event;
        Json::Value payload;
    };

    /**
     * @brief In-process megfigyelő busz.
     * Facade pattern: elrejti a belső Rx subjectet a külvilág elől; a push csatorna
     * (websocket/SSE adapter) egyszerűen feliratkozik rá.
     */
    class NotificationBus : public NotificationChannel {
    private:
        rxcpp::subjects::subject<Notification> bus;

        // A subscriber on_next nem szálbiztos, egyszerre egy publikáló
        std::mutex publishMutex;

        rxcpp::composite_subscription lifetime;
        std::atomic<uint64_t> published{0};

    public:
        NotificationBus() = default;
        ~NotificationBus() override;

        void notifyAll(const std::string& event, const Json::Value& payload) override;

        // Feliratkozás; a visszaadott subscription-nel egyenként le is iratkozhat
        rxcpp::composite_subscription observe(std::function<void(const Notification&)> observer);

        // Minden megfigyelő leválasztása
        void close();

        [[nodiscard]] uint64_t publishedCount() const { return published.load(); }
    };
}

#endif
