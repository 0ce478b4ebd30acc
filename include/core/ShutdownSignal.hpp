// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_SHUTDOWN_SIGNAL_HPP
#define LANWATCH_SHUTDOWN_SIGNAL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace Lanwatch::Core {

    /**
     * @brief Folyamat-szintű leállítási jel.
     * Minden hosszú életű loop az iterációk között figyeli; a várakozások (batch szünet,
     * backoff) azonnal felébrednek, ha leállítást kérnek.
     */
    class ShutdownSignal {
    private:
        std::atomic<bool> stopRequested{false};
        mutable std::mutex waitMutex;
        std::condition_variable waitCv;

    public:
        void request() {
            {
                std::lock_guard<std::mutex> lock(waitMutex);
                stopRequested = true;
            }
            waitCv.notify_all();
        }

        [[nodiscard]] bool requested() const { return stopRequested.load(); }

        // true, ha a várakozás alatt leállítást kértek
        template<typename Rep, typename Period>
        bool waitFor(std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock<std::mutex> lock(waitMutex);
            return waitCv.wait_for(lock, timeout, [this] { return stopRequested.load(); });
        }
    };
}

#endif // LANWATCH_SHUTDOWN_SIGNAL_HPP
