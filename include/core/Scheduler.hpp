// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor
// Periodic task scheduler: one dedicated worker per sweep

#ifndef LANWATCH_SCHEDULER_HPP
#define LANWATCH_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "rxcpp/rx.hpp" // A reaktív motor

namespace Lanwatch::Core {

    /**
     * @brief A periodikus sweepek ütemezője.
     * Minden feladat saját new_thread workeren fut, így egy feladat tickjei sosem
     * fedik át egymást; a feladatok között nincs sorrendi garancia.
     */
    class Scheduler {
    private:
        struct PeriodicTask {
            std::string name;
            std::atomic<bool> active{true};
            rxcpp::composite_subscription subscription;
            // A futó tick ezt tartja; a stop() ezen várja meg a befejezést
            std::mutex inFlight;
        };

        // --- State ---
        std::atomic<bool> running{false};

        // A fő subscription, ami életben tartja a folyamatokat.
        rxcpp::composite_subscription lifetime;

        std::mutex tasksMutex;
        std::vector<std::shared_ptr<PeriodicTask>> tasks;

    public:
        Scheduler();
        ~Scheduler();

        /**
         * @brief Periodikus feladat: első futás initialDelay után, majd period-onként.
         * A tick kivételeit a Scheduler nem nyeli le; a hívónak kell elkapnia őket.
         */
        void schedulePeriodic(const std::string& name,
                              std::chrono::milliseconds initialDelay,
                              std::chrono::milliseconds period,
                              std::function<void()> tick);

        /**
         * @brief Nem ütemez több ticket, és megvárja a folyamatban lévőket
         * (egy félbehagyott batch vagy tranzakció sosem szakad meg írás közben).
         */
        void stop();

        [[nodiscard]] bool isRunning() const { return running.load(); }
        [[nodiscard]] size_t taskCount();
    };
}

#endif // LANWATCH_SCHEDULER_HPP
