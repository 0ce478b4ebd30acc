// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "core/Scheduler.hpp"
#include <iostream>

namespace Lanwatch::Core {

    Scheduler::Scheduler() {
        running = true;
    }

    Scheduler::~Scheduler() {
        stop();
    }

    void Scheduler::schedulePeriodic(const std::string& name,
                                     std::chrono::milliseconds initialDelay,
                                     std::chrono::milliseconds period,
                                     std::function<void()> tick) {
        if (!running) return;

        auto task = std::make_shared<PeriodicTask>();
        task->name = name;
        lifetime.add(task->subscription);

        {
            std::lock_guard<std::mutex> lock(tasksMutex);
            tasks.push_back(task);
        }

        auto firstRun = rxcpp::schedulers::scheduler::clock_type::now() + initialDelay;

        // Dedikált worker szál feladatonként (The Vent helyett: egy sweep = egy szál)
        rxcpp::observable<>::interval(firstRun, period, rxcpp::observe_on_new_thread())
            .subscribe(task->subscription, [task, tick](long) {
                std::lock_guard<std::mutex> guard(task->inFlight);
                if (!task->active) return;
                tick();
            });

        std::cout << "[Scheduler] Task '" << name << "' scheduled, period "
                  << period.count() << "ms" << std::endl;
    }

    void Scheduler::stop() {
        if (!running.exchange(false)) return;

        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }

        std::vector<std::shared_ptr<PeriodicTask>> snapshot;
        {
            std::lock_guard<std::mutex> lock(tasksMutex);
            snapshot = tasks;
        }

        // A futó tick befejeződik, nem szakítjuk meg
        for (const auto& task : snapshot) {
            std::lock_guard<std::mutex> guard(task->inFlight);
            task->active = false;
        }

        std::cout << "[Scheduler] Stopped " << snapshot.size() << " task(s)." << std::endl;
    }

    size_t Scheduler::taskCount() {
        std::lock_guard<std::mutex> lock(tasksMutex);
        return tasks.size();
    }
}
