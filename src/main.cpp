// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>

#include "config/AppConfig.hpp"
#include "config/DatasourceRegistry.hpp"
#include "core/NotificationBus.hpp"
#include "core/Scheduler.hpp"
#include "core/ShutdownSignal.hpp"
#include "core/SpeedProbeSupervisor.hpp"
#include "modules/ConsistencyGuardian.hpp"
#include "modules/LogServiceInventory.hpp"
#include "modules/StaleTransferReaper.hpp"
#include "store/SqliteTransferStore.hpp"

using namespace Lanwatch;

namespace {

    constexpr int EXIT_CONFIG_FAILURE = 1;
    constexpr int EXIT_USAGE = 2;

    struct CommandLine {
        std::string configPath = Config::DEFAULT_CONFIG_PATH;
        bool verbose = false;
        bool once = false;
    };

    void printUsage(const char* argv0) {
        std::cerr << "Usage: " << argv0 << " [--config <path>] [--verbose] [--once]" << std::endl;
    }

    bool parseCommandLine(int argc, char* argv[], CommandLine& out) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config") {
                if (i + 1 >= argc) return false;
                out.configPath = argv[++i];
            } else if (arg == "--verbose") {
                out.verbose = true;
            } else if (arg == "--once") {
                out.once = true;
            } else {
                return false;
            }
        }
        return true;
    }

    // Gyors nyomkövetés: a push adapter helyén a busz eseményeit naplózzuk
    void traceNotification(const Core::Notification& n) {
        std::cout << "[Bus][DEBUG] " << n.event;
        if (!n.payload.isNull()) {
            std::cout << " totalBytesPerSecond=" << n.payload.get("totalBytesPerSecond", 0.0).asDouble();
        }
        std::cout << std::endl;
    }
}

int main(int argc, char* argv[]) {
    CommandLine cli;
    if (!parseCommandLine(argc, argv, cli)) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    // A jeleket minden szál előtt blokkoljuk: csak a fő szál sigwait-je kapja meg őket
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    signal(SIGPIPE, SIG_IGN);

    std::cout << "--- LANWATCH TRANSFER MONITOR ---" << std::endl;

    Config::AppConfig config;
    std::unique_ptr<Config::ConfiguredDatasourceRegistry> registry;
    try {
        config = Config::ConfigLoader::loadFile(cli.configPath);
        registry = std::make_unique<Config::ConfiguredDatasourceRegistry>(config.datasources);
    } catch (const Config::ConfigError& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return EXIT_CONFIG_FAILURE;
    }

    const Telemetry::LogLevel level = cli.verbose ? Telemetry::LogLevel::DEBUG : config.logLevel;

    std::cout << "[Config] Loaded " << cli.configPath << " (" << config.datasources.size()
              << " datasource(s), default '" << registry->defaultDatasource()->name << "')" << std::endl;

    std::unique_ptr<Store::SqliteTransferStore> store;
    try {
        store = std::make_unique<Store::SqliteTransferStore>(config.databasePath);
    } catch (const Store::StoreError& e) {
        std::cerr << "[Store] " << e.what() << std::endl;
        return EXIT_CONFIG_FAILURE;
    }
    std::cout << "[Store] Opened " << config.databasePath << std::endl;

    Core::ShutdownSignal shutdown;
    Core::NotificationBus bus;
    if (level == Telemetry::LogLevel::DEBUG) {
        bus.observe(traceNotification);
    }

    Modules::LogManagerInventory inventory(*registry, config.probe, level);
    Modules::StaleTransferReaper reaper(*store, config.reaper, shutdown, level);
    Modules::ConsistencyGuardian guardian(*store, *registry, inventory, level);

    // Karbantartó mód: induló takarítás és egy konzisztencia ciklus, szonda nélkül
    if (cli.once) {
        reaper.onStartup();
        guardian.runCycle();
        std::cout << "[SUCCESS] Maintenance pass finished." << std::endl;
        return 0;
    }

    const auto startupDelay = std::chrono::seconds(config.reaper.startupDelaySeconds);
    const auto reaperPeriod = std::chrono::seconds(config.reaper.intervalSeconds);
    const auto guardianPeriod = reaperPeriod * config.guardian.everyReaperTicks;

    Core::Scheduler scheduler;

    // Az első tick az induló sweep (sentinel + már elavult átvitelek)
    auto startupDone = std::make_shared<std::atomic<bool>>(false);
    scheduler.schedulePeriodic("reaper", startupDelay, reaperPeriod, [&reaper, startupDone]() {
        if (!startupDone->exchange(true)) {
            reaper.onStartup();
            return;
        }
        reaper.onTick();
    });

    // Saját worker: a log manager futása nem tartja fel a reaper tickjeit
    scheduler.schedulePeriodic("guardian", startupDelay, guardianPeriod, [&guardian, &shutdown]() {
        if (shutdown.requested()) return;
        guardian.runCycle();
    });

    Core::SpeedProbeSupervisor supervisor(config.probe, config.databasePath, *registry, bus, shutdown, level);
    supervisor.start(startupDelay);

    int received = 0;
    sigwait(&signals, &received);
    std::cout << "\n[Main] Signal " << received << " received, shutting down..." << std::endl;

    // (a) nincs több tick, (b) a futó batch / tranzakció befejeződik, (c) a szonda leáll
    shutdown.request();
    scheduler.stop();
    supervisor.join();
    bus.close();

    auto t = supervisor.telemetrySnapshot();
    std::cout << "[Main] Probe launches=" << t.launches << " crashes=" << t.crashes
              << " lines=" << t.lines_parsed << " rejected=" << t.lines_rejected
              << " updates=" << t.speed_updates_sent << " refreshes=" << t.refreshes_sent << std::endl;

    std::cout << "[SUCCESS] Lanwatch stopped." << std::endl;
    return 0;
}
