// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "core/SpeedProbeSupervisor.hpp"
#include "core/LineReader.hpp"
#include "core/ProbeProcess.hpp"
#include "utils/ProcessEnvironment.hpp"
#include "utils/StringUtils.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace Lanwatch::Core {

    namespace {
        // Ennyi időnként néz rá a loop a leállítási jelre olvasás közben
        constexpr auto READ_POLL = std::chrono::milliseconds(250);
    }

SpeedProbeSupervisor::SpeedProbeSupervisor(const Config::ProbeConfig& settings,
                                           std::string dbPath,
                                           const Config::DatasourceRegistry& registryRef,
                                           NotificationChannel& channelRef,
                                           ShutdownSignal& shutdownRef,
                                           Telemetry::LogLevel level)
    : config(settings),
      databasePath(std::move(dbPath)),
      registry(registryRef),
      channel(channelRef),
      shutdown(shutdownRef),
      logLevel(level) {
    currentSnapshot.window_seconds = config.windowSeconds;
    telemetry.state = Telemetry::ProbeState::IDLE;
}

SpeedProbeSupervisor::~SpeedProbeSupervisor() {
    if (worker.joinable()) {
        shutdown.request();
        worker.join();
    }
}

std::string SpeedProbeSupervisor::getName() const {
    return "SpeedProbeSupervisor";
}

void SpeedProbeSupervisor::start(std::chrono::milliseconds startupDelay) {
    if (worker.joinable()) return; // Már fut
    initialDelay = startupDelay;
    worker = std::thread([this]() {
        try {
            runLoop();
        } catch (const std::exception& e) {
            logError(std::string("Supervisor loop failed: ") + e.what());
            childPid = -1;
            setState(Telemetry::ProbeState::STOPPED);
        }
    });
}

void SpeedProbeSupervisor::join() {
    if (worker.joinable()) {
        worker.join();
    }
}

Telemetry::SpeedSnapshot SpeedProbeSupervisor::getCurrentSnapshot() const {
    std::lock_guard<std::mutex> lock(snapshotMutex);
    return currentSnapshot;
}

ExecRequest SpeedProbeSupervisor::buildRequest(const std::vector<Config::Datasource>& enabled) const {
    ExecRequest request;
    request.binary = config.speedTrackerPath;
    request.args.push_back(databasePath);
    for (const auto& ds : enabled) {
        request.args.push_back(ds.logPath);
    }
    request.env = LanwatchUtils::buildChildEnvironment();
    request.workingDir = LanwatchUtils::executableDirectory(config.speedTrackerPath);
    return request;
}

// --- Supervisor loop ---

void SpeedProbeSupervisor::runLoop() {
    auto enabled = registry.enabledDatasources();
    if (enabled.empty()) {
        setState(Telemetry::ProbeState::DISABLED);
        logInfo("No enabled datasources - speed probe disabled");
        return;
    }

    std::error_code ec;
    if (!fs::exists(config.speedTrackerPath, ec)) {
        setState(Telemetry::ProbeState::DISABLED);
        logError("Speed probe not found at " + config.speedTrackerPath + " - speed probe disabled");
        return;
    }

    if (initialDelay.count() > 0 && shutdown.waitFor(initialDelay)) {
        setState(Telemetry::ProbeState::STOPPED);
        return;
    }

    // A parancssor és a datasource-készlet erre a futásra rögzül, újraindításkor is ez megy
    const ExecRequest request = buildRequest(enabled);

    std::vector<std::string> names;
    for (const auto& ds : enabled) names.push_back(ds.name);
    logInfo("Monitoring " + std::to_string(enabled.size()) + " datasource(s): " + LanwatchUtils::joinComma(names));

    // previousHadActivity a loop élettartamára szól, újraindítás után is megmarad
    ProbeStreamHandler handler(
        channel, config.windowSeconds,
        [this](const Telemetry::SpeedSnapshot& snapshot) { publishSnapshot(snapshot); },
        &telemetry, logLevel);

    while (!shutdown.requested()) {
        setState(Telemetry::ProbeState::IDLE);
        RunOutcome outcome = runOnce(request, handler);

        if (outcome == RunOutcome::CANCELLED || shutdown.requested()) {
            break;
        }

        setState(Telemetry::ProbeState::CRASHED);
        telemetry.crashes++;

        logInfo("Restarting speed probe in " + std::to_string(config.restartDelaySeconds) + "s");
        setState(Telemetry::ProbeState::BACKOFF_WAIT);
        if (shutdown.waitFor(std::chrono::seconds(config.restartDelaySeconds))) {
            break;
        }
    }

    setState(Telemetry::ProbeState::STOPPING);
    setState(Telemetry::ProbeState::STOPPED);
    logInfo("Speed probe stopped");
}

SpeedProbeSupervisor::RunOutcome SpeedProbeSupervisor::runOnce(const ExecRequest& request, ProbeStreamHandler& handler) {
    logInfo("Starting speed probe: " + request.binary + " " + LanwatchUtils::joinQuoted(request.args));

    ProbeProcess process;
    std::string error;
    if (!process.launch(request, &error)) {
        logError("Failed to start speed probe: " + error);
        return RunOutcome::LAUNCH_FAILED;
    }

    telemetry.launches++;
    childPid = process.pid();
    setState(Telemetry::ProbeState::RUNNING);
    logInfo("Speed probe started (pid " + std::to_string(process.pid()) + ")");

    std::atomic<bool> stopDrain{false};
    std::thread stderrThread(&SpeedProbeSupervisor::drainStderr, this, process.stderrFd(), std::cref(stopDrain));

    RunOutcome outcome = RunOutcome::EXITED;
    LineReader reader(process.stdoutFd());
    std::string line;

    // A feldolgozás hibája (pl. a csatorna dob) összeomlásnak számít; a cleanup mindig lefut
    try {
        while (true) {
            if (shutdown.requested()) {
                outcome = RunOutcome::CANCELLED;
                break;
            }

            ReadStatus status = reader.readLine(line, READ_POLL);

            if (status == ReadStatus::LINE) {
                handler.handleLine(line);
                continue;
            }

            if (status == ReadStatus::TIMEOUT) {
                // Egy unokafolyamat nyitva tarthatja a csövet; a kilépést külön is figyeljük
                if (process.hasExited()) {
                    logError("Speed probe exited unexpectedly with code " + std::to_string(process.exitCode()));
                    outcome = RunOutcome::EXITED;
                    break;
                }
                continue;
            }

            if (status == ReadStatus::END_OF_STREAM) {
                if (shutdown.requested()) {
                    outcome = RunOutcome::CANCELLED;
                    break;
                }
                process.terminate(std::chrono::milliseconds(config.terminateGraceMs));
                logError("Speed probe exited unexpectedly with code " + std::to_string(process.exitCode()));
                outcome = RunOutcome::EXITED;
                break;
            }

            logError(std::string("Error reading speed probe output: ") + std::strerror(reader.lastError()));
            outcome = RunOutcome::READ_FAILED;
            break;
        }
    } catch (const std::exception& e) {
        logError(std::string("Error processing speed probe output: ") + e.what());
        outcome = RunOutcome::READ_FAILED;
    }

    if (outcome == RunOutcome::CANCELLED) {
        setState(Telemetry::ProbeState::STOPPING);
    }

    // Cleanup: a folyamat leáll, a stderr olvasó kiürül, csak utána zárunk
    process.terminate(std::chrono::milliseconds(config.terminateGraceMs));
    stopDrain = true;
    stderrThread.join();
    process.closeStreams();
    childPid = -1;

    return outcome;
}

void SpeedProbeSupervisor::drainStderr(int fd, const std::atomic<bool>& stop) const {
    LineReader reader(fd);
    std::string line;

    while (true) {
        ReadStatus status = reader.readLine(line, READ_POLL);
        if (status == ReadStatus::LINE) {
            if (logLevel == Telemetry::LogLevel::DEBUG && !line.empty()) {
                std::cout << "[SpeedProbe][stderr] " << line << std::endl;
            }
            continue;
        }
        if (status == ReadStatus::TIMEOUT && !stop.load()) {
            continue;
        }
        break;
    }
}

void SpeedProbeSupervisor::publishSnapshot(const Telemetry::SpeedSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(snapshotMutex);
    currentSnapshot = snapshot;
}

void SpeedProbeSupervisor::setState(Telemetry::ProbeState next) {
    Telemetry::ProbeState previous = telemetry.state.exchange(next);
    if (previous != next && logLevel == Telemetry::LogLevel::DEBUG) {
        std::cout << "[SpeedProbe][DEBUG] " << Telemetry::toString(previous) << " -> "
                  << Telemetry::toString(next) << std::endl;
    }
}

void SpeedProbeSupervisor::logInfo(const std::string& message) const {
    if (logLevel == Telemetry::LogLevel::SILENT) return;
    std::cout << "[SpeedProbe] " << message << std::endl;
}

void SpeedProbeSupervisor::logError(const std::string& message) const {
    std::cerr << "[SpeedProbe] ERROR: " << message << std::endl;
}

} // namespace Lanwatch::Core
