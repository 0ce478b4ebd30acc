// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor
// Long-running child process with captured stdout/stderr

#ifndef LANWATCH_PROBE_PROCESS_HPP
#define LANWATCH_PROBE_PROCESS_HPP

#include <chrono>
#include <string>
#include <sys/types.h>

#include "core/SafeExecutor.hpp"

namespace Lanwatch::Core {

    /**
     * @brief Egy futó szonda-folyamat tulajdonosa (RAII).
     * A stdout és stderr bájtfolyamként érkezik, nem öröklődik a konzolról.
     */
    class ProbeProcess {
    private:
        pid_t childPid = -1;
        int outFd = -1;
        int errFd = -1;
        bool reaped = false;
        int exitStatus = 0;

    public:
        ProbeProcess() = default;
        ~ProbeProcess();

        ProbeProcess(const ProbeProcess&) = delete;
        ProbeProcess& operator=(const ProbeProcess&) = delete;

        /**
         * @brief fork + execve. false, ha a fork vagy az execve nem sikerült
         * (az execve hibát egy CLOEXEC csövön keresztül kapjuk vissza).
         */
        bool launch(const ExecRequest& request, std::string* error = nullptr);

        [[nodiscard]] pid_t pid() const { return childPid; }
        [[nodiscard]] int stdoutFd() const { return outFd; }
        [[nodiscard]] int stderrFd() const { return errFd; }

        // Nem blokkoló ellenőrzés (WNOHANG); a kilépett gyereket begyűjti
        bool hasExited();

        // Kilépési kód, jel esetén 128 + signo
        [[nodiscard]] int exitCode() const;

        /**
         * @brief SIGTERM, várakozás legfeljebb grace ideig, majd SIGKILL és begyűjtés.
         * A csöveket nyitva hagyja, hogy az olvasó szálak az EOF-ig eljussanak.
         */
        void terminate(std::chrono::milliseconds grace);

        void closeStreams();
    };
}

#endif
