// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "core/ProbeProcess.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace Lanwatch::Core {

    ProbeProcess::~ProbeProcess() {
        terminate(std::chrono::milliseconds(500));
        closeStreams();
    }

    bool ProbeProcess::launch(const ExecRequest& request, std::string* error) {
        if (childPid > 0 && !reaped) {
            if (error) *error = "process already running";
            return false;
        }

        int outPipe[2];
        int errPipe[2];
        int execPipe[2];

        if (pipe2(outPipe, O_CLOEXEC) != 0) {
            if (error) *error = std::strerror(errno);
            return false;
        }
        if (pipe2(errPipe, O_CLOEXEC) != 0) {
            if (error) *error = std::strerror(errno);
            close(outPipe[0]); close(outPipe[1]);
            return false;
        }
        if (pipe2(execPipe, O_CLOEXEC) != 0) {
            if (error) *error = std::strerror(errno);
            close(outPipe[0]); close(outPipe[1]);
            close(errPipe[0]); close(errPipe[1]);
            return false;
        }

        const ExecArgv argv = SafeExecutor::prepare(request);

        pid_t pid = fork();

        if (pid == -1) {
            if (error) *error = std::strerror(errno);
            close(outPipe[0]); close(outPipe[1]);
            close(errPipe[0]); close(errPipe[1]);
            close(execPipe[0]); close(execPipe[1]);
            return false;
        }

        if (pid == 0) { // Gyerek
            close(outPipe[0]);
            close(errPipe[0]);
            close(execPipe[0]);
            SafeExecutor::execChild(request, argv, outPipe[1], errPipe[1], execPipe[1]);
        }

        // Szülő
        close(outPipe[1]);
        close(errPipe[1]);
        close(execPipe[1]);

        // Sikeres execve esetén a CLOEXEC cső lezárul és EOF-ot olvasunk
        int childErrno = 0;
        ssize_t n;
        do {
            n = read(execPipe[0], &childErrno, sizeof(childErrno));
        } while (n < 0 && errno == EINTR);
        close(execPipe[0]);

        childPid = pid;
        reaped = false;
        exitStatus = 0;
        outFd = outPipe[0];
        errFd = errPipe[0];

        if (n == static_cast<ssize_t>(sizeof(childErrno))) {
            if (error) *error = std::string("exec failed: ") + std::strerror(childErrno);
            terminate(std::chrono::milliseconds(0));
            closeStreams();
            return false;
        }
        return true;
    }

    bool ProbeProcess::hasExited() {
        if (childPid <= 0 || reaped) return true;

        int status = 0;
        pid_t r = waitpid(childPid, &status, WNOHANG);
        if (r == childPid) {
            reaped = true;
            exitStatus = status;
            return true;
        }
        if (r < 0 && errno == ECHILD) {
            reaped = true;
            return true;
        }
        return false;
    }

    int ProbeProcess::exitCode() const {
        if (WIFEXITED(exitStatus)) return WEXITSTATUS(exitStatus);
        if (WIFSIGNALED(exitStatus)) return 128 + WTERMSIG(exitStatus);
        return -1;
    }

    void ProbeProcess::terminate(std::chrono::milliseconds grace) {
        if (childPid <= 0 || hasExited()) return;

        kill(childPid, SIGTERM);

        auto deadline = std::chrono::steady_clock::now() + grace;
        while (std::chrono::steady_clock::now() < deadline) {
            if (hasExited()) return;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        // Nem reagált a SIGTERM-re
        kill(childPid, SIGKILL);

        int status = 0;
        pid_t r;
        do {
            r = waitpid(childPid, &status, 0);
        } while (r < 0 && errno == EINTR);

        reaped = true;
        exitStatus = status;
    }

    void ProbeProcess::closeStreams() {
        if (outFd >= 0) {
            close(outFd);
            outFd = -1;
        }
        if (errFd >= 0) {
            close(errFd);
            errFd = -1;
        }
    }
}
