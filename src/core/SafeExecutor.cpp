// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "core/SafeExecutor.hpp"
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Lanwatch::Core {

    ExecArgv SafeExecutor::prepare(const ExecRequest& request) {
        // Argumentumok előkészítése az execve-hez (char* konverzió)
        ExecArgv argv;
        argv.args.reserve(request.args.size() + 2);
        argv.args.push_back(const_cast<char*>(request.binary.c_str()));
        for (const auto& arg : request.args) {
            argv.args.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.args.push_back(nullptr);

        argv.env.reserve(request.env.size() + 1);
        for (const auto& entry : request.env) {
            argv.env.push_back(const_cast<char*>(entry.c_str()));
        }
        argv.env.push_back(nullptr);
        return argv;
    }

    void SafeExecutor::execChild(const ExecRequest& request, const ExecArgv& argv,
                                 int stdoutFd, int stderrFd, int errorPipeFd) {
        // A szülő sigwait miatt blokkolja a SIGTERM-et; a gyereknek ezt nem szabad örökölnie
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        signal(SIGPIPE, SIG_DFL);

        int devNull = open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        dup2(stdoutFd >= 0 ? stdoutFd : devNull, STDOUT_FILENO);
        dup2(stderrFd >= 0 ? stderrFd : devNull, STDERR_FILENO);

        if (!request.workingDir.empty() && chdir(request.workingDir.c_str()) != 0) {
            int err = errno;
            if (errorPipeFd >= 0) (void)!write(errorPipeFd, &err, sizeof(err));
            _exit(127);
        }

        // Tényleges futtatás shell nélkül
        execve(request.binary.c_str(), argv.args.data(), argv.env.data());

        // Ha az execve visszatér, hiba történt: jelezzük a szülőnek
        int err = errno;
        if (errorPipeFd >= 0) (void)!write(errorPipeFd, &err, sizeof(err));
        _exit(127);
    }

    ExecResult SafeExecutor::execute(const ExecRequest& request) {
        ExecResult result;

        int errPipe[2];
        if (pipe2(errPipe, O_CLOEXEC) != 0) {
            return result;
        }

        // Többszálú folyamat: fork után a gyerekben már nem allokálunk
        const ExecArgv argv = prepare(request);

        pid_t pid = fork();

        if (pid == -1) { // Fork hiba
            close(errPipe[0]);
            close(errPipe[1]);
            return result;
        }

        if (pid == 0) { // Gyerek folyamat
            close(errPipe[0]);
            execChild(request, argv, -1, errPipe[1], -1);
        }

        // Szülő folyamat
        close(errPipe[1]);
        result.started = true;

        char buffer[1024];
        while (true) {
            ssize_t n = read(errPipe[0], buffer, sizeof(buffer));
            if (n > 0) {
                if (result.errorOutput.size() < 64 * 1024) {
                    result.errorOutput.append(buffer, static_cast<size_t>(n));
                }
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            break;
        }
        close(errPipe[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return result;
            }
        }

        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exitCode = 128 + WTERMSIG(status);
        }
        return result;
    }
}
