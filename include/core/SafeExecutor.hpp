// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_SAFE_EXECUTOR_HPP
#define LANWATCH_SAFE_EXECUTOR_HPP

#include <string>
#include <vector>

namespace Lanwatch::Core {

    /**
     * @brief A "Prepared Statement" logika: bináris, argumentum vektor és környezet szétválasztva.
     * Nincs shell, nincs string-összefűzés: fork/execve.
     */
    struct ExecRequest {
        std::string binary;
        std::vector<std::string> args;
        std::vector<std::string> env;
        std::string workingDir;
    };

    /**
     * @brief Az execve-hez kész argv / envp tömbök, még a fork() előtt felépítve
     * (a gyerek oldalon nincs allokáció). A request-nél tovább nem élhet.
     */
    struct ExecArgv {
        std::vector<char*> args;   // binary, args..., nullptr
        std::vector<char*> env;    // KEY=VALUE..., nullptr
    };

    struct ExecResult {
        bool started = false;
        int exitCode = -1;
        std::string errorOutput;   // stderr, hibaüzenethez
    };

    class SafeExecutor {
    public:
        /**
         * @brief Blokkoló futtatás: megvárja a kilépést, a stderr-t összegyűjti.
         * A stdout /dev/null-ba megy.
         */
        static ExecResult execute(const ExecRequest& request);

        static ExecArgv prepare(const ExecRequest& request);

        /**
         * @brief A gyerek oldali execve előkészítése. Csak fork() után hívható, nem tér vissza.
         * A leállításhoz blokkolt jeleket feloldja, a stdin-t /dev/null-ra köti.
         */
        [[noreturn]] static void execChild(const ExecRequest& request, const ExecArgv& argv,
                                           int stdoutFd, int stderrFd, int errorPipeFd);
    };
}

#endif
