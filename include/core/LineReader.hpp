// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#ifndef LANWATCH_LINE_READER_HPP
#define LANWATCH_LINE_READER_HPP

#include <chrono>
#include <string>

namespace Lanwatch::Core {

    enum class ReadStatus { LINE, TIMEOUT, END_OF_STREAM, FAILED };

    /**
     * @brief Soronkénti olvasás egy pipe fd-ről, select() timeouttal,
     * hogy a hívó loop a leállítási jelet két olvasás között ellenőrizhesse.
     */
    class LineReader {
    private:
        static constexpr size_t MAX_LINE = 1024 * 1024;

        int fd;
        std::string pending;
        bool endOfStream = false;
        int lastErrno = 0;

        bool takeLine(std::string& line);

    public:
        explicit LineReader(int fd);

        ReadStatus readLine(std::string& line, std::chrono::milliseconds timeout);

        [[nodiscard]] int lastError() const { return lastErrno; }
    };
}

#endif
