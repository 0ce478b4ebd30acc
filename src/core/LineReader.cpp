// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "core/LineReader.hpp"
#include <cerrno>
#include <sys/select.h>
#include <sys/time.h>
#include <unistd.h>

namespace Lanwatch::Core {

    LineReader::LineReader(int fd) : fd(fd) {}

    bool LineReader::takeLine(std::string& line) {
        size_t pos = pending.find('\n');
        if (pos == std::string::npos) {
            // Túl hosszú sor: egyben továbbadjuk, a parser majd zajként eldobja
            if (pending.size() < MAX_LINE) return false;
            line.swap(pending);
            pending.clear();
            return true;
        }

        line.assign(pending, 0, pos);
        pending.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return true;
    }

    ReadStatus LineReader::readLine(std::string& line, std::chrono::milliseconds timeout) {
        if (takeLine(line)) return ReadStatus::LINE;

        if (endOfStream) {
            if (!pending.empty()) {
                // Utolsó, újsor nélküli sor
                line.swap(pending);
                pending.clear();
                return ReadStatus::LINE;
            }
            return ReadStatus::END_OF_STREAM;
        }

        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(fd, &fds);

        struct timeval tv;
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

        int ret = select(fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret == 0) return ReadStatus::TIMEOUT;
        if (ret < 0) {
            if (errno == EINTR) return ReadStatus::TIMEOUT;
            lastErrno = errno;
            return ReadStatus::FAILED;
        }

        char buffer[4096];
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) return ReadStatus::TIMEOUT;
            lastErrno = errno;
            return ReadStatus::FAILED;
        }
        if (n == 0) {
            endOfStream = true;
            return readLine(line, timeout);
        }

        pending.append(buffer, static_cast<size_t>(n));
        if (takeLine(line)) return ReadStatus::LINE;
        return ReadStatus::TIMEOUT;
    }
}
