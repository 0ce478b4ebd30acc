// © 2026 Beatrix Zselezny. All rights reserved.
// Lanwatch LAN-Cache Transfer Monitor

#include "utils/StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace LanwatchUtils {
    std::string trim(const std::string& s) {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
        return s.substr(start, end - start);
    }

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool iequals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    std::string quote(const std::string& arg) {
        return "\"" + arg + "\"";
    }

    std::string joinQuoted(const std::vector<std::string>& args) {
        std::string out;
        for (const auto& arg : args) {
            if (!out.empty()) out += " ";
            out += quote(arg);
        }
        return out;
    }

    std::string joinComma(const std::vector<std::string>& items, size_t limit) {
        std::string out;
        size_t count = 0;
        for (const auto& item : items) {
            if (count == limit) {
                out += ", ...";
                break;
            }
            if (count > 0) out += ", ";
            out += item;
            ++count;
        }
        return out;
    }
}
