#pragma once

#include <string>
#include <vector>
#include <cctype>

namespace multidl::util {

inline std::string trimCopy(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

inline std::string ellipsize(const std::string& s, size_t maxlen) {
    if (s.size() <= maxlen) return s;
    return s.substr(0, maxlen) + "...";
}

inline bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Last `count` non-empty lines of tool output, joined with " | ".
inline std::string lastLines(const std::string& text, size_t count) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) nl = text.size();
        std::string line = trimCopy(text.substr(start, nl - start));
        if (!line.empty()) lines.push_back(std::move(line));
        start = nl + 1;
    }
    std::string out;
    size_t first = lines.size() > count ? lines.size() - count : 0;
    for (size_t i = first; i < lines.size(); ++i) {
        if (!out.empty()) out += " | ";
        out += lines[i];
    }
    return out;
}

// Render argv for logs. The value following a secret flag is masked.
inline std::string joinCommandForLog(const std::vector<std::string>& argv) {
    std::string out;
    bool maskNext = false;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        if (maskNext) {
            out += "***";
            maskNext = false;
            continue;
        }
        if (a == "--password" || a == "-p" || a == "--token" || a == "--video-password") {
            maskNext = true;
        }
        if (a.find("Authorization:") != std::string::npos) {
            out += "Authorization: ***";
            continue;
        }
        if (a.find(' ') != std::string::npos) out += "'" + a + "'";
        else out += a;
    }
    return out;
}

} // namespace multidl::util
