#include "multidl/logger.hpp"
#include "multidl/filesystem.hpp"
#include <fstream>
#include <iostream>
#include <cctype>
#include <mutex>
#include <filesystem>

namespace multidl {

static constexpr size_t kMaxLogBytes = 512 * 1024; // rotate to <path>.1 past this
static bool gLogReady = false;
static LogLevel gMinLevel = LogLevel::Info;
static std::mutex gLogMutex;
static std::ofstream gLogFile;
static std::string gLogPath;
static size_t gLogBytes = 0;

bool initLogFile(const std::string& path) {
    // Create the directory before taking the lock; the helper logs on failure.
    if (!path.empty()) ensureParentDirectory(path);

    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogReady = false;
    gLogPath = path;
    if (path.empty()) return true;

    // Start a fresh log file per run
    gLogFile.open(path, std::ios::trunc);
    if (!gLogFile) {
        std::cerr << "[LOG] Failed to open log file: " << path << std::endl;
        return false;
    }
    gLogFile << "multidl log start\n";
    gLogFile.flush();
    gLogBytes = static_cast<size_t>(gLogFile.tellp());
    gLogReady = true;
    return true;
}

void closeLogFile() {
    std::lock_guard<std::mutex> lock(gLogMutex);
    if (gLogFile.is_open()) gLogFile.close();
    gLogReady = false;
}

void setLogLevel(LogLevel level) { gMinLevel = level; }

LogLevel logLevel() { return gMinLevel; }

void setLogLevelFromString(const std::string& level) {
    std::string l;
    l.reserve(level.size());
    for (char c : level) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (l == "debug") gMinLevel = LogLevel::Debug;
    else if (l == "warn" || l == "warning") gMinLevel = LogLevel::Warn;
    else if (l == "error") gMinLevel = LogLevel::Error;
    else gMinLevel = LogLevel::Info;
}

static const char* levelPrefix(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "D";
        case LogLevel::Info: return "I";
        case LogLevel::Warn: return "W";
        case LogLevel::Error: return "E";
    }
    return "?";
}

static void logInternal(LogLevel level, const std::string& tag, const std::string& msg) {
    if (level < gMinLevel) return;
    std::string line = std::string(levelPrefix(level)) + " [" + tag + "] " + msg;

    std::lock_guard<std::mutex> lock(gLogMutex);
    // stdout carries the run summary; diagnostics stay on stderr.
    std::cerr << line << std::endl;
    if (!gLogReady) return;

    auto rotate = []() {
        if (gLogFile.is_open()) gLogFile.close();
        std::error_code ec;
        std::filesystem::path p(gLogPath);
        std::filesystem::path rotated = p;
        rotated += ".1";
        std::filesystem::remove(rotated, ec);
        ec.clear();
        std::filesystem::rename(p, rotated, ec); // best-effort
        gLogFile.open(gLogPath, std::ios::trunc);
        gLogBytes = 0;
        if (gLogFile) {
            gLogFile << "multidl log start (rotated)\n";
            gLogFile.flush();
            gLogBytes = static_cast<size_t>(gLogFile.tellp());
        }
    };

    size_t writeBytes = line.size() + 1; // newline
    if (gLogBytes + writeBytes > kMaxLogBytes) {
        rotate();
    }
    if (gLogFile) {
        gLogFile << line << "\n";
        gLogFile.flush();
        gLogBytes += writeBytes;
    }
}

void logDebug(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Debug, tag, msg); }
void logInfo(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Info, tag, msg); }
void logWarn(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Warn, tag, msg); }
void logError(const std::string& msg, const std::string& tag) { logInternal(LogLevel::Error, tag, msg); }

} // namespace multidl
