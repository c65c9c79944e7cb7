#pragma once

#include <string>

namespace multidl {

enum class LogLevel { Debug = 0, Info, Warn, Error };

// Opens (truncates) the log file; an empty path keeps logging on stderr only.
bool initLogFile(const std::string& path);
void closeLogFile();
void setLogLevel(LogLevel level);
void setLogLevelFromString(const std::string& level);
LogLevel logLevel();

void logDebug(const std::string& msg, const std::string& tag = "DBG");
void logInfo(const std::string& msg, const std::string& tag = "APP");
void logWarn(const std::string& msg, const std::string& tag = "APP");
void logError(const std::string& msg, const std::string& tag = "APP");

} // namespace multidl
