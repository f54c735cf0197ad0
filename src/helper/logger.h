#pragma once

#include <string>

enum class LogLevel : int {
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    Off     = 4
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
bool isLogLevelEnabled(LogLevel level);

// Accepts "debug", "info", "warning"/"warn", "error", "off" (any case).
bool parseLogLevel(const std::string& text, LogLevel& out);

// Writes "[level] message" to stderr when level passes the filter.
void logMessage(LogLevel level, const std::string& message);

inline void logDebug(const std::string& message)   { logMessage(LogLevel::Debug, message); }
inline void logInfo(const std::string& message)    { logMessage(LogLevel::Info, message); }
inline void logWarning(const std::string& message) { logMessage(LogLevel::Warning, message); }
inline void logError(const std::string& message)   { logMessage(LogLevel::Error, message); }
