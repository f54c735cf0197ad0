#include "logger.h"

#include "text_utils.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace {

std::atomic<int> g_filterLevel{static_cast<int>(LogLevel::Info)};
std::mutex g_writeMutex;

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
        default:                return "off";
    }
}

}  // namespace

void setLogLevel(LogLevel level) {
    g_filterLevel.store(static_cast<int>(level));
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_filterLevel.load());
}

bool isLogLevelEnabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= g_filterLevel.load();
}

bool parseLogLevel(const std::string& text, LogLevel& out) {
    const std::string name = toLower(trim(text));
    if (name == "debug")                         out = LogLevel::Debug;
    else if (name == "info")                     out = LogLevel::Info;
    else if (name == "warning" || name == "warn") out = LogLevel::Warning;
    else if (name == "error")                    out = LogLevel::Error;
    else if (name == "off")                      out = LogLevel::Off;
    else return false;
    return true;
}

void logMessage(LogLevel level, const std::string& message) {
    if (!isLogLevelEnabled(level))
        return;

    std::lock_guard<std::mutex> lock(g_writeMutex);
    std::cerr << '[' << levelName(level) << "] " << message << '\n';
}
