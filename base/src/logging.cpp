#include "../include/dp_access/logging.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace {

const char* levelName(LogLevel level) {
    switch (level) {
        case logError: return "error";
        case logWarning: return "warning";
        case logInfo: return "info";
        case logDebug: return "debug";
    }
    return "unknown";
}

std::atomic<int>& threshold() {
    static std::atomic<int> level([] {
        const char* configured = std::getenv("DP_ACCESS_LOG_LEVEL");
        return static_cast<int>(configured ? parseLogLevel(configured, logWarning) : logWarning);
    }());
    return level;
}

}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    if (name == "error") return logError;
    if (name == "warning") return logWarning;
    if (name == "info") return logInfo;
    if (name == "debug") return logDebug;
    return fallback;
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(threshold().load());
}

void setLogLevel(LogLevel level) {
    threshold().store(static_cast<int>(level));
}

void logMessage(LogLevel level, const char* format, ...) {
    if (static_cast<int>(level) > threshold().load()) return;

    fprintf(stderr, "[dp_access] %s: ", levelName(level));

    va_list arguments;
    va_start(arguments, format);
    vfprintf(stderr, format, arguments);
    va_end(arguments);

    fprintf(stderr, "\n");
}
