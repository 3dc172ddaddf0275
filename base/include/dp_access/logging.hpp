#ifndef DP_ACCESS_LOGGING_HPP
#define DP_ACCESS_LOGGING_HPP

#include <string>

enum LogLevel {
    logError, logWarning, logInfo, logDebug
};

// threshold read once from DP_ACCESS_LOG_LEVEL, defaults to warning
LogLevel getLogLevel();
void setLogLevel(LogLevel level);
LogLevel parseLogLevel(const std::string& name, LogLevel fallback);

// printf-style diagnostics on stderr
void logMessage(LogLevel level, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
;

#endif //DP_ACCESS_LOGGING_HPP
