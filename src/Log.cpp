#include "Log.h"

#include <atomic>
#include <mutex>
#include <stdarg.h>
#include <stdio.h>

static std::atomic<uint8_t> s_level(static_cast<uint8_t>(ConfigDefaults::LOG_LEVEL));
static std::mutex s_sinkMutex;
static LogSink s_sink;

static void consoleSink(LogLevel level, const char* line) {
    // On the device stdout is routed to the same UART as Serial.
    printf("[%s] %s\n", logLevelName(level), line);
}

void logf(LogLevel level, const char* fmt, ...) {
    if (level == LogLevel::None ||
        static_cast<uint8_t>(level) > s_level.load()) {
        return;
    }

    char buf[192];

    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(s_sinkMutex);
    if (s_sink) {
        s_sink(level, buf);
    } else {
        consoleSink(level, buf);
    }
}

void setLogLevel(LogLevel level) {
    s_level.store(static_cast<uint8_t>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(s_level.load());
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(s_sinkMutex);
    s_sink = sink;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::None:
        default:
            return "NONE";
    }
}
