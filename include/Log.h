#pragma once

#include <functional>
#include "ConfigState.h"

// Receives one fully formatted line (no trailing newline).
using LogSink = std::function<void(LogLevel level, const char* line)>;

// printf-style logging helper shared by the whole firmware.
// Lines above the current level are dropped before formatting.
void logf(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

void setLogLevel(LogLevel level);
LogLevel logLevel();

// Replace the output sink. Passing an empty function restores the console sink.
void setLogSink(LogSink sink);

const char* logLevelName(LogLevel level);
