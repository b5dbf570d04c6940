#include "Log.h"
#include <atomic>
#include <stdarg.h>
#include <stdio.h>

#define LOG_LINE_MAX 192

static std::atomic<LogSink> activeSink(nullptr);

void setLogSink(LogSink sink) {
    activeSink.store(sink);
}

void logLine(const char* tag, const char* format, ...) {
    LogSink sink = activeSink.load();
    if (sink == nullptr) {
        return;
    }

    char buffer[LOG_LINE_MAX];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    sink(tag, buffer);
}
