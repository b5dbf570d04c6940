#ifndef LOG_H
#define LOG_H

// Tagged log lines, e.g. "[BARRIER] Barrier opened".
// main.cpp installs a serial sink at boot; tests install a capture sink.
// Lines are dropped while no sink is installed.
typedef void (*LogSink)(const char* tag, const char* message);

void setLogSink(LogSink sink);

void logLine(const char* tag, const char* format, ...)
    __attribute__((format(printf, 2, 3)));

#endif
