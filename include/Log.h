#pragma once

// Leveled stderr logging. One process-wide threshold; forked workers inherit
// it from the orchestrator.

namespace pneuma {

enum class LogLevel : int {
    Debug   = 10,
    Info    = 20,
    Warning = 30,
    Error   = 40,
};

void setLogLevel(LogLevel level);
LogLevel logLevel();

// Role tag printed on every line ("env", "comm", "ctrl"). Workers set their
// own after fork.
void setLogRole(const char* role);

const char* logLevelName(LogLevel level);
bool parseLogLevel(const char* text, LogLevel& out);

#if defined(__GNUC__) || defined(__clang__)
void logf(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
#else
void logf(LogLevel level, const char* fmt, ...);
#endif

} // namespace pneuma
