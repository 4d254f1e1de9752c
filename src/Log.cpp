#include "Log.h"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <strings.h>
#include <unistd.h>

namespace pneuma {

namespace {
LogLevel g_level = LogLevel::Error;
char g_role[16] = "env";
} // namespace

void setLogLevel(LogLevel level) {
    g_level = level;
}

LogLevel logLevel() {
    return g_level;
}

void setLogRole(const char* role) {
    std::snprintf(g_role, sizeof(g_role), "%s", role ? role : "?");
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "?";
}

bool parseLogLevel(const char* text, LogLevel& out) {
    if (!text) return false;
    if (::strcasecmp(text, "debug") == 0)   { out = LogLevel::Debug;   return true; }
    if (::strcasecmp(text, "info") == 0)    { out = LogLevel::Info;    return true; }
    if (::strcasecmp(text, "warn") == 0 ||
        ::strcasecmp(text, "warning") == 0) { out = LogLevel::Warning; return true; }
    if (::strcasecmp(text, "error") == 0)   { out = LogLevel::Error;   return true; }
    return false;
}

void logf(LogLevel level, const char* fmt, ...) {
    if (static_cast<int>(level) < static_cast<int>(g_level)) return;

    char msg[512];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);

    // Single write per line so interleaved worker output stays readable.
    std::fprintf(stderr, "[pneuma][%s][%s %d] %s\n",
                 logLevelName(level), g_role, static_cast<int>(::getpid()), msg);
}

} // namespace pneuma
