#ifdef ENABLE_LOGGING

#include "lx/common/logger.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include "lx/sys/term.h"

#define ENV_VAR "LX_LOG_LEVEL"

static char const *c_color_map[] = {
    NULL,                  // None
    LX_TERM_COLOR_RED,     // Error
    LX_TERM_COLOR_YELLOW,  // Warning
    LX_TERM_COLOR_BLUE,    // Info
    LX_TERM_COLOR_GREEN,   // Debug
    LX_TERM_COLOR_MAGENTA, // Trace
};

static char const *c_log_level_map[] = {
    NULL,
    "error",
    "warning",
    "info",
    "debug",
    "trace",
};

static char const *c_env_log_level_map[] = {
    "none",
    "error",
    "warning",
    "info",
    "debug",
    "trace",
};

typedef struct {
    std::chrono::steady_clock::time_point start_time;
    std::atomic<LxLogLevel> log_level;
    bool to_color;
    std::mutex mutex;
    size_t msg_count;
    std::atomic<bool> initialized;
} LoggerState;

static LoggerState s_logger;

// Unknown values leave `level` unchanged
static bool parseEnvLogLevel(char const *env_log_level, LxLogLevel &level) {
    for (size_t i = 0; i <= LxLog_Trace; i++) {
        if (strcmp(env_log_level, c_env_log_level_map[i]) == 0) {
            level = (LxLogLevel)i;
            return true;
        }
    }
    return false;
}

bool _lx_loggerCheck(LxLogLevel log_level) {
    return s_logger.initialized && log_level <= s_logger.log_level;
}

void _lx_loggerWrite(LxLogLevel log_level, char const *scope, char const *fmt, ...) {
    auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lk{s_logger.mutex};

    auto ts = std::chrono::duration<double>{now - s_logger.start_time}.count();
    bool const to_color = s_logger.to_color;

    if (to_color) {
        fprintf(stderr, LX_TERM_COLOR_NONE "%s", c_color_map[log_level]);
    }

    fprintf(stderr, "%04zu %lf %s %s ", ++s_logger.msg_count, ts, c_log_level_map[log_level], scope);

    va_list ap;
    va_start(ap, fmt);
    vfprintf(stderr, fmt, ap);
    va_end(ap);

    if (to_color) {
        fprintf(stderr, LX_TERM_COLOR_NONE);
    }

    fputc('\n', stderr);
}

void _lx_loggerInit(LxLoggerOptions opt) {
    std::lock_guard<std::mutex> lk{s_logger.mutex};

    s_logger.start_time = std::chrono::steady_clock::now();

    LxLogLevel log_level = opt.log_level;
    char const *env_log_level = getenv(ENV_VAR);
    if (env_log_level && !parseEnvLogLevel(env_log_level, log_level)) {
        fprintf(stderr, "warning: ignoring unknown " ENV_VAR " value `%s`\n", env_log_level);
    }
    s_logger.log_level = log_level;

    // Messages go to stderr
    s_logger.to_color =
        opt.color_mode == LxLog_Color_Always || (opt.color_mode == LxLog_Color_Auto && lx_isattyFd(fileno(stderr)));
    s_logger.msg_count = 0;

    s_logger.initialized = true;
}

#endif // ENABLE_LOGGING
