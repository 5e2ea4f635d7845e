#ifndef HEADER_GUARD_LX_COMMON_LOGGER
#define HEADER_GUARD_LX_COMMON_LOGGER

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    LxLog_None = 0,
    LxLog_Error,
    LxLog_Warning,
    LxLog_Info,
    LxLog_Debug,
    LxLog_Trace,
} LxLogLevel;

typedef enum {
    LxLog_Color_Auto = 0,
    LxLog_Color_Always,
    LxLog_Color_Never,
} LxColorMode;

typedef struct {
    LxLogLevel log_level;
    LxColorMode color_mode;
} LxLoggerOptions;

#ifdef ENABLE_LOGGING

bool _lx_loggerCheck(LxLogLevel log_level);
void _lx_loggerWrite(LxLogLevel log_level, char const *scope, char const *fmt, ...);

void _lx_loggerInit(LxLoggerOptions opt);

#define _LX_LOG_CHK(LEVEL, ...)                                 \
    if (_lx_loggerCheck(LEVEL)) {                               \
        _lx_loggerWrite(LEVEL, __lx_logger_scope, __VA_ARGS__); \
    } else                                                      \
        (void)0

#define LX_LOGGER_INIT(...) _lx_loggerInit(__VA_ARGS__)

#define LX_LOG_USE_SCOPE(NAME) static char const *__lx_logger_scope = #NAME

#define LX_LOG_ERR(...) _LX_LOG_CHK(LxLog_Error, __VA_ARGS__)
#define LX_LOG_WRN(...) _LX_LOG_CHK(LxLog_Warning, __VA_ARGS__)
#define LX_LOG_INF(...) _LX_LOG_CHK(LxLog_Info, __VA_ARGS__)
#define LX_LOG_DBG(...) _LX_LOG_CHK(LxLog_Debug, __VA_ARGS__)
#define LX_LOG_TRC(...) _LX_LOG_CHK(LxLog_Trace, __VA_ARGS__)

#else // ENABLE_LOGGING

#define LX_LOGGER_INIT(...)

#define LX_LOG_USE_SCOPE(...)

#define LX_LOG_ERR(...)
#define LX_LOG_WRN(...)
#define LX_LOG_INF(...)
#define LX_LOG_DBG(...)
#define LX_LOG_TRC(...)

#endif // ENABLE_LOGGING

#ifdef __cplusplus
}
#endif

#endif // HEADER_GUARD_LX_COMMON_LOGGER
