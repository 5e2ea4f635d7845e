#ifndef HEADER_GUARD_LX_SYS_TERM
#define HEADER_GUARD_LX_SYS_TERM

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

#define LX_TERM_COLOR_NONE "\x1b[0m"
#define LX_TERM_COLOR_RED "\x1b[1;31m"
#define LX_TERM_COLOR_GREEN "\x1b[1;32m"
#define LX_TERM_COLOR_YELLOW "\x1b[1;33m"
#define LX_TERM_COLOR_BLUE "\x1b[1;34m"
#define LX_TERM_COLOR_MAGENTA "\x1b[1;35m"
#define LX_TERM_COLOR_WHITE "\x1b[1;37m"

bool lx_isattyFd(int fd);

#ifdef __cplusplus
}
#endif

#endif // HEADER_GUARD_LX_SYS_TERM
