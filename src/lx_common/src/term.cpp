#include "lx/sys/term.h"

#include <unistd.h>

bool lx_isattyFd(int fd) {
    return ::isatty(fd);
}
