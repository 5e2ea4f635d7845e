#ifndef HEADER_GUARD_LX_COMMON_DIAGNOSTICS
#define HEADER_GUARD_LX_COMMON_DIAGNOSTICS

#include <cstdarg>
#include <cstddef>
#include <string_view>

#include "lx/common/utils.hpp"

typedef enum {
    LxColor_Auto,
    LxColor_Always,
    LxColor_Never,
} LxColorPolicy;

void lx_diag_init(LxColorPolicy color_policy);

typedef struct {
    std::string_view file;
    size_t lin;
    size_t col;
    size_t len;
} LxSourceLocation;

LX_PRINTF_LIKE(1, 2) void lx_diag_printError(char const *fmt, ...);
LX_PRINTF_LIKE(2, 3) void lx_diag_printErrorFile(LxSourceLocation loc, char const *fmt, ...);
LX_PRINTF_LIKE(3, 4) void lx_diag_printErrorQuote(std::string_view src, LxSourceLocation loc, char const *fmt, ...);

LX_PRINTF_LIKE(1, 0) void lx_diag_vprintError(char const *fmt, va_list ap);
LX_PRINTF_LIKE(2, 0) void lx_diag_vprintErrorFile(LxSourceLocation loc, char const *fmt, va_list ap);
LX_PRINTF_LIKE(3, 0) void lx_diag_vprintErrorQuote(std::string_view src, LxSourceLocation loc, char const *fmt, va_list ap);

// Prints the quote alone, for callers whose header column differs from the byte column.
void lx_diag_printQuote(std::string_view src, size_t lin, size_t col, size_t len);

// Renders the quoted source line with its underline, without the message header.
// `col` and `len` are byte based.
std::string lx_diag_formatQuote(std::string_view src, size_t lin, size_t col, size_t len, bool to_color);

#endif // HEADER_GUARD_LX_COMMON_DIAGNOSTICS
