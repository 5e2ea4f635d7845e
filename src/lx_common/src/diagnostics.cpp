#include "lx/common/diagnostics.h"

#include <cstdio>
#include <string>

#include "lx/common/string.hpp"
#include "lx/sys/term.h"

#define MAX_LINE_QUOTE 120

static LxColorPolicy s_color_policy;

static bool toColor() {
    return s_color_policy == LxColor_Always || (s_color_policy == LxColor_Auto && lx_isattyFd(2));
}

void lx_diag_init(LxColorPolicy color_policy) {
    s_color_policy = color_policy;
}

void lx_diag_printError(char const *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    lx_diag_vprintError(fmt, ap);
    va_end(ap);
}

void lx_diag_printErrorFile(LxSourceLocation loc, char const *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    lx_diag_vprintErrorFile(loc, fmt, ap);
    va_end(ap);
}

void lx_diag_printErrorQuote(std::string_view src, LxSourceLocation loc, char const *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    lx_diag_vprintErrorQuote(src, loc, fmt, ap);
    va_end(ap);
}

void lx_diag_vprintError(char const *fmt, va_list ap) {
    bool const to_color = toColor();
    if (to_color) {
        fprintf(stderr, LX_TERM_COLOR_RED);
    }
    fprintf(stderr, "error:");
    if (to_color) {
        fprintf(stderr, LX_TERM_COLOR_NONE);
    }
    fprintf(stderr, " ");
    vfprintf(stderr, fmt, ap);
    fprintf(stderr, "\n");
}

void lx_diag_vprintErrorFile(LxSourceLocation loc, char const *fmt, va_list ap) {
    bool const to_color = toColor();
    if (to_color) {
        fprintf(stderr, LX_TERM_COLOR_WHITE);
    }
    fprintf(stderr, "%.*s", (int)loc.file.size(), loc.file.data());
    if (loc.lin) {
        fprintf(stderr, ":%zu", loc.lin);
    }
    if (loc.col) {
        fprintf(stderr, ":%zu", loc.col);
    }
    fprintf(stderr, ":");
    if (to_color) {
        fprintf(stderr, LX_TERM_COLOR_NONE);
    }
    fprintf(stderr, " ");

    lx_diag_vprintError(fmt, ap);
}

void lx_diag_vprintErrorQuote(std::string_view src, LxSourceLocation loc, char const *fmt, va_list ap) {
    lx_diag_vprintErrorFile(loc, fmt, ap);
    lx_diag_printQuote(src, loc.lin, loc.col, loc.len);
}

void lx_diag_printQuote(std::string_view src, size_t lin, size_t col, size_t len) {
    std::string const quote = lx_diag_formatQuote(src, lin, col, len, toColor());
    fwrite(quote.data(), 1, quote.size(), stderr);
}

std::string lx_diag_formatQuote(std::string_view src, size_t lin, size_t col, size_t len, bool to_color) {
    std::string out;

    std::string_view line{};
    for (size_t i = 0; i < lin; i++) {
        line = lx::chopByDelim(src, '\n');
    }
    line = lx::trimRight(line);
    if (line.empty()) {
        return out;
    }

    if (col && col <= line.size() && col > MAX_LINE_QUOTE / 2) {
        line.remove_prefix(col - MAX_LINE_QUOTE / 2);
        col = MAX_LINE_QUOTE / 2;
    }
    if (line.size() > MAX_LINE_QUOTE) {
        line = line.substr(0, MAX_LINE_QUOTE);
    }
    if (col && col > line.size()) {
        col = line.size();
    }
    if (col && len && len > line.size() - col) {
        len = line.size() - col + 1;
    }

    out += string_format("%5zu |", lin);
    size_t const line_offset = out.size();
    size_t pointer_offset = col;
    size_t actual_len = len;
    if (col && len) {
        pointer_offset = lx::escape(out, line.substr(0, col - 1)) + 1;
        if (to_color) {
            out += LX_TERM_COLOR_RED;
        }
        actual_len = lx::escape(out, line.substr(col - 1, len));
        if (to_color) {
            out += LX_TERM_COLOR_NONE;
        }
        lx::escape(out, line.substr(col - 1 + len));
    } else {
        lx::escape(out, line);
    }
    out += '\n';

    if (col) {
        out += std::string(line_offset - 1, ' ');
        out += '|';
        if (to_color) {
            out += LX_TERM_COLOR_RED;
        }
        out += std::string(pointer_offset - 1, ' ');
        out += '^';
        if (actual_len > 0) {
            out += std::string(actual_len - 1, '~');
        }
        if (to_color) {
            out += LX_TERM_COLOR_NONE;
        }
        out += '\n';
    }

    return out;
}
