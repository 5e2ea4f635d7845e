#include "main.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#include "lx/common/cli.hpp"
#include "lx/common/config.hpp"
#include "lx/common/diagnostics.h"
#include "lx/common/logger.h"
#include "lx/common/string.hpp"
#include "lx/lex/scanner.hpp"

#ifndef LX_BINARY_NAME
#define LX_BINARY_NAME "lxscan"
#endif

#ifndef LX_BUILD_VERSION
#define LX_BUILD_VERSION "unknown"
#endif

namespace {

LX_LOG_USE_SCOPE(lxscan);

void printErrorUsage() {
    fprintf(stderr, "See `%s --help` for usage information\n", LX_BINARY_NAME);
}

void printUsage() {
    printf("Usage: " LX_BINARY_NAME
           " [options] {file | -e text}"
           "\nOptions:"
           "\n    -e, --expr TEXT                                      Scan TEXT instead of a file"
           "\n    -k, --keywords                                       Recognize reserved words"
           "\n        --no-floats                                      Scan `1.5` as integer, period, integer"
           "\n        --comments                                       Skip `//` and `/* */` comments"
           "\n        --config FILE                                    Read scan options from FILE"
           "\n    -c, --color {auto,always,never}                      Choose when to color output"
#ifdef ENABLE_LOGGING
           "\n    -l, --loglevel {none,error,warning,info,debug,trace} Select logging level"
#endif // ENABLE_LOGGING
           "\n    -h, --help                                           Display this message and exit"
           "\n    -v, --version                                        Show version information"
           "\n");
}

void printVersion() {
    printf(LX_BINARY_NAME " " LX_BUILD_VERSION "\n");
}

bool readFile(std::string_view file, std::string &out) {
    std::string const path{file};
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        lx_diag_printError("failed to read file `%s`: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

} // namespace

int lxscan_main(int /*argc*/, char const *const *argv) {
    std::string_view in_file{};
    std::string_view expr{};
    std::string_view config_file{};
    bool has_expr = false;
    bool help = false;
    bool version = false;

    bool opt_keywords = false;
    bool opt_no_floats = false;
    bool opt_comments = false;

    LxColorPolicy color_policy = LxColor_Auto;

    LxLoggerOptions log_options{};
    log_options.log_level = LxLog_Error;

    for (argv++; *argv;) {
        std::string_view key{};
        std::string_view val{};
        LX_CLI_ARG_INIT(&argv, &key, &val);

#define GET_VALUE                                                                                          \
    do {                                                                                                   \
        LX_CLI_ARG_GET_VALUE;                                                                              \
        if (val.empty()) {                                                                                 \
            fprintf(stderr, "error: argument `%.*s` requires a parameter\n", (int)key.size(), key.data()); \
            printErrorUsage();                                                                             \
            return 1;                                                                                      \
        }                                                                                                  \
    } while (0)

#define NO_VALUE                                                                                                \
    do {                                                                                                        \
        if (!val.empty()) {                                                                                     \
            fprintf(stderr, "error: argument `%.*s` doesn't accept parameters\n", (int)key.size(), key.data()); \
            printErrorUsage();                                                                                  \
            return 1;                                                                                           \
        }                                                                                                       \
    } while (0)

        if (!key.empty()) {
            if (key == "-h" || key == "--help") {
                NO_VALUE;
                help = true;
            } else if (key == "-v" || key == "--version") {
                NO_VALUE;
                version = true;
            } else if (key == "-e" || key == "--expr") {
                LX_CLI_ARG_GET_VALUE;
                expr = val;
                has_expr = true;
            } else if (key == "-k" || key == "--keywords") {
                NO_VALUE;
                opt_keywords = true;
            } else if (key == "--no-floats") {
                NO_VALUE;
                opt_no_floats = true;
            } else if (key == "--comments") {
                NO_VALUE;
                opt_comments = true;
            } else if (key == "--config") {
                GET_VALUE;
                config_file = val;
            } else if (key == "-c" || key == "--color") {
                GET_VALUE;
                if (val == "auto") {
                    color_policy = LxColor_Auto;
                    log_options.color_mode = LxLog_Color_Auto;
                } else if (val == "always") {
                    color_policy = LxColor_Always;
                    log_options.color_mode = LxLog_Color_Always;
                } else if (val == "never") {
                    color_policy = LxColor_Never;
                    log_options.color_mode = LxLog_Color_Never;
                } else {
                    fprintf(
                        stderr,
                        "error: invalid color mode `%.*s`. Possible values are `auto`, `always`, `never`\n",
                        (int)val.size(),
                        val.data());
                    printErrorUsage();
                    return 1;
                }
#ifdef ENABLE_LOGGING
            } else if (key == "-l" || key == "--loglevel") {
                GET_VALUE;
                if (val == "none") {
                    log_options.log_level = LxLog_None;
                } else if (val == "error") {
                    log_options.log_level = LxLog_Error;
                } else if (val == "warning") {
                    log_options.log_level = LxLog_Warning;
                } else if (val == "info") {
                    log_options.log_level = LxLog_Info;
                } else if (val == "debug") {
                    log_options.log_level = LxLog_Debug;
                } else if (val == "trace") {
                    log_options.log_level = LxLog_Trace;
                } else {
                    fprintf(
                        stderr,
                        "error: invalid loglevel `%.*s`. Possible values are `none`, `error`, `warning`, `info`, "
                        "`debug`, `trace`\n",
                        (int)val.size(),
                        val.data());
                    printErrorUsage();
                    return 1;
                }
#endif // ENABLE_LOGGING
            } else {
                fprintf(stderr, "error: invalid argument `%.*s`\n", (int)key.size(), key.data());
                printErrorUsage();
                return 1;
            }
        } else if (!has_expr && in_file.empty()) {
            in_file = val;
        } else {
            fprintf(stderr, "error: extra argument `%.*s`\n", (int)val.size(), val.data());
            printErrorUsage();
            return 1;
        }
    }

#undef GET_VALUE
#undef NO_VALUE

    if (help) {
        printUsage();
        return 0;
    }

    if (version) {
        printVersion();
        return 0;
    }

    if (!has_expr && in_file.empty()) {
        fprintf(stderr, "error: no input file\n");
        printErrorUsage();
        return 1;
    }

    if (has_expr && !in_file.empty()) {
        fprintf(stderr, "error: both an input file and `--expr` are given\n");
        printErrorUsage();
        return 1;
    }

    LX_LOGGER_INIT(log_options);
    lx_diag_init(color_policy);

    lx::ScanOptions opts{};

    if (!config_file.empty()) {
        lx::Config conf;
        if (!lx::readConfig(conf, config_file)) {
            return 1;
        }
        std::string err;
        if (!lx::applyScanConfig(conf, opts, err)) {
            lx_diag_printErrorFile({config_file, 0, 0, 0}, "%s", err.c_str());
            return 1;
        }
    }

    if (opt_keywords) {
        opts.keywords = true;
    }
    if (opt_no_floats) {
        opts.float_literals = false;
    }
    if (opt_comments) {
        opts.comments = true;
    }

    std::string src;
    std::string_view file = in_file;
    if (has_expr) {
        src = std::string{expr};
        file = "<expr>";
    } else if (!readFile(in_file, src)) {
        return 1;
    }

    LX_LOG_INF(
        "scanning `%.*s` keywords=%i float_literals=%i comments=%i",
        (int)file.size(),
        file.data(),
        opts.keywords,
        opts.float_literals,
        opts.comments);

    size_t invalid_count = 0;

    lx::Scanner scanner{src, opts};
    lx::Token token{};
    while (scanner.next(token)) {
        std::string const line = lx::tokenToString(token);
        printf("%s\n", line.c_str());

        if (token.id == lx::t_invalid) {
            invalid_count++;
            std::string const text = lx::escaped(token.text);
            lx_diag_printErrorFile(
                {file, token.pos.lin, token.pos.col, token.text.size()}, "unknown character `%s`", text.c_str());
            // Quote columns are byte based
            size_t const nl = token.pos.offset ? src.rfind('\n', token.pos.offset - 1) : std::string::npos;
            size_t const line_start = nl == std::string::npos ? 0 : nl + 1;
            lx_diag_printQuote(src, token.pos.lin, token.pos.offset - line_start + 1, token.text.size());
        }
    }

    fflush(stdout);

    if (invalid_count) {
        LX_LOG_WRN("%zu invalid tokens", invalid_count);
        return 1;
    }

    return 0;
}
