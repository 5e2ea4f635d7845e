#ifndef HEADER_GUARD_LX_COMMON_CLI
#define HEADER_GUARD_LX_COMMON_CLI

#include <string_view>

#include "lx/common/string.hpp"

// Splits the next argument into a key and a value:
// `--key=val`, `--key`, `-kval`, `-k=val`, `-k` or a positional `val`.
#define LX_CLI_ARG_INIT(pargv, pkey, pval)                       \
    char const *const **_lx_cli_pargv = (pargv);                 \
    std::string_view *_lx_cli_pkey = (pkey);                     \
    std::string_view *_lx_cli_pval = (pval);                     \
    do {                                                         \
        std::string_view _str{*(*_lx_cli_pargv)++};              \
        if (_str.substr(0, 2) == "--") {                         \
            *_lx_cli_pval = _str;                                \
            *_lx_cli_pkey = lx::chopByDelim(*_lx_cli_pval, '='); \
        } else if (!_str.empty() && _str.front() == '-') {       \
            *_lx_cli_pkey = _str.substr(0, 2);                   \
            if (_str.size() > 2) {                               \
                *_lx_cli_pval = _str.substr(2);                  \
                if (_lx_cli_pval->front() == '=') {              \
                    _lx_cli_pval->remove_prefix(1);              \
                }                                                \
            }                                                    \
        } else {                                                 \
            *_lx_cli_pval = _str;                                \
        }                                                        \
    } while (0)

// Takes the value from the following argument if it was not attached to the key
#define LX_CLI_ARG_GET_VALUE                                                               \
    do {                                                                                   \
        if (_lx_cli_pval->empty() && *(*_lx_cli_pargv) && (*(*_lx_cli_pargv))[0] != '-') { \
            *_lx_cli_pval = *(*_lx_cli_pargv)++;                                           \
        }                                                                                  \
    } while (0)

#endif // HEADER_GUARD_LX_COMMON_CLI
