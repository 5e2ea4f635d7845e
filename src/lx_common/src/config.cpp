#include "lx/common/config.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include "lx/common/diagnostics.h"
#include "lx/common/logger.h"
#include "lx/common/string.hpp"

#define MAX_LINE 4096

namespace lx {

namespace {

LX_LOG_USE_SCOPE(config);

} // namespace

bool parseConfig(Config &conf, std::string_view src, std::string_view file) {
    std::string_view const text = src;
    size_t lin = 1;
    while (!src.empty()) {
        std::string_view line = trim(chopByDelim(src, '\n'));
        if (!line.empty()) {
            if (line.size() > MAX_LINE) {
                lx_diag_printErrorQuote(text, {file, lin, 0, 0}, "failed to read config: line too long");
                return false;
            }
            if (line.front() != '#') {
                std::string_view const field = trim(chopByDelim(line, '='));
                line = trim(line);
                if (field.empty() || line.empty()) {
                    lx_diag_printErrorQuote(text, {file, lin, 0, 0}, "failed to read config: syntax error");
                    return false;
                }
                LX_LOG_DBG("%.*s = %.*s", (int)field.size(), field.data(), (int)line.size(), line.data());
                conf.insert_or_assign(std::string{field}, std::string{line});
            }
        }

        lin++;
    }

    return true;
}

bool readConfig(Config &conf, std::string_view file) {
    std::string const path{file};
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        lx_diag_printError("failed to read config `%s`: %s", path.c_str(), std::strerror(errno));
        return false;
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    std::string const src = ss.str();

    return parseConfig(conf, src, file);
}

} // namespace lx
