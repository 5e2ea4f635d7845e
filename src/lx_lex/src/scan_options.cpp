#include "lx/lex/scan_options.hpp"

#include "lx/common/logger.h"
#include "lx/common/utils.hpp"

namespace lx {

namespace {

LX_LOG_USE_SCOPE(scan_options);

struct OptionField {
    char const *name;
    bool ScanOptions::*field;
};

OptionField const c_option_fields[] = {
    {"float_literals", &ScanOptions::float_literals},
    {"keywords", &ScanOptions::keywords},
    {"comments", &ScanOptions::comments},
};

} // namespace

bool applyScanConfig(Config const &conf, ScanOptions &opts, std::string &err) {
    ScanOptions res = opts;

    for (auto const &[key, value] : conf) {
        OptionField const *option = nullptr;
        for (auto const &f : c_option_fields) {
            if (key == f.name) {
                option = &f;
                break;
            }
        }

        if (!option) {
            err = string_format("unknown option `%s`", key.c_str());
            return false;
        }

        if (value == "true") {
            res.*option->field = true;
        } else if (value == "false") {
            res.*option->field = false;
        } else {
            err = string_format(
                "invalid value `%s` for option `%s`. Possible values are `true`, `false`", value.c_str(), key.c_str());
            return false;
        }

        LX_LOG_DBG("%s=%s", key.c_str(), value.c_str());
    }

    opts = res;
    return true;
}

} // namespace lx
