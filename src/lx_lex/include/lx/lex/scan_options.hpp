#ifndef HEADER_GUARD_LX_LEX_SCAN_OPTIONS
#define HEADER_GUARD_LX_LEX_SCAN_OPTIONS

#include <string>

#include "lx/common/config.hpp"

namespace lx {

/// Optional grammar extensions.
struct ScanOptions {
    // `1.5` is a float_const, otherwise int_const, period, int_const
    bool float_literals = true;
    // Reserved words get their own ids instead of t_id
    bool keywords = false;
    // `// ...` and `/* ... */` are skipped like whitespace
    bool comments = false;
};

// Recognized keys: float_literals, keywords, comments. Values: true, false.
bool applyScanConfig(Config const &conf, ScanOptions &opts, std::string &err);

} // namespace lx

#endif // HEADER_GUARD_LX_LEX_SCAN_OPTIONS
