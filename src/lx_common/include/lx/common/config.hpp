#ifndef HEADER_GUARD_LX_COMMON_CONFIG
#define HEADER_GUARD_LX_COMMON_CONFIG

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace lx {

using Config = std::map<std::string, std::string, std::less<>>;

// Parses `key = value` lines, `#` starts a comment line.
// Errors are reported through diagnostics with `file` as the location.
bool parseConfig(Config &conf, std::string_view src, std::string_view file);

bool readConfig(Config &conf, std::string_view file);

} // namespace lx

#endif // HEADER_GUARD_LX_COMMON_CONFIG
