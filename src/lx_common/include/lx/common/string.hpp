#ifndef HEADER_GUARD_LX_COMMON_STRING_HPP
#define HEADER_GUARD_LX_COMMON_STRING_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace lx {

inline std::string_view trimLeft(std::string_view str) {
    while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
        str.remove_prefix(1);
    }
    return str;
}

inline std::string_view trimRight(std::string_view str) {
    while (!str.empty() && (str.back() == ' ' || str.back() == '\t' || str.back() == '\r')) {
        str.remove_suffix(1);
    }
    return str;
}

inline std::string_view trim(std::string_view str) {
    return trimRight(trimLeft(str));
}

// Returns the part of `str` before the first `delim` and drops it together with the delimiter
inline std::string_view chopByDelim(std::string_view &str, char delim) {
    size_t const i = str.find(delim);
    std::string_view res = str.substr(0, i);
    str.remove_prefix(i == std::string_view::npos ? str.size() : i + 1);
    return res;
}

// Appends a C-escaped copy of `str`, returns the number of characters appended
size_t escape(std::string &out, std::string_view str);

inline std::string escaped(std::string_view str) {
    std::string out;
    escape(out, str);
    return out;
}

} // namespace lx

#endif // HEADER_GUARD_LX_COMMON_STRING_HPP
