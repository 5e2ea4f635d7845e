#include "lx/common/utils.hpp"

#include <cstdio>

std::string string_vformat(char const *fmt, va_list ap) {
    va_list ap_copy;
    va_copy(ap_copy, ap);
    int const len = std::vsnprintf(nullptr, 0, fmt, ap_copy);
    va_end(ap_copy);

    if (len <= 0) {
        return {};
    }

    std::string str(static_cast<size_t>(len) + 1, '\0');
    std::vsnprintf(&str[0], str.size(), fmt, ap);
    str.resize(static_cast<size_t>(len));
    return str;
}

std::string string_format(char const *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    defer {
        va_end(ap);
    };
    return string_vformat(fmt, ap);
}
