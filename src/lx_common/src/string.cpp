#include "lx/common/string.hpp"

#include <cctype>
#include <cinttypes>
#include <cstdio>

namespace lx {

size_t escape(std::string &out, std::string_view str) {
    size_t const size_before = out.size();
    for (char c : str) {
        switch (c) {
        case '\a':
            out += "\\a";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\v':
            out += "\\v";
            break;
        case '\0':
            out += "\\0";
            break;
        case '\"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        default:
            if (std::isprint(static_cast<unsigned char>(c))) {
                out += c;
            } else {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02" PRIx8, static_cast<uint8_t>(c));
                out += buf;
            }
            break;
        }
    }
    return out.size() - size_before;
}

} // namespace lx
