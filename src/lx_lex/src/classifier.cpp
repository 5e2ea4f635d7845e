#include "lx/lex/classifier.hpp"

#include <algorithm>
#include <iterator>

#include "lx/lex/token.hpp"

namespace lx {

namespace {

struct CodePointRange {
    int first;
    int last;
};

// clang-format off
CodePointRange const c_letter_ranges[] = {
    {0x00aa, 0x00aa}, {0x00b5, 0x00b5}, {0x00ba, 0x00ba},
    {0x00c0, 0x00d6}, {0x00d8, 0x00f6}, {0x00f8, 0x02c1}, // Latin-1, Latin Extended, IPA
    {0x02c6, 0x02d1}, {0x02e0, 0x02e4},                   // Modifier letters
    {0x0370, 0x0374}, {0x0376, 0x0377}, {0x037a, 0x037d}, {0x037f, 0x037f},
    {0x0386, 0x0386}, {0x0388, 0x038a}, {0x038c, 0x038c}, {0x038e, 0x03a1},
    {0x03a3, 0x03f5}, {0x03f7, 0x0481},                   // Greek, Coptic, Cyrillic
    {0x048a, 0x052f},                                     // Cyrillic
    {0x0531, 0x0556}, {0x0560, 0x0588},                   // Armenian
    {0x05d0, 0x05ea},                                     // Hebrew
    {0x0620, 0x064a}, {0x0671, 0x06d3},                   // Arabic
    {0x0904, 0x0939},                                     // Devanagari
    {0x0e01, 0x0e30},                                     // Thai
    {0x10a0, 0x10c5}, {0x10d0, 0x10fa},                   // Georgian
    {0x1e00, 0x1fbc},                                     // Latin Extended Additional, Greek Extended
    {0x3041, 0x3096}, {0x30a1, 0x30fa},                   // Hiragana, Katakana
    {0x4e00, 0x9fff},                                     // CJK Unified Ideographs
    {0xac00, 0xd7a3},                                     // Hangul Syllables
};

// Unicode White_Space outside ASCII
CodePointRange const c_space_ranges[] = {
    {0x0085, 0x0085}, {0x00a0, 0x00a0}, {0x1680, 0x1680}, {0x2000, 0x200a},
    {0x2028, 0x2029}, {0x202f, 0x202f}, {0x205f, 0x205f}, {0x3000, 0x3000},
};
// clang-format on

template <size_t N>
bool inRanges(int c, CodePointRange const (&ranges)[N]) {
    auto it = std::lower_bound(std::begin(ranges), std::end(ranges), c, [](CodePointRange const &range, int value) {
        return range.last < value;
    });
    return it != std::end(ranges) && it->first <= c;
}

// Looks through the token table between the two marker entries
bool isFirstCharOf(int c, ETokenId begin_marker, ETokenId end_marker) {
    for (int id = begin_marker + 1; id < end_marker; id++) {
        if (static_cast<unsigned char>(s_token_text[id][0]) == c) {
            return true;
        }
    }
    return false;
}

} // namespace

bool isIdentStart(int c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || isUnicodeLetter(c);
}

bool isIdentContinue(int c) {
    return isIdentStart(c) || isDigit(c);
}

bool isDigit(int c) {
    return c >= '0' && c <= '9';
}

bool isWhitespace(int c) {
    switch (c) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case '\v':
    case '\f':
        return true;
    default:
        return c >= 0x80 && inRanges(c, c_space_ranges);
    }
}

bool isPunctuation(int c) {
    return c > 0 && c < 0x80 && isFirstCharOf(c, t_punctuation_marker, t_operator_marker);
}

bool isOperatorStart(int c) {
    return c > 0 && c < 0x80 && isFirstCharOf(c, t_operator_marker, t_keyword_marker);
}

bool isUnicodeLetter(int c) {
    return c >= 0x80 && inRanges(c, c_letter_ranges);
}

bool isUtf8Continuation(int c) {
    return c >= 0 && (c & 0xc0) == 0x80;
}

size_t utf8SeqLength(int c) {
    if (c >= 0xc2 && c <= 0xdf) {
        return 2;
    } else if (c >= 0xe0 && c <= 0xef) {
        return 3;
    } else if (c >= 0xf0 && c <= 0xf4) {
        return 4;
    }
    return 1;
}

size_t utf8Decode(std::string_view str, int &cp) {
    static constexpr int c_min_code_point[] = {0, 0, 0x80, 0x800, 0x10000};

    if (str.empty()) {
        return 0;
    }

    int const lead = static_cast<unsigned char>(str[0]);
    if (lead < 0x80) {
        cp = lead;
        return 1;
    }

    size_t const len = utf8SeqLength(lead);
    if (len == 1 || str.size() < len) {
        return 0;
    }

    int res = lead & (0xff >> (len + 1));
    for (size_t i = 1; i < len; i++) {
        int const c = static_cast<unsigned char>(str[i]);
        if (!isUtf8Continuation(c)) {
            return 0;
        }
        res = (res << 6) | (c & 0x3f);
    }

    if (res < c_min_code_point[len] || res > 0x10ffff || (res >= 0xd800 && res <= 0xdfff)) {
        return 0;
    }

    cp = res;
    return len;
}

} // namespace lx
