#ifndef HEADER_GUARD_LX_LEX_CLASSIFIER
#define HEADER_GUARD_LX_LEX_CLASSIFIER

#include <cstddef>
#include <string_view>

namespace lx {

// All predicates take a code point or a negative value (LX_EOF, LX_BAD_CHAR), which matches nothing.
// ASCII code points equal their byte values.

bool isIdentStart(int c);
bool isIdentContinue(int c);
bool isDigit(int c);
bool isWhitespace(int c);
bool isPunctuation(int c);
bool isOperatorStart(int c);

// Non-ASCII letters: Latin, Greek, Cyrillic, Armenian, Hebrew, Arabic, Indic, Thai, Georgian, Hangul, Kana, CJK
bool isUnicodeLetter(int c);

bool isUtf8Continuation(int c);

// Expected length of the UTF-8 sequence started by `c`, 1 for ASCII and stray bytes
size_t utf8SeqLength(int c);

// Decodes one code point from the start of `str` into `cp`.
// Returns the encoded length, or 0 for an empty or ill-formed sequence
// (stray byte, truncation, overlong form, surrogate, out of range).
size_t utf8Decode(std::string_view str, int &cp);

} // namespace lx

#endif // HEADER_GUARD_LX_LEX_CLASSIFIER
