#ifndef HEADER_GUARD_LX_LEX_CURSOR
#define HEADER_GUARD_LX_LEX_CURSOR

#include <cstddef>
#include <string_view>

#include "lx/lex/token.hpp"

#define LX_EOF (-1)
#define LX_BAD_CHAR (-2)

namespace lx {

/// Position-tracking reader over an input buffer.
///
/// Characters are bytes, returned as `unsigned char` values widened to int,
/// or `LX_EOF` past the end. Lines and columns are 1-based. The column
/// advances once per UTF-8 sequence: continuation bytes that belong to the
/// sequence of the preceding lead byte are not counted, stray ones are.
class Cursor {
public:
    explicit Cursor(std::string_view src)
        : m_src{src} {
    }

    int peek(size_t n = 0) const {
        return m_pos + n < m_src.size() ? static_cast<unsigned char>(m_src[m_pos + n]) : LX_EOF;
    }

    // Decoded code point at the current offset, its encoded length goes to `len`.
    // Ill-formed UTF-8 gives LX_BAD_CHAR with `len` of 1.
    int peekChar(size_t &len) const;

    bool on(char c, size_t n = 0) const {
        return peek(n) == static_cast<unsigned char>(c);
    }

    bool eof() const {
        return m_pos >= m_src.size();
    }

    int advance();
    void advance(size_t n);

    SourcePos pos() const {
        return {m_pos, m_lin, m_col};
    }

    // Text between `from` and the current offset
    std::string_view slice(size_t from) const {
        return m_src.substr(from, m_pos - from);
    }

private:
    std::string_view m_src;

    size_t m_pos = 0;
    size_t m_lin = 1;
    size_t m_col = 1;
    size_t m_seq_left = 0;
};

} // namespace lx

#endif // HEADER_GUARD_LX_LEX_CURSOR
