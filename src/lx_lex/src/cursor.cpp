#include "lx/lex/cursor.hpp"

#include "lx/lex/classifier.hpp"

namespace lx {

int Cursor::peekChar(size_t &len) const {
    if (eof()) {
        len = 0;
        return LX_EOF;
    }

    int cp = 0;
    len = utf8Decode(m_src.substr(m_pos), cp);
    if (!len) {
        len = 1;
        return LX_BAD_CHAR;
    }
    return cp;
}

int Cursor::advance() {
    int const c = peek();
    if (c == LX_EOF) {
        return LX_EOF;
    }

    m_pos++;
    if (c == '\n') {
        m_lin++;
        m_col = 1;
        m_seq_left = 0;
    } else if (m_seq_left && isUtf8Continuation(c)) {
        m_seq_left--;
    } else {
        m_col++;
        m_seq_left = utf8SeqLength(c) - 1;
    }

    return c;
}

void Cursor::advance(size_t n) {
    for (size_t i = 0; i < n && advance() != LX_EOF; i++) {
    }
}

} // namespace lx
