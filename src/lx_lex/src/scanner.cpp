#include "lx/lex/scanner.hpp"

#include <cstring>

#include "lx/common/logger.h"
#include "lx/common/string.hpp"
#include "lx/lex/classifier.hpp"

namespace lx {

namespace {

LX_LOG_USE_SCOPE(scanner);

} // namespace

bool Scanner::next(Token &token) {
    if (m_done) {
        return false;
    }

    skipSpaces();

    SourcePos const start = m_cursor.pos();

    ETokenId id{};
    size_t len = 0;
    int const c = m_cursor.peekChar(len);

    if (c == LX_EOF) {
        id = t_eof;
        m_done = true;
    } else if (isIdentStart(c)) {
        id = scanIdentifier();
    } else if (isDigit(c)) {
        id = scanNumber();
    } else if (isOperatorStart(c)) {
        id = scanOperator();
    } else if (isPunctuation(c)) {
        id = scanPunctuation();
    } else {
        id = scanInvalid();
    }

    token = {m_cursor.slice(start.offset), start, id};

    LX_LOG_DBG("%s: \"%s\"", s_token_id[token.id], escaped(token.text).c_str());

    return true;
}

void Scanner::skipSpaces() {
    do {
        size_t len = 0;
        while (isWhitespace(m_cursor.peekChar(len))) {
            m_cursor.advance(len);
        }
    } while (m_opts.comments && skipComment());
}

bool Scanner::skipComment() {
    if (!m_cursor.on('/')) {
        return false;
    }

    if (m_cursor.on('/', 1)) {
        while (!m_cursor.eof() && !m_cursor.on('\n')) {
            m_cursor.advance();
        }
        return true;
    } else if (m_cursor.on('*', 1)) {
        m_cursor.advance(2);
        while (!m_cursor.eof()) {
            if (m_cursor.on('*') && m_cursor.on('/', 1)) {
                m_cursor.advance(2);
                break;
            }
            m_cursor.advance();
        }
        return true;
    }

    return false;
}

ETokenId Scanner::scanIdentifier() {
    size_t const start = m_cursor.pos().offset;

    size_t len = 0;
    while (isIdentContinue(m_cursor.peekChar(len))) {
        m_cursor.advance(len);
    }

    if (m_opts.keywords) {
        std::string_view const text = m_cursor.slice(start);
        for (int id = t_keyword_marker + 1; id < t_id; id++) {
            if (text == s_token_text[id]) {
                return static_cast<ETokenId>(id);
            }
        }
    }

    return t_id;
}

ETokenId Scanner::scanNumber() {
    while (isDigit(m_cursor.peek())) {
        m_cursor.advance();
    }

    if (m_opts.float_literals && m_cursor.on('.') && isDigit(m_cursor.peek(1))) {
        m_cursor.advance();
        while (isDigit(m_cursor.peek())) {
            m_cursor.advance();
        }
        return t_float_const;
    }

    return t_int_const;
}

ETokenId Scanner::scanOperator() {
    int op_id = t_invalid;
    size_t op_len = 0;

    for (int id = t_operator_marker + 1; id < t_keyword_marker; id++) {
        char const *text = s_token_text[id];
        size_t const len = std::strlen(text);
        if (len <= op_len) {
            continue;
        }
        size_t i = 0;
        for (; i < len && m_cursor.on(text[i], i); i++) {
        }
        if (i == len) {
            op_id = id;
            op_len = len;
        }
    }

    if (!op_len) {
        return scanInvalid();
    }

    m_cursor.advance(op_len);
    return static_cast<ETokenId>(op_id);
}

ETokenId Scanner::scanPunctuation() {
    int const c = m_cursor.advance();
    for (int id = t_punctuation_marker + 1; id < t_operator_marker; id++) {
        if (static_cast<unsigned char>(s_token_text[id][0]) == c) {
            return static_cast<ETokenId>(id);
        }
    }
    return t_invalid;
}

ETokenId Scanner::scanInvalid() {
    size_t const len = utf8SeqLength(m_cursor.advance());
    for (size_t i = 1; i < len && isUtf8Continuation(m_cursor.peek()); i++) {
        m_cursor.advance();
    }
    return t_invalid;
}

std::vector<Token> lex(std::string_view src, ScanOptions opts) {
    LX_LOG_TRC("%s", __func__);

    std::vector<Token> tokens;
    Scanner scanner{src, opts};

    Token token{};
    while (scanner.next(token)) {
        tokens.emplace_back(token);
    }

    LX_LOG_TRC("produced %zu tokens", tokens.size());

    return tokens;
}

} // namespace lx
