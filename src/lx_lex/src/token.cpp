#include "lx/lex/token.hpp"

#include "lx/common/string.hpp"
#include "lx/common/utils.hpp"

namespace lx {

char const *s_token_id[] = {
#define PN(ID, TEXT) #ID,
#define OP(ID, TEXT) #ID,
#define KW(ID) #ID,
#define SP(ID, TEXT) #ID,
#include "lx/lex/tokens.inl"
};

char const *s_token_text[] = {
#define PN(ID, TEXT) TEXT,
#define OP(ID, TEXT) TEXT,
#define KW(ID) #ID,
#define SP(ID, TEXT) TEXT,
#include "lx/lex/tokens.inl"
};

static_assert(LX_AR_SIZE(s_token_id) == Token_Count, "token id table is out of sync");
static_assert(LX_AR_SIZE(s_token_text) == Token_Count, "token text table is out of sync");

TokenKind tokenKind(ETokenId id) {
    switch (id) {
    case t_id:
        return TokenKind::Identifier;
    case t_int_const:
        return TokenKind::IntegerLiteral;
    case t_float_const:
        return TokenKind::FloatLiteral;
    case t_eof:
        return TokenKind::EndOfInput;
    default:
        break;
    }

    if (id > t_punctuation_marker && id < t_operator_marker) {
        return TokenKind::Punctuation;
    } else if (id > t_operator_marker && id < t_keyword_marker) {
        return TokenKind::Operator;
    } else if (id > t_keyword_marker && id < t_id) {
        return TokenKind::Keyword;
    }

    return TokenKind::Invalid;
}

TokenKind Token::kind() const {
    return tokenKind(id);
}

char const *tokenKindName(TokenKind kind) {
    switch (kind) {
    case TokenKind::Identifier:
        return "Identifier";
    case TokenKind::Keyword:
        return "Keyword";
    case TokenKind::IntegerLiteral:
        return "IntegerLiteral";
    case TokenKind::FloatLiteral:
        return "FloatLiteral";
    case TokenKind::Punctuation:
        return "Punctuation";
    case TokenKind::Operator:
        return "Operator";
    case TokenKind::EndOfInput:
        return "EndOfInput";
    case TokenKind::Invalid:
        return "Invalid";
    }
    return "";
}

std::string tokenToString(Token const &token) {
    std::string str = string_format("%zu:%zu %s \"", token.pos.lin, token.pos.col, s_token_id[token.id]);
    escape(str, token.text);
    str += '"';
    return str;
}

} // namespace lx
