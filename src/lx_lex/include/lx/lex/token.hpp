#ifndef HEADER_GUARD_LX_LEX_TOKEN
#define HEADER_GUARD_LX_LEX_TOKEN

#include <cstddef>
#include <string>
#include <string_view>

namespace lx {

enum ETokenId {
#define PN(ID, TEXT) t_##ID,
#define OP(ID, TEXT) t_##ID,
#define KW(ID) t_##ID,
#define SP(ID, TEXT) t_##ID,
#include "lx/lex/tokens.inl"

    Token_Count,
};

enum class TokenKind {
    Identifier,
    Keyword,
    IntegerLiteral,
    FloatLiteral,
    Punctuation,
    Operator,
    EndOfInput,
    Invalid,
};

struct SourcePos {
    size_t offset;
    size_t lin;
    size_t col;
};

inline bool operator==(SourcePos const &lhs, SourcePos const &rhs) {
    return lhs.offset == rhs.offset && lhs.lin == rhs.lin && lhs.col == rhs.col;
}

inline bool operator!=(SourcePos const &lhs, SourcePos const &rhs) {
    return !(lhs == rhs);
}

// Line/column ordering
inline bool operator<(SourcePos const &lhs, SourcePos const &rhs) {
    return lhs.lin < rhs.lin || (lhs.lin == rhs.lin && lhs.col < rhs.col);
}

inline bool operator<=(SourcePos const &lhs, SourcePos const &rhs) {
    return !(rhs < lhs);
}

/// A classified slice of the input.
///
/// `text` points into the scanned buffer and is empty only for `t_eof`.
/// For `t_invalid` it holds the offending character (a whole UTF-8 sequence
/// when the character is multi-byte).
struct Token {
    std::string_view text;
    SourcePos pos;
    ETokenId id;

    TokenKind kind() const;

    size_t endOffset() const {
        return pos.offset + text.size();
    }
};

extern char const *s_token_id[];
extern char const *s_token_text[];

TokenKind tokenKind(ETokenId id);
char const *tokenKindName(TokenKind kind);

// `lin:col id "text"`
std::string tokenToString(Token const &token);

} // namespace lx

#endif // HEADER_GUARD_LX_LEX_TOKEN
