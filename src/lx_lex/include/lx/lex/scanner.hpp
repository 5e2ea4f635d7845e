#ifndef HEADER_GUARD_LX_LEX_SCANNER
#define HEADER_GUARD_LX_LEX_SCANNER

#include <string_view>
#include <vector>

#include "lx/lex/cursor.hpp"
#include "lx/lex/scan_options.hpp"
#include "lx/lex/token.hpp"

namespace lx {

/// Lazy, forward-only token stream over one input buffer.
///
/// Every call to `next` produces exactly one token. The last token is
/// always `t_eof`; after it has been produced `next` returns false.
/// Any byte sequence is accepted: unknown characters become `t_invalid`
/// tokens and scanning continues past them.
class Scanner {
public:
    explicit Scanner(std::string_view src, ScanOptions opts = {})
        : m_cursor{src}
        , m_opts{opts} {
    }

    Scanner(Scanner const &) = delete;
    Scanner &operator=(Scanner const &) = delete;

    bool next(Token &token);

    bool done() const {
        return m_done;
    }

    SourcePos pos() const {
        return m_cursor.pos();
    }

private:
    void skipSpaces();
    bool skipComment();

    ETokenId scanIdentifier();
    ETokenId scanNumber();
    ETokenId scanOperator();
    ETokenId scanPunctuation();
    ETokenId scanInvalid();

    Cursor m_cursor;
    ScanOptions const m_opts;
    bool m_done = false;
};

std::vector<Token> lex(std::string_view src, ScanOptions opts = {});

} // namespace lx

#endif // HEADER_GUARD_LX_LEX_SCANNER
