//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Token.cpp
// Purpose: Token kind names and tokenize-style rendering.
// Key invariants: describe() is stable; tests and the Tokens panel rely on it.
// Ownership/Lifetime: Stateless helpers.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "lang/Token.hpp"

#include "lang/Value.hpp"

namespace stagelens::lang
{

const char *tokenKindName(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Name:
            return "NAME";
        case TokenKind::Number:
            return "NUMBER";
        case TokenKind::String:
            return "STRING";
        case TokenKind::Op:
            return "OP";
        case TokenKind::Comment:
            return "COMMENT";
        case TokenKind::Newline:
            return "NEWLINE";
        case TokenKind::Indent:
            return "INDENT";
        case TokenKind::Dedent:
            return "DEDENT";
        case TokenKind::EndMarker:
            return "ENDMARKER";
    }
    return "?";
}

bool Token::isLayout() const
{
    return kind == TokenKind::Newline || kind == TokenKind::Indent || kind == TokenKind::Dedent ||
           kind == TokenKind::EndMarker;
}

bool Token::isOp(const char *op) const
{
    return kind == TokenKind::Op && text == op;
}

bool Token::isName(const char *word) const
{
    return kind == TokenKind::Name && text == word;
}

std::string Token::describe() const
{
    std::string out = std::to_string(start.line) + "," + std::to_string(start.column) + "-" +
                      std::to_string(end.line) + "," + std::to_string(end.column) + ": ";
    out += tokenKindName(kind);
    out += ' ';
    out += Value::string(text).repr();
    return out;
}

} // namespace stagelens::lang
