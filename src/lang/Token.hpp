//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Token.hpp
// Purpose: Token kinds and token records produced by the Pylite lexer.
// Key invariants: Keywords are NAME tokens; the parser distinguishes them.
//                 Layout tokens (NEWLINE, INDENT, DEDENT, ENDMARKER) carry
//                 positions but never belong to a single statement's text.
// Ownership/Lifetime: Tokens own their text.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_loc.hpp"

#include <cstdint>
#include <string>

namespace stagelens::lang
{

enum class TokenKind : uint8_t
{
    Name,
    Number,
    String,
    Op,
    Comment,
    Newline,
    Indent,
    Dedent,
    EndMarker,
};

/// @brief Upper-case tokenize-style name ("NAME", "OP", ...).
const char *tokenKindName(TokenKind kind);

struct Token
{
    TokenKind kind = TokenKind::EndMarker;
    std::string text;        ///< Exact source spelling (string quotes included).
    support::SourceLoc start;
    support::SourceLoc end;

    /// @brief Whether this is a layout token rather than source text.
    [[nodiscard]] bool isLayout() const;

    /// @brief Whether the token is OP with spelling @p op.
    [[nodiscard]] bool isOp(const char *op) const;

    /// @brief Whether the token is the keyword/name @p word.
    [[nodiscard]] bool isName(const char *word) const;

    /// @brief Render as `1,0-1,1: NAME 'a'`.
    [[nodiscard]] std::string describe() const;
};

} // namespace stagelens::lang
