//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Lexer.hpp
// Purpose: Indentation-aware tokenizer for Pylite source text.
// Key invariants: A successful tokenize() ends with ENDMARKER and balances
//                 every INDENT with a DEDENT. Newlines inside brackets are
//                 joined (no NEWLINE emitted).
// Ownership/Lifetime: The lexer views the caller's source; the returned
//                     tokens own their text.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lang/LexerCursor.hpp"
#include "lang/Token.hpp"
#include "support/diag_expected.hpp"

#include <string_view>
#include <vector>

namespace stagelens::lang
{

class Lexer : public LexerCursor<Lexer>
{
  public:
    explicit Lexer(std::string_view src) : src_(src) {}

    /// @brief Source viewed by the cursor.
    [[nodiscard]] std::string_view source() const
    {
        return src_;
    }

    /// @brief Tokenize the whole source.
    /// @return Tokens, or the first lexical error.
    support::Expected<std::vector<Token>> tokenize();

  private:
    /// @brief Handle indentation at the start of a logical line.
    /// @return False when the line is blank or comment-only and was skipped.
    bool lexIndentation(std::vector<Token> &out, support::Diag *&error);

    Token lexName();
    Token lexNumber();
    bool lexString(Token &out, support::Diag &error);
    bool lexOp(Token &out, support::Diag &error);
    Token lexComment();

    std::string_view src_;
    std::vector<uint32_t> indents_{0};
    int bracketDepth_ = 0;
    bool atLineStart_ = true;
    support::Diag pendingError_{};
};

/// @brief Convenience wrapper constructing a Lexer over @p src.
support::Expected<std::vector<Token>> tokenize(std::string_view src);

} // namespace stagelens::lang
