//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Parser.hpp
// Purpose: Recursive-descent parser producing the Pylite AST.
// Key invariants: Parsing stops at the first error; callers never observe a
//                 partially built Module.
// Ownership/Lifetime: The parser owns its token vector; the returned Module
//                     owns the AST.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lang/Ast.hpp"
#include "lang/Token.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stagelens::lang
{

class Parser
{
  public:
    /// @brief Construct over a token stream; COMMENT tokens are dropped.
    explicit Parser(std::vector<Token> tokens);

    /// @brief Parse the whole token stream as a module.
    support::Expected<Module> parseModule();

  private:
    const Token &peek(size_t ahead = 0) const;
    const Token &advance();
    bool atOp(const char *op) const;
    bool atKeyword(const char *word) const;
    bool acceptOp(const char *op);
    bool expectOp(const char *op);
    bool expectKind(TokenKind kind, const char *what);

    StmtPtr parseStatement();
    StmtPtr parseSimpleStatement();
    StmtPtr parseFor();
    StmtPtr parseWhile();
    StmtPtr parseIf();
    bool parseBlock(StmtList &out);

    ExprPtr parseExprList();
    ExprPtr parseExpr();
    ExprPtr parseComparison();
    ExprPtr parseSum();
    ExprPtr parseTerm();
    ExprPtr parseFactor();
    ExprPtr parsePostfix();
    ExprPtr parsePrimary();

    /// @brief Validate @p e as an assignment/for target and mark it Store.
    bool markStoreTarget(Expr &e);

    /// @brief Record the first error; later ones are ignored.
    void fail(support::SourceLoc loc, std::string message);

    /// @brief Report "invalid syntax" at the current token.
    void failHere();

    /// @brief Count one level of unary or parenthesised nesting.
    /// @return False (with the error recorded) once the depth limit is hit.
    bool enterExpr();

    std::vector<Token> toks_;
    size_t pos_ = 0;
    unsigned exprDepth_ = 0;
    unsigned ifDepth_ = 0;
    std::optional<support::Diag> error_;
};

/// @brief Tokenize and parse @p src.
support::Expected<Module> parse(std::string_view src);

/// @brief Whether @p word is reserved in Pylite.
bool isKeyword(std::string_view word);

} // namespace stagelens::lang
