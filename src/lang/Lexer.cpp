//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/lang/Lexer.cpp
// Purpose: Implement the Pylite tokenizer.
// Key invariants: Tabs advance indentation to the next multiple of eight.
//                 Errors stop tokenization; no partial token list escapes.
// Ownership/Lifetime: See Lexer.hpp.
// Links: docs/pylite.md
//
//===----------------------------------------------------------------------===//

#include "lang/Lexer.hpp"

#include <cctype>
#include <cstring>

namespace stagelens::lang
{
namespace
{
constexpr int kMaxBracketDepth = 200;
constexpr size_t kMaxIndentLevels = 100;

bool isNameStart(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isNameChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

constexpr const char *kTwoCharOps[] = {"//", "==", "!=", "<=", ">=", "->", "**"};
constexpr const char kOneCharOps[] = "()[]{},:;.=+-*/%<>";
} // namespace

/// @brief Measure leading whitespace and emit INDENT/DEDENT tokens.
/// @details Blank and comment-only lines do not affect indentation; their
///          comments are still emitted so the Tokens stage shows them.
bool Lexer::lexIndentation(std::vector<Token> &out, support::Diag *&error)
{
    uint32_t width = 0;
    const uint32_t lineNo = line();
    std::string ws;
    while (peek() == ' ' || peek() == '\t' || peek() == '\f')
    {
        char c = get();
        ws += c;
        if (c == '\t')
            width = (width / 8 + 1) * 8;
        else if (c == ' ')
            ++width;
    }
    if (peek() == '\r')
        get();
    if (eof() || peek() == '\n' || peek() == '#')
    {
        if (peek() == '#')
            out.push_back(lexComment());
        if (peek() == '\n')
            get();
        return false;
    }

    const support::SourceLoc here = loc();
    if (width > indents_.back())
    {
        if (indents_.size() > kMaxIndentLevels)
        {
            pendingError_ = support::makeError(here, "too many levels of indentation");
            error = &pendingError_;
            return true;
        }
        indents_.push_back(width);
        out.push_back(Token{TokenKind::Indent, ws, {lineNo, 0}, here});
    }
    else
    {
        while (width < indents_.back())
        {
            indents_.pop_back();
            out.push_back(Token{TokenKind::Dedent, "", here, here});
        }
        if (width != indents_.back())
        {
            pendingError_ =
                support::makeError(here, "unindent does not match any outer indentation level");
            error = &pendingError_;
        }
    }
    return true;
}

Token Lexer::lexName()
{
    Token t;
    t.kind = TokenKind::Name;
    t.start = loc();
    while (isNameChar(peek()))
        t.text += get();
    t.end = loc();
    return t;
}

Token Lexer::lexNumber()
{
    Token t;
    t.kind = TokenKind::Number;
    t.start = loc();
    while (isDigit(peek()) || (peek() == '_' && isDigit(peek(1))))
        t.text += get();
    t.end = loc();
    return t;
}

/// @brief Lex a single-line string literal, keeping quotes and escapes verbatim.
bool Lexer::lexString(Token &out, support::Diag &error)
{
    out.kind = TokenKind::String;
    out.start = loc();
    const char quote = get();
    out.text += quote;
    while (true)
    {
        char c = peek();
        if (c == '\0' || c == '\n')
        {
            error = support::makeError(out.start, "unterminated string literal");
            return false;
        }
        out.text += get();
        if (c == '\\')
        {
            if (peek() == '\0' || peek() == '\n')
            {
                error = support::makeError(out.start, "unterminated string literal");
                return false;
            }
            out.text += get();
            continue;
        }
        if (c == quote)
            break;
    }
    out.end = loc();
    return true;
}

bool Lexer::lexOp(Token &out, support::Diag &error)
{
    out.kind = TokenKind::Op;
    out.start = loc();
    const char two[3] = {peek(), peek(1), '\0'};
    for (const char *op : kTwoCharOps)
    {
        if (std::strcmp(op, two) == 0)
        {
            out.text += get();
            out.text += get();
            out.end = loc();
            return true;
        }
    }
    const char c = peek();
    if (c == '\0' || std::strchr(kOneCharOps, c) == nullptr)
    {
        error = support::makeError(out.start,
                                   std::string("invalid character '") + c + "' in source");
        return false;
    }
    out.text += get();
    out.end = loc();
    if (c == '(' || c == '[' || c == '{')
    {
        if (++bracketDepth_ > kMaxBracketDepth)
        {
            error = support::makeError(out.start, "too many nested parentheses");
            return false;
        }
    }
    else if ((c == ')' || c == ']' || c == '}') && bracketDepth_ > 0)
        --bracketDepth_;
    return true;
}

Token Lexer::lexComment()
{
    Token t;
    t.kind = TokenKind::Comment;
    t.start = loc();
    while (!eof() && peek() != '\n' && peek() != '\r')
        t.text += get();
    t.end = loc();
    return t;
}

/// @brief Drive the scanner over the whole source.
/// @details The loop alternates between line-start handling (indentation)
///          and token scanning. At EOF a NEWLINE is synthesised when the last
///          logical line lacked one, remaining indents are closed, and
///          ENDMARKER is appended on the line after the last one.
support::Expected<std::vector<Token>> Lexer::tokenize()
{
    std::vector<Token> out;
    support::Diag error{};
    bool lineHasTokens = false;

    while (true)
    {
        if (atLineStart_ && bracketDepth_ == 0)
        {
            if (eof())
                break;
            support::Diag *indentError = nullptr;
            if (!lexIndentation(out, indentError))
                continue;
            if (indentError)
                return *indentError;
            atLineStart_ = false;
        }

        skipHorizontalWhitespace(*this);
        if (eof())
            break;

        const char c = peek();
        if (c == '\n')
        {
            if (bracketDepth_ == 0)
            {
                const support::SourceLoc start = loc();
                get();
                out.push_back(Token{TokenKind::Newline, "\n", start, {start.line, start.column + 1}});
                atLineStart_ = true;
                lineHasTokens = false;
            }
            else
            {
                get();
            }
            continue;
        }
        if (c == '\\' && peek(1) == '\n')
        {
            get();
            get();
            continue;
        }
        if (c == '#')
        {
            out.push_back(lexComment());
            continue;
        }

        lineHasTokens = true;
        if (isNameStart(c))
        {
            out.push_back(lexName());
        }
        else if (isDigit(c))
        {
            out.push_back(lexNumber());
        }
        else if (c == '"' || c == '\'')
        {
            Token t;
            if (!lexString(t, error))
                return error;
            out.push_back(std::move(t));
        }
        else
        {
            Token t;
            if (!lexOp(t, error))
                return error;
            out.push_back(std::move(t));
        }
    }

    if (bracketDepth_ > 0)
        return support::makeError(loc(), "unexpected EOF in multi-line statement");

    const support::SourceLoc end = loc();
    if (lineHasTokens)
        out.push_back(Token{TokenKind::Newline, "", end, {end.line, end.column + 1}});
    const uint32_t lastLine = end.column == 0 ? end.line : end.line + 1;
    const support::SourceLoc markerLoc{lastLine, 0};
    while (indents_.size() > 1)
    {
        indents_.pop_back();
        out.push_back(Token{TokenKind::Dedent, "", markerLoc, markerLoc});
    }
    out.push_back(Token{TokenKind::EndMarker, "", markerLoc, markerLoc});
    return out;
}

support::Expected<std::vector<Token>> tokenize(std::string_view src)
{
    Lexer lexer(src);
    return lexer.tokenize();
}

} // namespace stagelens::lang
