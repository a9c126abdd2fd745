//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: lang/LexerCursor.hpp
// Purpose: Lexer cursor management utilities.
//
// Key Invariants:
//   - Lines are 1-based, columns are 0-based byte offsets (tokenize style)
//   - EOF is indicated by returning '\0' from peek operations
//   - Newlines increment line and reset column to 0
//
//===----------------------------------------------------------------------===//
#pragma once

#include "support/source_loc.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace stagelens::lang
{

/// @brief CRTP base class for lexer cursor management.
/// @details Provides peek(), get(), eof(), and location tracking.
/// Derived class must provide source() returning std::string_view.
template <typename Derived> class LexerCursor
{
  public:
    /// @brief Peek at the current character without consuming it.
    /// @return The current character, or '\0' if at end of source.
    [[nodiscard]] char peek() const
    {
        auto src = static_cast<const Derived *>(this)->source();
        return pos_ < src.size() ? src[pos_] : '\0';
    }

    /// @brief Peek at a character ahead of current position.
    [[nodiscard]] char peek(std::size_t offset) const
    {
        auto src = static_cast<const Derived *>(this)->source();
        std::size_t idx = pos_ + offset;
        return idx < src.size() ? src[idx] : '\0';
    }

    /// @brief Consume and return the current character.
    char get()
    {
        auto src = static_cast<const Derived *>(this)->source();
        if (pos_ >= src.size())
            return '\0';
        char c = src[pos_++];
        if (c == '\n')
        {
            line_++;
            column_ = 0;
        }
        else
        {
            column_++;
        }
        return c;
    }

    /// @brief Check whether the lexer has reached the end of the source.
    [[nodiscard]] bool eof() const
    {
        return pos_ >= static_cast<const Derived *>(this)->source().size();
    }

    [[nodiscard]] std::size_t position() const noexcept
    {
        return pos_;
    }

    [[nodiscard]] uint32_t line() const noexcept
    {
        return line_;
    }

    [[nodiscard]] uint32_t column() const noexcept
    {
        return column_;
    }

    /// @brief Current location as a SourceLoc.
    [[nodiscard]] support::SourceLoc loc() const noexcept
    {
        return support::SourceLoc{line_, column_};
    }

  protected:
    std::size_t pos_{0};  ///< Current position in source.
    uint32_t line_{1};    ///< 1-based line number.
    uint32_t column_{0};  ///< 0-based column number.
};

/// @brief Skip horizontal whitespace (space, tab, CR, form feed).
template <typename Lexer> inline void skipHorizontalWhitespace(Lexer &lex)
{
    while (!lex.eof())
    {
        char c = lex.peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\f')
            lex.get();
        else
            break;
    }
}

/// @brief Skip a line (until newline or EOF) without consuming the newline.
template <typename Lexer> inline void skipToEndOfLine(Lexer &lex)
{
    while (!lex.eof() && lex.peek() != '\n')
        lex.get();
}

} // namespace stagelens::lang
