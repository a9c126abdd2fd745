// tui/include/tui/text/text_buffer.hpp
// @brief Editable text with line-start bookkeeping.
// @invariant lineStarts_ always indexes the first byte of every line;
//            line numbers and columns are 0-based byte offsets.
// @ownership TextBuffer owns its text.
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stagelens::tui::text
{

class TextBuffer
{
  public:
    void load(std::string text);

    [[nodiscard]] const std::string &str() const
    {
        return text_;
    }

    [[nodiscard]] size_t size() const
    {
        return text_.size();
    }

    [[nodiscard]] size_t lineCount() const
    {
        return lineStarts_.size();
    }

    /// @brief Line @p line without its newline; empty past the end.
    [[nodiscard]] std::string_view getLine(size_t line) const;

    /// @brief Offset of the first byte of @p line, or size() past the end.
    [[nodiscard]] size_t lineStart(size_t line) const;

    /// @brief Offset of the newline ending @p line, or size().
    [[nodiscard]] size_t lineEnd(size_t line) const;

    /// @brief (line, column) of byte @p offset.
    [[nodiscard]] std::pair<size_t, size_t> position(size_t offset) const;

    /// @brief Offset of (@p line, @p col), clamped to the line.
    [[nodiscard]] size_t offset(size_t line, size_t col) const;

    void insert(size_t pos, std::string_view s);
    void erase(size_t pos, size_t len);

  private:
    void reindex();

    std::string text_;
    std::vector<size_t> lineStarts_{0};
};

} // namespace stagelens::tui::text
