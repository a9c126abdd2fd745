// tui/src/text/text_buffer.cpp
// @brief TextBuffer editing and line lookup.
// @invariant reindex() runs after every mutation.
// @ownership TextBuffer owns its string.

#include "tui/text/text_buffer.hpp"

#include <algorithm>

namespace stagelens::tui::text
{

void TextBuffer::load(std::string text)
{
    text_ = std::move(text);
    reindex();
}

void TextBuffer::reindex()
{
    lineStarts_.assign(1, 0);
    for (size_t i = 0; i < text_.size(); ++i)
    {
        if (text_[i] == '\n')
            lineStarts_.push_back(i + 1);
    }
}

std::string_view TextBuffer::getLine(size_t line) const
{
    if (line >= lineStarts_.size())
        return {};
    const size_t begin = lineStarts_[line];
    return std::string_view(text_).substr(begin, lineEnd(line) - begin);
}

size_t TextBuffer::lineStart(size_t line) const
{
    return line < lineStarts_.size() ? lineStarts_[line] : text_.size();
}

size_t TextBuffer::lineEnd(size_t line) const
{
    if (line + 1 < lineStarts_.size())
        return lineStarts_[line + 1] - 1;
    return text_.size();
}

std::pair<size_t, size_t> TextBuffer::position(size_t offset) const
{
    offset = std::min(offset, text_.size());
    auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
    const size_t line = static_cast<size_t>(it - lineStarts_.begin()) - 1;
    return {line, offset - lineStarts_[line]};
}

size_t TextBuffer::offset(size_t line, size_t col) const
{
    if (line >= lineStarts_.size())
        return text_.size();
    return std::min(lineStarts_[line] + col, lineEnd(line));
}

void TextBuffer::insert(size_t pos, std::string_view s)
{
    pos = std::min(pos, text_.size());
    text_.insert(pos, s);
    reindex();
}

void TextBuffer::erase(size_t pos, size_t len)
{
    if (pos >= text_.size())
        return;
    text_.erase(pos, len);
    reindex();
}

} // namespace stagelens::tui::text
