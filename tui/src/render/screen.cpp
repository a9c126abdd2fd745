// tui/src/render/screen.cpp
// @brief ScreenBuffer storage, text placement and frame diffing.
// @invariant prev_ is empty until the first snapshotPrev() after a resize.
// @ownership ScreenBuffer owns both cell vectors.

#include "tui/render/screen.hpp"

#include <algorithm>

namespace stagelens::tui::render
{

void ScreenBuffer::resize(int rows, int cols)
{
    rows_ = std::max(rows, 0);
    cols_ = std::max(cols, 0);
    cells_.assign(static_cast<size_t>(rows_) * static_cast<size_t>(cols_), Cell{});
    prev_.clear();
}

void ScreenBuffer::clear(const Style &style)
{
    Cell blank{};
    blank.style = style;
    std::fill(cells_.begin(), cells_.end(), blank);
}

Cell &ScreenBuffer::at(int y, int x)
{
    return cells_[static_cast<size_t>(y) * static_cast<size_t>(cols_) + static_cast<size_t>(x)];
}

const Cell &ScreenBuffer::at(int y, int x) const
{
    return cells_[static_cast<size_t>(y) * static_cast<size_t>(cols_) + static_cast<size_t>(x)];
}

void ScreenBuffer::snapshotPrev()
{
    prev_ = cells_;
}

void ScreenBuffer::computeDiff(std::vector<DiffSpan> &out) const
{
    const bool full = prev_.size() != cells_.size();
    for (int y = 0; y < rows_; ++y)
    {
        int x = 0;
        while (x < cols_)
        {
            const size_t idx = static_cast<size_t>(y) * static_cast<size_t>(cols_) + static_cast<size_t>(x);
            if (!full && cells_[idx] == prev_[idx])
            {
                ++x;
                continue;
            }
            const int x0 = x;
            while (x < cols_)
            {
                const size_t j =
                    static_cast<size_t>(y) * static_cast<size_t>(cols_) + static_cast<size_t>(x);
                if (!full && cells_[j] == prev_[j])
                    break;
                ++x;
            }
            out.push_back(DiffSpan{y, x0, x});
        }
    }
}

int ScreenBuffer::putText(int y, int x, std::string_view text, const Style &style, int maxCols)
{
    if (y < 0 || y >= rows_ || x >= cols_)
        return 0;
    const int limit = std::min(cols_, x + std::max(maxCols, 0));
    int col = x;
    for (char32_t ch : decodeUtf8(text))
    {
        if (col >= limit)
            break;
        if (ch == U'\t' || ch < 0x20)
            ch = U' ';
        if (col >= 0)
        {
            Cell &c = at(y, col);
            c.ch = ch;
            c.style = style;
            c.width = 1;
        }
        ++col;
    }
    return col - x;
}

void ScreenBuffer::fill(int y, int x, int h, int w, const Style &style)
{
    for (int row = std::max(y, 0); row < std::min(y + h, rows_); ++row)
    {
        for (int col = std::max(x, 0); col < std::min(x + w, cols_); ++col)
        {
            Cell &c = at(row, col);
            c.ch = U' ';
            c.style = style;
            c.width = 1;
        }
    }
}

std::string ScreenBuffer::rowText(int y) const
{
    std::string out;
    if (y < 0 || y >= rows_)
        return out;
    for (int x = 0; x < cols_; ++x)
        out += encodeUtf8(at(y, x).ch);
    return out;
}

std::u32string decodeUtf8(std::string_view text)
{
    std::u32string out;
    size_t i = 0;
    while (i < text.size())
    {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        char32_t cp = lead;
        if (lead >= 0x80)
        {
            if ((lead & 0xE0) == 0xC0)
            {
                len = 2;
                cp = lead & 0x1F;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                len = 3;
                cp = lead & 0x0F;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                len = 4;
                cp = lead & 0x07;
            }
            else
            {
                out.push_back(U'\uFFFD');
                ++i;
                continue;
            }
            if (i + len > text.size())
            {
                out.push_back(U'\uFFFD');
                break;
            }
            bool ok = true;
            for (size_t k = 1; k < len; ++k)
            {
                const auto c = static_cast<unsigned char>(text[i + k]);
                if ((c & 0xC0) != 0x80)
                {
                    ok = false;
                    break;
                }
                cp = (cp << 6) | (c & 0x3F);
            }
            if (!ok)
            {
                out.push_back(U'\uFFFD');
                ++i;
                continue;
            }
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::string encodeUtf8(char32_t ch)
{
    std::string out;
    if (ch <= 0x7F)
    {
        out += static_cast<char>(ch);
    }
    else if (ch <= 0x7FF)
    {
        out += static_cast<char>(0xC0 | ((ch >> 6) & 0x1F));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    }
    else if (ch <= 0xFFFF)
    {
        out += static_cast<char>(0xE0 | ((ch >> 12) & 0x0F));
        out += static_cast<char>(0x80 | ((ch >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | ((ch >> 18) & 0x07));
        out += static_cast<char>(0x80 | ((ch >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((ch >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (ch & 0x3F));
    }
    return out;
}

} // namespace stagelens::tui::render
