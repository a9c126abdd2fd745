// tui/src/render/renderer.cpp
// @brief ANSI renderer producing minimal terminal updates.
// @invariant setStyle and moveCursor avoid redundant sequences based on cached state.
// @ownership Renderer writes through a borrowed TermIO reference.

#include "tui/render/renderer.hpp"

#include <string>
#include <vector>

namespace stagelens::tui::render
{

Renderer::Renderer(term::TermIO &tio, bool truecolor) : tio_(tio), truecolor_(truecolor) {}

namespace
{
int toCube(uint8_t c)
{
    return c / 51; // map 0-255 to 0-5
}

std::string colorParams(const RGBA &c, bool truecolor, bool foreground)
{
    if (truecolor)
    {
        return std::string(foreground ? ";38;2;" : ";48;2;") + std::to_string(c.r) + ";" +
               std::to_string(c.g) + ";" + std::to_string(c.b);
    }
    const int idx = 16 + 36 * toCube(c.r) + 6 * toCube(c.g) + toCube(c.b);
    return std::string(foreground ? ";38;5;" : ";48;5;") + std::to_string(idx);
}
} // namespace

void Renderer::invalidate()
{
    styleKnown_ = false;
    cursorY_ = -1;
    cursorX_ = -1;
}

void Renderer::setStyle(const Style &style)
{
    if (styleKnown_ && style == currentStyle_)
    {
        return;
    }

    std::string seq = "\x1b[0";
    if (style.attrs & Bold)
        seq += ";1";
    if (style.attrs & Faint)
        seq += ";2";
    if (style.attrs & Italic)
        seq += ";3";
    if (style.attrs & Underline)
        seq += ";4";
    if (style.attrs & Blink)
        seq += ";5";
    if (style.attrs & Reverse)
        seq += ";7";
    if (style.attrs & Invisible)
        seq += ";8";
    if (style.attrs & Strike)
        seq += ";9";
    seq += colorParams(style.fg, truecolor_, true);
    seq += colorParams(style.bg, truecolor_, false);
    seq += 'm';

    tio_.write(seq);
    currentStyle_ = style;
    styleKnown_ = true;
}

void Renderer::moveCursor(int y, int x)
{
    if (y == cursorY_ && x == cursorX_)
    {
        return;
    }
    std::string seq = "\x1b[" + std::to_string(y + 1) + ";" + std::to_string(x + 1) + 'H';
    tio_.write(seq);
    cursorY_ = y;
    cursorX_ = x;
}

void Renderer::draw(const ScreenBuffer &sb)
{
    std::vector<ScreenBuffer::DiffSpan> spans;
    sb.computeDiff(spans);
    for (const auto &span : spans)
    {
        moveCursor(span.row, span.x0);
        for (int x = span.x0; x < span.x1; ++x)
        {
            const Cell &cell = sb.at(span.row, x);
            setStyle(cell.style);
            tio_.write(encodeUtf8(cell.ch));
            cursorX_ += cell.width;
        }
    }
    tio_.flush();
}

} // namespace stagelens::tui::render
