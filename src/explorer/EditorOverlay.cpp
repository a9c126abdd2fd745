//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/explorer/EditorOverlay.cpp
// Purpose: Key handling and painting for the source editor modal.
// Key invariants: Esc commits, Ctrl+X and F10 discard; both close the modal.
// Ownership/Lifetime: See EditorOverlay.hpp.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "explorer/EditorOverlay.hpp"

#include "tui/render/screen.hpp"

#include <algorithm>

namespace stagelens::explorer
{

using tui::render::ScreenBuffer;
using tui::style::Role;
using tui::term::KeyEvent;
using tui::ui::Event;
using tui::ui::Rect;

namespace
{
bool isContinuation(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U;
}
} // namespace

EditorOverlay::EditorOverlay(std::string text,
                             const tui::style::Theme &theme,
                             unsigned tabWidth,
                             DismissFn onDismiss)
    : original_(text), theme_(theme), tabWidth_(tabWidth == 0 ? 1 : tabWidth),
      onDismiss_(std::move(onDismiss))
{
    buffer_.load(std::move(text));
}

Rect EditorOverlay::preferredRect(const Rect &host) const
{
    const int insetX = host.w >= 20 ? host.w / 10 : 0;
    const int insetY = host.h >= 10 ? host.h / 10 : 0;
    return Rect{host.x + insetX, host.y + insetY, host.w - 2 * insetX, host.h - 2 * insetY};
}

void EditorOverlay::dismiss(std::optional<std::string> result)
{
    if (dismissed_)
        return;
    dismissed_ = true;
    if (onDismiss_)
        onDismiss_(std::move(result));
    requestClose();
}

void EditorOverlay::insert(std::string_view s)
{
    buffer_.insert(cursor_, s);
    cursor_ += s.size();
}

void EditorOverlay::backspace()
{
    if (cursor_ == 0)
        return;
    size_t start = cursor_ - 1;
    while (start > 0 && isContinuation(buffer_.str()[start]))
        --start;
    buffer_.erase(start, cursor_ - start);
    cursor_ = start;
}

void EditorOverlay::deleteForward()
{
    const std::string &s = buffer_.str();
    if (cursor_ >= s.size())
        return;
    size_t end = cursor_ + 1;
    while (end < s.size() && isContinuation(s[end]))
        ++end;
    buffer_.erase(cursor_, end - cursor_);
}

void EditorOverlay::moveLeft()
{
    if (cursor_ == 0)
        return;
    --cursor_;
    while (cursor_ > 0 && isContinuation(buffer_.str()[cursor_]))
        --cursor_;
}

void EditorOverlay::moveRight()
{
    const std::string &s = buffer_.str();
    if (cursor_ >= s.size())
        return;
    ++cursor_;
    while (cursor_ < s.size() && isContinuation(s[cursor_]))
        ++cursor_;
}

void EditorOverlay::moveVertical(int delta)
{
    auto [line, col] = buffer_.position(cursor_);
    if (delta < 0 && line == 0)
    {
        cursor_ = 0;
        return;
    }
    const size_t target = delta < 0 ? line - 1 : line + 1;
    if (target >= buffer_.lineCount())
    {
        cursor_ = buffer_.size();
        return;
    }
    size_t off = buffer_.offset(target, col);
    while (off > buffer_.lineStart(target) && off < buffer_.size() && isContinuation(buffer_.str()[off]))
        --off;
    cursor_ = off;
}

bool EditorOverlay::onEvent(const Event &ev)
{
    if (dismissed_)
        return true;
    if (ev.kind == Event::Kind::Paste)
    {
        insert(ev.paste);
        return true;
    }
    if (ev.kind != Event::Kind::Key)
        return true;

    const KeyEvent &k = ev.key;
    switch (k.code)
    {
        case KeyEvent::Code::Esc:
            if (buffer_.str() == original_)
                dismiss(std::nullopt);
            else
                dismiss(buffer_.str());
            return true;
        case KeyEvent::Code::F10:
            dismiss(std::nullopt);
            return true;
        case KeyEvent::Code::Enter:
            insert("\n");
            return true;
        case KeyEvent::Code::Tab:
        {
            const auto [line, col] = buffer_.position(cursor_);
            const size_t column = displayColumn(line, col);
            insert(std::string(tabWidth_ - column % tabWidth_, ' '));
            return true;
        }
        case KeyEvent::Code::Backspace:
            backspace();
            return true;
        case KeyEvent::Code::Delete:
            deleteForward();
            return true;
        case KeyEvent::Code::Left:
            moveLeft();
            return true;
        case KeyEvent::Code::Right:
            moveRight();
            return true;
        case KeyEvent::Code::Up:
            moveVertical(-1);
            return true;
        case KeyEvent::Code::Down:
            moveVertical(1);
            return true;
        case KeyEvent::Code::Home:
            cursor_ = buffer_.lineStart(buffer_.position(cursor_).first);
            return true;
        case KeyEvent::Code::End:
            cursor_ = buffer_.lineEnd(buffer_.position(cursor_).first);
            return true;
        case KeyEvent::Code::Unknown:
            break;
        default:
            return true;
    }

    if ((k.mods & KeyEvent::Ctrl) && (k.codepoint == 'x' || k.codepoint == 'X'))
    {
        dismiss(std::nullopt);
        return true;
    }
    if ((k.mods & (KeyEvent::Ctrl | KeyEvent::Alt)) == 0 && k.codepoint >= 0x20 && k.codepoint != 0x7F)
        insert(tui::render::encodeUtf8(static_cast<char32_t>(k.codepoint)));
    return true;
}

size_t EditorOverlay::displayColumn(size_t line, size_t byteCol) const
{
    const std::string_view text = buffer_.getLine(line).substr(0, byteCol);
    size_t column = 0;
    for (char c : text)
    {
        if (c == '\t')
            column += tabWidth_ - column % tabWidth_;
        else if (!isContinuation(c))
            ++column;
    }
    return column;
}

std::string EditorOverlay::expandTabs(std::string_view line) const
{
    std::string out;
    size_t column = 0;
    for (char c : line)
    {
        if (c == '\t')
        {
            const size_t n = tabWidth_ - column % tabWidth_;
            out.append(n, ' ');
            column += n;
            continue;
        }
        out.push_back(c);
        if (!isContinuation(c))
            ++column;
    }
    return out;
}

void EditorOverlay::paint(ScreenBuffer &sb)
{
    const Rect &r = rect_;
    if (r.w < 4 || r.h < 3)
        return;
    const auto &frame = theme_.style(Role::Accent);
    const auto &normal = theme_.style(Role::Normal);
    const auto &hint = theme_.style(Role::Disabled);

    sb.fill(r.y, r.x, r.h, r.w, normal);
    sb.fill(r.y, r.x, 1, r.w, frame);
    sb.putText(r.y, r.x + 1, "Edit source", frame, r.w - 2);
    sb.fill(r.y + r.h - 1, r.x, 1, r.w, hint);
    sb.putText(r.y + r.h - 1, r.x + 1, "Esc: apply   Ctrl+X/F10: discard", hint, r.w - 2);

    const size_t bodyRows = static_cast<size_t>(r.h - 2);
    const auto [curLine, curCol] = buffer_.position(cursor_);
    if (curLine < firstLine_)
        firstLine_ = curLine;
    else if (curLine >= firstLine_ + bodyRows)
        firstLine_ = curLine - bodyRows + 1;

    constexpr int kGutter = 5;
    const int textW = r.w - kGutter - 1;
    for (size_t row = 0; row < bodyRows; ++row)
    {
        const size_t line = firstLine_ + row;
        if (line >= buffer_.lineCount())
            break;
        const int y = r.y + 1 + static_cast<int>(row);
        std::string num = std::to_string(line + 1);
        if (num.size() < kGutter - 1)
            num.insert(0, kGutter - 1 - num.size(), ' ');
        sb.putText(y, r.x, num, hint, kGutter);
        if (textW > 0)
            sb.putText(y, r.x + kGutter, expandTabs(buffer_.getLine(line)), normal, textW);
    }

    const int cy = r.y + 1 + static_cast<int>(curLine - firstLine_);
    const int cx = r.x + kGutter + static_cast<int>(displayColumn(curLine, curCol));
    if (cx < r.x + r.w - 1)
    {
        auto &cell = sb.at(cy, cx);
        cell.style.attrs |= tui::render::Reverse;
    }
}

} // namespace stagelens::explorer
