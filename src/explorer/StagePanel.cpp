//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/explorer/StagePanel.cpp
// Purpose: Painting, scrolling and pointer handling for stage panels.
// Key invariants: The first highlighted item is scrolled into view whenever a
//                 new highlight is applied.
// Ownership/Lifetime: See StagePanel.hpp.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "explorer/StagePanel.hpp"

#include <algorithm>

namespace stagelens::explorer
{

using tui::render::ScreenBuffer;
using tui::render::Style;
using tui::style::Role;
using tui::term::KeyEvent;
using tui::term::MouseEvent;
using tui::ui::Event;

StagePanel::StagePanel(pipeline::StageKind kind, const tui::style::Theme &theme)
    : kind_(kind), theme_(theme)
{
}

std::string StagePanel::title() const
{
    std::string t = std::string(pipeline::stageTitle(kind_)) + " (" + pipeline::stageKey(kind_) + ")";
    if (stale_)
        t += " [stale]";
    return t;
}

void StagePanel::setContent(const std::vector<pipeline::StageItem> &items)
{
    items_ = items;
    highlighted_.clear();
    isHighlighted_.assign(items_.size(), false);
    cursor_.reset();
    scroll_ = 0;
}

void StagePanel::highlight(const std::vector<size_t> &indices)
{
    highlighted_.clear();
    isHighlighted_.assign(items_.size(), false);
    for (size_t idx : indices)
    {
        if (idx < items_.size())
        {
            highlighted_.push_back(idx);
            isHighlighted_[idx] = true;
        }
    }
    if (!highlighted_.empty())
    {
        // Keep the whole highlighted run on screen when it fits.
        scrollTo(highlighted_.back());
        scrollTo(highlighted_.front());
    }
}

void StagePanel::clearHighlight()
{
    highlighted_.clear();
    isHighlighted_.assign(items_.size(), false);
}

void StagePanel::markStale(bool stale)
{
    stale_ = stale;
}

size_t StagePanel::bodyRows() const
{
    return rect_.h > 2 ? static_cast<size_t>(rect_.h - 2) : 0;
}

void StagePanel::scrollTo(size_t index)
{
    const size_t rows = bodyRows();
    if (rows == 0)
        return;
    if (index < scroll_)
        scroll_ = index;
    else if (index >= scroll_ + rows)
        scroll_ = index - rows + 1;
}

void StagePanel::pointAt(size_t index)
{
    if (index >= items_.size())
        return;
    cursor_ = index;
    if (items_[index].line && onHoverLine)
        onHoverLine(*items_[index].line);
}

void StagePanel::moveCursor(int delta)
{
    if (items_.empty())
        return;
    size_t idx = 0;
    if (cursor_)
    {
        if (delta < 0)
            idx = *cursor_ > 0 ? *cursor_ - 1 : 0;
        else
            idx = std::min(*cursor_ + 1, items_.size() - 1);
    }
    scrollTo(idx);
    pointAt(idx);
}

bool StagePanel::onEvent(const Event &ev)
{
    if (ev.kind == Event::Kind::Mouse)
    {
        const MouseEvent &me = ev.mouse;
        if (!rect_.contains(me.x, me.y))
            return false;
        if (me.type == MouseEvent::Type::Wheel)
        {
            const size_t rows = bodyRows();
            if (me.buttons == 1)
                scroll_ = scroll_ > 3 ? scroll_ - 3 : 0;
            else if (items_.size() > rows)
                scroll_ = std::min(scroll_ + 3, items_.size() - rows);
            return true;
        }
        const int row = me.y - rect_.y - 1;
        if (row < 0 || static_cast<size_t>(row) >= bodyRows())
            return true;
        pointAt(scroll_ + static_cast<size_t>(row));
        return true;
    }

    if (ev.kind != Event::Kind::Key)
        return false;
    switch (ev.key.code)
    {
        case KeyEvent::Code::Up:
            moveCursor(-1);
            return true;
        case KeyEvent::Code::Down:
            moveCursor(1);
            return true;
        case KeyEvent::Code::PageUp:
            moveCursor(-static_cast<int>(std::max<size_t>(bodyRows(), 1)));
            return true;
        case KeyEvent::Code::PageDown:
            for (size_t i = 0; i < std::max<size_t>(bodyRows(), 1); ++i)
                moveCursor(1);
            return true;
        default:
            return false;
    }
}

void StagePanel::paint(ScreenBuffer &sb)
{
    const auto &r = rect_;
    if (r.w < 2 || r.h < 2)
        return;

    const Style &normal = theme_.style(Role::Normal);
    const Style &frame = focused_ ? theme_.style(Role::Accent) : theme_.style(Role::Disabled);
    sb.fill(r.y, r.x, r.h, r.w, normal);

    // Border.
    for (int x = r.x; x < r.x + r.w; ++x)
    {
        sb.putText(r.y, x, "─", frame, 1);
        sb.putText(r.y + r.h - 1, x, "─", frame, 1);
    }
    for (int y = r.y; y < r.y + r.h; ++y)
    {
        sb.putText(y, r.x, "│", frame, 1);
        sb.putText(y, r.x + r.w - 1, "│", frame, 1);
    }
    sb.putText(r.y, r.x, "┌", frame, 1);
    sb.putText(r.y, r.x + r.w - 1, "┐", frame, 1);
    sb.putText(r.y + r.h - 1, r.x, "└", frame, 1);
    sb.putText(r.y + r.h - 1, r.x + r.w - 1, "┘", frame, 1);
    sb.putText(r.y, r.x + 2, " " + title() + " ", stale_ ? theme_.style(Role::Disabled) : frame, r.w - 4);

    // Items.
    const int inner = r.w - 2;
    const size_t rows = bodyRows();
    for (size_t row = 0; row < rows; ++row)
    {
        const size_t idx = scroll_ + row;
        if (idx >= items_.size())
            break;
        const int y = r.y + 1 + static_cast<int>(row);
        Style style = normal;
        if (isHighlighted_[idx])
            style = theme_.style(Role::Selection);
        else if (!items_[idx].line)
            style = theme_.style(Role::Disabled);
        if (focused_ && cursor_ && *cursor_ == idx)
            style.attrs |= tui::render::Underline;
        sb.fill(y, r.x + 1, 1, inner, style);
        sb.putText(y, r.x + 1, items_[idx].text, style, inner);
    }
}

} // namespace stagelens::explorer
