// tui/src/ui/focus.cpp
// @brief Focus ring traversal with focus-change notifications.
// @invariant Only widgets whose wantsFocus() is true can become current; the
//            first registered widget is current without a notification.
// @ownership FocusManager never owns widgets.

#include "tui/ui/focus.hpp"

#include <algorithm>

namespace stagelens::tui::ui
{

void FocusManager::registerWidget(Widget *w)
{
    if (!w || std::find(ring_.begin(), ring_.end(), w) != ring_.end())
        return;
    ring_.push_back(w);
}

void FocusManager::clear()
{
    ring_.clear();
    index_ = 0;
}

void FocusManager::moveTo(size_t idx)
{
    if (idx == index_)
        return;
    if (Widget *old = current())
        old->onFocusChanged(false);
    index_ = idx;
    ring_[index_]->onFocusChanged(true);
}

Widget *FocusManager::step(int dir)
{
    if (ring_.empty())
        return nullptr;
    const size_t n = ring_.size();
    size_t idx = index_;
    for (size_t k = 0; k < n; ++k)
    {
        idx = dir > 0 ? (idx + 1) % n : (idx + n - 1) % n;
        if (ring_[idx]->wantsFocus())
        {
            moveTo(idx);
            return ring_[idx];
        }
    }
    return current();
}

Widget *FocusManager::next()
{
    return step(1);
}

Widget *FocusManager::prev()
{
    return step(-1);
}

bool FocusManager::setFocus(Widget *w)
{
    auto it = std::find(ring_.begin(), ring_.end(), w);
    if (it == ring_.end() || !w->wantsFocus())
        return false;
    moveTo(static_cast<size_t>(it - ring_.begin()));
    return true;
}

Widget *FocusManager::current() const
{
    if (ring_.empty() || !ring_[index_]->wantsFocus())
        return nullptr;
    return ring_[index_];
}

} // namespace stagelens::tui::ui
