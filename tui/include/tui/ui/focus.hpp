// tui/include/tui/ui/focus.hpp
// @brief Ordered focus ring over registered widgets.
// @invariant current() is null or a registered widget that wants focus;
//            onFocusChanged() fires on every focus transfer.
// @ownership FocusManager stores non-owning widget pointers.
#pragma once

#include "tui/ui/widget.hpp"

#include <cstddef>
#include <vector>

namespace stagelens::tui::ui
{

class FocusManager
{
  public:
    /// @brief Append @p w to the ring; the first widget becomes current.
    void registerWidget(Widget *w);

    /// @brief Remove every widget without focus notifications.
    void clear();

    /// @brief Advance focus; returns the newly focused widget.
    Widget *next();

    /// @brief Move focus backwards; returns the newly focused widget.
    Widget *prev();

    /// @brief Focus @p w if registered; returns false otherwise.
    bool setFocus(Widget *w);

    [[nodiscard]] Widget *current() const;

  private:
    void moveTo(size_t idx);
    Widget *step(int dir);

    std::vector<Widget *> ring_;
    size_t index_{0};
};

} // namespace stagelens::tui::ui
