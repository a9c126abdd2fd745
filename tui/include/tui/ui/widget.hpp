// tui/include/tui/ui/widget.hpp
// @brief Base widget interface with layout, paint and event hooks.
// @invariant rect() reflects the last layout() call.
// @ownership Widgets own their children; parents hold them by unique_ptr.
#pragma once

#include "tui/render/screen.hpp"
#include "tui/term/input.hpp"

#include <string>

namespace stagelens::tui::ui
{

struct Rect
{
    int x{0};
    int y{0};
    int w{0};
    int h{0};

    [[nodiscard]] bool contains(int px, int py) const
    {
        return px >= x && px < x + w && py >= y && py < y + h;
    }
};

struct Event
{
    enum class Kind
    {
        Key,
        Mouse,
        Paste,
    };

    Kind kind{Kind::Key};
    term::KeyEvent key{};
    term::MouseEvent mouse{};
    std::string paste;
};

class Widget
{
  public:
    virtual ~Widget() = default;

    /// @brief Assign the widget's screen rectangle.
    virtual void layout(const Rect &r)
    {
        rect_ = r;
    }

    virtual void paint(render::ScreenBuffer &sb)
    {
        (void)sb;
    }

    /// @brief Handle @p ev; return true when consumed.
    virtual bool onEvent(const Event &ev)
    {
        (void)ev;
        return false;
    }

    [[nodiscard]] virtual bool wantsFocus() const
    {
        return false;
    }

    virtual void onFocusChanged(bool focused)
    {
        (void)focused;
    }

    [[nodiscard]] const Rect &rect() const
    {
        return rect_;
    }

  protected:
    Rect rect_{};
};

} // namespace stagelens::tui::ui
