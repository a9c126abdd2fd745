// tui/tests/test_focus.cpp
// @brief Verify key routing to the focused widget, Tab cycling and focus hooks.
// @invariant Enter toggles only the focused widget; Tab cycles focus order.
// @ownership Test owns widgets, app, and TermIO.

#include "tui/app.hpp"
#include "tui/term/term_io.hpp"
#include "tui/ui/focus.hpp"
#include "tui/ui/widget.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using stagelens::tui::App;
using stagelens::tui::term::KeyEvent;
using stagelens::tui::term::StringTermIO;
using stagelens::tui::ui::Event;
using stagelens::tui::ui::FocusManager;
using stagelens::tui::ui::Widget;

namespace
{
struct ToggleWidget : Widget
{
    bool state{false};
    bool focusable{true};
    std::vector<bool> focusLog;

    bool wantsFocus() const override
    {
        return focusable;
    }

    void onFocusChanged(bool focused) override
    {
        focusLog.push_back(focused);
    }

    bool onEvent(const Event &ev) override
    {
        if (ev.kind == Event::Kind::Key && ev.key.code == KeyEvent::Code::Enter)
        {
            state = !state;
            return true;
        }
        return false;
    }
};

Event key(KeyEvent::Code code, unsigned mods = 0)
{
    Event ev{};
    ev.key.code = code;
    ev.key.mods = mods;
    return ev;
}
} // namespace

TEST(Focus, TabCyclesAndEnterReachesFocusedWidget)
{
    ToggleWidget a;
    ToggleWidget b;
    StringTermIO tio;
    App app(std::make_unique<Widget>(), tio, 2, 2);
    app.focus().registerWidget(&a);
    app.focus().registerWidget(&b);

    app.pushEvent(key(KeyEvent::Code::Enter));
    app.tick();
    EXPECT_TRUE(a.state);
    EXPECT_FALSE(b.state);

    app.pushEvent(key(KeyEvent::Code::Tab));
    app.pushEvent(key(KeyEvent::Code::Enter));
    app.tick();
    EXPECT_TRUE(b.state);
    EXPECT_TRUE(a.state);

    app.pushEvent(key(KeyEvent::Code::Tab, KeyEvent::Shift));
    app.pushEvent(key(KeyEvent::Code::Enter));
    app.tick();
    EXPECT_FALSE(a.state);
}

TEST(Focus, HooksFireOnEveryMove)
{
    ToggleWidget a;
    ToggleWidget b;
    ToggleWidget c;
    FocusManager fm;
    fm.registerWidget(&a);
    fm.registerWidget(&b);
    fm.registerWidget(&c);
    EXPECT_EQ(fm.current(), &a);
    EXPECT_TRUE(a.focusLog.empty());

    EXPECT_EQ(fm.next(), &b);
    EXPECT_EQ(a.focusLog, (std::vector<bool>{false}));
    EXPECT_EQ(b.focusLog, (std::vector<bool>{true}));

    EXPECT_EQ(fm.prev(), &a);
    EXPECT_EQ(b.focusLog, (std::vector<bool>{true, false}));
    EXPECT_EQ(a.focusLog, (std::vector<bool>{false, true}));
    EXPECT_TRUE(c.focusLog.empty());

    EXPECT_TRUE(fm.setFocus(&a));
    EXPECT_EQ(a.focusLog.size(), 2U);
}

TEST(Focus, SkipsWidgetsThatDeclineFocus)
{
    ToggleWidget a;
    ToggleWidget b;
    ToggleWidget c;
    b.focusable = false;
    FocusManager fm;
    fm.registerWidget(&a);
    fm.registerWidget(&b);
    fm.registerWidget(&c);
    EXPECT_EQ(fm.next(), &c);
    EXPECT_EQ(fm.next(), &a);
    EXPECT_FALSE(fm.setFocus(&b));
    EXPECT_TRUE(fm.setFocus(&c));
    EXPECT_EQ(fm.prev(), &a);

    fm.clear();
    EXPECT_EQ(fm.current(), nullptr);
    EXPECT_EQ(fm.next(), nullptr);
}
