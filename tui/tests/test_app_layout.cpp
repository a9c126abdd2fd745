// tui/tests/test_app_layout.cpp
// @brief Verify App lays out and paints the root and redraws after resize.
// @invariant Each tick lays the root out over the full screen.
// @ownership App owns the widget tree; test owns the TermIO.

#include "tui/app.hpp"
#include "tui/term/term_io.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using stagelens::tui::App;
using stagelens::tui::render::ScreenBuffer;
using stagelens::tui::render::Style;
using stagelens::tui::term::StringTermIO;
using stagelens::tui::ui::Rect;
using stagelens::tui::ui::Widget;

namespace
{
struct Label : Widget
{
    std::string text;

    void paint(ScreenBuffer &sb) override
    {
        sb.putText(rect_.y, rect_.x, text, Style{}, rect_.w);
    }
};
} // namespace

TEST(App, TickLaysOutAndPaintsRoot)
{
    auto label = std::make_unique<Label>();
    label->text = "hello";
    Label *labelPtr = label.get();
    StringTermIO tio;
    App app(std::move(label), tio, 3, 8);
    app.tick();

    EXPECT_EQ(labelPtr->rect().w, 8);
    EXPECT_EQ(labelPtr->rect().h, 3);
    EXPECT_EQ(app.screen().rowText(0), "hello   ");
    EXPECT_NE(tio.buffer().find("hello"), std::string::npos);
}

TEST(App, ResizeTriggersFullRedraw)
{
    auto label = std::make_unique<Label>();
    label->text = "abc";
    Label *labelPtr = label.get();
    StringTermIO tio;
    App app(std::move(label), tio, 2, 4);
    app.tick();
    tio.clear();

    app.tick();
    EXPECT_EQ(tio.buffer().find("abc"), std::string::npos);

    app.resize(4, 10);
    app.tick();
    EXPECT_EQ(app.rows(), 4);
    EXPECT_EQ(app.cols(), 10);
    EXPECT_EQ(labelPtr->rect().w, 10);
    EXPECT_NE(tio.buffer().find("abc"), std::string::npos);
}
