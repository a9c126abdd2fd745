// tui/include/tui/style/theme.hpp
// @brief Named style roles shared by all widgets.
// @invariant style() always returns a valid style for every Role.
// @ownership Theme owns its styles by value.
#pragma once

#include "tui/render/screen.hpp"

namespace stagelens::tui::style
{

enum class Role
{
    Normal,
    Accent,
    Disabled,
    Selection,
};

struct Theme
{
    render::Style normal{{208, 208, 208, 255}, {28, 28, 28, 255}, 0};
    render::Style accent{{95, 175, 255, 255}, {28, 28, 28, 255}, render::Bold};
    render::Style disabled{{128, 128, 128, 255}, {28, 28, 28, 255}, 0};
    render::Style selection{{18, 18, 18, 255}, {255, 215, 95, 255}, 0};

    [[nodiscard]] const render::Style &style(Role role) const;
};

} // namespace stagelens::tui::style
