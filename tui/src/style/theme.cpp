// tui/src/style/theme.cpp
// @brief Role to style lookup.
// @invariant Every Role maps to one of the four theme styles.
// @ownership Returns references into the Theme.

#include "tui/style/theme.hpp"

namespace stagelens::tui::style
{

const render::Style &Theme::style(Role role) const
{
    switch (role)
    {
        case Role::Accent:
            return accent;
        case Role::Disabled:
            return disabled;
        case Role::Selection:
            return selection;
        case Role::Normal:
            break;
    }
    return normal;
}

} // namespace stagelens::tui::style
