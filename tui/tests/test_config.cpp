// tui/tests/test_config.cpp
// @brief Verify configuration loader parses theme, keymap, explorer and editor settings.
// @invariant Invalid values are ignored and leave defaults in place.
// @ownership Test owns configuration data only.

#include "tui/config/config.hpp"

#include <gtest/gtest.h>

using stagelens::tui::config::Config;
using stagelens::tui::config::loadFromFile;
using stagelens::tui::config::parseChord;
using stagelens::tui::render::RGBA;
using stagelens::tui::term::KeyEvent;

TEST(Config, LoadsAllSections)
{
    Config cfg;
    ASSERT_TRUE(loadFromFile(CONFIG_INI, cfg));

    EXPECT_EQ(cfg.theme.accent.bg, (RGBA{200, 200, 200, 255}));
    EXPECT_EQ(cfg.theme.selection.fg, (RGBA{0, 0, 0, 255}));
    EXPECT_EQ(cfg.theme.selection.bg, (RGBA{255, 215, 95, 255}));
    EXPECT_EQ(cfg.editor.tab_width, 2U);

    ASSERT_EQ(cfg.keymap_global.size(), 2U);
    EXPECT_EQ(cfg.keymap_global[0].command, "editor");
    EXPECT_NE(cfg.keymap_global[0].chord.mods & KeyEvent::Ctrl, 0U);
    EXPECT_TRUE(cfg.keymap_global[0].chord.codepoint == 'E' || cfg.keymap_global[0].chord.codepoint == 'e');
    EXPECT_EQ(cfg.keymap_global[1].command, "toggle.tokens");
    EXPECT_EQ(cfg.keymap_global[1].chord.code, KeyEvent::Code::F2);

    ASSERT_TRUE(cfg.explorer.toolchain.has_value());
    EXPECT_EQ(*cfg.explorer.toolchain, "reduced");
    ASSERT_TRUE(cfg.explorer.visible.has_value());
    EXPECT_EQ(*cfg.explorer.visible, (std::vector<std::string>{"source", "tokens", "code"}));
    EXPECT_FALSE(cfg.explorer.truecolor);
}

TEST(Config, InvalidValuesKeepDefaults)
{
    Config defaults;
    Config cfg;
    ASSERT_TRUE(loadFromFile(CONFIG_BAD_INI, cfg));
    EXPECT_EQ(cfg.theme.accent.bg, defaults.theme.accent.bg);
    EXPECT_EQ(cfg.theme.normal.fg, defaults.theme.normal.fg);
    EXPECT_TRUE(cfg.explorer.truecolor);
    EXPECT_EQ(cfg.editor.tab_width, 4U);
    EXPECT_FALSE(cfg.explorer.toolchain.has_value());
    EXPECT_FALSE(cfg.explorer.visible.has_value());
}

TEST(Config, MissingFileFails)
{
    Config cfg;
    EXPECT_FALSE(loadFromFile("/nonexistent/stagelens.ini", cfg));
}

TEST(Config, ParseChordModifiersAndNamedKeys)
{
    const auto esc = parseChord("Esc");
    EXPECT_EQ(esc.code, KeyEvent::Code::Esc);
    EXPECT_EQ(esc.mods, 0U);

    const auto combo = parseChord("ctrl + shift + f5");
    EXPECT_EQ(combo.code, KeyEvent::Code::F5);
    EXPECT_EQ(combo.mods, static_cast<unsigned>(KeyEvent::Ctrl | KeyEvent::Shift));

    const auto digit = parseChord("3");
    EXPECT_EQ(digit.code, KeyEvent::Code::Unknown);
    EXPECT_EQ(digit.codepoint, static_cast<uint32_t>('3'));
}
