// tui/include/tui/config/config.hpp
// @brief INI-style configuration for theme, global key bindings, explorer and
//        editor settings.
// @invariant Unknown keys and malformed values are skipped, leaving defaults.
// @ownership Config is a plain value filled by loadFromFile().
#pragma once

#include "tui/input/keymap.hpp"
#include "tui/style/theme.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stagelens::tui::config
{

struct Binding
{
    input::KeyChord chord{};
    input::CommandId command;
};

struct EditorConfig
{
    unsigned tab_width{4};
};

struct ExplorerConfig
{
    std::optional<std::string> toolchain; ///< "full" or "reduced".
    std::optional<std::vector<std::string>> visible; ///< Stage names.
    bool truecolor{true};
};

struct Config
{
    style::Theme theme{};
    std::vector<Binding> keymap_global{};
    ExplorerConfig explorer{};
    EditorConfig editor{};
};

/// @brief Parse a key chord such as "ctrl+e" or "shift+tab".
input::KeyChord parseChord(const std::string &str);

/// @brief Load settings from @p path into @p out.
/// @return False when the file cannot be opened.
bool loadFromFile(const std::string &path, Config &out);

} // namespace stagelens::tui::config
