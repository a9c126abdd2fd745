// tui/src/config/config.cpp
// @brief INI-like configuration loader implementation.
// @invariant Reads sections [theme], [keymap.global], [explorer] and [editor].
// @ownership Loader does not own external resources beyond file path.

#include "tui/config/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace stagelens::tui::config
{

namespace
{
std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

bool parse_color(const std::string &s, render::RGBA &out)
{
    std::string_view hex = s;
    if (!hex.empty() && hex.front() == '#')
    {
        hex.remove_prefix(1);
    }
    if (hex.size() != 6 || !std::all_of(hex.begin(), hex.end(), [](unsigned char c) {
            return std::isxdigit(c) != 0;
        }))
    {
        return false;
    }
    const unsigned long v = std::stoul(std::string(hex), nullptr, 16);
    out = render::RGBA{static_cast<uint8_t>((v >> 16) & 0xFF),
                       static_cast<uint8_t>((v >> 8) & 0xFF),
                       static_cast<uint8_t>(v & 0xFF),
                       255};
    return true;
}

struct NamedCode
{
    const char *name;
    term::KeyEvent::Code code;
};

constexpr NamedCode kNamedCodes[] = {
    {"enter", term::KeyEvent::Code::Enter},
    {"return", term::KeyEvent::Code::Enter},
    {"esc", term::KeyEvent::Code::Esc},
    {"escape", term::KeyEvent::Code::Esc},
    {"tab", term::KeyEvent::Code::Tab},
    {"backspace", term::KeyEvent::Code::Backspace},
    {"up", term::KeyEvent::Code::Up},
    {"down", term::KeyEvent::Code::Down},
    {"left", term::KeyEvent::Code::Left},
    {"right", term::KeyEvent::Code::Right},
    {"home", term::KeyEvent::Code::Home},
    {"end", term::KeyEvent::Code::End},
    {"pageup", term::KeyEvent::Code::PageUp},
    {"pagedown", term::KeyEvent::Code::PageDown},
    {"insert", term::KeyEvent::Code::Insert},
    {"delete", term::KeyEvent::Code::Delete},
};

/// Map a lower-case key name ("esc", "pagedown", "f5") to its code.
term::KeyEvent::Code parse_code(const std::string &name)
{
    using Code = term::KeyEvent::Code;
    for (const auto &nc : kNamedCodes)
    {
        if (name == nc.name)
            return nc.code;
    }
    if (name.size() < 2 || name.size() > 3 || name[0] != 'f')
        return Code::Unknown;
    unsigned num = 0;
    for (size_t i = 1; i < name.size(); ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(name[i])))
            return Code::Unknown;
        num = num * 10 + static_cast<unsigned>(name[i] - '0');
    }
    if (num < 1 || num > 12)
        return Code::Unknown;
    return static_cast<Code>(static_cast<unsigned>(Code::F1) + num - 1);
}

std::string to_lower(std::string s)
{
    std::transform(
        s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::vector<std::string> split_list(const std::string &s)
{
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ','))
    {
        item = trim(item);
        if (!item.empty())
        {
            out.push_back(item);
        }
    }
    return out;
}

bool parse_unsigned(const std::string &s, unsigned &out)
{
    try
    {
        size_t parsed = 0;
        const unsigned long v = std::stoul(s, &parsed);
        if (parsed != s.size() || v > 0xFFFFU)
        {
            return false;
        }
        out = static_cast<unsigned>(v);
        return true;
    }
    catch (const std::invalid_argument &)
    {
        return false;
    }
    catch (const std::out_of_range &)
    {
        return false;
    }
}

bool parse_bool(const std::string &s, bool &out)
{
    const std::string lower = to_lower(s);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
    {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
    {
        out = false;
        return true;
    }
    return false;
}

} // namespace

input::KeyChord parseChord(const std::string &str)
{
    input::KeyChord kc{};
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, '+'))
    {
        token = trim(token);
        const std::string lower = to_lower(token);
        if (lower == "ctrl")
            kc.mods |= term::KeyEvent::Ctrl;
        else if (lower == "alt")
            kc.mods |= term::KeyEvent::Alt;
        else if (lower == "shift")
            kc.mods |= term::KeyEvent::Shift;
        else if (token.size() == 1)
            kc.codepoint = static_cast<uint32_t>(token[0]);
        else
            kc.code = parse_code(lower);
    }
    return kc;
}

namespace
{
/// Resolve "<role>_fg" / "<role>_bg" to the colour slot it names.
render::RGBA *themeSlot(style::Theme &theme, const std::string &key)
{
    const auto us = key.rfind('_');
    if (us == std::string::npos)
        return nullptr;
    const std::string role = key.substr(0, us);
    const std::string part = key.substr(us + 1);
    render::Style *st = nullptr;
    if (role == "normal")
        st = &theme.normal;
    else if (role == "accent")
        st = &theme.accent;
    else if (role == "disabled")
        st = &theme.disabled;
    else if (role == "selection")
        st = &theme.selection;
    if (!st)
        return nullptr;
    if (part == "fg")
        return &st->fg;
    if (part == "bg")
        return &st->bg;
    return nullptr;
}
} // namespace

bool loadFromFile(const std::string &path, Config &out)
{
    std::ifstream in(path);
    if (!in)
    {
        return false;
    }
    std::string line;
    std::string section;
    while (std::getline(in, line))
    {
        const std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = to_lower(trim(trimmed.substr(1, trimmed.size() - 2)));
            continue;
        }
        const auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        const std::string key = trim(trimmed.substr(0, eq));
        const std::string value = trim(trimmed.substr(eq + 1));
        const std::string lower_key = to_lower(key);

        if (section == "theme")
        {
            // Malformed colours keep the built-in default.
            render::RGBA col;
            render::RGBA *slot = themeSlot(out.theme, lower_key);
            if (slot && parse_color(value, col))
            {
                *slot = col;
            }
        }
        else if (section == "keymap.global")
        {
            Binding b{};
            b.chord = parseChord(key);
            b.command = value;
            out.keymap_global.push_back(b);
        }
        else if (section == "explorer")
        {
            if (lower_key == "toolchain")
            {
                out.explorer.toolchain = to_lower(value);
            }
            else if (lower_key == "visible")
            {
                out.explorer.visible = split_list(to_lower(value));
            }
            else if (lower_key == "truecolor")
            {
                bool truecolor = true;
                if (parse_bool(value, truecolor))
                {
                    out.explorer.truecolor = truecolor;
                }
            }
        }
        else if (section == "editor")
        {
            if (lower_key == "tab_width")
            {
                unsigned width = 0;
                if (parse_unsigned(value, width) && width > 0 && width <= 16)
                {
                    out.editor.tab_width = width;
                }
            }
        }
    }
    return true;
}

} // namespace stagelens::tui::config
