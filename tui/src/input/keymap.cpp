// tui/src/input/keymap.cpp
// @brief Explorer command registry: chord lookup and footer hint ordering.
// @invariant A chord runs at most one command; rebinding a chord replaces it.
// @ownership Keymap owns command callbacks.

#include "tui/input/keymap.hpp"

#include "tui/render/screen.hpp"

#include <algorithm>

namespace stagelens::tui::input
{
namespace
{
/// @brief A bare character with no modifiers, the shortest thing to show in a hint.
bool isPlainChar(const KeyChord &kc)
{
    return kc.code == term::KeyEvent::Code::Unknown && kc.mods == 0;
}
} // namespace

bool KeyChord::operator==(const KeyChord &other) const
{
    return code == other.code && mods == other.mods && codepoint == other.codepoint;
}

std::size_t KeyChordHash::operator()(const KeyChord &kc) const
{
    return static_cast<std::size_t>(kc.code) ^ (static_cast<std::size_t>(kc.mods) << 8U) ^
           (static_cast<std::size_t>(kc.codepoint) << 16U);
}

std::string chordName(const KeyChord &kc)
{
    using Code = term::KeyEvent::Code;
    std::string out;
    if (kc.mods & term::KeyEvent::Ctrl)
        out += "ctrl+";
    if (kc.mods & term::KeyEvent::Alt)
        out += "alt+";
    if (kc.mods & term::KeyEvent::Shift)
        out += "shift+";
    switch (kc.code)
    {
        case Code::Enter:
            return out + "enter";
        case Code::Esc:
            return out + "esc";
        case Code::Tab:
            return out + "tab";
        case Code::Backspace:
            return out + "backspace";
        case Code::Up:
            return out + "up";
        case Code::Down:
            return out + "down";
        case Code::Left:
            return out + "left";
        case Code::Right:
            return out + "right";
        case Code::Home:
            return out + "home";
        case Code::End:
            return out + "end";
        case Code::PageUp:
            return out + "pageup";
        case Code::PageDown:
            return out + "pagedown";
        case Code::Insert:
            return out + "insert";
        case Code::Delete:
            return out + "delete";
        case Code::Unknown:
            return out + render::encodeUtf8(static_cast<char32_t>(kc.codepoint));
        default:
            break;
    }
    const int f = static_cast<int>(kc.code) - static_cast<int>(Code::F1) + 1;
    return out + "f" + std::to_string(f);
}

void Keymap::registerCommand(CommandId id, std::string name, std::function<void()> action)
{
    if (auto it = index_.find(id); it != index_.end())
    {
        commands_[it->second] = Command{std::move(id), std::move(name), std::move(action)};
        return;
    }
    index_.emplace(id, commands_.size());
    commands_.push_back(Command{std::move(id), std::move(name), std::move(action)});
}

void Keymap::bindGlobal(const KeyChord &kc, const CommandId &id)
{
    global_[kc] = id;
}

bool Keymap::execute(const CommandId &id) const
{
    const Command *cmd = find(id);
    if (!cmd || !cmd->action)
        return false;
    cmd->action();
    return true;
}

const Command *Keymap::find(const CommandId &id) const
{
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &commands_[it->second];
}

bool Keymap::handle(const term::KeyEvent &key) const
{
    auto it = global_.find(KeyChord{key.code, key.mods, key.codepoint});
    return it != global_.end() && execute(it->second);
}

std::vector<KeyChord> Keymap::chordsFor(const CommandId &id) const
{
    std::vector<KeyChord> out;
    for (const auto &[chord, cmd] : global_)
    {
        if (cmd == id)
            out.push_back(chord);
    }
    std::sort(out.begin(),
              out.end(),
              [](const KeyChord &a, const KeyChord &b)
              {
                  if (isPlainChar(a) != isPlainChar(b))
                      return isPlainChar(a);
                  return chordName(a) < chordName(b);
              });
    return out;
}

} // namespace stagelens::tui::input
