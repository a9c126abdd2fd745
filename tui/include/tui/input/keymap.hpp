// tui/include/tui/input/keymap.hpp
// @brief Explorer command registry and the key chords bound to each command.
// @invariant Command ids are unique; a chord maps to at most one command.
// @ownership Keymap owns command callbacks.
#pragma once

#include "tui/term/input.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stagelens::tui::input
{

using CommandId = std::string;

struct KeyChord
{
    term::KeyEvent::Code code{term::KeyEvent::Code::Unknown};
    unsigned mods{0};
    uint32_t codepoint{0};

    bool operator==(const KeyChord &other) const;
};

struct KeyChordHash
{
    std::size_t operator()(const KeyChord &kc) const;
};

/// @brief Render a chord for help text ("ctrl+e", "esc", "q").
std::string chordName(const KeyChord &kc);

struct Command
{
    CommandId id;
    std::string name;
    std::function<void()> action;
};

class Keymap
{
  public:
    /// @brief Register or replace the command @p id.
    void registerCommand(CommandId id, std::string name, std::function<void()> action);

    /// @brief Bind @p kc to @p id, replacing whatever the chord ran before.
    void bindGlobal(const KeyChord &kc, const CommandId &id);

    /// @brief Run command @p id; false when unknown or without action.
    bool execute(const CommandId &id) const;

    [[nodiscard]] const Command *find(const CommandId &id) const;

    /// @brief Run the command bound to @p key; false when none is bound.
    bool handle(const term::KeyEvent &key) const;

    /// @brief Chords bound to @p id, plain characters first, then by name.
    [[nodiscard]] std::vector<KeyChord> chordsFor(const CommandId &id) const;

  private:
    std::vector<Command> commands_;
    std::unordered_map<CommandId, size_t> index_;
    std::unordered_map<KeyChord, CommandId, KeyChordHash> global_;
};

} // namespace stagelens::tui::input
