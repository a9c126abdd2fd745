// tui/include/tui/term/input.hpp
// @brief Decoder turning raw terminal bytes into key, mouse and paste events.
// @invariant Incomplete escape or UTF-8 sequences are buffered across feed()
//            calls; invalid UTF-8 yields a KeyEvent with codepoint 0.
// @ownership InputDecoder owns its pending bytes and event queues.
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stagelens::tui::term
{

struct KeyEvent
{
    enum class Code
    {
        Unknown,
        Enter,
        Esc,
        Tab,
        Backspace,
        Up,
        Down,
        Left,
        Right,
        Home,
        End,
        PageUp,
        PageDown,
        Insert,
        Delete,
        F1,
        F2,
        F3,
        F4,
        F5,
        F6,
        F7,
        F8,
        F9,
        F10,
        F11,
        F12,
    };

    /// Modifier bits; values match the xterm modifier parameter minus one.
    enum Mods : unsigned
    {
        Shift = 1U,
        Alt = 2U,
        Ctrl = 4U,
    };

    Code code{Code::Unknown};
    unsigned mods{0};
    uint32_t codepoint{0}; ///< Printable character when code is Unknown.
};

struct MouseEvent
{
    enum class Type
    {
        Down,
        Up,
        Move,
        Wheel,
    };

    Type type{Type::Move};
    int x{0}; ///< 0-based column.
    int y{0}; ///< 0-based row.
    unsigned buttons{0};
    unsigned mods{0};
};

struct PasteEvent
{
    std::string text;
};

class InputDecoder
{
  public:
    /// @brief Append raw bytes and decode every complete sequence.
    void feed(std::string_view bytes);

    /// @brief Take decoded key events.
    std::vector<KeyEvent> drain();

    /// @brief Take decoded mouse events.
    std::vector<MouseEvent> drain_mouse();

    /// @brief Take completed bracketed pastes.
    std::vector<PasteEvent> drain_paste();

  private:
    /// Decode one sequence at pending_[pos]; returns bytes consumed or 0 when
    /// more input is required.
    size_t decodeOne(size_t pos);
    size_t decodeEscape(size_t pos);
    size_t decodeCsi(size_t pos);
    size_t decodeUtf8(size_t pos);
    void emitKey(KeyEvent::Code code, unsigned mods = 0, uint32_t cp = 0);

    std::string pending_;
    bool inPaste_{false};
    std::string paste_;
    std::vector<KeyEvent> keys_;
    std::vector<MouseEvent> mouse_;
    std::vector<PasteEvent> pastes_;
};

} // namespace stagelens::tui::term
