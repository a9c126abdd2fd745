//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: tui/src/term/input.cpp
// Purpose: Incremental decoder for keyboard, SGR mouse and bracketed paste
//          input.
// Key invariants: Bytes stay in the pending buffer until a whole sequence is
//                 available; a lone ESC at the end of a feed is reported as
//                 the Esc key.
// Ownership/Lifetime: See input.hpp.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "tui/term/input.hpp"

#include <utility>

namespace stagelens::tui::term
{
namespace
{
constexpr std::string_view kPasteEnd = "\x1b[201~";

using Code = KeyEvent::Code;

Code tildeCode(int n)
{
    switch (n)
    {
        case 1:
        case 7:
            return Code::Home;
        case 2:
            return Code::Insert;
        case 3:
            return Code::Delete;
        case 4:
        case 8:
            return Code::End;
        case 5:
            return Code::PageUp;
        case 6:
            return Code::PageDown;
        case 11:
            return Code::F1;
        case 12:
            return Code::F2;
        case 13:
            return Code::F3;
        case 14:
            return Code::F4;
        case 15:
            return Code::F5;
        case 17:
            return Code::F6;
        case 18:
            return Code::F7;
        case 19:
            return Code::F8;
        case 20:
            return Code::F9;
        case 21:
            return Code::F10;
        case 23:
            return Code::F11;
        case 24:
            return Code::F12;
        default:
            return Code::Unknown;
    }
}

Code letterCode(char c)
{
    switch (c)
    {
        case 'A':
            return Code::Up;
        case 'B':
            return Code::Down;
        case 'C':
            return Code::Right;
        case 'D':
            return Code::Left;
        case 'H':
            return Code::Home;
        case 'F':
            return Code::End;
        case 'P':
            return Code::F1;
        case 'Q':
            return Code::F2;
        case 'R':
            return Code::F3;
        case 'S':
            return Code::F4;
        default:
            return Code::Unknown;
    }
}

unsigned modsFromParam(int p)
{
    return p > 1 ? static_cast<unsigned>(p - 1) & (KeyEvent::Shift | KeyEvent::Alt | KeyEvent::Ctrl)
                 : 0U;
}
} // namespace

void InputDecoder::emitKey(KeyEvent::Code code, unsigned mods, uint32_t cp)
{
    KeyEvent ev{};
    ev.code = code;
    ev.mods = mods;
    ev.codepoint = cp;
    keys_.push_back(ev);
}

void InputDecoder::feed(std::string_view bytes)
{
    pending_.append(bytes);
    size_t pos = 0;
    while (pos < pending_.size())
    {
        if (inPaste_)
        {
            const size_t end = pending_.find(kPasteEnd, pos);
            if (end == std::string::npos)
            {
                // Keep a possible partial terminator for the next feed.
                const size_t keep = kPasteEnd.size() - 1;
                const size_t avail = pending_.size() - pos;
                const size_t take = avail > keep ? avail - keep : 0;
                paste_.append(pending_, pos, take);
                pos += take;
                break;
            }
            paste_.append(pending_, pos, end - pos);
            pastes_.push_back(PasteEvent{std::move(paste_)});
            paste_.clear();
            inPaste_ = false;
            pos = end + kPasteEnd.size();
            continue;
        }
        const size_t used = decodeOne(pos);
        if (used == 0)
            break;
        pos += used;
    }
    pending_.erase(0, pos);
}

size_t InputDecoder::decodeOne(size_t pos)
{
    const auto b = static_cast<unsigned char>(pending_[pos]);
    switch (b)
    {
        case 0x1b:
            return decodeEscape(pos);
        case '\r':
        case '\n':
            emitKey(Code::Enter);
            return 1;
        case '\t':
            emitKey(Code::Tab);
            return 1;
        case 0x7f:
        case 0x08:
            emitKey(Code::Backspace);
            return 1;
        default:
            break;
    }
    if (b < 0x20)
    {
        if (b == 0)
            emitKey(Code::Unknown, KeyEvent::Ctrl, ' ');
        else
            emitKey(Code::Unknown, KeyEvent::Ctrl, static_cast<uint32_t>('a' + b - 1));
        return 1;
    }
    return decodeUtf8(pos);
}

size_t InputDecoder::decodeEscape(size_t pos)
{
    if (pos + 1 >= pending_.size())
    {
        emitKey(Code::Esc);
        return 1;
    }
    const char next = pending_[pos + 1];
    if (next == '[')
        return decodeCsi(pos);
    if (next == 'O')
    {
        if (pos + 2 >= pending_.size())
            return 0;
        emitKey(letterCode(pending_[pos + 2]));
        return 3;
    }
    emitKey(Code::Esc);
    return 1;
}

size_t InputDecoder::decodeCsi(size_t pos)
{
    size_t i = pos + 2;
    const bool sgrMouse = i < pending_.size() && pending_[i] == '<';
    if (sgrMouse)
        ++i;

    std::vector<int> params;
    int cur = -1;
    while (i < pending_.size())
    {
        const char c = pending_[i];
        if (c >= '0' && c <= '9')
        {
            cur = (cur < 0 ? 0 : cur) * 10 + (c - '0');
            if (cur > 100000)
                cur = 100000;
        }
        else if (c == ';')
        {
            params.push_back(cur < 0 ? 0 : cur);
            cur = -1;
        }
        else
            break;
        ++i;
    }
    if (i >= pending_.size())
        return 0;
    if (cur >= 0)
        params.push_back(cur);

    const char final = pending_[i];
    const size_t used = i - pos + 1;

    if (sgrMouse)
    {
        if ((final != 'M' && final != 'm') || params.size() < 3)
            return used;
        const int b = params[0];
        MouseEvent me{};
        me.x = params[1] - 1;
        me.y = params[2] - 1;
        me.mods = ((b & 4) ? KeyEvent::Shift : 0U) | ((b & 8) ? KeyEvent::Alt : 0U) |
                  ((b & 16) ? KeyEvent::Ctrl : 0U);
        if (b & 64)
        {
            me.type = MouseEvent::Type::Wheel;
            me.buttons = (b & 1) ? 2U : 1U;
        }
        else if (b & 32)
        {
            me.type = MouseEvent::Type::Move;
            me.buttons = (b & 3) == 3 ? 0U : static_cast<unsigned>((b & 3) + 1);
        }
        else
        {
            me.type = final == 'M' ? MouseEvent::Type::Down : MouseEvent::Type::Up;
            me.buttons = static_cast<unsigned>((b & 3) + 1);
        }
        mouse_.push_back(me);
        return used;
    }

    const unsigned mods = params.size() >= 2 ? modsFromParam(params[1]) : 0U;
    if (final == '~')
    {
        const int n = params.empty() ? 0 : params[0];
        if (n == 200)
        {
            inPaste_ = true;
            paste_.clear();
            return used;
        }
        emitKey(tildeCode(n), mods);
        return used;
    }
    if (final == 'Z')
    {
        emitKey(Code::Tab, KeyEvent::Shift);
        return used;
    }
    emitKey(letterCode(final), mods);
    return used;
}

size_t InputDecoder::decodeUtf8(size_t pos)
{
    const auto lead = static_cast<unsigned char>(pending_[pos]);
    size_t len = 0;
    uint32_t cp = 0;
    uint32_t minCp = 0;
    if (lead < 0x80)
    {
        emitKey(Code::Unknown, 0, lead);
        return 1;
    }
    if ((lead & 0xE0) == 0xC0)
    {
        len = 2;
        cp = lead & 0x1F;
        minCp = 0x80;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        len = 3;
        cp = lead & 0x0F;
        minCp = 0x800;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        len = 4;
        cp = lead & 0x07;
        minCp = 0x10000;
    }
    else
    {
        emitKey(Code::Unknown);
        return 1;
    }

    for (size_t k = 1; k < len; ++k)
    {
        if (pos + k >= pending_.size())
            return 0;
        const auto c = static_cast<unsigned char>(pending_[pos + k]);
        if ((c & 0xC0) != 0x80)
        {
            emitKey(Code::Unknown);
            return k;
        }
        cp = (cp << 6) | (c & 0x3F);
    }

    const bool invalid = cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF);
    emitKey(Code::Unknown, 0, invalid ? 0 : cp);
    return len;
}

std::vector<KeyEvent> InputDecoder::drain()
{
    return std::exchange(keys_, {});
}

std::vector<MouseEvent> InputDecoder::drain_mouse()
{
    return std::exchange(mouse_, {});
}

std::vector<PasteEvent> InputDecoder::drain_paste()
{
    return std::exchange(pastes_, {});
}

} // namespace stagelens::tui::term
