//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/explorer/EditorOverlay.hpp
// Purpose: Modal source editor shown on top of the panel grid.
// Key invariants: cursor() is always a code point boundary within text();
//                 onDismiss fires exactly once, just before the modal asks to
//                 close.
// Ownership/Lifetime: Owned by the ModalHost while open.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tui/style/theme.hpp"
#include "tui/text/text_buffer.hpp"
#include "tui/ui/modal.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace stagelens::explorer
{

class EditorOverlay : public tui::ui::Modal
{
  public:
    /// @brief Receives the edited text on commit, or nullopt when the edit was
    ///        discarded or left the text unchanged.
    using DismissFn = std::function<void(std::optional<std::string>)>;

    EditorOverlay(std::string text, const tui::style::Theme &theme, unsigned tabWidth, DismissFn onDismiss);

    void paint(tui::render::ScreenBuffer &sb) override;
    bool onEvent(const tui::ui::Event &ev) override;

    bool wantsFocus() const override
    {
        return true;
    }

    tui::ui::Rect preferredRect(const tui::ui::Rect &host) const override;

    const std::string &text() const
    {
        return buffer_.str();
    }

    size_t cursor() const
    {
        return cursor_;
    }

  private:
    void insert(std::string_view s);
    void backspace();
    void deleteForward();
    void moveLeft();
    void moveRight();
    void moveVertical(int delta);
    void dismiss(std::optional<std::string> result);
    size_t displayColumn(size_t line, size_t byteCol) const;
    std::string expandTabs(std::string_view line) const;

    tui::text::TextBuffer buffer_;
    std::string original_;
    const tui::style::Theme &theme_;
    unsigned tabWidth_;
    DismissFn onDismiss_;
    size_t cursor_{0};
    size_t firstLine_{0};
    bool dismissed_{false};
};

} // namespace stagelens::explorer
