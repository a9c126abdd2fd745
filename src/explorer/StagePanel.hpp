//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/explorer/StagePanel.hpp
// Purpose: Bordered, titled list widget showing one stage's items.
// Key invariants: highlighted() holds valid ascending indices into items();
//                 setContent() clears the highlight and the cursor.
// Ownership/Lifetime: Owned by PanelGrid; the pipeline borrows it as a
//                     PanelView.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "pipeline/PanelView.hpp"
#include "pipeline/StageKind.hpp"
#include "tui/style/theme.hpp"
#include "tui/ui/widget.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stagelens::explorer
{

class StagePanel : public tui::ui::Widget, public pipeline::PanelView
{
  public:
    StagePanel(pipeline::StageKind kind, const tui::style::Theme &theme);

    // PanelView
    void setContent(const std::vector<pipeline::StageItem> &items) override;
    void highlight(const std::vector<size_t> &indices) override;
    void clearHighlight() override;
    void markStale(bool stale) override;

    // Widget
    void paint(tui::render::ScreenBuffer &sb) override;
    bool onEvent(const tui::ui::Event &ev) override;

    bool wantsFocus() const override
    {
        return true;
    }

    void onFocusChanged(bool focused) override
    {
        focused_ = focused;
    }

    /// @brief Invoked with the source line of an item the user points at.
    std::function<void(uint32_t)> onHoverLine;

    pipeline::StageKind kind() const
    {
        return kind_;
    }

    /// @brief Title as drawn in the border, e.g. "Tokens (2) [stale]".
    std::string title() const;

    const std::vector<pipeline::StageItem> &items() const
    {
        return items_;
    }

    const std::vector<size_t> &highlighted() const
    {
        return highlighted_;
    }

    bool isStale() const
    {
        return stale_;
    }

    std::optional<size_t> cursor() const
    {
        return cursor_;
    }

  private:
    /// Number of item rows inside the border.
    size_t bodyRows() const;
    void scrollTo(size_t index);
    void moveCursor(int delta);
    void pointAt(size_t index);

    pipeline::StageKind kind_;
    const tui::style::Theme &theme_;
    std::vector<pipeline::StageItem> items_;
    std::vector<size_t> highlighted_;
    std::vector<bool> isHighlighted_;
    std::optional<size_t> cursor_;
    size_t scroll_{0};
    bool stale_{false};
    bool focused_{false};
};

} // namespace stagelens::explorer
