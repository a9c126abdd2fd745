// tui/include/tui/app.hpp
// @brief Application loop managing widgets, focus, key bindings and rendering.
// @invariant tick() processes queued events once and renders the widget tree.
// @ownership App owns the root widget and screen buffer; it borrows the
//            TermIO, keymap and modal host.
#pragma once

#include "tui/input/keymap.hpp"
#include "tui/render/renderer.hpp"
#include "tui/ui/focus.hpp"
#include "tui/ui/modal.hpp"
#include "tui/ui/widget.hpp"

#include <memory>
#include <vector>

namespace stagelens::tui
{

class App
{
  public:
    App(std::unique_ptr<ui::Widget> root,
        term::TermIO &tio,
        int rows,
        int cols,
        bool truecolor = false);

    /// @brief Queue an event for processing on next tick.
    void pushEvent(const ui::Event &ev);

    /// @brief Resize the backing screen buffer.
    void resize(int rows, int cols);

    /// @brief Process queued events and render once.
    void tick();

    [[nodiscard]] render::ScreenBuffer &screen()
    {
        return screen_;
    }

    ui::FocusManager &focus();

    /// @brief Install the keymap consulted before focused widgets.
    void setKeymap(input::Keymap *km);

    /// @brief While @p host shows a modal, keys bypass keymap and focus and go
    ///        straight to the modal.
    void setModalHost(ui::ModalHost *host);

    [[nodiscard]] int rows() const
    {
        return rows_;
    }

    [[nodiscard]] int cols() const
    {
        return cols_;
    }

  private:
    void dispatch(const ui::Event &ev);

    std::unique_ptr<ui::Widget> root_{};
    render::ScreenBuffer screen_{};
    render::Renderer renderer_;
    ui::FocusManager focus_{};
    input::Keymap *keymap_{nullptr};
    ui::ModalHost *modalHost_{nullptr};
    std::vector<ui::Event> events_{};
    int rows_{0};
    int cols_{0};
};

} // namespace stagelens::tui
