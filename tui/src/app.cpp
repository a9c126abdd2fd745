//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: tui/src/app.cpp
// Purpose: Implement the application event loop behind the explorer.
// Key invariants: Renderer draws exactly one frame per call to tick() after
//                 draining all pending events.
// Ownership/Lifetime: App owns the root widget hierarchy and backing screen
//                     buffer while borrowing a TermIO implementation.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the terminal UI application loop and event dispatch.
/// @details The `stagelens::tui::App` type coordinates the root widget tree,
///          focus manager, and terminal renderer.  Each `tick()` consumes
///          queued events, routes them through the modal host or keymap, and
///          paints the widget tree into the backing buffer before flushing to
///          the terminal.

#include "tui/app.hpp"

#include "support/trace.hpp"

#include <string>

namespace stagelens::tui
{
/// @brief Construct an application host around a widget tree and renderer.
/// @param root Root widget that defines the UI hierarchy.
/// @param tio Terminal I/O shim responsible for drawing frames to the user.
/// @param rows Number of rows in the terminal viewport.
/// @param cols Number of columns in the terminal viewport.
/// @param truecolor Whether the renderer may emit 24-bit colour sequences.
App::App(std::unique_ptr<ui::Widget> root, term::TermIO &tio, int rows, int cols, bool truecolor)
    : root_(std::move(root)), renderer_(tio, truecolor), rows_(rows), cols_(cols)
{
    screen_.resize(rows, cols);
}

/// @brief Queue an input event to be processed on the next @ref tick cycle.
void App::pushEvent(const ui::Event &ev)
{
    events_.push_back(ev);
}

/// @brief Expose the focus manager that tracks the currently active widget.
ui::FocusManager &App::focus()
{
    return focus_;
}

/// @brief Install a keymap that translates key presses into commands.
/// @details Passing @c nullptr removes the active keymap, allowing events to
///          flow directly to the focused widget.
void App::setKeymap(input::Keymap *km)
{
    keymap_ = km;
}

void App::setModalHost(ui::ModalHost *host)
{
    modalHost_ = host;
}

/// @brief Route one event.
/// @details Open modals see every event first.  Mouse and paste events go to
///          the root widget, which forwards them by position.  Tab cycles
///          focus, the keymap gets the remaining keys and the focused widget
///          receives whatever the keymap leaves unhandled.
void App::dispatch(const ui::Event &ev)
{
    if (modalHost_ && modalHost_->hasModal())
    {
        modalHost_->onEvent(ev);
        return;
    }
    if (ev.kind != ui::Event::Kind::Key)
    {
        if (root_)
            root_->onEvent(ev);
        return;
    }
    if (ev.key.code == term::KeyEvent::Code::Tab)
    {
        if (ev.key.mods & term::KeyEvent::Shift)
        {
            (void)focus_.prev();
        }
        else
        {
            (void)focus_.next();
        }
        return;
    }
    bool handled = false;
    if (keymap_)
    {
        handled = keymap_->handle(ev.key);
    }
    if (!handled)
    {
        if (auto *w = focus_.current())
        {
            w->onEvent(ev);
        }
    }
}

/// @brief Advance the application by one frame, processing events and drawing.
void App::tick()
{
    // Commands may queue further events; swap first so they run next tick.
    std::vector<ui::Event> pending;
    pending.swap(events_);
    for (const auto &ev : pending)
    {
        dispatch(ev);
    }
    if (root_)
    {
        ui::Rect full{0, 0, cols_, rows_};
        root_->layout(full);
        screen_.clear(render::Style{});
        root_->paint(screen_);
    }
    renderer_.draw(screen_);
    screen_.snapshotPrev();
}

/// @brief Update the terminal dimensions and resize internal buffers.
void App::resize(int rows, int cols)
{
    if (rows == rows_ && cols == cols_)
        return;
    support::trace("app", "resize " + std::to_string(rows) + "x" + std::to_string(cols));
    rows_ = rows;
    cols_ = cols;
    screen_.resize(rows_, cols_);
    renderer_.invalidate();
}

} // namespace stagelens::tui
