// tui/tests/test_modal.cpp
// @brief Verify ModalHost routing, layout and closing.
// @invariant While a modal is open it receives every event.
// @ownership ModalHost owns its root and modals.

#include "tui/app.hpp"
#include "tui/input/keymap.hpp"
#include "tui/term/term_io.hpp"
#include "tui/ui/modal.hpp"

#include <gtest/gtest.h>

#include <memory>

using stagelens::tui::App;
using stagelens::tui::input::KeyChord;
using stagelens::tui::input::Keymap;
using stagelens::tui::term::KeyEvent;
using stagelens::tui::term::StringTermIO;
using stagelens::tui::ui::Event;
using stagelens::tui::ui::Modal;
using stagelens::tui::ui::ModalHost;
using stagelens::tui::ui::Rect;
using stagelens::tui::ui::Widget;

namespace
{
struct CountingWidget : Widget
{
    int events{0};

    bool onEvent(const Event &) override
    {
        ++events;
        return true;
    }
};

struct ClosingModal : Modal
{
    int *keys{nullptr};

    bool onEvent(const Event &ev) override
    {
        ++*keys;
        if (ev.key.code == KeyEvent::Code::Esc)
            requestClose();
        return true;
    }

    Rect preferredRect(const Rect &host) const override
    {
        return Rect{host.x + 1, host.y + 1, host.w - 2, host.h - 2};
    }
};

Event keyEvent(KeyEvent::Code code, uint32_t cp = 0)
{
    Event ev{};
    ev.key.code = code;
    ev.key.codepoint = cp;
    return ev;
}
} // namespace

TEST(ModalHost, ForwardsToRootWithoutModal)
{
    auto root = std::make_unique<CountingWidget>();
    CountingWidget *rootPtr = root.get();
    ModalHost host(std::move(root));
    Event ev{};
    ev.kind = Event::Kind::Mouse;
    EXPECT_TRUE(host.onEvent(ev));
    EXPECT_EQ(rootPtr->events, 1);
    EXPECT_FALSE(host.hasModal());
}

TEST(ModalHost, ModalCapturesKeysUntilClosed)
{
    auto root = std::make_unique<CountingWidget>();
    CountingWidget *rootPtr = root.get();
    auto host = std::make_unique<ModalHost>(std::move(root));
    ModalHost *hostPtr = host.get();

    StringTermIO tio;
    App app(std::move(host), tio, 10, 20);
    app.setModalHost(hostPtr);
    Keymap km;
    int quits = 0;
    km.registerCommand("quit", "Quit", [&] { ++quits; });
    km.bindGlobal(KeyChord{KeyEvent::Code::Unknown, 0, 'q'}, "quit");
    app.setKeymap(&km);
    app.tick();

    int modalKeys = 0;
    auto modal = std::make_unique<ClosingModal>();
    modal->keys = &modalKeys;
    ClosingModal *modalPtr = modal.get();
    hostPtr->pushModal(std::move(modal));
    EXPECT_EQ(modalPtr->rect().x, 1);
    EXPECT_EQ(modalPtr->rect().w, 18);

    app.pushEvent(keyEvent(KeyEvent::Code::Unknown, 'q'));
    app.tick();
    EXPECT_EQ(quits, 0);
    EXPECT_EQ(modalKeys, 1);

    app.pushEvent(keyEvent(KeyEvent::Code::Esc));
    app.tick();
    EXPECT_FALSE(hostPtr->hasModal());

    app.pushEvent(keyEvent(KeyEvent::Code::Unknown, 'q'));
    app.tick();
    EXPECT_EQ(quits, 1);
    EXPECT_EQ(rootPtr->events, 0);
}
