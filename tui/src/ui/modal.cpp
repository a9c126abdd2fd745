// tui/src/ui/modal.cpp
// @brief ModalHost layering and event routing.
// @invariant Modals are laid out within the host rect at their preferred size.
// @ownership ModalHost owns root and modals.

#include "tui/ui/modal.hpp"

#include <utility>

namespace stagelens::tui::ui
{

ModalHost::ModalHost(std::unique_ptr<Widget> root) : root_(std::move(root)) {}

void ModalHost::pushModal(std::unique_ptr<Modal> modal)
{
    if (!modal)
        return;
    modal->layout(modal->preferredRect(rect_));
    modals_.push_back(std::move(modal));
}

void ModalHost::popModal()
{
    if (!modals_.empty())
        modals_.pop_back();
}

void ModalHost::layout(const Rect &r)
{
    Widget::layout(r);
    if (root_)
        root_->layout(r);
    for (auto &m : modals_)
        m->layout(m->preferredRect(r));
}

void ModalHost::paint(render::ScreenBuffer &sb)
{
    if (root_)
        root_->paint(sb);
    for (auto &m : modals_)
        m->paint(sb);
}

bool ModalHost::onEvent(const Event &ev)
{
    if (!modals_.empty())
    {
        Modal *top = modals_.back().get();
        top->onEvent(ev);
        if (top->closeRequested())
            popModal();
        return true;
    }
    return root_ ? root_->onEvent(ev) : false;
}

} // namespace stagelens::tui::ui
