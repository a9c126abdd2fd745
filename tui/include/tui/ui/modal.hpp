// tui/include/tui/ui/modal.hpp
// @brief Modal layer hosting dialogs above a root widget.
// @invariant While a modal is open it receives every event; a modal that
//            requested closing is popped after the event that caused it.
// @ownership ModalHost owns the root widget and the modal stack.
#pragma once

#include "tui/ui/widget.hpp"

#include <memory>
#include <vector>

namespace stagelens::tui::ui
{

/// @brief Widget shown above the root; asks the host to close it.
class Modal : public Widget
{
  public:
    void requestClose()
    {
        closeRequested_ = true;
    }

    [[nodiscard]] bool closeRequested() const
    {
        return closeRequested_;
    }

    /// @brief Preferred size; the host centres the modal within its rect.
    [[nodiscard]] virtual Rect preferredRect(const Rect &host) const
    {
        return host;
    }

  private:
    bool closeRequested_{false};
};

class ModalHost : public Widget
{
  public:
    explicit ModalHost(std::unique_ptr<Widget> root);

    void pushModal(std::unique_ptr<Modal> modal);
    void popModal();

    [[nodiscard]] bool hasModal() const
    {
        return !modals_.empty();
    }

    [[nodiscard]] Modal *topModal() const
    {
        return modals_.empty() ? nullptr : modals_.back().get();
    }

    [[nodiscard]] Widget *root() const
    {
        return root_.get();
    }

    void layout(const Rect &r) override;
    void paint(render::ScreenBuffer &sb) override;
    bool onEvent(const Event &ev) override;

  private:
    std::unique_ptr<Widget> root_;
    std::vector<std::unique_ptr<Modal>> modals_;
};

} // namespace stagelens::tui::ui
