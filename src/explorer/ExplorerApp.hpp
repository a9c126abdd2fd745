//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/explorer/ExplorerApp.hpp
// Purpose: Wires the pipeline core to the terminal UI.
// Key invariants: Every StagePanel is attached to the controller for its whole
//                 lifetime; the focus ring holds exactly the visible panels.
// Ownership/Lifetime: Owns the toolchain, controller, view state, broadcaster,
//                     keymap and tui::App. The App (and with it every widget)
//                     is destroyed before the pipeline objects it refers to.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "explorer/PanelGrid.hpp"
#include "pipeline/HighlightBroadcaster.hpp"
#include "pipeline/LangToolchain.hpp"
#include "pipeline/PipelineController.hpp"
#include "pipeline/ViewState.hpp"
#include "tui/app.hpp"
#include "tui/config/config.hpp"
#include "tui/input/keymap.hpp"

#include <memory>
#include <string>

namespace stagelens::explorer
{

class ExplorerApp
{
  public:
    ExplorerApp(tui::term::TermIO &tio,
                int rows,
                int cols,
                const tui::config::Config &config,
                pipeline::ToolchainVersion version);
    ~ExplorerApp();

    ExplorerApp(const ExplorerApp &) = delete;
    ExplorerApp &operator=(const ExplorerApp &) = delete;

    /// @brief Push @p text through the pipeline and refresh highlights.
    support::Expected<void, pipeline::PipelineError> loadSource(std::string text);

    /// @brief Show or hide @p kind; unavailable stages are ignored.
    void toggleStage(pipeline::StageKind kind);

    /// @brief Open the source editor over the panels.
    void openEditor();

    /// @brief Select source line @p line in every visible panel.
    void selectLine(uint32_t line);

    bool quitRequested() const
    {
        return quit_;
    }

    /// @brief Text of the two footer rows (key hints, status).
    std::string hintText() const;
    std::string statusText() const;

    tui::App &app()
    {
        return *app_;
    }

    pipeline::PipelineController &controller()
    {
        return controller_;
    }

    const pipeline::ViewState &view() const
    {
        return view_;
    }

    pipeline::HighlightBroadcaster &broadcaster()
    {
        return broadcaster_;
    }

    tui::input::Keymap &keymap()
    {
        return keymap_;
    }

    PanelGrid &grid()
    {
        return *grid_;
    }

    tui::ui::ModalHost &modalHost()
    {
        return *host_;
    }

  private:
    void registerCommands(const tui::config::Config &config);
    void applyVisibility(const tui::config::ExplorerConfig &cfg);
    void rebuildFocus();

    tui::style::Theme theme_;
    unsigned tabWidth_;
    pipeline::LangToolchain toolchain_;
    pipeline::PipelineController controller_;
    pipeline::ViewState view_;
    pipeline::HighlightBroadcaster broadcaster_;
    tui::input::Keymap keymap_;
    PanelGrid *grid_{nullptr};
    tui::ui::ModalHost *host_{nullptr};
    bool quit_{false};
    std::unique_ptr<tui::App> app_;
};

} // namespace stagelens::explorer
