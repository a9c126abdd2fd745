//===----------------------------------------------------------------------===//
//
// Part of the Stagelens project, under the GNU GPL v3.
//
//===----------------------------------------------------------------------===//
//
// File: src/explorer/ExplorerApp.cpp
// Purpose: Explorer widget tree, key commands and pipeline wiring.
// Key invariants: Stage toggle commands exist only for available stages.
// Ownership/Lifetime: See ExplorerApp.hpp.
// Links: docs/explorer.md
//
//===----------------------------------------------------------------------===//

#include "explorer/ExplorerApp.hpp"

#include "explorer/EditorOverlay.hpp"
#include "support/trace.hpp"

#include <functional>

namespace stagelens::explorer
{

using pipeline::kAllStages;
using pipeline::StageKind;
using tui::style::Role;
using tui::term::KeyEvent;
using tui::ui::Rect;

namespace
{

/// Header row, panel grid and a two-row footer.
class ExplorerRoot : public tui::ui::Widget
{
  public:
    ExplorerRoot(std::unique_ptr<PanelGrid> grid,
                 const tui::style::Theme &theme,
                 std::function<std::string()> header,
                 std::function<std::string()> hints,
                 std::function<std::string()> status)
        : grid_(std::move(grid)), theme_(theme), header_(std::move(header)),
          hints_(std::move(hints)), status_(std::move(status))
    {
    }

    void layout(const Rect &r) override
    {
        rect_ = r;
        const int gridH = r.h > 3 ? r.h - 3 : 0;
        grid_->layout(Rect{r.x, r.y + 1, r.w, gridH});
    }

    void paint(tui::render::ScreenBuffer &sb) override
    {
        if (rect_.h <= 0)
            return;
        const auto &accent = theme_.style(Role::Accent);
        const auto &dim = theme_.style(Role::Disabled);
        sb.fill(rect_.y, rect_.x, 1, rect_.w, accent);
        sb.putText(rect_.y, rect_.x + 1, header_(), accent, rect_.w - 2);
        grid_->paint(sb);
        if (rect_.h >= 3)
        {
            const int hintsY = rect_.y + rect_.h - 2;
            sb.fill(hintsY, rect_.x, 2, rect_.w, dim);
            sb.putText(hintsY, rect_.x + 1, hints_(), dim, rect_.w - 2);
            sb.putText(hintsY + 1, rect_.x + 1, status_(), theme_.style(Role::Normal), rect_.w - 2);
        }
    }

    bool onEvent(const tui::ui::Event &ev) override
    {
        return grid_->onEvent(ev);
    }

    PanelGrid *grid() const
    {
        return grid_.get();
    }

  private:
    std::unique_ptr<PanelGrid> grid_;
    const tui::style::Theme &theme_;
    std::function<std::string()> header_;
    std::function<std::string()> hints_;
    std::function<std::string()> status_;
};

tui::input::KeyChord charChord(char c)
{
    tui::input::KeyChord kc{};
    kc.codepoint = static_cast<uint32_t>(c);
    return kc;
}

std::string toggleCommand(StageKind kind)
{
    return std::string("toggle.") + pipeline::stageName(kind);
}

} // namespace

ExplorerApp::ExplorerApp(tui::term::TermIO &tio,
                         int rows,
                         int cols,
                         const tui::config::Config &config,
                         pipeline::ToolchainVersion version)
    : theme_(config.theme), tabWidth_(config.editor.tab_width), toolchain_(version),
      controller_(toolchain_), view_(toolchain_.availableStages()),
      broadcaster_(controller_, view_)
{
    applyVisibility(config.explorer);

    auto grid = std::make_unique<PanelGrid>(view_, theme_);
    grid_ = grid.get();
    for (auto kind : kAllStages)
    {
        StagePanel &p = grid_->panel(kind);
        p.onHoverLine = [this](uint32_t line) { selectLine(line); };
        if (view_.isAvailable(kind))
            controller_.attachPanel(kind, &p);
    }

    auto root = std::make_unique<ExplorerRoot>(
        std::move(grid),
        theme_,
        [this] {
            return std::string("stagelens ") + "(" + pipeline::toolchainVersionName(toolchain_.version()) +
                   " toolchain)  revision " + std::to_string(controller_.revision());
        },
        [this] { return hintText(); },
        [this] { return statusText(); });
    auto host = std::make_unique<tui::ui::ModalHost>(std::move(root));
    host_ = host.get();

    app_ = std::make_unique<tui::App>(std::move(host), tio, rows, cols, config.explorer.truecolor);
    app_->setModalHost(host_);
    registerCommands(config);
    app_->setKeymap(&keymap_);
    rebuildFocus();
}

ExplorerApp::~ExplorerApp()
{
    // Panels die with the App; detach them from the controller first.
    for (auto kind : kAllStages)
        controller_.attachPanel(kind, nullptr);
    app_.reset();
}

void ExplorerApp::applyVisibility(const tui::config::ExplorerConfig &cfg)
{
    if (!cfg.visible)
        return;
    for (auto kind : kAllStages)
        view_.setVisible(kind, false);
    for (const auto &name : *cfg.visible)
    {
        if (auto kind = pipeline::parseStageName(name))
            view_.setVisible(*kind, true);
        else
            support::trace("app", "ignoring unknown stage '" + name + "' in [explorer] visible");
    }
}

void ExplorerApp::registerCommands(const tui::config::Config &config)
{
    keymap_.registerCommand("quit", "Quit", [this] { quit_ = true; });
    keymap_.registerCommand("editor", "Edit", [this] { openEditor(); });
    keymap_.bindGlobal(charChord('q'), "quit");
    tui::input::KeyChord esc{};
    esc.code = KeyEvent::Code::Esc;
    keymap_.bindGlobal(esc, "quit");
    keymap_.bindGlobal(charChord('e'), "editor");

    for (auto kind : view_.available().members())
    {
        const std::string id = toggleCommand(kind);
        keymap_.registerCommand(id, pipeline::stageTitle(kind), [this, kind] { toggleStage(kind); });
        keymap_.bindGlobal(charChord(pipeline::stageKey(kind)), id);
    }

    for (const auto &b : config.keymap_global)
    {
        if (!keymap_.find(b.command))
        {
            support::trace("app", "ignoring binding to unknown command '" + b.command + "'");
            continue;
        }
        keymap_.bindGlobal(b.chord, b.command);
    }
}

void ExplorerApp::rebuildFocus()
{
    auto &focus = app_->focus();
    tui::ui::Widget *previous = focus.current();
    focus.clear();
    for (auto kind : kAllStages)
        grid_->panel(kind).onFocusChanged(false);
    bool keepPrevious = false;
    for (auto kind : view_.visibleStages())
    {
        StagePanel &p = grid_->panel(kind);
        focus.registerWidget(&p);
        keepPrevious = keepPrevious || &p == previous;
    }
    if (keepPrevious)
        focus.setFocus(previous);
    if (auto *w = focus.current())
        w->onFocusChanged(true);
}

support::Expected<void, pipeline::PipelineError> ExplorerApp::loadSource(std::string text)
{
    auto result = controller_.setSource(std::move(text));
    broadcaster_.reapply();
    return result;
}

void ExplorerApp::toggleStage(StageKind kind)
{
    if (!view_.isAvailable(kind))
        return;
    view_.toggle(kind);
    support::trace("app",
                   std::string(view_.isVisible(kind) ? "show " : "hide ") + pipeline::stageName(kind) +
                       ", " + std::to_string(view_.panelColumns()) + " column(s)");
    rebuildFocus();
    // Re-layout happens on the next tick; highlights are pushed right away.
    broadcaster_.reapply();
}

void ExplorerApp::selectLine(uint32_t line)
{
    broadcaster_.onLineSelected(line);
}

void ExplorerApp::openEditor()
{
    if (host_->hasModal())
        return;
    host_->pushModal(std::make_unique<EditorOverlay>(
        controller_.source(), theme_, tabWidth_, [this](std::optional<std::string> edited) {
            if (!edited)
            {
                support::trace("app", "editor closed without changes");
                return;
            }
            auto result = loadSource(std::move(*edited));
            if (!result)
                support::trace("app", "edited source rejected: " + result.error().describe());
        }));
}

std::string ExplorerApp::hintText() const
{
    // Each hint shows the first chord bound to its command, so config
    // rebinding is reflected and commands left without a chord drop out.
    const auto keyFor = [this](const std::string &id)
    {
        const auto chords = keymap_.chordsFor(id);
        return chords.empty() ? std::string() : tui::input::chordName(chords.front());
    };

    std::string out;
    if (const std::string key = keyFor("quit"); !key.empty())
        out += key + " quit  ";
    if (const std::string key = keyFor("editor"); !key.empty())
        out += key + " edit  ";
    for (auto kind : view_.available().members())
    {
        const std::string key = keyFor(toggleCommand(kind));
        if (key.empty())
            continue;
        const bool visible = view_.isVisible(kind);
        out += key;
        out += visible ? " [" : " ";
        out += pipeline::stageName(kind);
        out += visible ? "] " : " ";
    }
    out += " tab focus";
    return out;
}

std::string ExplorerApp::statusText() const
{
    if (const auto &err = controller_.lastError())
        return err->describe();
    if (auto line = controller_.currentLine())
        return "line " + std::to_string(*line);
    return "hover over an item to highlight its source line";
}

} // namespace stagelens::explorer
