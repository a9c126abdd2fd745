// File: tests/common/PipelineFakes.hpp
// Purpose: Recording panel and scripted toolchain adapter for pipeline tests.
// Key invariants: RecordingPanel mirrors exactly what the controller and the
//                 broadcaster pushed; ScriptedAdapter fails or throws only on
//                 the configured stage.
// Ownership/Lifetime: Fakes are owned by the test; panels must outlive their
//                     attachment to a controller.

#pragma once

#include "pipeline/PanelView.hpp"
#include "pipeline/ToolchainAdapter.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stagelens::tests
{
class RecordingPanel : public pipeline::PanelView
{
  public:
    void setContent(const std::vector<pipeline::StageItem> &items) override
    {
        items_ = items;
        highlighted_.clear();
        ++contentCalls_;
    }

    void highlight(const std::vector<size_t> &indices) override
    {
        highlighted_ = indices;
        ++highlightCalls_;
    }

    void clearHighlight() override
    {
        highlighted_.clear();
        ++clearCalls_;
    }

    void markStale(bool stale) override
    {
        stale_ = stale;
    }

    const std::vector<pipeline::StageItem> &items() const
    {
        return items_;
    }

    const std::vector<size_t> &highlighted() const
    {
        return highlighted_;
    }

    bool stale() const
    {
        return stale_;
    }

    int contentCalls() const
    {
        return contentCalls_;
    }

    int highlightCalls() const
    {
        return highlightCalls_;
    }

    int clearCalls() const
    {
        return clearCalls_;
    }

  private:
    std::vector<pipeline::StageItem> items_;
    std::vector<size_t> highlighted_;
    bool stale_ = false;
    int contentCalls_ = 0;
    int highlightCalls_ = 0;
    int clearCalls_ = 0;
};

/// Adapter producing one item per source line, tagged with the stage name.
class ScriptedAdapter : public pipeline::ToolchainAdapter
{
  public:
    explicit ScriptedAdapter(pipeline::StageSet stages = pipeline::StageSet::all())
        : stages_(stages)
    {
    }

    pipeline::StageSet availableStages() const override
    {
        return stages_;
    }

    support::Expected<pipeline::StageOutput> run(std::string_view source,
                                                 pipeline::StageKind kind) override
    {
        ++runs;
        if (throwOn && *throwOn == kind)
            throw std::runtime_error("adapter exploded");
        if (failOn && *failOn == kind)
            return support::makeError({failLine, 0}, "scripted failure");

        pipeline::StageOutput out;
        uint32_t line = 1;
        size_t begin = 0;
        while (begin < source.size())
        {
            size_t end = source.find('\n', begin);
            if (end == std::string_view::npos)
                end = source.size();
            out.items.push_back(pipeline::StageItem{
                std::string(pipeline::stageName(kind)) + ":" +
                    std::string(source.substr(begin, end - begin)),
                line++});
            begin = end + 1;
        }
        out.items.push_back(pipeline::StageItem{"<end>", std::nullopt});
        return out;
    }

    std::optional<pipeline::StageKind> failOn;
    std::optional<pipeline::StageKind> throwOn;
    uint32_t failLine = 1;
    int runs = 0;

  private:
    pipeline::StageSet stages_;
};
} // namespace stagelens::tests
