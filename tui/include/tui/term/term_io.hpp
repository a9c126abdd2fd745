// tui/include/tui/term/term_io.hpp
// @brief Output sink abstraction for terminal escape sequences and text.
// @invariant flush() makes all previously written bytes visible to the sink.
// @ownership Implementations own only their internal buffers.
#pragma once

#include <string>
#include <string_view>

namespace stagelens::tui::term
{

/// @brief Abstract byte sink used by the renderer and terminal session.
class TermIO
{
  public:
    virtual ~TermIO() = default;

    /// @brief Append @p s to the output.
    virtual void write(std::string_view s) = 0;

    /// @brief Push buffered output to the device.
    virtual void flush() = 0;
};

/// @brief Writes to the process's standard output.
class RealTermIO final : public TermIO
{
  public:
    void write(std::string_view s) override;
    void flush() override;

  private:
    std::string pending_;
};

/// @brief In-memory sink for tests and headless rendering.
class StringTermIO final : public TermIO
{
  public:
    void write(std::string_view s) override
    {
        buf_.append(s);
    }

    void flush() override
    {
        ++flushes_;
    }

    [[nodiscard]] const std::string &buffer() const
    {
        return buf_;
    }

    [[nodiscard]] int flushCount() const
    {
        return flushes_;
    }

    void clear()
    {
        buf_.clear();
        flushes_ = 0;
    }

  private:
    std::string buf_;
    int flushes_{0};
};

} // namespace stagelens::tui::term
