// tui/include/tui/render/screen.hpp
// @brief Cell grid with styles and row-span diffing against the previous frame.
// @invariant computeDiff() reports every cell that differs from the snapshot
//            taken by snapshotPrev(); after resize() every cell differs.
// @ownership ScreenBuffer owns current and previous cell storage.
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stagelens::tui::render
{

struct RGBA
{
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};
    uint8_t a{255};

    bool operator==(const RGBA &) const = default;
};

enum Attr : uint16_t
{
    Bold = 1U << 0,
    Faint = 1U << 1,
    Italic = 1U << 2,
    Underline = 1U << 3,
    Blink = 1U << 4,
    Reverse = 1U << 5,
    Invisible = 1U << 6,
    Strike = 1U << 7,
};

struct Style
{
    RGBA fg{208, 208, 208, 255};
    RGBA bg{28, 28, 28, 255};
    uint16_t attrs{0};

    bool operator==(const Style &) const = default;
};

struct Cell
{
    char32_t ch{U' '};
    Style style{};
    uint8_t width{1};

    bool operator==(const Cell &) const = default;
};

class ScreenBuffer
{
  public:
    /// @brief Half-open run [x0, x1) of changed cells on one row.
    struct DiffSpan
    {
        int row;
        int x0;
        int x1;
    };

    void resize(int rows, int cols);

    /// @brief Fill every cell with a blank in @p style.
    void clear(const Style &style);

    Cell &at(int y, int x);
    const Cell &at(int y, int x) const;

    [[nodiscard]] int rows() const
    {
        return rows_;
    }

    [[nodiscard]] int cols() const
    {
        return cols_;
    }

    /// @brief Remember the current contents as the last drawn frame.
    void snapshotPrev();

    /// @brief Append spans of cells that changed since snapshotPrev().
    void computeDiff(std::vector<DiffSpan> &out) const;

    /// @brief Write UTF-8 @p text at (@p y, @p x), clipped to @p maxCols
    ///        columns and to the buffer.
    /// @return Number of columns written.
    int putText(int y, int x, std::string_view text, const Style &style, int maxCols);

    /// @brief Fill the rectangle with blanks in @p style.
    void fill(int y, int x, int h, int w, const Style &style);

    /// @brief Characters of row @p y as UTF-8, trailing blanks kept.
    [[nodiscard]] std::string rowText(int y) const;

  private:
    int rows_{0};
    int cols_{0};
    std::vector<Cell> cells_;
    std::vector<Cell> prev_;
};

/// @brief Decode UTF-8 into code points; invalid bytes become U+FFFD.
std::u32string decodeUtf8(std::string_view text);

/// @brief Encode one code point as UTF-8.
std::string encodeUtf8(char32_t ch);

} // namespace stagelens::tui::render
