#pragma once

#include "terminal/AttributeTranslator.h"
#include "terminal/TextAttribute.h"
#include <string>
#include <vector>

namespace ViewPane::Rendering {
class IRenderSurface;
}

namespace ViewPane::Terminal {

// Single cell in the content grid
struct Cell {
    char32_t ch;             // Unicode codepoint
    TextAttribute attr;      // Packed style + color slot

    Cell() : ch(U' '), attr(0) {}
    Cell(char32_t c, TextAttribute a) : ch(c), attr(a) {}
};

// Scroll destination for one axis
class ScrollTarget {
public:
    enum class Kind { Coordinate, Min, Max, Unchanged };

    static ScrollTarget At(int value) { return ScrollTarget(Kind::Coordinate, value); }
    static ScrollTarget Min() { return ScrollTarget(Kind::Min, 0); }
    static ScrollTarget Max() { return ScrollTarget(Kind::Max, 0); }
    static ScrollTarget Unchanged() { return ScrollTarget(Kind::Unchanged, 0); }

    Kind GetKind() const { return m_kind; }
    int GetValue() const { return m_value; }

    // Resolve against the current offset and the last valid index of the axis
    int Resolve(int current, int last) const;

private:
    ScrollTarget(Kind kind, int value) : m_kind(kind), m_value(value) {}

    Kind m_kind;
    int m_value;
};

/**
 * @brief Virtual content buffer ("pad") plus a clamped scroll offset
 *
 * Every Write() replaces the whole content and resizes the grid to exactly
 * fit it: max(1, lines) rows by max(1, widest line) + 1 columns. The
 * offset always satisfies 0 <= y < rows and 0 <= x < cols.
 *
 * Rows are stored at their own length; cells past the end of a row read
 * as blanks with no attribute.
 */
class ViewportBuffer {
public:
    ViewportBuffer();

    // Replace contents with the given lines of spans
    void Write(const std::vector<RenderedLine>& lines);

    // Relative scroll, saturating at the buffer edges
    void MoveBy(int deltaY, int deltaX);

    // Absolute/edge scroll, clamped like MoveBy
    void JumpTo(ScrollTarget targetY, ScrollTarget targetX);

    /**
     * @brief Project the buffer from the scroll offset onto the surface
     *
     * Paints screen rows 0..screenRows-2; the last row is left for the
     * status line.
     */
    void Render(Rendering::IRenderSurface& surface, int screenRows, int screenCols) const;

    int GetRows() const { return m_rows; }
    int GetCols() const { return m_cols; }
    int GetOffsetY() const { return m_offsetY; }
    int GetOffsetX() const { return m_offsetX; }

    const Cell& GetCell(int x, int y) const;

    // Row content as UTF-8, trailing blanks trimmed
    std::string GetRowText(int y) const;

private:
    void ClampOffset();

    int m_rows;
    int m_cols;
    std::vector<std::vector<Cell>> m_lines;

    int m_offsetY;
    int m_offsetX;
};

} // namespace ViewPane::Terminal
