#include "terminal/ViewportBuffer.h"
#include "terminal/Utf8.h"
#include "rendering/IRenderSurface.h"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

namespace ViewPane::Terminal {

int ScrollTarget::Resolve(int current, int last) const {
    switch (m_kind) {
        case Kind::Coordinate: return std::clamp(m_value, 0, last);
        case Kind::Min:        return 0;
        case Kind::Max:        return last;
        case Kind::Unchanged:  return std::clamp(current, 0, last);
    }
    return current;
}

ViewportBuffer::ViewportBuffer()
    : m_rows(1)
    , m_cols(1)
    , m_offsetY(0)
    , m_offsetX(0)
{
}

void ViewportBuffer::Write(const std::vector<RenderedLine>& lines) {
    // Fresh rows every time - a write never keeps residue from earlier content
    std::vector<std::vector<Cell>> decoded;
    decoded.reserve(lines.size());

    size_t maxWidth = 0;
    for (const RenderedLine& line : lines) {
        std::vector<Cell> cells;
        for (const RenderedSpan& span : line) {
            for (char32_t ch : Utf8::Decode(span.text)) {
                cells.emplace_back(ch, span.attribute);
            }
        }
        maxWidth = std::max(maxWidth, cells.size());
        decoded.push_back(std::move(cells));
    }

    constexpr size_t kMaxExtent = static_cast<size_t>(std::numeric_limits<int>::max()) - 1;
    int rows = static_cast<int>(std::clamp<size_t>(decoded.size(), 1, kMaxExtent));
    int cols = static_cast<int>(std::clamp<size_t>(maxWidth, 1, kMaxExtent)) + 1;

    if (rows != m_rows || cols != m_cols) {
        spdlog::debug("Resizing viewport buffer from {}x{} to {}x{}", m_rows, m_cols, rows, cols);
    }

    m_lines = std::move(decoded);
    m_rows = rows;
    m_cols = cols;

    ClampOffset();
}

void ViewportBuffer::ClampOffset() {
    m_offsetY = std::clamp(m_offsetY, 0, m_rows - 1);
    m_offsetX = std::clamp(m_offsetX, 0, m_cols - 1);
}

void ViewportBuffer::MoveBy(int deltaY, int deltaX) {
    // Widen before adding so huge deltas saturate instead of overflowing
    long long y = static_cast<long long>(m_offsetY) + deltaY;
    long long x = static_cast<long long>(m_offsetX) + deltaX;
    m_offsetY = static_cast<int>(std::clamp<long long>(y, 0, m_rows - 1));
    m_offsetX = static_cast<int>(std::clamp<long long>(x, 0, m_cols - 1));
}

void ViewportBuffer::JumpTo(ScrollTarget targetY, ScrollTarget targetX) {
    m_offsetY = targetY.Resolve(m_offsetY, m_rows - 1);
    m_offsetX = targetX.Resolve(m_offsetX, m_cols - 1);
}

void ViewportBuffer::Render(Rendering::IRenderSurface& surface, int screenRows, int screenCols) const {
    surface.Erase();

    // Final screen row is reserved for status/input
    int viewRows = std::min(screenRows - 1, m_rows - m_offsetY);
    int viewCols = std::min(screenCols, m_cols - m_offsetX);
    if (viewRows <= 0 || viewCols <= 0) {
        return;
    }

    for (int row = 0; row < viewRows; ++row) {
        int y = m_offsetY + row;

        // Group runs of equal attribute into single draw calls
        int runStart = 0;
        std::string runText;
        TextAttribute runAttr = GetCell(m_offsetX, y).attr;

        for (int col = 0; col < viewCols; ++col) {
            const Cell& cell = GetCell(m_offsetX + col, y);
            if (cell.attr != runAttr) {
                surface.DrawText(row, runStart, runText, runAttr);
                runText.clear();
                runStart = col;
                runAttr = cell.attr;
            }
            Utf8::AppendCodepoint(runText, cell.ch);
        }

        if (!runText.empty()) {
            surface.DrawText(row, runStart, runText, runAttr);
        }
    }
}

const Cell& ViewportBuffer::GetCell(int x, int y) const {
    static const Cell emptyCell;
    if (x < 0 || y < 0 || static_cast<size_t>(y) >= m_lines.size()) {
        return emptyCell;
    }
    const auto& row = m_lines[static_cast<size_t>(y)];
    if (static_cast<size_t>(x) >= row.size()) {
        return emptyCell;
    }
    return row[static_cast<size_t>(x)];
}

std::string ViewportBuffer::GetRowText(int y) const {
    if (y < 0 || static_cast<size_t>(y) >= m_lines.size()) {
        return {};
    }

    std::u32string text;
    for (const Cell& cell : m_lines[static_cast<size_t>(y)]) {
        text.push_back(cell.ch);
    }
    while (!text.empty() && text.back() == U' ') {
        text.pop_back();
    }
    return Utf8::Encode(text);
}

} // namespace ViewPane::Terminal
