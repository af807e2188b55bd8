#pragma once

#include "terminal/ColorPairRegistry.h"
#include "terminal/TextAttribute.h"
#include <string>

namespace ViewPane::Rendering {

/**
 * @brief Abstract interface for the character-cell screen the viewport paints onto
 *
 * This interface abstracts the curses operations needed by the viewer,
 * enabling testing with mock implementations that don't require a real
 * terminal.
 */
class IRenderSurface {
public:
    virtual ~IRenderSurface() = default;

    // Current physical screen size
    virtual void GetSize(int& rows, int& cols) const = 0;

    // Pick up a new terminal size after a resize event
    virtual void UpdateSize() = 0;

    // Blank the whole screen (applied on the next Refresh)
    virtual void Erase() = 0;

    // Paint UTF-8 text at a position; text past the right edge is clipped
    virtual void DrawText(int row, int col, const std::string& text, Terminal::TextAttribute attr) = 0;

    virtual void MoveCursor(int row, int col) = 0;

    // Push pending changes to the physical screen
    virtual void Refresh() = 0;

    // Wait up to the input timeout for one key; Keys::None on timeout
    virtual int ReadKey() = 0;

    // Number of allocatable color pair slots (excluding the reserved slot 0)
    virtual int MaxColorPairs() const = 0;

    // Tell the surface about a newly allocated color pair slot
    virtual void RegisterColorPair(int slot, const Terminal::ColorPair& pair) = 0;
};

} // namespace ViewPane::Rendering
