#pragma once

#include "terminal/Instruction.h"

namespace ViewPane::Terminal {

/**
 * @brief Map a 256-color palette index to the closest of the 16 standard colors
 *
 * Indices below 16 are returned unchanged.
 */
int Map256ColorTo16(int colorIndex);

/**
 * @brief Fit a color code into a palette of the given size
 *
 * kDefaultColor passes through. Codes that already fit are kept, 256-color
 * codes are folded to the 16 standard colors, and bright colors fold to
 * their normal counterpart on 8-color palettes. Anything that still does not
 * fit becomes kDefaultColor.
 */
ColorCode ReduceColor(ColorCode color, int paletteSize);

} // namespace ViewPane::Terminal
