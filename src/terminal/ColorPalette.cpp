#include "terminal/ColorPalette.h"

namespace ViewPane::Terminal {

int Map256ColorTo16(int colorIndex) {
    if (colorIndex < 16) return colorIndex;
    if (colorIndex >= 232) {
        // Grayscale ramp (232-255) -> map to closest standard color
        int gray = (colorIndex - 232) * 255 / 23;
        if (gray < 64) return 0;        // Black
        if (gray < 192) return 8;       // Gray
        return 7;                        // White
    }
    // Color cube (16-231) -> map to closest 16-color
    int idx = colorIndex - 16;
    int r = idx / 36, g = (idx % 36) / 6, b = idx % 6;
    if (r > g && r > b) return (r > 3) ? 9 : 1;        // Red
    if (g > r && g > b) return (g > 3) ? 10 : 2;       // Green
    if (b > r && b > g) return (b > 3) ? 12 : 4;       // Blue
    if (r == g && r > b) return (r > 3) ? 11 : 3;      // Yellow
    if (r == b && r > g) return (r > 3) ? 13 : 5;      // Magenta
    if (g == b && g > r) return (g > 3) ? 14 : 6;      // Cyan
    return (r > 2) ? 15 : 7;                            // White/Gray
}

ColorCode ReduceColor(ColorCode color, int paletteSize) {
    if (color == kDefaultColor || color < 0 || color > 255) {
        return kDefaultColor;
    }
    if (color < paletteSize) {
        return color;
    }

    int reduced = Map256ColorTo16(color);
    if (reduced < paletteSize) {
        return reduced;
    }
    if (paletteSize >= 8) {
        return reduced % 8;
    }
    return kDefaultColor;
}

} // namespace ViewPane::Terminal
