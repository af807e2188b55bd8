#pragma once

#include <cstdint>

namespace ViewPane::Terminal {

// Packed style flags + color pair slot, as carried by a rendered span.
// Low byte: style flags. Bits 8..31: color pair slot (0 = default colors).
// The rendering surface translates this into its native attribute.
using TextAttribute = uint32_t;

// Style flags (SGR)
struct StyleFlags {
    static constexpr uint8_t BOLD      = 0x01;
    static constexpr uint8_t DIM       = 0x02;
    static constexpr uint8_t ITALIC    = 0x04;
    static constexpr uint8_t UNDERLINE = 0x08;
    static constexpr uint8_t BLINK     = 0x10;
    static constexpr uint8_t REVERSE   = 0x20;
    static constexpr uint8_t HIDDEN    = 0x40;
};

constexpr int kColorSlotShift = 8;

constexpr TextAttribute EncodeAttribute(uint8_t flags, int colorSlot) {
    return static_cast<TextAttribute>(flags) |
           (static_cast<TextAttribute>(colorSlot) << kColorSlotShift);
}

constexpr uint8_t AttributeFlags(TextAttribute attr) {
    return static_cast<uint8_t>(attr & 0xFF);
}

constexpr int AttributeColorSlot(TextAttribute attr) {
    return static_cast<int>(attr >> kColorSlotShift);
}

} // namespace ViewPane::Terminal
