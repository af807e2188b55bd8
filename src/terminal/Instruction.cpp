#include "terminal/Instruction.h"

namespace ViewPane::Terminal {

const char* AttributeName(Attribute attribute) {
    switch (attribute) {
        case Attribute::Normal:    return "normal";
        case Attribute::Bold:      return "bold";
        case Attribute::Dim:       return "dim";
        case Attribute::Italic:    return "italic";
        case Attribute::Underline: return "underline";
        case Attribute::Blink:     return "blink";
        case Attribute::Reverse:   return "reverse";
        case Attribute::Hidden:    return "hidden";
    }
    return "unknown";
}

} // namespace ViewPane::Terminal
