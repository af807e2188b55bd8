#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ViewPane::Terminal {

// Palette index (0-255) or kDefaultColor for the terminal's own default
using ColorCode = int;
constexpr ColorCode kDefaultColor = -1;

enum class Attribute {
    Normal,     // SGR 0 when enabled
    Bold,
    Dim,
    Italic,
    Underline,
    Blink,
    Reverse,
    Hidden,
};

// Literal text to be emitted with the current style
struct TextRun {
    std::string text;
};

// Empty color means the escape sequence carried no usable color
struct SetForeground {
    std::optional<ColorCode> color;
};

struct SetBackground {
    std::optional<ColorCode> color;
};

struct SetAttribute {
    Attribute attribute;
    bool enabled = true;
};

struct ResetAttributes {};

// One parsed unit of an escape-coded line. Consumed left to right, once.
using Instruction = std::variant<TextRun, SetForeground, SetBackground, SetAttribute, ResetAttributes>;
using InstructionList = std::vector<Instruction>;

const char* AttributeName(Attribute attribute);

} // namespace ViewPane::Terminal
