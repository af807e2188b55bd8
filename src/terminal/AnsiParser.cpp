#include "terminal/AnsiParser.h"
#include <algorithm>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace ViewPane::Terminal {

namespace {
constexpr int kMaxParamValue = 65535;

int CubeLevel(int component) {
    // xterm cube levels: 0, 95, 135, 175, 215, 255
    if (component < 48) return 0;
    if (component < 115) return 1;
    return std::min(5, (component - 35) / 40);
}
} // anonymous namespace

AnsiParser::AnsiParser()
    : m_state(State::Ground)
    , m_column(0)
    , m_intermediateChar(0)
    , m_finalChar(0)
{
}

InstructionList AnsiParser::ParseLine(const std::string& line) {
    m_state = State::Ground;
    m_output.clear();
    m_text.clear();
    m_column = 0;
    ResetState();

    for (char ch : line) {
        ProcessCharacter(ch);
    }

    if (m_state != State::Ground) {
        spdlog::debug("Dropping unterminated escape sequence at end of line");
    }
    FlushText();

    InstructionList result;
    result.swap(m_output);
    return result;
}

int AnsiParser::RgbTo256(int r, int g, int b) {
    r = std::clamp(r, 0, 255);
    g = std::clamp(g, 0, 255);
    b = std::clamp(b, 0, 255);

    if (r == g && g == b) {
        // Grayscale ramp (232-255) with the cube's black/white at the ends
        if (r < 8) return 16;
        if (r > 248) return 231;
        return 232 + ((r - 8) * 24) / 247;
    }
    return 16 + 36 * CubeLevel(r) + 6 * CubeLevel(g) + CubeLevel(b);
}

void AnsiParser::ProcessCharacter(char ch) {
    switch (m_state) {
        case State::Ground:
            if (ch == '\x1b') {  // ESC
                m_state = State::Escape;
                ResetState();
            } else if (static_cast<uint8_t>(ch) < 0x20 || ch == '\x7f') {
                ExecuteCharacter(ch);
            } else {
                AppendText(ch);
            }
            break;

        case State::Escape:
            HandleEscapeSequence(ch);
            break;

        case State::Escape_Intermediate:
            if (ch >= 0x30 && ch <= 0x7E) {
                // Charset designation and similar have no meaning in a static view
                m_state = State::Ground;
            } else if (static_cast<uint8_t>(ch) < 0x20 || static_cast<uint8_t>(ch) >= 0x80) {
                m_state = State::Ground;
            }
            break;

        case State::CSI_Entry:
            // Just entered CSI - private mode indicators are only valid here
            if (ch == '\x1b') {
                m_state = State::Escape;
                ResetState();
            } else if (static_cast<uint8_t>(ch) < 0x20) {
                ExecuteCharacter(ch);
            } else if (ch >= '0' && ch <= '9') {
                m_paramBuffer += ch;
                m_state = State::CSI_Param;
            } else if (ch == ';') {
                // Empty first parameter
                m_params.push_back(0);
                m_state = State::CSI_Param;
            } else if (ch == '?' || ch == '>' || ch == '<' || ch == '=' || ch == '!') {
                m_intermediateChar = ch;
                m_state = State::CSI_Param;
            } else if (ch >= 0x20 && ch <= 0x2F) {  // Intermediate byte
                m_intermediateChar = ch;
                m_state = State::CSI_Intermediate;
            } else if (ch >= 0x40 && ch <= 0x7E) {  // Final byte
                m_finalChar = ch;
                HandleCSI();
                m_state = State::Ground;
            } else if (static_cast<uint8_t>(ch) >= 0x80) {
                m_state = State::Ground;
            } else {
                // ':' sub-parameters and other unsupported parameter bytes
                spdlog::debug("Skipping CSI sequence on byte 0x{:02X}", static_cast<uint8_t>(ch));
                m_state = State::CSI_Ignore;
            }
            break;

        case State::CSI_Param:
            if (ch == '\x1b') {
                m_state = State::Escape;
                ResetState();
            } else if (static_cast<uint8_t>(ch) < 0x20) {
                ExecuteCharacter(ch);
            } else if (ch >= '0' && ch <= '9') {
                m_paramBuffer += ch;
            } else if (ch == ';') {
                PushParam();
            } else if (ch >= 0x20 && ch <= 0x2F) {  // Intermediate byte
                FinishParams();
                m_intermediateChar = ch;
                m_state = State::CSI_Intermediate;
            } else if (ch >= 0x40 && ch <= 0x7E) {  // Final byte
                FinishParams();
                m_finalChar = ch;
                HandleCSI();
                m_state = State::Ground;
            } else if (static_cast<uint8_t>(ch) >= 0x80) {
                m_state = State::Ground;
            } else {
                // ':' sub-parameters and other unsupported parameter bytes
                spdlog::debug("Skipping CSI sequence on byte 0x{:02X}", static_cast<uint8_t>(ch));
                m_state = State::CSI_Ignore;
            }
            break;

        case State::CSI_Ignore:
            if (ch == '\x1b') {
                m_state = State::Escape;
                ResetState();
            } else if (static_cast<uint8_t>(ch) < 0x20) {
                ExecuteCharacter(ch);
            } else if (ch >= 0x40 && ch <= 0x7E) {
                m_state = State::Ground;
            } else if (static_cast<uint8_t>(ch) >= 0x80) {
                m_state = State::Ground;
            }
            break;

        case State::CSI_Intermediate:
            if (ch == '\x1b') {
                m_state = State::Escape;
                ResetState();
            } else if (static_cast<uint8_t>(ch) < 0x20) {
                ExecuteCharacter(ch);
            } else if (ch >= 0x40 && ch <= 0x7E) {
                m_finalChar = ch;
                HandleCSI();
                m_state = State::Ground;
            } else if (static_cast<uint8_t>(ch) >= 0x80) {
                m_state = State::Ground;
            }
            break;

        case State::OSC_String:
            // OSC sequences end with BEL (0x07) or ST (ESC \)
            if (ch == '\x07') {
                m_state = State::Ground;
            } else if (ch == '\x1b') {
                m_state = State::OSC_Escape;
            }
            break;

        case State::OSC_Escape:
            if (ch == '\\') {
                m_state = State::Ground;
            } else {
                // Not a string terminator; treat as the start of a new escape
                m_state = State::Escape;
                ResetState();
                HandleEscapeSequence(ch);
            }
            break;
    }
}

void AnsiParser::HandleEscapeSequence(char ch) {
    switch (ch) {
        case '[':  // CSI
            m_state = State::CSI_Entry;
            break;

        case ']':  // OSC (Operating System Command)
            m_state = State::OSC_String;
            break;

        case '\x1b':
            // ESC ESC - stay in escape state
            break;

        case '(': case ')': case '*': case '+': case '#': case '%': case ' ':
            m_intermediateChar = ch;
            m_state = State::Escape_Intermediate;
            break;

        default:
            // Two-byte escapes (charset selection, keypad modes, RIS, ...)
            // have no meaning in a static view
            spdlog::debug("Ignoring escape sequence ESC {}", ch);
            m_state = State::Ground;
            break;
    }
}

void AnsiParser::HandleCSI() {
    if (m_finalChar == 'm' && m_intermediateChar == 0) {
        HandleSGR();
        return;
    }
    spdlog::debug("Ignoring CSI sequence with final byte '{}'", m_finalChar);
}

void AnsiParser::HandleSGR() {
    // If no parameters, default to 0 (reset)
    if (m_params.empty()) {
        m_params.push_back(0);
    }

    FlushText();

    for (size_t i = 0; i < m_params.size(); ++i) {
        int param = m_params[i];
        switch (param) {
            case 0:  // Reset
                m_output.emplace_back(ResetAttributes{});
                break;

            case 1:  // Bold
                m_output.emplace_back(SetAttribute{Attribute::Bold, true});
                break;

            case 2:  // Dim/Faint
                m_output.emplace_back(SetAttribute{Attribute::Dim, true});
                break;

            case 3:  // Italic
                m_output.emplace_back(SetAttribute{Attribute::Italic, true});
                break;

            case 4:   // Underline (single)
            case 21:  // Double underline
                m_output.emplace_back(SetAttribute{Attribute::Underline, true});
                break;

            case 5:  // Slow Blink
            case 6:  // Rapid Blink (treat same as slow blink)
                m_output.emplace_back(SetAttribute{Attribute::Blink, true});
                break;

            case 7:  // Inverse
                m_output.emplace_back(SetAttribute{Attribute::Reverse, true});
                break;

            case 8:  // Hidden/Invisible
                m_output.emplace_back(SetAttribute{Attribute::Hidden, true});
                break;

            case 22:  // Not bold/dim - clears both
                m_output.emplace_back(SetAttribute{Attribute::Bold, false});
                m_output.emplace_back(SetAttribute{Attribute::Dim, false});
                break;

            case 23:  // Not italic
                m_output.emplace_back(SetAttribute{Attribute::Italic, false});
                break;

            case 24:  // Not underline
                m_output.emplace_back(SetAttribute{Attribute::Underline, false});
                break;

            case 25:  // Not blinking
                m_output.emplace_back(SetAttribute{Attribute::Blink, false});
                break;

            case 27:  // Not inverse
                m_output.emplace_back(SetAttribute{Attribute::Reverse, false});
                break;

            case 28:  // Not hidden
                m_output.emplace_back(SetAttribute{Attribute::Hidden, false});
                break;

            // Foreground colors (30-37 for standard, 90-97 for bright)
            case 30: case 31: case 32: case 33: case 34: case 35: case 36: case 37:
                m_output.emplace_back(SetForeground{param - 30});
                break;

            case 90: case 91: case 92: case 93: case 94: case 95: case 96: case 97:
                m_output.emplace_back(SetForeground{param - 90 + 8});  // Bright colors are 8-15
                break;

            // Extended foreground color: 38;5;N (256-color) or 38;2;R;G;B (true color)
            case 38:
                m_output.emplace_back(SetForeground{ParseExtendedColor(i)});
                break;

            case 39:  // Default foreground
                m_output.emplace_back(SetForeground{kDefaultColor});
                break;

            // Background colors (40-47 for standard, 100-107 for bright)
            case 40: case 41: case 42: case 43: case 44: case 45: case 46: case 47:
                m_output.emplace_back(SetBackground{param - 40});
                break;

            case 100: case 101: case 102: case 103: case 104: case 105: case 106: case 107:
                m_output.emplace_back(SetBackground{param - 100 + 8});
                break;

            // Extended background color: 48;5;N (256-color) or 48;2;R;G;B (true color)
            case 48:
                m_output.emplace_back(SetBackground{ParseExtendedColor(i)});
                break;

            case 49:  // Default background
                m_output.emplace_back(SetBackground{kDefaultColor});
                break;

            default:
                // Strikethrough, fonts, overline, ... have no curses equivalent
                spdlog::debug("Ignoring unsupported SGR parameter {}", param);
                break;
        }
    }
}

std::optional<ColorCode> AnsiParser::ParseExtendedColor(size_t& i) const {
    if (i + 1 >= m_params.size()) {
        return std::nullopt;
    }

    int mode = m_params[i + 1];
    if (mode == 5) {
        if (i + 2 >= m_params.size()) {
            i += 1;
            return std::nullopt;
        }
        int index = m_params[i + 2];
        i += 2;
        if (index > 255) {
            return std::nullopt;
        }
        return index;
    }

    if (mode == 2) {
        if (i + 4 >= m_params.size()) {
            i = m_params.size() - 1;
            return std::nullopt;
        }
        int color = RgbTo256(m_params[i + 2], m_params[i + 3], m_params[i + 4]);
        i += 4;
        return color;
    }

    i += 1;
    return std::nullopt;
}

void AnsiParser::ExecuteCharacter(char ch) {
    if (ch == '\t') {
        int spaces = kTabWidth - (m_column % kTabWidth);
        for (int n = 0; n < spaces; ++n) {
            AppendText(' ');
        }
    }
    // Everything else (CR, BEL, BS, ...) is dropped
}

void AnsiParser::AppendText(char ch) {
    m_text += ch;
    if ((static_cast<uint8_t>(ch) & 0xC0) != 0x80) {
        ++m_column;
    }
}

void AnsiParser::FlushText() {
    if (!m_text.empty()) {
        m_output.emplace_back(TextRun{std::move(m_text)});
        m_text.clear();
    }
}

void AnsiParser::PushParam() {
    if (m_paramBuffer.empty()) {
        m_params.push_back(0);
        return;
    }

    int value = 0;
    for (char digit : m_paramBuffer) {
        value = std::min(kMaxParamValue, value * 10 + (digit - '0'));
    }
    m_params.push_back(value);
    m_paramBuffer.clear();
}

void AnsiParser::FinishParams() {
    // A trailing ';' leaves an empty (zero) final parameter
    if (!m_paramBuffer.empty() || !m_params.empty()) {
        PushParam();
    }
}

void AnsiParser::ResetState() {
    m_intermediateChar = 0;
    m_finalChar = 0;
    m_params.clear();
    m_paramBuffer.clear();
}

} // namespace ViewPane::Terminal
