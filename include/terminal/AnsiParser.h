#pragma once

#include "terminal/Instruction.h"
#include <string>
#include <vector>

namespace ViewPane::Terminal {

/**
 * @brief Parses one line of escape-coded text into an instruction stream
 *
 * Only SGR (ESC [ ... m) sequences produce styling instructions. Any other
 * CSI, OSC or two-byte escape is consumed and dropped, as is every C0
 * control except TAB, which expands to the next multiple of kTabWidth.
 * Parsing state does not carry across lines.
 */
class AnsiParser {
public:
    static constexpr int kTabWidth = 8;

    AnsiParser();

    InstructionList ParseLine(const std::string& line);

    // Nearest xterm 256-color index for a 24-bit color
    static int RgbTo256(int r, int g, int b);

private:
    enum class State {
        Ground,          // Normal text
        Escape,          // ESC received
        Escape_Intermediate, // ESC + intermediate byte, e.g. ESC ( B
        CSI_Entry,       // ESC [ received (Control Sequence Introducer)
        CSI_Param,       // Reading CSI parameters
        CSI_Intermediate,// CSI intermediate bytes
        CSI_Ignore,      // Malformed CSI, skipped up to its final byte
        OSC_String,      // Operating System Command string
        OSC_Escape,      // ESC inside OSC, possible ST
    };

    void ProcessCharacter(char ch);
    void HandleEscapeSequence(char ch);
    void HandleCSI();
    void HandleSGR();
    void ExecuteCharacter(char ch);
    void AppendText(char ch);
    void FlushText();
    void PushParam();
    void FinishParams();
    void ResetState();

    // Extended color (38/48): returns the color or nullopt, advances index
    std::optional<ColorCode> ParseExtendedColor(size_t& index) const;

    State m_state;
    InstructionList m_output;
    std::string m_text;
    int m_column;

    char m_intermediateChar;
    char m_finalChar;
    std::vector<int> m_params;
    std::string m_paramBuffer;
};

} // namespace ViewPane::Terminal
