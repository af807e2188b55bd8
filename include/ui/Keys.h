#pragma once

namespace ViewPane::UI {

// Surface-independent key codes. Printable keys use their character value,
// Ctrl+letter uses the ASCII control code (Ctrl+A = 1).
namespace Keys {
    constexpr int None      = -1;
    constexpr int Enter     = '\n';
    constexpr int Escape    = 0x1b;
    constexpr int Space     = ' ';

    constexpr int Up        = 0x10000;
    constexpr int Down      = 0x10001;
    constexpr int Left      = 0x10002;
    constexpr int Right     = 0x10003;
    constexpr int PageUp    = 0x10004;
    constexpr int PageDown  = 0x10005;
    constexpr int Home      = 0x10006;
    constexpr int End       = 0x10007;
    constexpr int Backspace = 0x10008;
    constexpr int Delete    = 0x10009;
    constexpr int Insert    = 0x1000A;
    constexpr int Resize    = 0x1000B;   // terminal size changed
    constexpr int F1        = 0x10100;   // F1..F12 = F1 + 0..11

    constexpr int Ctrl(char letter) {
        return (letter >= 'a' && letter <= 'z') ? letter - 'a' + 1
             : (letter >= 'A' && letter <= 'Z') ? letter - 'A' + 1
             : None;
    }
} // namespace Keys

} // namespace ViewPane::UI
