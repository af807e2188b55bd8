#include "rendering/NcursesSurface.h"
#include "terminal/ColorPalette.h"
#include "terminal/Utf8.h"
#include "ui/Keys.h"
#include <algorithm>
#include <clocale>
#include <stdexcept>
#include <ncurses.h>
#include <spdlog/spdlog.h>

namespace ViewPane::Rendering {

using Terminal::StyleFlags;
namespace Keys = UI::Keys;

namespace {

attr_t ToCursesAttributes(Terminal::TextAttribute attr, bool hasColors) {
    uint8_t flags = Terminal::AttributeFlags(attr);
    attr_t result = A_NORMAL;

    if (flags & StyleFlags::BOLD) result |= A_BOLD;
    if (flags & StyleFlags::DIM) result |= A_DIM;
#ifdef A_ITALIC
    if (flags & StyleFlags::ITALIC) result |= A_ITALIC;
#endif
    if (flags & StyleFlags::UNDERLINE) result |= A_UNDERLINE;
    if (flags & StyleFlags::BLINK) result |= A_BLINK;
    if (flags & StyleFlags::REVERSE) result |= A_REVERSE;
    if (flags & StyleFlags::HIDDEN) result |= A_INVIS;

    int slot = Terminal::AttributeColorSlot(attr);
    if (hasColors && slot > 0) {
        result |= COLOR_PAIR(slot);
    }
    return result;
}

int TranslateKey(int ch) {
    switch (ch) {
        case ERR:           return Keys::None;
        case KEY_UP:        return Keys::Up;
        case KEY_DOWN:      return Keys::Down;
        case KEY_LEFT:      return Keys::Left;
        case KEY_RIGHT:     return Keys::Right;
        case KEY_PPAGE:     return Keys::PageUp;
        case KEY_NPAGE:     return Keys::PageDown;
        case KEY_HOME:      return Keys::Home;
        case KEY_END:       return Keys::End;
        case KEY_BACKSPACE: return Keys::Backspace;
        case KEY_DC:        return Keys::Delete;
        case KEY_IC:        return Keys::Insert;
        case KEY_ENTER:     return Keys::Enter;
        case '\r':          return Keys::Enter;
        case KEY_RESIZE:    return Keys::Resize;
        default:
            break;
    }

    if (ch >= KEY_F(1) && ch <= KEY_F(12)) {
        return Keys::F1 + (ch - KEY_F(1));
    }
    if (ch >= KEY_MIN) {
        spdlog::debug("Unmapped curses key {}", ch);
        return Keys::None;
    }
    return ch;
}

} // anonymous namespace

NcursesSurface::NcursesSurface(int inputTimeoutMs) {
    // Needed for multibyte output through the wide curses library
    std::setlocale(LC_ALL, "");

    if (initscr() == nullptr) {
        throw std::runtime_error("failed to initialize the terminal screen");
    }

    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    timeout(inputTimeoutMs);
    curs_set(0);

    if (has_colors() && start_color() == OK) {
        m_hasColors = true;
        m_defaultColors = (use_default_colors() == OK);
    }

    getmaxyx(stdscr, m_rows, m_cols);
    spdlog::info("Curses screen {}x{}, colors={}, color pairs={}",
                 m_cols, m_rows, m_hasColors ? COLORS : 0, MaxColorPairs());
}

NcursesSurface::~NcursesSurface() {
    endwin();
}

void NcursesSurface::GetSize(int& rows, int& cols) const {
    rows = m_rows;
    cols = m_cols;
}

void NcursesSurface::UpdateSize() {
    getmaxyx(stdscr, m_rows, m_cols);
    clearok(curscr, TRUE);
    spdlog::debug("Screen resized to {}x{}", m_cols, m_rows);
}

void NcursesSurface::Erase() {
    erase();
}

void NcursesSurface::DrawText(int row, int col, const std::string& text, Terminal::TextAttribute attr) {
    if (row < 0 || row >= m_rows || col < 0 || col >= m_cols) {
        return;
    }

    // addstr wraps at the right margin, so clip first
    std::u32string codepoints = Terminal::Utf8::Decode(text);
    size_t room = static_cast<size_t>(m_cols - col);
    if (codepoints.size() > room) {
        codepoints.resize(room);
    }
    std::string clipped = Terminal::Utf8::Encode(codepoints);

    attr_t cursesAttr = ToCursesAttributes(attr, m_hasColors);
    attron(cursesAttr);
    // Writing the bottom-right cell reports ERR after the cursor fails to advance
    mvaddstr(row, col, clipped.c_str());
    attroff(cursesAttr);
}

void NcursesSurface::MoveCursor(int row, int col) {
    move(row, col);
}

void NcursesSurface::Refresh() {
    refresh();
}

int NcursesSurface::ReadKey() {
    return TranslateKey(getch());
}

int NcursesSurface::MaxColorPairs() const {
    if (!m_hasColors || COLOR_PAIRS <= 1) {
        return 0;
    }
    return std::min(COLOR_PAIRS - 1, Terminal::ColorPairRegistry::kMaxPairsLimit);
}

short NcursesSurface::ToCursesColor(Terminal::ColorCode color, short fallback) const {
    Terminal::ColorCode reduced = Terminal::ReduceColor(color, COLORS);
    if (reduced == Terminal::kDefaultColor) {
        return m_defaultColors ? -1 : fallback;
    }
    return static_cast<short>(reduced);
}

void NcursesSurface::RegisterColorPair(int slot, const Terminal::ColorPair& pair) {
    if (!m_hasColors) {
        return;
    }

    short fg = ToCursesColor(pair.foreground, COLOR_WHITE);
    short bg = ToCursesColor(pair.background, COLOR_BLACK);
    if (init_pair(static_cast<short>(slot), fg, bg) == ERR) {
        spdlog::warn("init_pair({}, {}, {}) failed", slot, fg, bg);
    }
}

} // namespace ViewPane::Rendering
