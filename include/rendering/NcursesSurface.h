#pragma once

#include "rendering/IRenderSurface.h"

namespace ViewPane::Rendering {

/**
 * @brief IRenderSurface backed by the curses standard screen
 *
 * Owns the curses session: the constructor enters curses mode and the
 * destructor restores the terminal. Only one instance may exist at a time.
 */
class NcursesSurface : public IRenderSurface {
public:
    // inputTimeoutMs bounds how long ReadKey() blocks
    explicit NcursesSurface(int inputTimeoutMs);
    ~NcursesSurface() override;

    NcursesSurface(const NcursesSurface&) = delete;
    NcursesSurface& operator=(const NcursesSurface&) = delete;

    void GetSize(int& rows, int& cols) const override;
    void UpdateSize() override;
    void Erase() override;
    void DrawText(int row, int col, const std::string& text, Terminal::TextAttribute attr) override;
    void MoveCursor(int row, int col) override;
    void Refresh() override;
    int ReadKey() override;
    int MaxColorPairs() const override;
    void RegisterColorPair(int slot, const Terminal::ColorPair& pair) override;

private:
    short ToCursesColor(Terminal::ColorCode color, short fallback) const;

    bool m_hasColors = false;
    bool m_defaultColors = false;   // use_default_colors() succeeded
    int m_rows = 0;
    int m_cols = 0;
};

} // namespace ViewPane::Rendering
