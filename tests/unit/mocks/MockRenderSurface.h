#pragma once

#include "rendering/IRenderSurface.h"
#include "terminal/Utf8.h"
#include "ui/Keys.h"
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace ViewPane::Tests {

/**
 * @brief In-memory IRenderSurface for unit tests
 *
 * Keeps a character grid with per-cell attributes, records every DrawText
 * call and replays scripted keys. Once the script runs out ReadKey()
 * returns Keys::None.
 */
class MockRenderSurface : public Rendering::IRenderSurface {
public:
    struct DrawCall {
        int row;
        int col;
        std::string text;
        Terminal::TextAttribute attr;
    };

    MockRenderSurface(int rows = 24, int cols = 80, int maxColorPairs = 255)
        : m_maxColorPairs(maxColorPairs)
    {
        SetSize(rows, cols);
    }

    void SetSize(int rows, int cols) {
        m_rows = rows;
        m_cols = cols;
        m_chars.assign(static_cast<size_t>(rows), std::u32string(static_cast<size_t>(cols), U' '));
        m_attrs.assign(static_cast<size_t>(rows), std::vector<Terminal::TextAttribute>(static_cast<size_t>(cols), 0));
    }

    void GetSize(int& rows, int& cols) const override {
        rows = m_rows;
        cols = m_cols;
    }

    void UpdateSize() override { ++updateSizeCount; }

    void Erase() override {
        ++eraseCount;
        drawCalls.clear();
        for (auto& row : m_chars) {
            row.assign(row.size(), U' ');
        }
        for (auto& row : m_attrs) {
            row.assign(row.size(), 0);
        }
    }

    void DrawText(int row, int col, const std::string& text, Terminal::TextAttribute attr) override {
        drawCalls.push_back({row, col, text, attr});
        if (row < 0 || row >= m_rows) {
            return;
        }
        int x = col;
        for (char32_t ch : Terminal::Utf8::Decode(text)) {
            if (x >= 0 && x < m_cols) {
                m_chars[row][x] = ch;
                m_attrs[row][x] = attr;
            }
            ++x;
        }
    }

    void MoveCursor(int row, int col) override {
        cursorRow = row;
        cursorCol = col;
    }

    void Refresh() override { ++refreshCount; }

    int ReadKey() override {
        ++readKeyCount;
        if (m_keys.empty()) {
            return UI::Keys::None;
        }
        int key = m_keys.front();
        m_keys.pop_front();
        return key;
    }

    int MaxColorPairs() const override { return m_maxColorPairs; }

    void RegisterColorPair(int slot, const Terminal::ColorPair& pair) override {
        registeredPairs[slot] = pair;
    }

    void QueueKey(int key) { m_keys.push_back(key); }
    void QueueKeys(const std::string& keys) {
        for (char ch : keys) {
            m_keys.push_back(static_cast<unsigned char>(ch));
        }
    }

    // Screen row as UTF-8 with trailing blanks trimmed
    std::string GetRowText(int row) const {
        std::u32string text = m_chars.at(static_cast<size_t>(row));
        while (!text.empty() && text.back() == U' ') {
            text.pop_back();
        }
        return Terminal::Utf8::Encode(text);
    }

    Terminal::TextAttribute GetAttr(int row, int col) const {
        return m_attrs.at(static_cast<size_t>(row)).at(static_cast<size_t>(col));
    }

    std::vector<DrawCall> drawCalls;
    std::map<int, Terminal::ColorPair> registeredPairs;
    int eraseCount = 0;
    int refreshCount = 0;
    int updateSizeCount = 0;
    int readKeyCount = 0;
    int cursorRow = -1;
    int cursorCol = -1;

private:
    int m_rows = 0;
    int m_cols = 0;
    int m_maxColorPairs;
    std::vector<std::u32string> m_chars;
    std::vector<std::vector<Terminal::TextAttribute>> m_attrs;
    std::deque<int> m_keys;
};

} // namespace ViewPane::Tests
