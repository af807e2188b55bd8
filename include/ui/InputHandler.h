#pragma once

#include "ui/KeyMap.h"
#include <functional>

namespace ViewPane {

namespace Terminal {
    class ViewportBuffer;
}

namespace UI {

/**
 * @brief Callback interface for InputHandler to notify the controller of actions.
 *
 * Scroll actions are applied to the viewport directly; control actions go
 * through these callbacks.
 */
struct InputHandlerCallbacks {
    std::function<void()> onQuit;
    std::function<void()> onResize;
    std::function<void()> onRefresh;
    std::function<int()> getViewRows;   // screen rows available for content
};

/**
 * @brief Maps keystrokes to viewport scrolling and control actions.
 *
 * Page jumps move by the view height, half-page jumps by half of it
 * (at least one row).
 */
class InputHandler {
public:
    InputHandler(InputHandlerCallbacks callbacks, KeyMap keyMap);

    /**
     * @brief Handle one keystroke.
     * @param key Key code (see Keys.h).
     * @param viewport Viewport to scroll.
     * @return True if the key was mapped to an action.
     */
    bool OnKey(int key, Terminal::ViewportBuffer& viewport);

    // Apply an action directly
    void Apply(ScrollAction action, Terminal::ViewportBuffer& viewport);

    const KeyMap& GetKeyMap() const { return m_keyMap; }

private:
    int PageRows() const;
    int HalfPageRows() const;

    InputHandlerCallbacks m_callbacks;
    KeyMap m_keyMap;
};

} // namespace UI
} // namespace ViewPane
