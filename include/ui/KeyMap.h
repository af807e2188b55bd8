#pragma once

#include "core/Config.h"
#include <optional>
#include <string>
#include <unordered_map>

namespace ViewPane::UI {

enum class ScrollAction {
    ScrollUp,
    ScrollDown,
    ScrollLeft,
    ScrollRight,
    HalfPageUp,
    HalfPageDown,
    PageUp,
    PageDown,
    Top,
    Bottom,
    LineStart,
    LineEnd,
    Refresh,
    Quit,
    Resize,
};

std::optional<ScrollAction> ActionFromName(const std::string& name);

// Key code for a configured binding (see Keys.h), if the key is expressible
std::optional<int> KeyCodeFor(const Core::KeyBinding& binding);

/**
 * @brief Table lookup from key code to action
 *
 * Built from the keybinding config; the terminal resize key is always
 * mapped to ScrollAction::Resize.
 */
class KeyMap {
public:
    KeyMap();
    explicit KeyMap(const Core::KeybindingConfig& config);

    std::optional<ScrollAction> Lookup(int key) const;

    void Bind(int key, ScrollAction action);
    size_t Size() const { return m_actions.size(); }

private:
    void Load(const Core::KeybindingConfig& config);

    std::unordered_map<int, ScrollAction> m_actions;
};

} // namespace ViewPane::UI
