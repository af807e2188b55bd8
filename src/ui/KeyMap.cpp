#include "ui/KeyMap.h"
#include "ui/Keys.h"
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace ViewPane::UI {

std::optional<ScrollAction> ActionFromName(const std::string& name) {
    static const std::unordered_map<std::string, ScrollAction> actions = {
        {"scroll_up", ScrollAction::ScrollUp},
        {"scroll_down", ScrollAction::ScrollDown},
        {"scroll_left", ScrollAction::ScrollLeft},
        {"scroll_right", ScrollAction::ScrollRight},
        {"half_page_up", ScrollAction::HalfPageUp},
        {"half_page_down", ScrollAction::HalfPageDown},
        {"page_up", ScrollAction::PageUp},
        {"page_down", ScrollAction::PageDown},
        {"top", ScrollAction::Top},
        {"bottom", ScrollAction::Bottom},
        {"line_start", ScrollAction::LineStart},
        {"line_end", ScrollAction::LineEnd},
        {"refresh", ScrollAction::Refresh},
        {"quit", ScrollAction::Quit},
    };

    auto it = actions.find(name);
    if (it == actions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int> KeyCodeFor(const Core::KeyBinding& binding) {
    const std::string& key = binding.key;

    if (key.size() == 1) {
        if (binding.ctrl) {
            int code = Keys::Ctrl(key[0]);
            if (code == Keys::None) {
                return std::nullopt;
            }
            return code;
        }
        return static_cast<int>(static_cast<unsigned char>(key[0]));
    }

    if (binding.ctrl) {
        return std::nullopt;
    }

    static const std::unordered_map<std::string, int> namedKeys = {
        {"up", Keys::Up},
        {"down", Keys::Down},
        {"left", Keys::Left},
        {"right", Keys::Right},
        {"pageup", Keys::PageUp},
        {"pagedown", Keys::PageDown},
        {"home", Keys::Home},
        {"end", Keys::End},
        {"space", Keys::Space},
        {"enter", Keys::Enter},
        {"escape", Keys::Escape},
        {"tab", '\t'},
        {"backspace", Keys::Backspace},
        {"delete", Keys::Delete},
        {"insert", Keys::Insert},
    };

    auto it = namedKeys.find(key);
    if (it != namedKeys.end()) {
        return it->second;
    }

    // f1..f12
    if (key.size() >= 2 && key[0] == 'f') {
        int number = std::atoi(key.c_str() + 1);
        if (number >= 1 && number <= 12) {
            return Keys::F1 + number - 1;
        }
    }
    return std::nullopt;
}

KeyMap::KeyMap() {
    Core::KeybindingConfig defaults;
    defaults.SetDefaults();
    Load(defaults);
}

KeyMap::KeyMap(const Core::KeybindingConfig& config) {
    Load(config);
}

void KeyMap::Load(const Core::KeybindingConfig& config) {
    m_actions.clear();

    for (const auto& [name, keys] : config.bindings) {
        auto action = ActionFromName(name);
        if (!action) {
            spdlog::warn("Ignoring bindings for unknown action '{}'", name);
            continue;
        }
        for (const auto& binding : keys) {
            auto code = KeyCodeFor(binding);
            if (!code) {
                spdlog::warn("Cannot bind key '{}' for action '{}'", binding.ToString(), name);
                continue;
            }
            Bind(*code, *action);
        }
    }

    Bind(Keys::Resize, ScrollAction::Resize);
}

void KeyMap::Bind(int key, ScrollAction action) {
    auto [it, inserted] = m_actions.insert_or_assign(key, action);
    (void)it;
    if (!inserted) {
        spdlog::debug("Key {} rebound", key);
    }
}

std::optional<ScrollAction> KeyMap::Lookup(int key) const {
    auto it = m_actions.find(key);
    if (it == m_actions.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace ViewPane::UI
