#include "core/Config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ViewPane::Core {

using nlohmann::json;

namespace {
std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const std::vector<std::string> kNamedKeys = {
    "up", "down", "left", "right", "pageup", "pagedown", "home", "end",
    "space", "enter", "escape", "tab", "backspace", "delete", "insert",
    "f1", "f2", "f3", "f4", "f5", "f6", "f7", "f8", "f9", "f10", "f11", "f12",
};

bool IsNamedKey(const std::string& name) {
    return std::find(kNamedKeys.begin(), kNamedKeys.end(), name) != kNamedKeys.end();
}
} // anonymous namespace

// ============================================================================
// KeyBinding
// ============================================================================

std::optional<KeyBinding> KeyBinding::Parse(const std::string& binding) {
    if (binding.empty()) {
        return std::nullopt;
    }
    if (binding == "+") {
        return KeyBinding{"+", false};
    }

    std::vector<std::string> parts;
    std::stringstream stream(binding);
    std::string part;
    while (std::getline(stream, part, '+')) {
        parts.push_back(part);
    }
    if (parts.empty() || parts.back().empty()) {
        return std::nullopt;
    }

    KeyBinding result;
    bool shift = false;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        std::string modifier = ToLower(parts[i]);
        if (modifier == "ctrl" || modifier == "control") {
            result.ctrl = true;
        } else if (modifier == "shift") {
            shift = true;
        } else {
            // Alt/Meta are not distinguishable on a plain terminal
            return std::nullopt;
        }
    }

    const std::string& key = parts.back();
    if (key.size() == 1) {
        // Single characters keep their case: "g" and "G" are different keys
        char ch = key[0];
        if (shift || result.ctrl) {
            ch = static_cast<char>(shift ? std::toupper(static_cast<unsigned char>(ch))
                                         : std::tolower(static_cast<unsigned char>(ch)));
        }
        if (result.ctrl && !std::isalpha(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
        if (result.ctrl) {
            // Ctrl+letter has no shifted variant
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        result.key = std::string(1, ch);
        return result;
    }

    std::string name = ToLower(key);
    if (!IsNamedKey(name) || shift) {
        return std::nullopt;
    }
    result.key = name;
    return result;
}

std::string KeyBinding::ToString() const {
    return ctrl ? "Ctrl+" + key : key;
}

// ============================================================================
// KeybindingConfig
// ============================================================================

const std::vector<std::string>& KeybindingConfig::ActionNames() {
    static const std::vector<std::string> actions = {
        "scroll_up", "scroll_down", "scroll_left", "scroll_right",
        "half_page_up", "half_page_down", "page_up", "page_down",
        "top", "bottom", "line_start", "line_end",
        "refresh", "quit",
    };
    return actions;
}

bool KeybindingConfig::IsKnownAction(const std::string& action) {
    const auto& actions = ActionNames();
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

void KeybindingConfig::SetDefaults() {
    bindings.clear();

    auto bind = [this](const std::string& action, std::initializer_list<const char*> keys) {
        for (const char* key : keys) {
            if (auto kb = KeyBinding::Parse(key)) {
                bindings[action].push_back(*kb);
            }
        }
    };

    bind("scroll_up", {"up", "k", "ctrl+p"});
    bind("scroll_down", {"down", "j", "enter", "ctrl+n"});
    bind("scroll_left", {"left", "h"});
    bind("scroll_right", {"right", "l"});
    bind("half_page_up", {"u", "ctrl+u"});
    bind("half_page_down", {"d", "ctrl+d"});
    bind("page_up", {"pageup", "b", "ctrl+b"});
    bind("page_down", {"pagedown", "space", "ctrl+f"});
    bind("top", {"home", "g"});
    bind("bottom", {"end", "G"});
    bind("line_start", {"0"});
    bind("line_end", {"$"});
    bind("refresh", {"r", "ctrl+l"});
    bind("quit", {"q", "Q"});
}

std::vector<KeyBinding> KeybindingConfig::GetBindings(const std::string& action) const {
    auto it = bindings.find(action);
    if (it != bindings.end()) {
        return it->second;
    }
    return {};
}

std::optional<KeyBinding> KeybindingConfig::GetBinding(const std::string& action) const {
    auto it = bindings.find(action);
    if (it != bindings.end() && !it->second.empty()) {
        return it->second.front();
    }
    return std::nullopt;
}

// ============================================================================
// Config
// ============================================================================

Config::Config() {
    SetDefaults();
}

void Config::SetDefaults() {
    m_refresh = RefreshConfig{};
    m_display = DisplayConfig{};
    m_logging = LoggingConfig{};
    m_keybindings.SetDefaults();
}

std::string Config::GetDefaultConfigPath() {
    namespace fs = std::filesystem;

    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && xdg[0] != '\0') {
        return (fs::path(xdg) / "viewpane" / "config.json").string();
    }
    if (const char* home = std::getenv("HOME"); home && home[0] != '\0') {
        return (fs::path(home) / ".config" / "viewpane" / "config.json").string();
    }
    return {};
}

bool Config::IsValidLogLevel(const std::string& level) {
    static const std::vector<std::string> levels = {
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off",
    };
    return std::find(levels.begin(), levels.end(), ToLower(level)) != levels.end();
}

bool Config::LoadDefault() {
    std::string path = GetDefaultConfigPath();
    if (path.empty()) {
        SetDefaults();
        m_warnings.clear();
        m_loaded = false;
        return true;
    }
    return Load(path);
}

bool Config::Load(const std::string& path) {
    SetDefaults();
    m_warnings.clear();
    m_loaded = false;

    std::ifstream file(path);
    if (!file.is_open()) {
        // No config file - defaults are fine
        return true;
    }

    std::stringstream contents;
    contents << file.rdbuf();

    if (!ParseJson(contents.str())) {
        return false;
    }

    m_loaded = true;
    spdlog::info("Loaded config from {}", path);
    return true;
}

bool Config::ParseJson(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        m_warnings.push_back(std::string("Invalid JSON: ") + e.what());
        return false;
    }

    if (!root.is_object()) {
        m_warnings.push_back("Config root must be a JSON object");
        return false;
    }

    // Refresh settings
    if (auto it = root.find("refresh"); it != root.end() && it->is_object()) {
        const json& refresh = *it;

        if (auto v = refresh.find("intervalSeconds"); v != refresh.end()) {
            if (!v->is_number()) {
                m_warnings.push_back("refresh.intervalSeconds must be a number");
            } else {
                double interval = v->get<double>();
                if (interval < kMinIntervalSeconds || interval > kMaxIntervalSeconds) {
                    m_warnings.push_back("refresh.intervalSeconds out of range (" +
                                         std::to_string(interval) + "), using default");
                } else {
                    m_refresh.intervalSeconds = interval;
                }
            }
        }

        if (auto v = refresh.find("inputPollMs"); v != refresh.end()) {
            if (!v->is_number_integer()) {
                m_warnings.push_back("refresh.inputPollMs must be an integer");
            } else {
                int poll = v->get<int>();
                int clamped = std::clamp(poll, 1, 1000);
                if (clamped != poll) {
                    m_warnings.push_back("refresh.inputPollMs clamped to " + std::to_string(clamped));
                }
                m_refresh.inputPollMs = clamped;
            }
        }
    }

    // Display settings
    if (auto it = root.find("display"); it != root.end() && it->is_object()) {
        const json& display = *it;

        if (auto v = display.find("showStatus"); v != display.end()) {
            if (v->is_boolean()) {
                m_display.showStatus = v->get<bool>();
            } else {
                m_warnings.push_back("display.showStatus must be a boolean");
            }
        }

        if (auto v = display.find("colors"); v != display.end()) {
            if (v->is_boolean()) {
                m_display.colors = v->get<bool>();
            } else {
                m_warnings.push_back("display.colors must be a boolean");
            }
        }

        if (auto v = display.find("maxColorPairs"); v != display.end()) {
            if (!v->is_number_integer()) {
                m_warnings.push_back("display.maxColorPairs must be an integer");
            } else {
                int pairs = v->get<int>();
                int clamped = std::clamp(pairs, 0, kMaxColorPairsLimit);
                if (clamped != pairs) {
                    m_warnings.push_back("display.maxColorPairs clamped to " + std::to_string(clamped));
                }
                m_display.maxColorPairs = clamped;
            }
        }
    }

    // Keybindings: each entry replaces the default keys for that action
    if (auto it = root.find("keybindings"); it != root.end() && it->is_object()) {
        for (const auto& item : it->items()) {
            const std::string& action = item.key();
            const json& value = item.value();

            if (!KeybindingConfig::IsKnownAction(action)) {
                m_warnings.push_back("Unknown keybinding action: " + action);
                continue;
            }

            std::vector<std::string> keys;
            if (value.is_string()) {
                keys.push_back(value.get<std::string>());
            } else if (value.is_array()) {
                for (const auto& entry : value) {
                    if (entry.is_string()) {
                        keys.push_back(entry.get<std::string>());
                    }
                }
            }

            std::vector<KeyBinding> parsed;
            for (const auto& key : keys) {
                if (auto kb = KeyBinding::Parse(key)) {
                    parsed.push_back(*kb);
                } else {
                    m_warnings.push_back("Invalid keybinding for " + action + ": " + key);
                }
            }

            if (parsed.empty()) {
                m_warnings.push_back("No valid keys for " + action + ", keeping defaults");
                continue;
            }
            m_keybindings.bindings[action] = std::move(parsed);
        }
    }

    // Logging
    if (auto it = root.find("logging"); it != root.end() && it->is_object()) {
        const json& logging = *it;

        if (auto v = logging.find("file"); v != logging.end() && v->is_string()) {
            m_logging.file = v->get<std::string>();
        }

        if (auto v = logging.find("level"); v != logging.end() && v->is_string()) {
            std::string level = v->get<std::string>();
            if (IsValidLogLevel(level)) {
                m_logging.level = ToLower(level);
            } else {
                m_warnings.push_back("Unknown logging.level: " + level);
            }
        }
    }

    return true;
}

bool Config::Save(const std::string& path) const {
    json root;

    root["refresh"] = {
        {"intervalSeconds", m_refresh.intervalSeconds},
        {"inputPollMs", m_refresh.inputPollMs},
    };

    root["display"] = {
        {"showStatus", m_display.showStatus},
        {"colors", m_display.colors},
        {"maxColorPairs", m_display.maxColorPairs},
    };

    json keybindings = json::object();
    for (const auto& action : KeybindingConfig::ActionNames()) {
        json keys = json::array();
        for (const auto& kb : m_keybindings.GetBindings(action)) {
            keys.push_back(kb.ctrl ? "ctrl+" + kb.key : kb.key);
        }
        if (!keys.empty()) {
            keybindings[action] = keys;
        }
    }
    root["keybindings"] = keybindings;

    root["logging"] = {
        {"file", m_logging.file},
        {"level", m_logging.level},
    };

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        spdlog::error("Failed to open config file for writing: {}", path);
        return false;
    }

    file << root.dump(4) << '\n';
    return file.good();
}

} // namespace ViewPane::Core
