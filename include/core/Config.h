#pragma once

#include <string>
#include <unordered_map>
#include <optional>
#include <vector>

namespace ViewPane::Core {

// Key combination for keybindings
struct KeyBinding {
    std::string key;          // e.g., "j", "G", "up", "pagedown", "f1"
    bool ctrl = false;

    static std::optional<KeyBinding> Parse(const std::string& binding);
    std::string ToString() const;

    bool operator==(const KeyBinding& other) const {
        return key == other.key && ctrl == other.ctrl;
    }
};

// Keybinding configuration: action name -> keys
struct KeybindingConfig {
    std::unordered_map<std::string, std::vector<KeyBinding>> bindings;

    // Every action name a binding may refer to
    static const std::vector<std::string>& ActionNames();
    static bool IsKnownAction(const std::string& action);

    // Default keybindings
    void SetDefaults();
    std::vector<KeyBinding> GetBindings(const std::string& action) const;
    std::optional<KeyBinding> GetBinding(const std::string& action) const;
};

// Redraw timing
struct RefreshConfig {
    double intervalSeconds = 2.0;      // how often the command is re-run
    int inputPollMs = 50;              // keystroke wait per loop iteration
};

struct DisplayConfig {
    bool showStatus = false;           // status line with command + exit status
    bool colors = true;                // translate color escapes at all
    int maxColorPairs = 255;           // upper bound on allocated color pairs
};

struct LoggingConfig {
    std::string file;                  // empty = logging disabled
    std::string level = "info";
};

// Main configuration class
class Config {
public:
    static constexpr double kMinIntervalSeconds = 0.05;
    static constexpr double kMaxIntervalSeconds = 86400.0;
    static constexpr int kMaxColorPairsLimit = 255;  // COLOR_PAIR() keeps 8 bits of pair number

    Config();
    ~Config() = default;

    // Load configuration from file
    bool Load(const std::string& path);

    // Load from default location ($XDG_CONFIG_HOME/viewpane/config.json)
    bool LoadDefault();

    // Save configuration to file
    bool Save(const std::string& path) const;

    // Get configuration path
    static std::string GetDefaultConfigPath();

    static bool IsValidLogLevel(const std::string& level);

    // Accessors
    const RefreshConfig& GetRefresh() const { return m_refresh; }
    const DisplayConfig& GetDisplay() const { return m_display; }
    const KeybindingConfig& GetKeybindings() const { return m_keybindings; }
    const LoggingConfig& GetLogging() const { return m_logging; }

    // Mutable accessors for command line overrides and testing
    RefreshConfig& GetRefreshMut() { return m_refresh; }
    DisplayConfig& GetDisplayMut() { return m_display; }
    KeybindingConfig& GetKeybindingsMut() { return m_keybindings; }
    LoggingConfig& GetLoggingMut() { return m_logging; }

    // Check if config was loaded from an existing file
    bool IsLoaded() const { return m_loaded; }

    // Get any warnings from loading
    const std::vector<std::string>& GetWarnings() const { return m_warnings; }

private:
    bool ParseJson(const std::string& json);
    void SetDefaults();

    RefreshConfig m_refresh;
    DisplayConfig m_display;
    KeybindingConfig m_keybindings;
    LoggingConfig m_logging;

    bool m_loaded = false;
    std::vector<std::string> m_warnings;
};

} // namespace ViewPane::Core
