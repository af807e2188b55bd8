#include <gtest/gtest.h>
#include "core/Config.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace ViewPane::Core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test configs
        testDir = std::filesystem::temp_directory_path() / "viewpane_config_test";
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        // Clean up temp files
        std::filesystem::remove_all(testDir);
    }

    std::filesystem::path testDir;

    std::string WriteTestConfig(const std::string& filename, const std::string& content) {
        std::ofstream file(testDir / filename);
        file << content;
        return (testDir / filename).string();
    }
};

// KeyBinding parsing tests
TEST_F(ConfigTest, KeyBindingParse_Simple) {
    auto kb = KeyBinding::Parse("j");
    ASSERT_TRUE(kb.has_value());
    EXPECT_EQ(kb->key, "j");
    EXPECT_FALSE(kb->ctrl);
}

TEST_F(ConfigTest, KeyBindingParse_KeepsCaseOfSingleCharacter) {
    auto lower = KeyBinding::Parse("g");
    auto upper = KeyBinding::Parse("G");
    ASSERT_TRUE(lower.has_value());
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(lower->key, "g");
    EXPECT_EQ(upper->key, "G");
}

TEST_F(ConfigTest, KeyBindingParse_WithCtrl) {
    auto kb = KeyBinding::Parse("ctrl+d");
    ASSERT_TRUE(kb.has_value());
    EXPECT_EQ(kb->key, "d");
    EXPECT_TRUE(kb->ctrl);
}

TEST_F(ConfigTest, KeyBindingParse_CaseInsensitive) {
    auto kb = KeyBinding::Parse("CTRL+U");
    ASSERT_TRUE(kb.has_value());
    EXPECT_EQ(kb->key, "u");
    EXPECT_TRUE(kb->ctrl);

    auto named = KeyBinding::Parse("PageDown");
    ASSERT_TRUE(named.has_value());
    EXPECT_EQ(named->key, "pagedown");
}

TEST_F(ConfigTest, KeyBindingParse_ShiftUppercases) {
    auto kb = KeyBinding::Parse("shift+g");
    ASSERT_TRUE(kb.has_value());
    EXPECT_EQ(kb->key, "G");
    EXPECT_FALSE(kb->ctrl);
}

TEST_F(ConfigTest, KeyBindingParse_NamedKeys) {
    for (const char* name : {"up", "down", "left", "right", "home", "end", "space", "enter", "escape", "f1", "f12"}) {
        auto kb = KeyBinding::Parse(name);
        ASSERT_TRUE(kb.has_value()) << name;
        EXPECT_EQ(kb->key, name);
    }
}

TEST_F(ConfigTest, KeyBindingParse_Punctuation) {
    EXPECT_EQ(KeyBinding::Parse("$")->key, "$");
    EXPECT_EQ(KeyBinding::Parse("0")->key, "0");
    EXPECT_EQ(KeyBinding::Parse("+")->key, "+");
}

TEST_F(ConfigTest, KeyBindingParse_Invalid) {
    EXPECT_FALSE(KeyBinding::Parse("").has_value());
    EXPECT_FALSE(KeyBinding::Parse("alt+x").has_value());
    EXPECT_FALSE(KeyBinding::Parse("ctrl+1").has_value());
    EXPECT_FALSE(KeyBinding::Parse("ctrl+").has_value());
    EXPECT_FALSE(KeyBinding::Parse("hyper").has_value());
    EXPECT_FALSE(KeyBinding::Parse("f13").has_value());
    EXPECT_FALSE(KeyBinding::Parse("shift+up").has_value());
}

TEST_F(ConfigTest, KeyBindingToString) {
    KeyBinding kb{"u", true};
    EXPECT_EQ(kb.ToString(), "Ctrl+u");
    EXPECT_EQ((KeyBinding{"pagedown", false}).ToString(), "pagedown");
}

// Config loading tests
TEST_F(ConfigTest, LoadFromNonExistentFile_UsesDefaults) {
    Config config;
    EXPECT_TRUE(config.Load((testDir / "nonexistent.json").string()));
    EXPECT_FALSE(config.IsLoaded());
    EXPECT_DOUBLE_EQ(config.GetRefresh().intervalSeconds, 2.0);
    EXPECT_EQ(config.GetRefresh().inputPollMs, 50);
    EXPECT_FALSE(config.GetDisplay().showStatus);
    EXPECT_TRUE(config.GetDisplay().colors);
    EXPECT_EQ(config.GetDisplay().maxColorPairs, 255);
    EXPECT_TRUE(config.GetLogging().file.empty());
    EXPECT_EQ(config.GetLogging().level, "info");
    EXPECT_TRUE(config.GetWarnings().empty());
}

TEST_F(ConfigTest, ParseJson_RefreshConfig) {
    Config config;
    std::string path = WriteTestConfig("config.json", R"({
        "refresh": { "intervalSeconds": 0.5, "inputPollMs": 20 }
    })");

    EXPECT_TRUE(config.Load(path));
    EXPECT_TRUE(config.IsLoaded());
    EXPECT_DOUBLE_EQ(config.GetRefresh().intervalSeconds, 0.5);
    EXPECT_EQ(config.GetRefresh().inputPollMs, 20);
}

TEST_F(ConfigTest, ParseJson_DisplayConfig) {
    Config config;
    std::string path = WriteTestConfig("config.json", R"({
        "display": { "showStatus": true, "colors": false, "maxColorPairs": 64 }
    })");

    EXPECT_TRUE(config.Load(path));
    EXPECT_TRUE(config.GetDisplay().showStatus);
    EXPECT_FALSE(config.GetDisplay().colors);
    EXPECT_EQ(config.GetDisplay().maxColorPairs, 64);
}

TEST_F(ConfigTest, ParseJson_LoggingConfig) {
    Config config;
    std::string path = WriteTestConfig("config.json", R"({
        "logging": { "file": "/tmp/viewpane.log", "level": "DEBUG" }
    })");

    EXPECT_TRUE(config.Load(path));
    EXPECT_EQ(config.GetLogging().file, "/tmp/viewpane.log");
    EXPECT_EQ(config.GetLogging().level, "debug");
}

TEST_F(ConfigTest, ParseJson_Keybindings) {
    Config config;
    std::string path = WriteTestConfig("config.json", R"({
        "keybindings": {
            "quit": "x",
            "page_down": ["pagedown", "ctrl+f", "f"]
        }
    })");

    EXPECT_TRUE(config.Load(path));

    auto quit = config.GetKeybindings().GetBindings("quit");
    ASSERT_EQ(quit.size(), 1u);
    EXPECT_EQ(quit[0].key, "x");

    auto pageDown = config.GetKeybindings().GetBindings("page_down");
    ASSERT_EQ(pageDown.size(), 3u);
    EXPECT_EQ(pageDown[1], (KeyBinding{"f", true}));
    EXPECT_EQ(pageDown[2], (KeyBinding{"f", false}));

    // Untouched actions keep their defaults
    EXPECT_EQ(config.GetKeybindings().GetBindings("scroll_down").size(), 4u);
}

TEST_F(ConfigTest, ParseJson_InvalidJson) {
    Config config;
    std::string path = WriteTestConfig("config.json", "{ this is not json");

    EXPECT_FALSE(config.Load(path));
    EXPECT_FALSE(config.GetWarnings().empty());
    EXPECT_DOUBLE_EQ(config.GetRefresh().intervalSeconds, 2.0);
}

TEST_F(ConfigTest, ParseJson_RootMustBeObject) {
    Config config;
    std::string path = WriteTestConfig("config.json", "[1, 2, 3]");

    EXPECT_FALSE(config.Load(path));
    EXPECT_FALSE(config.GetWarnings().empty());
}

TEST_F(ConfigTest, ParseJson_IntervalOutOfRange) {
    Config config;
    std::string path = WriteTestConfig("config.json", R"({ "refresh": { "intervalSeconds": 0 } })");

    EXPECT_TRUE(config.Load(path));
    // Should warn but keep default
    EXPECT_FALSE(config.GetWarnings().empty());
    EXPECT_DOUBLE_EQ(config.GetRefresh().intervalSeconds, 2.0);
}

TEST_F(ConfigTest, ParseJson_WrongTypes) {
    Config config;
    std::string path = WriteTestConfig("config.json", R"({
        "refresh": { "intervalSeconds": "fast" },
        "display": { "showStatus": "yes", "maxColorPairs": 1.5 }
    })");

    EXPECT_TRUE(config.Load(path));
    EXPECT_EQ(config.GetWarnings().size(), 3u);
    EXPECT_FALSE(config.GetDisplay().showStatus);
    EXPECT_EQ(config.GetDisplay().maxColorPairs, 255);
}

TEST_F(ConfigTest, ParseJson_UnknownActionAndKey) {
    Config config;
    std::string path = WriteTestConfig("config.json", R"({
        "keybindings": { "explode": "x", "quit": "alt+q" }
    })");

    EXPECT_TRUE(config.Load(path));
    EXPECT_GE(config.GetWarnings().size(), 2u);
    // Invalid replacement leaves the defaults
    EXPECT_EQ(config.GetKeybindings().GetBindings("quit").size(), 2u);
}

TEST_F(ConfigTest, ParseJson_InvalidLogLevel) {
    Config config;
    std::string path = WriteTestConfig("config.json", R"({ "logging": { "level": "chatty" } })");

    EXPECT_TRUE(config.Load(path));
    EXPECT_FALSE(config.GetWarnings().empty());
    EXPECT_EQ(config.GetLogging().level, "info");
}

TEST_F(ConfigTest, LimitsClamped) {
    Config config;
    std::string path = WriteTestConfig("config.json", R"({
        "refresh": { "inputPollMs": 50000 },
        "display": { "maxColorPairs": -3 }
    })");

    ASSERT_TRUE(config.Load(path));
    EXPECT_EQ(config.GetRefresh().inputPollMs, 1000);
    EXPECT_EQ(config.GetDisplay().maxColorPairs, 0);
    EXPECT_EQ(config.GetWarnings().size(), 2u);

    path = WriteTestConfig("config2.json", R"({ "display": { "maxColorPairs": 100000 } })");
    ASSERT_TRUE(config.Load(path));
    EXPECT_EQ(config.GetDisplay().maxColorPairs, Config::kMaxColorPairsLimit);
    EXPECT_EQ(Config::kMaxColorPairsLimit, 255);
}

TEST_F(ConfigTest, ReloadResetsPreviousValues) {
    Config config;
    std::string first = WriteTestConfig("a.json", R"({ "display": { "showStatus": true } })");
    std::string second = WriteTestConfig("b.json", R"({ "refresh": { "intervalSeconds": 5 } })");

    ASSERT_TRUE(config.Load(first));
    ASSERT_TRUE(config.Load(second));
    EXPECT_FALSE(config.GetDisplay().showStatus);
    EXPECT_DOUBLE_EQ(config.GetRefresh().intervalSeconds, 5.0);
}

TEST_F(ConfigTest, Save_AndReload) {
    Config config1;
    config1.GetRefreshMut().intervalSeconds = 0.25;
    config1.GetDisplayMut().showStatus = true;
    config1.GetDisplayMut().maxColorPairs = 32;
    config1.GetLoggingMut().level = "warn";
    config1.GetKeybindingsMut().bindings["quit"] = {KeyBinding{"c", true}};

    std::string path = (testDir / "nested" / "config.json").string();
    EXPECT_TRUE(config1.Save(path));

    // Reload and verify
    Config config2;
    EXPECT_TRUE(config2.Load(path));
    EXPECT_TRUE(config2.GetWarnings().empty());
    EXPECT_DOUBLE_EQ(config2.GetRefresh().intervalSeconds, 0.25);
    EXPECT_TRUE(config2.GetDisplay().showStatus);
    EXPECT_EQ(config2.GetDisplay().maxColorPairs, 32);
    EXPECT_EQ(config2.GetLogging().level, "warn");

    auto quit = config2.GetKeybindings().GetBindings("quit");
    ASSERT_EQ(quit.size(), 1u);
    EXPECT_EQ(quit[0], (KeyBinding{"c", true}));
    EXPECT_EQ(config2.GetKeybindings().GetBindings("bottom"),
              config1.GetKeybindings().GetBindings("bottom"));
}

TEST_F(ConfigTest, DefaultKeybindings) {
    KeybindingConfig keybindings;
    keybindings.SetDefaults();

    for (const auto& action : KeybindingConfig::ActionNames()) {
        EXPECT_TRUE(keybindings.GetBinding(action).has_value()) << action;
    }

    EXPECT_EQ(keybindings.GetBinding("quit")->key, "q");
    EXPECT_EQ(keybindings.GetBinding("bottom")->key, "end");
    EXPECT_FALSE(keybindings.GetBinding("nonexistent").has_value());
}

TEST_F(ConfigTest, KnownActions) {
    EXPECT_TRUE(KeybindingConfig::IsKnownAction("half_page_down"));
    EXPECT_FALSE(KeybindingConfig::IsKnownAction("resize"));
}

TEST_F(ConfigTest, LogLevels) {
    EXPECT_TRUE(Config::IsValidLogLevel("trace"));
    EXPECT_TRUE(Config::IsValidLogLevel("Warning"));
    EXPECT_TRUE(Config::IsValidLogLevel("off"));
    EXPECT_FALSE(Config::IsValidLogLevel("verbose"));
}

TEST_F(ConfigTest, DefaultConfigPathFollowsXdg) {
    const char* saved = std::getenv("XDG_CONFIG_HOME");
    std::string previous = saved ? saved : "";

    setenv("XDG_CONFIG_HOME", testDir.string().c_str(), 1);
    EXPECT_EQ(Config::GetDefaultConfigPath(), (testDir / "viewpane" / "config.json").string());

    if (saved) {
        setenv("XDG_CONFIG_HOME", previous.c_str(), 1);
    } else {
        unsetenv("XDG_CONFIG_HOME");
    }
}
