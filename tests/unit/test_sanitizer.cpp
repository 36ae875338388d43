#include <gtest/gtest.h>
#include "event_recorder.hpp"
#include "symiosis/config/sanitizer.hpp"
#include "symiosis/config/catalogs.hpp"
#include "symiosis/config/shortcut_fields.hpp"
#include "symiosis/config/validator.hpp"
#include "symiosis/common/constants.hpp"
#include "symiosis/common/paths.hpp"
#include <cmath>
#include <cstdlib>
#include <limits>

using namespace symiosis;
using namespace symiosis::config;

namespace {
const char* VALIDATION = constants::log_categories::CONFIG_VALIDATION;

class ScopedHome {
public:
    explicit ScopedHome(const char* value) {
        if (const char* current = std::getenv("HOME")) {
            saved_ = current;
        }
        setenv("HOME", value, 1);
    }

    ~ScopedHome() {
        if (saved_) {
            setenv("HOME", saved_->c_str(), 1);
        } else {
            unsetenv("HOME");
        }
    }

private:
    std::optional<std::string> saved_;
};

common::AppConfig corruptEverything(common::AppConfig config) {
    config.notes_directory = "../../etc";
    config.global_shortcut = "N";
    config.interface.ui_theme = "";
    config.interface.markdown_render_theme = "neon";
    config.interface.md_render_code_theme = std::string(500, 'z');
    config.interface.font_size = 0;
    config.interface.editor_font_size = 65535;
    config.editor.mode = "nano";
    config.editor.theme = "Gruvbox-Dark";
    config.editor.tab_size = 17;
    config.preferences.max_search_results = 0;
    for (const auto& field : shortcutFields()) {
        config.shortcuts.*field.member = "Ctrl++";
    }
    config.shortcuts.up = "";
    config.shortcuts.down = "Hyper+j";
    return config;
}
}

class ConfigSanitizerTest : public ::testing::Test {
protected:
    test::EventRecorder recorder;
    common::AppConfig defaults = common::Config::createDefaultConfig();

    size_t sanitize(common::AppConfig& config) {
        ConfigSanitizer sanitizer(recorder.sink());
        return sanitizer.sanitize(config, defaults);
    }
};

TEST_F(ConfigSanitizerTest, DefaultIsFixedPoint) {
    auto config = defaults;
    EXPECT_EQ(sanitize(config), 0u);
    EXPECT_EQ(config, defaults);
    EXPECT_TRUE(recorder.events.empty());
}

TEST_F(ConfigSanitizerTest, Idempotent) {
    auto config = corruptEverything(defaults);
    sanitize(config);
    auto once = config;
    recorder.events.clear();

    EXPECT_EQ(sanitize(config), 0u);
    EXPECT_EQ(config, once);
    EXPECT_TRUE(recorder.events.empty());
}

TEST_F(ConfigSanitizerTest, EveryGovernedFieldIsRestored) {
    auto config = corruptEverything(defaults);
    size_t corrected = sanitize(config);

    EXPECT_EQ(config.notes_directory, defaults.notes_directory);
    EXPECT_EQ(config.global_shortcut, defaults.global_shortcut);
    EXPECT_EQ(config.interface, defaults.interface);
    EXPECT_EQ(config.editor, defaults.editor);
    EXPECT_EQ(config.preferences, defaults.preferences);
    EXPECT_EQ(config.shortcuts.up, defaults.shortcuts.up);
    EXPECT_EQ(config.shortcuts.down, defaults.shortcuts.down);
    EXPECT_EQ(config.shortcuts.create_note, "Ctrl++");

    EXPECT_EQ(corrected, 13u);
    EXPECT_EQ(recorder.count(VALIDATION), corrected);

    ConfigValidator validator;
    EXPECT_TRUE(validator.validate(config).is_valid);
}

TEST_F(ConfigSanitizerTest, StructuralFieldsAreUntouched) {
    auto config = defaults;
    config.general.scroll_amount = -3.5;
    config.interface.font_family = "";
    config.interface.always_on_top = true;
    config.editor.word_wrap = false;
    config.interface.custom_markdown_theme_path = "../anything";

    auto expected = config;
    EXPECT_EQ(sanitize(config), 0u);
    EXPECT_EQ(config, expected);
}

TEST_F(ConfigSanitizerTest, TabSizeZero) {
    auto config = loadConfigFromContent("[editor]\ntab_size = 0\n", recorder.sink());

    EXPECT_EQ(config.editor.tab_size, defaults.editor.tab_size);
    ASSERT_EQ(recorder.events.size(), 1u);
    EXPECT_EQ(recorder.events[0].category, VALIDATION);
    EXPECT_NE(recorder.events[0].message.find("tab_size"), std::string::npos);
    EXPECT_EQ(recorder.events[0].message, "Invalid editor.tab_size 0. Using default 2.");
    ASSERT_TRUE(recorder.events[0].detail);
    EXPECT_EQ(*recorder.events[0].detail, "Tab size 0 is below minimum 1");
}

TEST_F(ConfigSanitizerTest, MaxSearchResultsTooLarge) {
    auto config = loadConfigFromContent("[preferences]\nmax_search_results = 50000\n", recorder.sink());

    EXPECT_EQ(config.preferences.max_search_results, 100u);
    ASSERT_EQ(recorder.events.size(), 1u);
    EXPECT_NE(recorder.events[0].message.find("max_search_results"), std::string::npos);
}

TEST_F(ConfigSanitizerTest, TraversalNotesDirectory) {
    auto config = loadConfigFromContent("notes_directory = \"../secret\"\n", recorder.sink());

    EXPECT_EQ(config.notes_directory, defaults.notes_directory);
    ASSERT_EQ(recorder.events.size(), 1u);
    EXPECT_NE(recorder.events[0].message.find("notes_directory '../secret'"), std::string::npos);
}

TEST_F(ConfigSanitizerTest, UnknownUiTheme) {
    auto config = loadConfigFromContent("[interface]\nui_theme = \"not-a-theme\"\n", recorder.sink());

    EXPECT_EQ(config.interface.ui_theme, catalogs::ui_themes::DEFAULT);
    ASSERT_EQ(recorder.events.size(), 1u);
    EXPECT_EQ(recorder.events[0].message,
              "Invalid interface.ui_theme 'not-a-theme'. Using default 'gruvbox-dark'.");
}

TEST_F(ConfigSanitizerTest, AllShortcutsEmpty) {
    std::string content = "[shortcuts]\n";
    for (const auto& field : shortcutFields()) {
        content += std::string(field.name) + " = \"\"\n";
    }

    auto config = loadConfigFromContent(content, recorder.sink());

    EXPECT_EQ(config.shortcuts, defaults.shortcuts);
    EXPECT_EQ(recorder.count(VALIDATION), 22u);
    EXPECT_EQ(recorder.events.size(), 22u);
    for (size_t i = 0; i < shortcutFields().size(); ++i) {
        std::string field = std::string("shortcuts.") + shortcutFields()[i].name + " ";
        EXPECT_NE(recorder.events[i].message.find(field), std::string::npos) << field;
    }
}

TEST_F(ConfigSanitizerTest, IndependentCorrection) {
    auto config = loadConfigFromContent(
        "[editor]\ntab_size = 0\n[interface]\nui_theme = \"nonexistent\"\nfont_size = 20\n",
        recorder.sink());

    EXPECT_EQ(config.editor.tab_size, defaults.editor.tab_size);
    EXPECT_EQ(config.interface.ui_theme, defaults.interface.ui_theme);
    EXPECT_EQ(config.interface.font_size, 20u);
    EXPECT_EQ(recorder.count(VALIDATION), 2u);
}

TEST_F(ConfigSanitizerTest, LongValuesAreWithheldFromEvents) {
    auto config = defaults;
    config.editor.theme = std::string(100, 'q');
    sanitize(config);

    ASSERT_EQ(recorder.events.size(), 1u);
    EXPECT_EQ(recorder.events[0].message.find("qqqq"), std::string::npos);
    EXPECT_NE(recorder.events[0].message.find("<withheld: 100 bytes>"), std::string::npos);
}

TEST_F(ConfigSanitizerTest, ReplacementsComeFromGivenDefaults) {
    auto custom = defaults;
    custom.editor.tab_size = 8;
    custom.shortcuts.up = "Alt+k";

    auto config = defaults;
    config.editor.tab_size = 99;
    config.shortcuts.up = "";

    ConfigSanitizer sanitizer(recorder.sink());
    EXPECT_EQ(sanitizer.sanitize(config, custom), 2u);
    EXPECT_EQ(config.editor.tab_size, 8u);
    EXPECT_EQ(config.shortcuts.up, "Alt+k");
}

TEST_F(ConfigSanitizerTest, NullSinkIsAccepted) {
    ConfigSanitizer sanitizer(common::EventSink{});
    auto config = corruptEverything(defaults);
    EXPECT_EQ(sanitizer.sanitize(config, defaults), 13u);
}

TEST_F(ConfigSanitizerTest, NanScrollAmountKeepsIdempotence) {
    auto config = defaults;
    config.general.scroll_amount = std::numeric_limits<double>::quiet_NaN();

    sanitize(config);
    auto once = config;
    sanitize(config);

    EXPECT_TRUE(std::isnan(config.general.scroll_amount));
    EXPECT_EQ(config, once);
    EXPECT_TRUE(recorder.events.empty());
}

TEST(DefaultNotesDirectoryTest, DottedHomeStaysValid) {
    ScopedHome home("/home/j..doe");

    auto defaults = common::Config::createDefaultConfig();
    EXPECT_EQ(defaults.notes_directory, "/home/j..doe/Documents/Notes");
    EXPECT_FALSE(ConfigValidator::validateNotesDirectory(defaults.notes_directory));

    test::EventRecorder recorder;
    ConfigSanitizer sanitizer(recorder.sink());
    auto config = defaults;
    EXPECT_EQ(sanitizer.sanitize(config, defaults), 0u);
    EXPECT_EQ(config, defaults);
    EXPECT_TRUE(recorder.events.empty());
}

TEST(DefaultNotesDirectoryTest, UnsafeHomeFallsBackToRelativeNotes) {
    for (const char* value : {".", "./home", "/home/bad|name", "/home/../root"}) {
        ScopedHome home(value);

        auto defaults = common::Config::createDefaultConfig();
        EXPECT_EQ(defaults.notes_directory, constants::config_defaults::NOTES_FALLBACK_DIRECTORY) << value;

        test::EventRecorder recorder;
        ConfigSanitizer sanitizer(recorder.sink());
        auto config = defaults;
        EXPECT_EQ(sanitizer.sanitize(config, defaults), 0u) << value;
        EXPECT_TRUE(recorder.events.empty()) << value;
    }
}

TEST(DefaultNotesDirectoryTest, LoadEmitsNothingUnderDottedHome) {
    ScopedHome home("/home/j..doe");

    test::EventRecorder recorder;
    auto config = loadConfigFromContent("[editor]\ntab_size = 4\n", recorder.sink());
    EXPECT_EQ(config.notes_directory, "/home/j..doe/Documents/Notes");
    EXPECT_TRUE(recorder.events.empty());
}
