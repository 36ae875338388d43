#include <gtest/gtest.h>
#include "symiosis/config/validator.hpp"
#include "symiosis/common/config.hpp"

using namespace symiosis;
using config::ConfigValidator;
using config::ValidationErrorCode;

TEST(NotesDirectoryTest, AcceptsAbsolutePath) {
    EXPECT_FALSE(ConfigValidator::validateNotesDirectory("/home/user/Documents/Notes"));
    EXPECT_FALSE(ConfigValidator::validateNotesDirectory("Notes"));
}

TEST(NotesDirectoryTest, DotsInsideComponentAreAllowed) {
    EXPECT_FALSE(ConfigValidator::validateNotesDirectory("/home/j..doe/Documents/Notes"));
    EXPECT_FALSE(ConfigValidator::validateNotesDirectory("/srv/notes.../archive"));
    EXPECT_FALSE(ConfigValidator::validateNotesDirectory("/srv/..notes"));
}

TEST(NotesDirectoryTest, RejectsUnsafePaths) {
    auto empty = ConfigValidator::validateNotesDirectory("");
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty->code, ValidationErrorCode::PATH_EMPTY);

    auto traversal = ConfigValidator::validateNotesDirectory("../secret");
    ASSERT_TRUE(traversal);
    EXPECT_EQ(traversal->code, ValidationErrorCode::PATH_TRAVERSAL);

    auto embedded = ConfigValidator::validateNotesDirectory("/home/user/../root");
    ASSERT_TRUE(embedded);
    EXPECT_EQ(embedded->code, ValidationErrorCode::PATH_TRAVERSAL);

    auto relative = ConfigValidator::validateNotesDirectory("notes/..");
    ASSERT_TRUE(relative);
    EXPECT_EQ(relative->code, ValidationErrorCode::PATH_TRAVERSAL);

    auto hidden = ConfigValidator::validateNotesDirectory(".notes");
    ASSERT_TRUE(hidden);
    EXPECT_EQ(hidden->code, ValidationErrorCode::PATH_HIDDEN);

    auto too_long = ConfigValidator::validateNotesDirectory("/" + std::string(5000, 'a'));
    ASSERT_TRUE(too_long);
    EXPECT_EQ(too_long->code, ValidationErrorCode::PATH_TOO_LONG);

    auto bad_chars = ConfigValidator::validateNotesDirectory("/tmp/no|tes");
    ASSERT_TRUE(bad_chars);
    EXPECT_EQ(bad_chars->code, ValidationErrorCode::PATH_INVALID_CHARACTERS);

    EXPECT_TRUE(ConfigValidator::validateNotesDirectory(std::string("/tmp/a\0b", 8)));
}

TEST(ShortcutFormatTest, AcceptsModifierCombos) {
    EXPECT_FALSE(ConfigValidator::validateShortcutFormat("Ctrl+Shift+N"));
    EXPECT_FALSE(ConfigValidator::validateShortcutFormat("ctrl+shift+n"));
    EXPECT_FALSE(ConfigValidator::validateShortcutFormat("CmdOrCtrl+Alt+F12"));
    EXPECT_FALSE(ConfigValidator::validateShortcutFormat("Meta+Space"));
    EXPECT_FALSE(ConfigValidator::validateShortcutFormat("Ctrl++"));
    EXPECT_FALSE(ConfigValidator::validateShortcutFormat("Alt+KeyA"));
}

TEST(ShortcutFormatTest, RejectsMalformedCombos) {
    auto empty = ConfigValidator::validateShortcutFormat("");
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty->code, ValidationErrorCode::SHORTCUT_EMPTY);

    auto no_modifier = ConfigValidator::validateShortcutFormat("N");
    ASSERT_TRUE(no_modifier);
    EXPECT_EQ(no_modifier->code, ValidationErrorCode::SHORTCUT_MISSING_MODIFIER);

    auto trailing = ConfigValidator::validateShortcutFormat("Ctrl+Shift+");
    ASSERT_TRUE(trailing);
    EXPECT_EQ(trailing->code, ValidationErrorCode::SHORTCUT_MALFORMED);

    auto double_sep = ConfigValidator::validateShortcutFormat("Ctrl++Shift+N");
    ASSERT_TRUE(double_sep);
    EXPECT_EQ(double_sep->code, ValidationErrorCode::SHORTCUT_MALFORMED);

    auto modifier_only = ConfigValidator::validateShortcutFormat("Ctrl+Shift");
    ASSERT_TRUE(modifier_only);
    EXPECT_EQ(modifier_only->code, ValidationErrorCode::SHORTCUT_MALFORMED);

    auto unknown = ConfigValidator::validateShortcutFormat("Hyper+N");
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown->code, ValidationErrorCode::SHORTCUT_UNKNOWN_MODIFIER);

    auto duplicate = ConfigValidator::validateShortcutFormat("Ctrl+Control+N");
    ASSERT_TRUE(duplicate);
    EXPECT_EQ(duplicate->code, ValidationErrorCode::SHORTCUT_DUPLICATE_MODIFIER);

    auto bad_key = ConfigValidator::validateShortcutFormat("Ctrl+Banana");
    ASSERT_TRUE(bad_key);
    EXPECT_EQ(bad_key->code, ValidationErrorCode::SHORTCUT_INVALID_KEY);

    auto too_long = ConfigValidator::validateShortcutFormat("Ctrl+" + std::string(200, 'a'));
    ASSERT_TRUE(too_long);
    EXPECT_EQ(too_long->code, ValidationErrorCode::SHORTCUT_TOO_LONG);
}

TEST(ShortcutFormatTest, BasicGrammarIsLooser) {
    EXPECT_FALSE(ConfigValidator::validateBasicShortcutFormat("Enter"));
    EXPECT_FALSE(ConfigValidator::validateBasicShortcutFormat("Ctrl+Control+x"));
    EXPECT_FALSE(ConfigValidator::validateBasicShortcutFormat("Ctrl+Banana"));
    EXPECT_FALSE(ConfigValidator::validateBasicShortcutFormat("Meta+,"));
    EXPECT_FALSE(ConfigValidator::validateBasicShortcutFormat("Ctrl+."));

    EXPECT_TRUE(ConfigValidator::validateBasicShortcutFormat(""));
    EXPECT_TRUE(ConfigValidator::validateBasicShortcutFormat("Ctrl+"));
    EXPECT_TRUE(ConfigValidator::validateBasicShortcutFormat("+x"));
    EXPECT_TRUE(ConfigValidator::validateBasicShortcutFormat("Ctrl+Page Up"));
    EXPECT_TRUE(ConfigValidator::validateBasicShortcutFormat("Ctrl+" + std::string(40, 'k')));
}

TEST(ShortcutFormatTest, DefaultsSatisfyGrammar) {
    auto defaults = common::Config::createDefaultConfig();
    EXPECT_FALSE(ConfigValidator::validateShortcutFormat(defaults.global_shortcut));
    EXPECT_FALSE(ConfigValidator::validateNotesDirectory(defaults.notes_directory));
}

TEST(FontSizeTest, ReportsLabelValueAndBound) {
    EXPECT_FALSE(ConfigValidator::validateFontSize(8, "UI font size"));
    EXPECT_FALSE(ConfigValidator::validateFontSize(72, "UI font size"));

    auto low = ConfigValidator::validateFontSize(7, "UI font size");
    ASSERT_TRUE(low);
    EXPECT_EQ(low->code, ValidationErrorCode::VALUE_OUT_OF_RANGE);
    EXPECT_EQ(low->message, "UI font size 7 is below minimum 8");

    auto high = ConfigValidator::validateFontSize(73, "Editor font size");
    ASSERT_TRUE(high);
    EXPECT_EQ(high->message, "Editor font size 73 exceeds maximum 72");
}

TEST(RangeTest, InclusiveBounds) {
    EXPECT_FALSE(ConfigValidator::validateRange(1, 1, 16, "Tab size"));
    EXPECT_FALSE(ConfigValidator::validateRange(16, 1, 16, "Tab size"));

    auto zero = ConfigValidator::validateRange(0, 1, 16, "Tab size");
    ASSERT_TRUE(zero);
    EXPECT_EQ(zero->message, "Tab size 0 is below minimum 1");

    auto big = ConfigValidator::validateRange(50000, 1, 10000, "Max search results");
    ASSERT_TRUE(big);
    EXPECT_EQ(big->message, "Max search results 50000 exceeds maximum 10000");
}

TEST(NoteNameTest, AcceptsOrdinaryNames) {
    EXPECT_FALSE(ConfigValidator::validateNoteName("meeting notes.md"));
    EXPECT_FALSE(ConfigValidator::validateNoteName("projects/plan.md"));
    EXPECT_FALSE(ConfigValidator::validateNoteName("note-\xE6\xB5\x8B\xE8\xAF\x95-\xF0\x9F\xA6\x80.md"));
}

TEST(NoteNameTest, ShortValuesAreEchoed) {
    auto traversal = ConfigValidator::validateNoteName("../x");
    ASSERT_TRUE(traversal);
    EXPECT_EQ(traversal->code, ValidationErrorCode::NOTE_NAME_TRAVERSAL);
    EXPECT_EQ(traversal->message, "Path traversal not allowed: '../x'");

    auto hidden = ConfigValidator::validateNoteName(".hidden");
    ASSERT_TRUE(hidden);
    EXPECT_EQ(hidden->message, "Note name cannot start with a dot: '.hidden'");
}

TEST(NoteNameTest, LongValuesAreWithheld) {
    auto traversal = ConfigValidator::validateNoteName("../../etc/passwd");
    ASSERT_TRUE(traversal);
    EXPECT_EQ(traversal->message, "Path traversal not allowed");

    auto invalid = ConfigValidator::validateNoteName("secret-name?.md");
    ASSERT_TRUE(invalid);
    EXPECT_EQ(invalid->code, ValidationErrorCode::NOTE_NAME_INVALID);
    EXPECT_EQ(invalid->message, "Invalid note name");

    auto too_long = ConfigValidator::validateNoteName(std::string(300, 'n'));
    ASSERT_TRUE(too_long);
    EXPECT_EQ(too_long->code, ValidationErrorCode::NOTE_NAME_TOO_LONG);
    EXPECT_EQ(too_long->message.rfind("Note name too long", 0), 0u);
    EXPECT_EQ(too_long->message.find("nnnn"), std::string::npos);
}

TEST(NoteNameTest, EmptyAndAbsolute) {
    auto empty = ConfigValidator::validateNoteName("");
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty->message, "Note name cannot be empty");

    auto backslash = ConfigValidator::validateNoteName("file\\path");
    ASSERT_TRUE(backslash);
    EXPECT_EQ(backslash->message, "Invalid note name: 'file\\path'");

    auto absolute = ConfigValidator::validateNoteName("/etc");
    ASSERT_TRUE(absolute);
    EXPECT_EQ(absolute->message, "Invalid note name: '/etc'");
}

TEST(ConfigMaskerTest, WithholdsLongValues) {
    EXPECT_EQ(config::ConfigMasker::display("abc", 10), "'abc'");
    EXPECT_EQ(config::ConfigMasker::display("abcdefghijk", 10), "<withheld: 11 bytes>");
    EXPECT_EQ(config::ConfigMasker::forLog(std::string(64, 'x')), "'" + std::string(64, 'x') + "'");
    EXPECT_EQ(config::ConfigMasker::forLog(std::string(65, 'x')), "<withheld: 65 bytes>");
}

TEST(ReportValidatorTest, DefaultIsValid) {
    config::ConfigValidator validator;
    auto result = validator.validate(common::Config::createDefaultConfig());
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST(ReportValidatorTest, ListsEveryInvalidField) {
    auto config = common::Config::createDefaultConfig();
    config.editor.tab_size = 0;
    config.interface.ui_theme = "nonexistent";
    config.shortcuts.up = "";

    config::ConfigValidator validator;
    auto result = validator.validate(config);

    EXPECT_FALSE(result.is_valid);
    ASSERT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.errors[0].rfind("interface.ui_theme", 0), 0u);
    EXPECT_EQ(result.errors[1], "editor.tab_size: Tab size 0 is below minimum 1");
    EXPECT_EQ(result.errors[2], "shortcuts.up: Shortcut cannot be empty");
    EXPECT_EQ(config.editor.tab_size, 0u);
}

TEST(ValidationErrorCodeTest, RegistryLookup) {
    EXPECT_STREQ(config::ValidationErrorCodeHelper::toString(ValidationErrorCode::SHORTCUT_EMPTY),
                 "SHORTCUT_EMPTY");
    EXPECT_STREQ(config::ValidationErrorCodeHelper::getMessage(ValidationErrorCode::VALUE_NOT_IN_CATALOG),
                 "Value is not one of the available choices");
    EXPECT_STREQ(config::ValidationErrorCodeHelper::toString(static_cast<ValidationErrorCode>(999)),
                 "UNKNOWN");
}
