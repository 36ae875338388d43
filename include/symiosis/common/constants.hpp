#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace symiosis {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("Symiosis Config v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "Symiosis";
    constexpr const char* CONFIG_DIR_NAME = "symiosis";
    constexpr const char* CONFIG_FILE_NAME = "config.toml";
    constexpr const char* CONFIG_ENV_OVERRIDE = "SYMIOSIS_CONFIG";
    constexpr const char* LOGGER_NAME = "symiosis";
}

namespace log_categories {
    constexpr const char* CONFIG_PARSE = "CONFIG_PARSE";
    constexpr const char* CONFIG_VALIDATION = "CONFIG_VALIDATION";
    constexpr const char* MAC_FOCUS = "MAC_FOCUS";
}

namespace limits {
    constexpr uint16_t MIN_FONT_SIZE = 8;
    constexpr uint16_t MAX_FONT_SIZE = 72;

    constexpr uint16_t MIN_TAB_SIZE = 1;
    constexpr uint16_t MAX_TAB_SIZE = 16;

    constexpr size_t MIN_SEARCH_RESULTS = 1;
    constexpr size_t MAX_SEARCH_RESULTS = 10000;

    constexpr size_t MAX_PATH_LENGTH = 4096;
    constexpr size_t MAX_NOTE_NAME_LENGTH = 255;
    constexpr size_t MAX_SHORTCUT_LENGTH = 100;
    constexpr size_t MAX_BASIC_KEY_LENGTH = 32;

    // Values longer than these are withheld from log lines and error messages.
    constexpr size_t MAX_LOGGED_VALUE_LENGTH = 64;
    constexpr size_t MAX_ECHOED_NOTE_NAME_LENGTH = 10;
}

namespace config_defaults {
    constexpr const char* GLOBAL_SHORTCUT = "Ctrl+Shift+N";
    constexpr const char* NOTES_SUBDIRECTORY = "Documents/Notes";
    constexpr const char* NOTES_FALLBACK_DIRECTORY = "Notes";

    constexpr double SCROLL_AMOUNT = 0.4;

    constexpr const char* FONT_FAMILY = "Inter, sans-serif";
    constexpr uint16_t FONT_SIZE = 14;
    constexpr const char* EDITOR_FONT_FAMILY = "JetBrains Mono, Consolas, monospace";
    constexpr uint16_t EDITOR_FONT_SIZE = 14;
    constexpr bool ALWAYS_ON_TOP = false;
    constexpr bool WINDOW_DECORATIONS = true;

    constexpr bool WORD_WRAP = true;
    constexpr uint16_t TAB_SIZE = 2;
    constexpr bool EXPAND_TABS = true;
    constexpr bool SHOW_LINE_NUMBERS = true;

    constexpr size_t MAX_SEARCH_RESULTS = 100;
}

namespace shortcut_defaults {
    constexpr const char* CREATE_NOTE = "Ctrl+Enter";
    constexpr const char* RENAME_NOTE = "Ctrl+m";
    constexpr const char* DELETE_NOTE = "Ctrl+x";
    constexpr const char* EDIT_NOTE = "Enter";
    constexpr const char* SAVE_AND_EXIT = "Ctrl+s";
    constexpr const char* OPEN_EXTERNAL = "Ctrl+o";
    constexpr const char* OPEN_FOLDER = "Ctrl+f";
    constexpr const char* REFRESH_CACHE = "Ctrl+r";
    constexpr const char* SCROLL_UP = "Ctrl+u";
    constexpr const char* SCROLL_DOWN = "Ctrl+d";
    constexpr const char* UP = "Ctrl+k";
    constexpr const char* DOWN = "Ctrl+j";
    constexpr const char* NAVIGATE_PREVIOUS = "Ctrl+p";
    constexpr const char* NAVIGATE_NEXT = "Ctrl+n";
    constexpr const char* NAVIGATE_CODE_PREVIOUS = "Ctrl+Alt+h";
    constexpr const char* NAVIGATE_CODE_NEXT = "Ctrl+Alt+l";
    constexpr const char* NAVIGATE_LINK_PREVIOUS = "Ctrl+h";
    constexpr const char* NAVIGATE_LINK_NEXT = "Ctrl+l";
    constexpr const char* COPY_CURRENT_SECTION = "Ctrl+y";
    constexpr const char* OPEN_SETTINGS = "Meta+,";
    constexpr const char* VERSION_EXPLORER = "Ctrl+/";
    constexpr const char* RECENTLY_DELETED = "Ctrl+.";
}

}
}
