#pragma once

#include <string>
#include <vector>
#include <array>
#include <algorithm>

namespace symiosis {
namespace catalogs {

namespace detail {
    constexpr bool equals(const char* a, const char* b) {
        while (*a != '\0' && *a == *b) {
            ++a;
            ++b;
        }
        return *a == *b;
    }

    template<std::size_t N>
    constexpr bool contains(const std::array<const char*, N>& values, const char* value) {
        for (std::size_t i = 0; i < N; ++i) {
            if (equals(values[i], value)) return true;
        }
        return false;
    }

    template<std::size_t N>
    inline std::vector<std::string> toVector(const std::array<const char*, N>& values) {
        return std::vector<std::string>(values.begin(), values.end());
    }

    template<std::size_t N>
    inline bool isMember(const std::array<const char*, N>& values, const std::string& value) {
        return std::find_if(values.begin(), values.end(),
            [&value](const char* candidate) { return value == candidate; }) != values.end();
    }
}

namespace ui_themes {
    constexpr std::array<const char*, 3> SUPPORTED = {
        "gruvbox-dark", "article", "modern-dark"
    };

    constexpr const char* DEFAULT = "gruvbox-dark";

    inline std::vector<std::string> getAvailable() { return detail::toVector(SUPPORTED); }
    inline bool isSupported(const std::string& theme) { return detail::isMember(SUPPORTED, theme); }
}

namespace markdown_themes {
    constexpr std::array<const char*, 3> SUPPORTED = {
        "modern-dark", "article", "gruvbox-dark"
    };

    constexpr const char* DEFAULT = "modern-dark";

    inline std::vector<std::string> getAvailable() { return detail::toVector(SUPPORTED); }
    inline bool isSupported(const std::string& theme) { return detail::isMember(SUPPORTED, theme); }
}

namespace code_themes {
    constexpr std::array<const char*, 18> SUPPORTED = {
        "gruvbox-dark-hard",
        "gruvbox-dark-medium",
        "gruvbox-dark-soft",
        "gruvbox-light-hard",
        "gruvbox-light-medium",
        "atom-one-dark",
        "dracula",
        "nord",
        "monokai",
        "github-dark",
        "vs2015",
        "night-owl",
        "tokyo-night-dark",
        "atom-one-light",
        "github",
        "vs",
        "xcode",
        "tokyo-night-light"
    };

    constexpr const char* DEFAULT = "gruvbox-dark-medium";

    inline std::vector<std::string> getAvailable() { return detail::toVector(SUPPORTED); }
    inline bool isSupported(const std::string& theme) { return detail::isMember(SUPPORTED, theme); }
}

namespace editor_modes {
    constexpr std::array<const char*, 3> SUPPORTED = {"basic", "vim", "emacs"};

    constexpr const char* DEFAULT = "basic";

    inline std::vector<std::string> getAvailable() { return detail::toVector(SUPPORTED); }
    inline bool isSupported(const std::string& mode) { return detail::isMember(SUPPORTED, mode); }
}

namespace editor_themes {
    constexpr std::array<const char*, 23> SUPPORTED = {
        "abcdef",
        "abyss",
        "android-studio",
        "andromeda",
        "basic-dark",
        "basic-light",
        "forest",
        "github-dark",
        "github-light",
        "gruvbox-dark",
        "gruvbox-light",
        "material-dark",
        "material-light",
        "monokai",
        "nord",
        "palenight",
        "solarized-dark",
        "solarized-light",
        "tokyo-night-day",
        "tokyo-night-storm",
        "volcano",
        "vscode-dark",
        "vscode-light"
    };

    constexpr const char* DEFAULT = "gruvbox-dark";

    inline std::vector<std::string> getAvailable() { return detail::toVector(SUPPORTED); }
    inline bool isSupported(const std::string& theme) { return detail::isMember(SUPPORTED, theme); }
}

// A default outside its catalog would make the default config invalid.
static_assert(detail::contains(ui_themes::SUPPORTED, ui_themes::DEFAULT), "ui theme default");
static_assert(detail::contains(markdown_themes::SUPPORTED, markdown_themes::DEFAULT), "markdown theme default");
static_assert(detail::contains(code_themes::SUPPORTED, code_themes::DEFAULT), "code theme default");
static_assert(detail::contains(editor_modes::SUPPORTED, editor_modes::DEFAULT), "editor mode default");
static_assert(detail::contains(editor_themes::SUPPORTED, editor_themes::DEFAULT), "editor theme default");

}
}
