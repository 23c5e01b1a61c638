#pragma once

#include <cstdint>
#include <string>

namespace halo::ui {

// The 16 ANSI palette entries; Default leaves the terminal's own color
enum class Color : uint32_t {
    Default = 0,
    Black = 1,
    Red = 2,
    Green = 3,
    Yellow = 4,
    Blue = 5,
    Magenta = 6,
    Cyan = 7,
    White = 8,

    // Bright variants
    BrightBlack = 9,
    BrightRed = 10,
    BrightGreen = 11,
    BrightYellow = 12,
    BrightBlue = 13,
    BrightMagenta = 14,
    BrightCyan = 15,
    BrightWhite = 16
};

enum class Attribute : uint8_t {
    None = 0,
    Bold = 1 << 0,
    Dim = 1 << 1,
    Underline = 1 << 2,
};

inline Attribute operator|(Attribute a, Attribute b) {
    return static_cast<Attribute>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline bool has_attribute(Attribute set, Attribute check) {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(check)) != 0;
}

struct Style {
    Color fg = Color::Default;
    Color bg = Color::Default;
    Attribute attr = Attribute::None;

    bool operator==(const Style& other) const = default;
};

// SGR parameter for a palette color: 30-37/90-97 foreground, 40-47/100-107 background
inline int sgr_code(Color color, bool background) {
    int index = static_cast<int>(color) - 1;
    int code = (background ? 40 : 30) + index % 8;
    if (index >= 8) {
        code += 60;
    }
    return code;
}

// Escape sequence selecting `style`, empty for the default style
inline std::string sgr_sequence(const Style& style) {
    std::string out;
    if (style.fg != Color::Default) {
        out += "\033[" + std::to_string(sgr_code(style.fg, false)) + "m";
    }
    if (style.bg != Color::Default) {
        out += "\033[" + std::to_string(sgr_code(style.bg, true)) + "m";
    }
    if (has_attribute(style.attr, Attribute::Bold)) out += "\033[1m";
    if (has_attribute(style.attr, Attribute::Dim)) out += "\033[2m";
    if (has_attribute(style.attr, Attribute::Underline)) out += "\033[4m";
    return out;
}

} // namespace halo::ui
