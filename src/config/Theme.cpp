#include "config/Theme.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace halo::config {

// Define the static member
std::unordered_map<std::string, Theme> ThemeManager::themes_;

namespace {

struct NamedColor {
    const char* name;
    ui::Color color;
};

constexpr NamedColor COLOR_NAMES[] = {
    {"default", ui::Color::Default},
    {"black", ui::Color::Black},
    {"red", ui::Color::Red},
    {"green", ui::Color::Green},
    {"yellow", ui::Color::Yellow},
    {"blue", ui::Color::Blue},
    {"magenta", ui::Color::Magenta},
    {"cyan", ui::Color::Cyan},
    {"white", ui::Color::White},
    {"bright_black", ui::Color::BrightBlack},
    {"bright_red", ui::Color::BrightRed},
    {"bright_green", ui::Color::BrightGreen},
    {"bright_yellow", ui::Color::BrightYellow},
    {"bright_blue", ui::Color::BrightBlue},
    {"bright_magenta", ui::Color::BrightMagenta},
    {"bright_cyan", ui::Color::BrightCyan},
    {"bright_white", ui::Color::BrightWhite},
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

void ThemeManager::init_default_themes() {
    // light: near-white card, gray text, black mask
    Theme light{"light", {}};
    light.hud.background_color = ui::Color::BrightWhite;
    light.hud.text_color = ui::Color::BrightBlack;
    light.hud.mask_color = ui::Color::Black;
    light.hud.accent_color = ui::Color::Yellow;
    light.hud.failure_color = ui::Color::Red;
    themes_["light"] = light;

    Theme dark{"dark", {}};
    dark.hud.background_color = ui::Color::Black;
    dark.hud.text_color = ui::Color::White;
    dark.hud.mask_color = ui::Color::Black;
    dark.hud.accent_color = ui::Color::BrightYellow;
    dark.hud.failure_color = ui::Color::BrightRed;
    themes_["dark"] = dark;

    // terminal: inherit the host terminal's colors
    Theme terminal{"terminal", {}};
    terminal.hud.background_color = ui::Color::Default;
    terminal.hud.text_color = ui::Color::Default;
    terminal.hud.mask_color = ui::Color::Default;
    terminal.hud.accent_color = ui::Color::Yellow;
    terminal.hud.failure_color = ui::Color::Red;
    themes_["terminal"] = terminal;
}

Theme ThemeManager::get_theme(const std::string& name) {
    if (themes_.empty()) {
        init_default_themes();
    }

    auto it = themes_.find(to_lower(name));
    if (it == themes_.end()) {
        halo::util::Logger::warn("Theme: Unknown theme '" + name + "', using light");
        return themes_["light"];
    }
    return it->second;
}

bool ThemeManager::has_theme(const std::string& name) {
    if (themes_.empty()) {
        init_default_themes();
    }
    return themes_.count(to_lower(name)) != 0;
}

void ThemeManager::register_theme(const std::string& name, const Theme& theme) {
    if (themes_.empty()) {
        init_default_themes();
    }
    themes_[to_lower(name)] = theme;
}

std::optional<ui::Color> ThemeManager::parse_color(const std::string& name) {
    std::string key = to_lower(name);
    std::replace(key.begin(), key.end(), '-', '_');
    for (const auto& entry : COLOR_NAMES) {
        if (key == entry.name) {
            return entry.color;
        }
    }
    return std::nullopt;
}

std::string ThemeManager::color_name(ui::Color color) {
    for (const auto& entry : COLOR_NAMES) {
        if (entry.color == color) {
            return entry.name;
        }
    }
    return "default";
}

}  // namespace halo::config
