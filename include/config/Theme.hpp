#pragma once

#include "model/OverlayState.hpp"
#include "ui/Color.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace halo::config {

// A named color preset for the HUD card, text and mask
struct Theme {
    std::string name;
    model::HUDConfig hud;
};

class ThemeManager {
public:
    // Unknown names fall back to "light"
    static Theme get_theme(const std::string& name);
    static bool has_theme(const std::string& name);
    static void register_theme(const std::string& name, const Theme& theme);

    // "red", "bright_cyan", "default", ... (case-insensitive)
    static std::optional<ui::Color> parse_color(const std::string& name);
    static std::string color_name(ui::Color color);

private:
    static std::unordered_map<std::string, Theme> themes_;
    static void init_default_themes();
};

}  // namespace halo::config
