#pragma once

#include "model/OverlayState.hpp"
#include <filesystem>
#include <istream>
#include <string>
#include <unordered_map>

namespace halo::config {

struct Config {
    // [hud]
    std::string theme = "light";
    model::HUDConfig hud;   // theme colors with per-key overrides applied

    // [animation]
    int base_duration_ms = 300;
    int stroke_duration_ms = 600;

    // [keybinds] action -> key
    std::unordered_map<std::string, std::string> keybinds;
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static Config parse(std::istream& input);
    static void save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
    static Config create_default_config();
};

}  // namespace halo::config
