#include "config/Config.hpp"
#include "config/KeyMap.hpp"
#include "config/Theme.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

namespace halo::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

std::optional<bool> parse_bool(const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    return std::nullopt;
}

std::optional<int> parse_duration_ms(const std::string& value) {
    try {
        size_t used = 0;
        int ms = std::stoi(value, &used);
        if (used != value.size() || ms < 0) return std::nullopt;
        return ms;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void warn_invalid(const std::string& section, const std::string& key, const std::string& value) {
    halo::util::Logger::warn("Config: Ignoring invalid value for [" + section + "] " +
        key + " = \"" + value + "\"");
}

}  // namespace

Config ConfigLoader::load_config() {
    halo::util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }
    halo::util::Logger::info("Config: No config file at " + config_file.string() + ", using defaults");
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    halo::util::Logger::debug("Config: Loading from file " + path.string());

    std::ifstream file(path);
    if (!file) {
        halo::util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return create_default_config();
    }
    return parse(file);
}

Config ConfigLoader::parse(std::istream& input) {
    Config cfg = create_default_config();

    // Color keys override the theme no matter where they appear
    std::unordered_map<std::string, ui::Color> color_overrides;
    std::optional<bool> allow_user_interaction;

    std::string line, current_section;
    while (std::getline(input, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            halo::util::Logger::warn("Config: Skipping malformed line: " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "hud") {
            if (key == "theme") {
                if (ThemeManager::has_theme(value)) {
                    cfg.theme = value;
                } else {
                    warn_invalid(current_section, key, value);
                }
            } else if (key == "allow_user_interaction") {
                allow_user_interaction = parse_bool(value);
                if (!allow_user_interaction) warn_invalid(current_section, key, value);
            } else if (key == "background_color" || key == "text_color" || key == "mask_color" ||
                       key == "accent_color" || key == "failure_color") {
                if (auto color = ThemeManager::parse_color(value)) {
                    color_overrides[key] = *color;
                } else {
                    warn_invalid(current_section, key, value);
                }
            }
        }
        else if (current_section == "animation") {
            auto ms = parse_duration_ms(value);
            if (!ms) {
                warn_invalid(current_section, key, value);
            } else if (key == "base_duration_ms") {
                cfg.base_duration_ms = *ms;
            } else if (key == "stroke_duration_ms") {
                cfg.stroke_duration_ms = *ms;
            }
        }
        else if (current_section == "keybinds") {
            if (!value.empty()) {
                cfg.keybinds[key] = value;
            }
        }
    }

    cfg.hud = ThemeManager::get_theme(cfg.theme).hud;
    for (const auto& [key, color] : color_overrides) {
        if (key == "background_color") cfg.hud.background_color = color;
        else if (key == "text_color") cfg.hud.text_color = color;
        else if (key == "mask_color") cfg.hud.mask_color = color;
        else if (key == "accent_color") cfg.hud.accent_color = color;
        else if (key == "failure_color") cfg.hud.failure_color = color;
    }
    if (allow_user_interaction) {
        cfg.hud.allow_user_interaction = *allow_user_interaction;
    }

    return cfg;
}

void ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    halo::util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        halo::util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
        return;
    }

    std::ofstream file(path);
    if (!file) {
        halo::util::Logger::error("Config: Cannot write " + path.string());
        return;
    }

    file << "# HALO Config\n";
    file << "# Generated on first run; edit with care\n\n";

    file << "[hud]\n";
    file << "# Color preset: \"light\", \"dark\", \"terminal\"\n";
    file << "theme = \"" << cfg.theme << "\"\n\n";
    file << "# Per-color overrides (default, black, red, ..., bright_white)\n";
    file << "background_color = \"" << ThemeManager::color_name(cfg.hud.background_color) << "\"\n";
    file << "text_color = \"" << ThemeManager::color_name(cfg.hud.text_color) << "\"\n";
    file << "mask_color = \"" << ThemeManager::color_name(cfg.hud.mask_color) << "\"\n";
    file << "accent_color = \"" << ThemeManager::color_name(cfg.hud.accent_color) << "\"\n";
    file << "failure_color = \"" << ThemeManager::color_name(cfg.hud.failure_color) << "\"\n\n";
    file << "# Let input reach the screen underneath while a HUD is up\n";
    file << "allow_user_interaction = " << (cfg.hud.allow_user_interaction ? "true" : "false") << "\n\n";

    file << "[animation]\n";
    file << "# Show/hide sequence base duration; phases are base/1.5, base/2, base/2\n";
    file << "base_duration_ms = " << cfg.base_duration_ms << "\n\n";
    file << "# Checkmark / cross drawing time\n";
    file << "stroke_duration_ms = " << cfg.stroke_duration_ms << "\n\n";

    file << "[keybinds]\n";
    for (const auto& action : KeyMap::actions()) {
        auto it = cfg.keybinds.find(action);
        if (it != cfg.keybinds.end()) {
            file << action << " = \"" << it->second << "\"\n";
        }
    }
}

std::filesystem::path ConfigLoader::get_config_file() {
    return halo::util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.hud = ThemeManager::get_theme(cfg.theme).hud;

    KeyMap defaults;
    for (const auto& action : KeyMap::actions()) {
        std::string key = defaults.key_for(action);
        if (!key.empty()) {
            cfg.keybinds[action] = key;
        }
    }
    return cfg;
}

}  // namespace halo::config
