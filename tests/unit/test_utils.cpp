#include "../framework/SimpleTest.hpp"
#include "config/Config.hpp"
#include "config/KeyMap.hpp"
#include "config/Theme.hpp"
#include "ui/Color.hpp"
#include "ui/Formatting.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace halo;

// ============================================================================
// Config
// ============================================================================

TEST_CASE(test_config_defaults) {
    auto cfg = config::ConfigLoader::create_default_config();
    ASSERT_EQ(cfg.theme, "light");
    ASSERT_EQ(cfg.base_duration_ms, 300);
    ASSERT_EQ(cfg.stroke_duration_ms, 600);
    ASSERT_FALSE(cfg.hud.allow_user_interaction);
    ASSERT_TRUE(cfg.hud.background_color == ui::Color::BrightWhite);
    ASSERT_EQ(cfg.keybinds.size(), config::KeyMap::actions().size());
    ASSERT_EQ(cfg.keybinds.at("show_loading_timed"), "L");
    ASSERT_EQ(cfg.keybinds.at("quit"), config::KeyMap().key_for("quit"));
}

TEST_CASE(test_config_parse_sections) {
    std::istringstream input(
        "# comment\n"
        "[hud]\n"
        "theme = \"dark\"\n"
        "accent_color = \"bright-cyan\"\n"
        "allow_user_interaction = true\n"
        "\n"
        "[animation]\n"
        "base_duration_ms = 450\n"
        "stroke_duration_ms = 900\n"
        "\n"
        "[keybinds]\n"
        "hide = \"x\"\n");

    auto cfg = config::ConfigLoader::parse(input);
    ASSERT_EQ(cfg.theme, "dark");
    ASSERT_TRUE(cfg.hud.background_color == ui::Color::Black);
    ASSERT_TRUE(cfg.hud.accent_color == ui::Color::BrightCyan);
    ASSERT_TRUE(cfg.hud.allow_user_interaction);
    ASSERT_EQ(cfg.base_duration_ms, 450);
    ASSERT_EQ(cfg.stroke_duration_ms, 900);
    ASSERT_EQ(cfg.keybinds.at("hide"), "x");
}

TEST_CASE(test_config_color_override_wins_over_theme_in_any_order) {
    std::istringstream input(
        "[hud]\n"
        "text_color = \"red\"\n"
        "theme = \"terminal\"\n");

    auto cfg = config::ConfigLoader::parse(input);
    ASSERT_TRUE(cfg.hud.text_color == ui::Color::Red);
    ASSERT_TRUE(cfg.hud.background_color == ui::Color::Default);
}

TEST_CASE(test_config_invalid_values_keep_defaults) {
    std::istringstream input(
        "[hud]\n"
        "theme = \"neon\"\n"
        "mask_color = \"chartreuse\"\n"
        "allow_user_interaction = maybe\n"
        "this line is malformed\n"
        "[animation]\n"
        "base_duration_ms = -20\n"
        "stroke_duration_ms = fast\n");

    auto cfg = config::ConfigLoader::parse(input);
    ASSERT_EQ(cfg.theme, "light");
    ASSERT_TRUE(cfg.hud.mask_color == ui::Color::Black);
    ASSERT_FALSE(cfg.hud.allow_user_interaction);
    ASSERT_EQ(cfg.base_duration_ms, 300);
    ASSERT_EQ(cfg.stroke_duration_ms, 600);
}

TEST_CASE(test_config_missing_file_gives_defaults) {
    auto cfg = config::ConfigLoader::load_from_file("/nonexistent/halo/config.toml");
    ASSERT_EQ(cfg.theme, "light");
    ASSERT_EQ(cfg.base_duration_ms, 300);
}

TEST_CASE(test_config_save_then_load) {
    auto dir = std::filesystem::temp_directory_path() /
               ("halo_test_" + std::to_string(::getpid()));
    auto path = dir / "config.toml";

    auto cfg = config::ConfigLoader::create_default_config();
    cfg.theme = "dark";
    cfg.hud = config::ThemeManager::get_theme("dark").hud;
    cfg.hud.failure_color = ui::Color::Magenta;
    cfg.base_duration_ms = 240;
    cfg.keybinds["quit"] = "Q";
    config::ConfigLoader::save_config(cfg, path);

    ASSERT_TRUE(std::filesystem::exists(path));
    auto loaded = config::ConfigLoader::load_from_file(path);
    ASSERT_EQ(loaded.theme, "dark");
    ASSERT_TRUE(loaded.hud == cfg.hud);
    ASSERT_EQ(loaded.base_duration_ms, 240);
    ASSERT_EQ(loaded.keybinds.at("quit"), "Q");
    ASSERT_EQ(loaded.keybinds.size(), config::KeyMap::actions().size());
    ASSERT_EQ(loaded.keybinds.at("hide"), config::KeyMap().key_for("hide"));

    std::filesystem::remove_all(dir);
}

// ============================================================================
// Themes
// ============================================================================

TEST_CASE(test_theme_presets) {
    ASSERT_TRUE(config::ThemeManager::has_theme("light"));
    ASSERT_TRUE(config::ThemeManager::has_theme("Dark"));
    ASSERT_TRUE(config::ThemeManager::has_theme("terminal"));
    ASSERT_FALSE(config::ThemeManager::has_theme("neon"));

    auto fallback = config::ThemeManager::get_theme("neon");
    ASSERT_EQ(fallback.name, "light");
}

TEST_CASE(test_theme_register_custom) {
    config::Theme custom{"ocean", {}};
    custom.hud.background_color = ui::Color::Blue;
    config::ThemeManager::register_theme("ocean", custom);

    ASSERT_TRUE(config::ThemeManager::has_theme("ocean"));
    ASSERT_TRUE(config::ThemeManager::get_theme("ocean").hud.background_color == ui::Color::Blue);
}

TEST_CASE(test_parse_color_names) {
    ASSERT_TRUE(config::ThemeManager::parse_color("red") == ui::Color::Red);
    ASSERT_TRUE(config::ThemeManager::parse_color("Bright_White") == ui::Color::BrightWhite);
    ASSERT_TRUE(config::ThemeManager::parse_color("bright-black") == ui::Color::BrightBlack);
    ASSERT_FALSE(config::ThemeManager::parse_color("orange").has_value());
    ASSERT_EQ(config::ThemeManager::color_name(ui::Color::BrightYellow), "bright_yellow");
}

// ============================================================================
// KeyMap
// ============================================================================

TEST_CASE(test_keymap_defaults) {
    config::KeyMap keymap;
    ASSERT_EQ(keymap.lookup_action("l"), "show_loading");
    ASSERT_EQ(keymap.lookup_action("L"), "show_loading_timed");
    ASSERT_EQ(keymap.lookup_action("q"), "quit");
    ASSERT_EQ(keymap.lookup_action("z"), "");
    ASSERT_EQ(keymap.key_for("hide"), "h");
    ASSERT_EQ(config::KeyMap::actions().size(), 7u);
}

TEST_CASE(test_keymap_rebind_replaces_old_key) {
    config::KeyMap keymap;
    keymap.add_binding("hide", "x");
    ASSERT_EQ(keymap.lookup_action("x"), "hide");
    ASSERT_EQ(keymap.lookup_action("h"), "");
    ASSERT_EQ(keymap.key_for("hide"), "x");
}

// ============================================================================
// Text
// ============================================================================

TEST_CASE(test_wrap_text_at_spaces) {
    auto lines = util::wrap_text("hello world foo", 11);
    ASSERT_EQ(lines.size(), 2u);
    ASSERT_EQ(lines[0], "hello world");
    ASSERT_EQ(lines[1], "foo");
}

TEST_CASE(test_wrap_text_hard_newline) {
    auto lines = util::wrap_text("first\nsecond", 40);
    ASSERT_EQ(lines.size(), 2u);
    ASSERT_EQ(lines[0], "first");
    ASSERT_EQ(lines[1], "second");
}

TEST_CASE(test_wrap_text_splits_long_words) {
    auto lines = util::wrap_text("abcdefghij", 4);
    ASSERT_EQ(lines.size(), 3u);
    ASSERT_EQ(lines[0], "abcd");
    ASSERT_EQ(lines[2], "ij");
}

TEST_CASE(test_wrap_text_wide_characters) {
    // Each ideograph takes two columns
    auto lines = util::wrap_text("完成了完成了", 6);
    ASSERT_EQ(lines.size(), 2u);
    ASSERT_EQ(util::display_width(lines[0]), 6);
}

TEST_CASE(test_wrap_text_empty) {
    ASSERT_TRUE(util::wrap_text("", 10).empty());
    ASSERT_TRUE(util::wrap_text("text", 0).empty());
}

TEST_CASE(test_display_cols_skips_escapes) {
    ASSERT_EQ(ui::display_cols("abc"), 3);
    ASSERT_EQ(ui::display_cols("\x1B[31mabc\x1B[0m"), 3);
    ASSERT_EQ(ui::display_cols("完成"), 4);
}

TEST_CASE(test_trunc_pad) {
    ASSERT_EQ(ui::trunc_pad("ab", 4), "ab  ");
    ASSERT_EQ(ui::trunc_pad("abcd", 4), "abcd");
    ASSERT_EQ(ui::trunc_pad("abcdef", 4), "abc…");
    ASSERT_EQ(ui::trunc_pad("abc", 0), "");
}

TEST_CASE(test_take_cols_and_center) {
    ASSERT_EQ(ui::take_cols("abcdef", 3), "abc");
    ASSERT_EQ(ui::take_cols("完成", 3), "完");
    ASSERT_EQ(ui::center_offset("ab", 10), 4);
    ASSERT_EQ(ui::center_offset("too long", 4), 0);
}

TEST_CASE(test_sgr_sequences) {
    ASSERT_EQ(ui::sgr_code(ui::Color::Black, false), 30);
    ASSERT_EQ(ui::sgr_code(ui::Color::White, true), 47);
    ASSERT_EQ(ui::sgr_code(ui::Color::BrightBlack, false), 90);
    ASSERT_EQ(ui::sgr_code(ui::Color::BrightWhite, true), 107);

    ASSERT_EQ(ui::sgr_sequence(ui::Style{}), "");
    ui::Style style{ui::Color::Red, ui::Color::BrightWhite, ui::Attribute::Bold | ui::Attribute::Dim};
    ASSERT_EQ(ui::sgr_sequence(style), "\033[31m\033[107m\033[1m\033[2m");
}

// ============================================================================
// Logger
// ============================================================================

TEST_CASE(test_logger_level_filter) {
    ASSERT_TRUE(util::Logger::parse_level("debug") == util::Logger::Level::Debug);
    ASSERT_TRUE(util::Logger::parse_level("error") == util::Logger::Level::Error);
    ASSERT_TRUE(util::Logger::parse_level("loud") == util::Logger::Level::Info);

    auto path = std::filesystem::temp_directory_path() /
                ("halo_log_" + std::to_string(::getpid()) + ".log");
    util::Logger::init(path.string());
    util::Logger::set_level(util::Logger::Level::Warn);
    util::Logger::info("dropped line");
    util::Logger::warn("kept line");
    util::Logger::set_level(util::Logger::Level::Debug);

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ASSERT_TRUE(contents.find("kept line") != std::string::npos);
    ASSERT_TRUE(contents.find("[WARN]") != std::string::npos);
    ASSERT_TRUE(contents.find("dropped line") == std::string::npos);

    util::Logger::init();
    std::filesystem::remove(path);
}

int main() {
    return halo::test::TestRunner::instance().run_all();
}
