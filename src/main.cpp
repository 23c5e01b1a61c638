#include "config/Config.hpp"
#include "config/KeyMap.hpp"
#include "hud/HudContext.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <poll.h>
#include <unistd.h>

static std::atomic<bool> g_shutdown{false};

// Signal handler for graceful shutdown (Ctrl+C, kill, etc.)
static void signal_handler(int signum) {
    g_shutdown.store(true);

    // Restore terminal immediately on signal
    auto& terminal = halo::ui::Terminal::instance();
    if (terminal.is_initialized()) {
        terminal.shutdown();
    }

    std::exit(signum == SIGINT ? 0 : signum);
}

static halo::config::KeyMap build_keymap(const halo::config::Config& config) {
    halo::config::KeyMap keymap;
    const auto& actions = halo::config::KeyMap::actions();
    for (const auto& [action, key] : config.keybinds) {
        if (std::find(actions.begin(), actions.end(), action) == actions.end()) {
            halo::util::Logger::warn("Config: Unknown keybind action: " + action);
            continue;
        }
        keymap.add_binding(action, key);
    }
    return keymap;
}

int main() {
    try {
        halo::util::Logger::init();
        if (const char* level = std::getenv("HALO_LOG_LEVEL")) {
            halo::util::Logger::set_level(halo::util::Logger::parse_level(level));
        } else {
            halo::util::Logger::set_level(halo::util::Logger::Level::Info);
        }
        halo::util::Logger::info("HALO demo starting...");

        auto config_file = halo::config::ConfigLoader::get_config_file();
        bool first_run = !std::filesystem::exists(config_file);
        auto config = halo::config::ConfigLoader::load_config();
        if (first_run) {
            halo::config::ConfigLoader::save_config(config, config_file);
        }
        halo::util::Logger::info("Configuration loaded (theme: " + config.theme + ")");

        auto keymap = build_keymap(config);

        // The demo mounts the shared context so HUD:: calls land on screen too
        auto& context = halo::hud::HudContext::shared();
        context.controller().set_config(config.hud);
        context.sequencer().set_timing({
            std::chrono::milliseconds(config.base_duration_ms),
            std::chrono::milliseconds(config.stroke_duration_ms),
        });

        auto& terminal = halo::ui::Terminal::instance();
        terminal.init();

        // Install signal handlers after terminal init
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        halo::ui::Renderer renderer(context, keymap);
        renderer.render();

        while (!renderer.should_quit() && !g_shutdown.load()) {
            // Run due animation phases and auto-hides against the wall clock
            context.tick();
            renderer.render();

            struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
            int ret = poll(&pfd, 1, 33); // ~30fps while animating

            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                halo::util::Logger::error("Poll failed: errno=" + std::to_string(errno));
                break;
            }

            if (ret > 0 && (pfd.revents & POLLIN)) {
                // Bring the scheduler clock up to date so shows are anchored to the key press
                context.tick();
                renderer.handle_input();
            }
        }

        terminal.shutdown();
        halo::util::Logger::info("HALO demo shutdown");
        return 0;
    } catch (const std::exception& e) {
        // Restore terminal even on exception
        auto& terminal = halo::ui::Terminal::instance();
        terminal.shutdown();
        halo::util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
