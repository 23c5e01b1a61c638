#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

namespace halo::ui {

namespace {
    constexpr int MIN_TERMINAL_COLS = 40;
    constexpr int MIN_TERMINAL_ROWS = 12;

    constexpr std::chrono::milliseconds TIMED_LOADING_HIDE{3000};
}

Renderer::Renderer(hud::HudContext& context, const config::KeyMap& keymap)
    : context_(context),
      keymap_(keymap),
      canvas_(1, 1),
      prev_canvas_(1, 1) {
    demo_screen_ = std::make_unique<widgets::DemoScreen>(keymap_);
    hud_overlay_ = std::make_unique<widgets::HudOverlay>();

    // Configured default for shows triggered from the keyboard
    pass_through_ = context_.overlay_state().config.allow_user_interaction;
}

Renderer::~Renderer() = default;

model::Snapshot Renderer::snapshot() const {
    model::Snapshot snap;
    snap.overlay = context_.overlay_state();
    snap.now = context_.scheduler().now();
    snap.animation = context_.sequencer().sample(snap.now);
    snap.sequencer_phase = hud::to_string(context_.sequencer().phase());
    snap.last_action = last_action_;
    snap.dismissed_count = dismissed_count_;
    snap.pass_through = pass_through_;
    return snap;
}

void Renderer::flush_canvas() {
    auto& terminal = Terminal::instance();

    // Only update changed cells
    std::string frame;
    for (int y = 0; y < canvas_.height(); ++y) {
        for (int x = 0; x < canvas_.width(); ++x) {
            const auto& cell = canvas_.at(x, y);
            const auto& prev = prev_canvas_.at(x, y);

            if (cell == prev) continue;

            frame += fmt::format("\033[{};{}H", y + 1, x + 1);
            frame += sgr_sequence(cell.style);
            frame += cell.content;
            frame += "\033[0m";
        }
    }

    if (!frame.empty()) {
        terminal.write_raw(frame);
    }

    prev_canvas_ = canvas_;
}

void Renderer::render(bool force_redraw) {
    auto& terminal = Terminal::instance();

    // Query size every frame for dynamic layout
    int cols = std::max(terminal.get_terminal_width(), MIN_TERMINAL_COLS);
    int rows = std::max(terminal.get_terminal_height(), MIN_TERMINAL_ROWS);

    if (cols != last_cols_ || rows != last_rows_ || force_redraw) {
        canvas_.resize(cols, rows);
        prev_canvas_.resize(cols, rows);
        terminal.clear_screen();
        last_cols_ = cols;
        last_rows_ = rows;
    }

    canvas_.clear();

    auto snap = snapshot();
    LayoutRect screen{0, 0, cols, rows};
    demo_screen_->render(canvas_, screen, snap);
    hud_overlay_->render(canvas_, screen, snap);

    flush_canvas();
}

void Renderer::handle_input() {
    auto& terminal = Terminal::instance();
    auto event = terminal.read_input();

    if (event.empty()) return;

    if (event.type == InputEvent::Type::Resize) {
        halo::util::Logger::debug("Renderer: Resize");
        render(true);
        return;
    }

    halo::util::Logger::debug("Renderer: Key=" + std::to_string(event.key) + " name=" + event.key_name);
    handle_input_event(event);
}

void Renderer::handle_input_event(const InputEvent& event) {
    if (event.type != InputEvent::Type::KeyPress) return;

    std::string action = keymap_.lookup_action(event.key_name);
    if (action.empty()) return;

    // A blocking HUD swallows everything but dismissal and quit
    if (widgets::HudOverlay::blocks_input(snapshot()) && action != "hide" && action != "quit") {
        halo::util::Logger::debug("Renderer: Input blocked by HUD: " + action);
        last_action_ = action + " (blocked)";
        return;
    }

    dispatch(action);
}

void Renderer::dispatch(const std::string& action) {
    auto& controller = context_.controller();
    last_action_ = action;

    auto on_dismiss = [this] { ++dismissed_count_; };

    if (action == "show_loading") {
        controller.show_loading("Loading...", pass_through_);
    } else if (action == "show_loading_timed") {
        controller.show_loading("Syncing", pass_through_, TIMED_LOADING_HIDE);
    } else if (action == "show_success") {
        controller.show_success("Saved", pass_through_,
                                hud::PresentationController::kDefaultAutoHide, on_dismiss);
    } else if (action == "show_failure") {
        controller.show_failure("Upload failed. Check your connection and try again.", pass_through_,
                                hud::PresentationController::kDefaultAutoHide, on_dismiss);
    } else if (action == "hide") {
        controller.hide(on_dismiss);
    } else if (action == "toggle_interaction") {
        pass_through_ = !pass_through_;
    } else if (action == "quit") {
        halo::util::Logger::info("Renderer: Quit requested");
        should_quit_ = true;
    }
}

bool Renderer::should_quit() const {
    return should_quit_;
}

}  // namespace halo::ui
