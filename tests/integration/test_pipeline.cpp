#include "../framework/SimpleTest.hpp"
#include "config/KeyMap.hpp"
#include "hud/HudContext.hpp"
#include "ui/Canvas.hpp"
#include "ui/Renderer.hpp"
#include "ui/widgets/DemoScreen.hpp"
#include "ui/widgets/HudOverlay.hpp"
#include <chrono>
#include <string>

using namespace halo;
using namespace std::chrono_literals;

namespace {

const auto T0 = std::chrono::steady_clock::time_point{} + 1h;
constexpr int COLS = 80;
constexpr int ROWS = 24;

model::Snapshot snapshot_of(hud::HudContext& ctx) {
    model::Snapshot snap;
    snap.overlay = ctx.overlay_state();
    snap.now = ctx.scheduler().now();
    snap.animation = ctx.animation_state();
    snap.sequencer_phase = hud::to_string(ctx.sequencer().phase());
    return snap;
}

ui::Canvas render_overlay(hud::HudContext& ctx) {
    ui::Canvas canvas(COLS, ROWS);
    ui::widgets::HudOverlay overlay;
    overlay.render(canvas, {0, 0, COLS, ROWS}, snapshot_of(ctx));
    return canvas;
}

std::string row_text(const ui::Canvas& canvas, int y) {
    std::string out;
    for (int x = 0; x < canvas.width(); ++x) {
        out += canvas.at(x, y).content;
    }
    return out;
}

bool canvas_contains(const ui::Canvas& canvas, const std::string& text) {
    for (int y = 0; y < canvas.height(); ++y) {
        if (row_text(canvas, y).find(text) != std::string::npos) return true;
    }
    return false;
}

// U+2801..U+28FF: braille with at least one dot raised
int count_braille_cells(const ui::Canvas& canvas) {
    int count = 0;
    for (int y = 0; y < canvas.height(); ++y) {
        for (int x = 0; x < canvas.width(); ++x) {
            const auto& c = canvas.at(x, y).content;
            if (c.size() == 3 && static_cast<unsigned char>(c[0]) == 0xE2 &&
                (static_cast<unsigned char>(c[1]) & 0xFC) == 0xA0 && c != "⠀") {
                ++count;
            }
        }
    }
    return count;
}

}  // namespace

TEST_CASE(test_overlay_draws_nothing_when_hidden) {
    hud::HudContext ctx(T0);
    auto canvas = render_overlay(ctx);

    ui::Cell blank;
    for (int y = 0; y < ROWS; ++y) {
        for (int x = 0; x < COLS; ++x) {
            ASSERT_TRUE(canvas.at(x, y) == blank);
        }
    }
}

TEST_CASE(test_overlay_settled_card_and_message) {
    hud::HudContext ctx(T0);
    ctx.controller().show_loading("Loading");
    ctx.tick(T0 + 1s);

    auto snap = snapshot_of(ctx);
    auto card = ui::widgets::HudOverlay::card_rect({0, 0, COLS, ROWS}, snap);
    auto canvas = render_overlay(ctx);

    ASSERT_EQ(canvas.at(card.x, card.y).content, "╭");
    ASSERT_EQ(canvas.at(card.x + card.width - 1, card.y + card.height - 1).content, "╯");
    ASSERT_TRUE(canvas_contains(canvas, "Loading"));

    // Mask dims the screen around the card
    const auto& corner = canvas.at(0, 0).style;
    ASSERT_TRUE(ui::has_attribute(corner.attr, ui::Attribute::Dim));
    ASSERT_TRUE(corner.bg == snap.overlay.config.mask_color);

    // Card interior uses the configured card colors
    const auto& inside = canvas.at(card.x + 1, card.y + 1).style;
    ASSERT_TRUE(inside.bg == snap.overlay.config.background_color);
}

TEST_CASE(test_overlay_long_message_wraps_inside_card) {
    hud::HudContext ctx(T0);
    ctx.controller().show_failure("The upload failed because the server did not answer in time", false, 5000ms);
    ctx.tick(T0 + 1s);

    auto snap = snapshot_of(ctx);
    auto card = ui::widgets::HudOverlay::card_rect({0, 0, COLS, ROWS}, snap);
    ASSERT_TRUE(card.width <= COLS * 2 / 5);
    ASSERT_TRUE(card.height > 2 + 2 + ui::widgets::HudOverlay::INDICATOR_ROWS + 2);

    auto canvas = render_overlay(ctx);
    ASSERT_TRUE(canvas_contains(canvas, "upload"));
}

TEST_CASE(test_overlay_stroke_follows_progress) {
    hud::HudContext ctx(T0);
    ctx.controller().show_success("Saved", false, 5000ms);

    // Stroke has not started drawing yet
    ctx.tick(T0);
    ASSERT_EQ(count_braille_cells(render_overlay(ctx)), 0);

    ctx.tick(T0 + 1s);
    ASSERT_TRUE(ctx.animation_state().stroke_progress >= 1.0f);
    ASSERT_TRUE(count_braille_cells(render_overlay(ctx)) > 0);
}

TEST_CASE(test_overlay_gone_after_hide_sequence) {
    hud::HudContext ctx(T0);
    ctx.controller().show_failure("Nope", false, 1000ms);
    ctx.tick(T0 + 1200ms);

    // Still fading out
    ASSERT_TRUE(ctx.animation_state().is_visible);

    ctx.tick(T0 + 2s);
    auto canvas = render_overlay(ctx);
    ASSERT_FALSE(canvas_contains(canvas, "Nope"));
    ASSERT_FALSE(ui::has_attribute(canvas.at(0, 0).style.attr, ui::Attribute::Dim));
}

TEST_CASE(test_blocks_input_follows_interaction_flag) {
    hud::HudContext ctx(T0);
    ASSERT_FALSE(ui::widgets::HudOverlay::blocks_input(snapshot_of(ctx)));

    ctx.controller().show_loading("Wait", false);
    ASSERT_TRUE(ui::widgets::HudOverlay::blocks_input(snapshot_of(ctx)));

    ctx.controller().show_loading("Wait", true);
    ASSERT_FALSE(ui::widgets::HudOverlay::blocks_input(snapshot_of(ctx)));
}

TEST_CASE(test_renderer_blocking_hud_only_lets_hide_through) {
    hud::HudContext ctx(T0);
    config::KeyMap keymap;
    ui::Renderer renderer(ctx, keymap);

    renderer.handle_input_event({ui::InputEvent::Type::KeyPress, 'l', "l"});
    ASSERT_TRUE(ctx.controller().is_presented());

    renderer.handle_input_event({ui::InputEvent::Type::KeyPress, 's', "s"});
    ASSERT_TRUE(ctx.overlay_state().variant == model::HUDVariant::Loading);
    ASSERT_EQ(renderer.snapshot().last_action, "show_success (blocked)");

    renderer.handle_input_event({ui::InputEvent::Type::KeyPress, 'h', "h"});
    ASSERT_FALSE(ctx.controller().is_presented());
    ASSERT_EQ(renderer.snapshot().dismissed_count, 1);
    ASSERT_FALSE(renderer.should_quit());

    renderer.handle_input_event({ui::InputEvent::Type::KeyPress, 'q', "q"});
    ASSERT_TRUE(renderer.should_quit());
}

TEST_CASE(test_renderer_pass_through_shows_accept_input) {
    hud::HudContext ctx(T0);
    config::KeyMap keymap;
    ui::Renderer renderer(ctx, keymap);

    renderer.handle_input_event({ui::InputEvent::Type::KeyPress, 'i', "i"});
    ASSERT_TRUE(renderer.snapshot().pass_through);

    renderer.handle_input_event({ui::InputEvent::Type::KeyPress, 'l', "l"});
    ASSERT_TRUE(ctx.overlay_state().config.allow_user_interaction);

    renderer.handle_input_event({ui::InputEvent::Type::KeyPress, 's', "s"});
    ASSERT_TRUE(ctx.overlay_state().variant == model::HUDVariant::Success);

    ctx.tick(T0 + 2s);
    ASSERT_FALSE(ctx.controller().is_presented());
    ASSERT_EQ(renderer.snapshot().dismissed_count, 1);
}

TEST_CASE(test_renderer_timed_loading_hides_itself) {
    hud::HudContext ctx(T0);
    config::KeyMap keymap;
    ui::Renderer renderer(ctx, keymap);

    renderer.handle_input_event({ui::InputEvent::Type::KeyPress, 'L', "L"});
    ctx.tick(T0 + 2999ms);
    ASSERT_TRUE(ctx.controller().is_presented());
    ctx.tick(T0 + 3s);
    ASSERT_FALSE(ctx.controller().is_presented());
}

TEST_CASE(test_renderer_key_press_after_tick_anchors_to_current_time) {
    hud::HudContext ctx(T0);
    config::KeyMap keymap;
    ui::Renderer renderer(ctx, keymap);

    // The demo loop ticks to the key press time before dispatching
    ctx.tick(T0 + 500ms);
    renderer.handle_input_event({ui::InputEvent::Type::KeyPress, 'L', "L"});
    ctx.tick(T0 + 3499ms);
    ASSERT_TRUE(ctx.controller().is_presented());
    ctx.tick(T0 + 3500ms);
    ASSERT_FALSE(ctx.controller().is_presented());
}

TEST_CASE(test_demo_screen_lists_keys_and_state) {
    hud::HudContext ctx(T0);
    config::KeyMap keymap;
    keymap.add_binding("hide", "x");

    ui::Canvas canvas(COLS, ROWS);
    ui::widgets::DemoScreen screen(keymap);
    auto snap = snapshot_of(ctx);
    snap.last_action = "show_failure";
    screen.render(canvas, {0, 0, COLS, ROWS}, snap);

    ASSERT_TRUE(canvas_contains(canvas, " HALO "));
    ASSERT_TRUE(canvas_contains(canvas, "Toggle pass-through"));
    ASSERT_TRUE(canvas_contains(canvas, "x"));
    ASSERT_TRUE(canvas_contains(canvas, "show_failure"));
    ASSERT_TRUE(canvas_contains(canvas, "hidden"));
}

int main() {
    return halo::test::TestRunner::instance().run_all();
}
