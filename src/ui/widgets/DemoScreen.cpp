#include "ui/widgets/DemoScreen.hpp"
#include "ui/Formatting.hpp"
#include <cstdio>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace halo::ui::widgets {

namespace {
    constexpr int KEY_COLUMN = 10;
    constexpr int MIN_SPLIT_WIDTH = 60;

    const std::unordered_map<std::string, std::string> ACTION_LABELS = {
        {"show_loading", "Show loading"},
        {"show_loading_timed", "Show loading, hide after 3s"},
        {"show_success", "Show success"},
        {"show_failure", "Show failure"},
        {"hide", "Hide"},
        {"toggle_interaction", "Toggle pass-through"},
        {"quit", "Quit"},
    };

    std::string fixed(float value) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%.3f", value);
        return buf;
    }
}

DemoScreen::DemoScreen(const config::KeyMap& keymap) : keymap_(keymap) {}

void DemoScreen::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    if (rect.width >= MIN_SPLIT_WIDTH) {
        int left_width = rect.width / 2;
        render_help(canvas, {rect.x, rect.y, left_width, rect.height});
        render_status(canvas, {rect.x + left_width, rect.y, rect.width - left_width, rect.height}, snap);
    } else {
        int top_height = rect.height / 2;
        render_help(canvas, {rect.x, rect.y, rect.width, top_height});
        render_status(canvas, {rect.x, rect.y + top_height, rect.width, rect.height - top_height}, snap);
    }
}

void DemoScreen::render_help(Canvas& canvas, const LayoutRect& rect) {
    auto inner = draw_box_border(canvas, rect, "HALO");
    if (inner.width <= 0 || inner.height <= 0) return;

    Style heading_style{Color::BrightYellow, Color::Default, Attribute::Bold};
    Style key_style{Color::BrightCyan, Color::Default, Attribute::Bold};
    Style text_style{Color::White, Color::Default, Attribute::None};

    int y = inner.y;
    int bottom = inner.y + inner.height;
    canvas.draw_text(inner.x + 1, y++, trunc_pad("Keys:", inner.width - 1), heading_style);

    for (const auto& action : config::KeyMap::actions()) {
        if (y >= bottom) break;
        std::string key = keymap_.key_for(action);
        if (key.empty()) continue;

        auto label = ACTION_LABELS.find(action);
        canvas.draw_text(inner.x + 3, y, take_cols(key, KEY_COLUMN - 1), key_style);
        canvas.draw_text(inner.x + 3 + KEY_COLUMN, y,
                         take_cols(label != ACTION_LABELS.end() ? label->second : action,
                                   inner.width - 3 - KEY_COLUMN),
                         text_style);
        ++y;
    }
}

void DemoScreen::render_status(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    auto inner = draw_box_border(canvas, rect, "STATE");
    if (inner.width <= 0 || inner.height <= 0) return;

    Style label_style{Color::BrightBlack, Color::Default, Attribute::None};
    Style value_style{Color::BrightWhite, Color::Default, Attribute::None};

    const auto& overlay = snap.overlay;
    const auto& anim = snap.animation;

    std::vector<std::pair<std::string, std::string>> rows = {
        {"presented", overlay.is_presented ? "yes" : "no"},
        {"variant", model::to_string(overlay.variant)},
        {"message", overlay.message ? "\"" + *overlay.message + "\"" : "-"},
        {"input", overlay.config.allow_user_interaction ? "pass-through" : "blocked"},
        {"generation", std::to_string(overlay.generation)},
        {"phase", snap.sequencer_phase},
        {"scale", fixed(anim.card_scale)},
        {"opacity", fixed(anim.card_opacity)},
        {"mask", fixed(anim.mask_opacity)},
        {"stroke", fixed(anim.stroke_progress)},
        {"next show", snap.pass_through ? "pass-through" : "blocking"},
        {"dismissed", std::to_string(snap.dismissed_count)},
        {"last action", snap.last_action.empty() ? "-" : snap.last_action},
    };

    constexpr int LABEL_WIDTH = 13;
    int y = inner.y;
    for (const auto& [label, value] : rows) {
        if (y >= inner.y + inner.height) break;
        canvas.draw_text(inner.x + 1, y, trunc_pad(label, LABEL_WIDTH), label_style);
        canvas.draw_text(inner.x + 1 + LABEL_WIDTH, y, take_cols(value, inner.width - 1 - LABEL_WIDTH), value_style);
        ++y;
    }
}

}  // namespace halo::ui::widgets
