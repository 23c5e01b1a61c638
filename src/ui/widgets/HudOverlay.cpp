#include "ui/widgets/HudOverlay.hpp"
#include "ui/Formatting.hpp"
#include "ui/ShapePath.hpp"
#include "ui/VisualBlocks.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace halo::ui::widgets {

namespace {
    constexpr int PADDING_X = 2;
    constexpr int PADDING_Y = 1;
    constexpr int MESSAGE_GAP = 1;
    constexpr int SPINNER_FRAME_MS = 80;

    // Below these the card is too small or too faint to carry content
    constexpr float MIN_CONTENT_SCALE = 0.5f;
    constexpr float MIN_CARD_OPACITY = 0.05f;
    constexpr float FAINT_OPACITY = 0.5f;
}

bool HudOverlay::blocks_input(const model::Snapshot& snap) {
    return snap.animation.is_visible && !snap.overlay.config.allow_user_interaction;
}

std::vector<std::string> HudOverlay::message_lines(const LayoutRect& screen, const model::Snapshot& snap) {
    if (!snap.overlay.message || snap.overlay.message->empty()) {
        return {};
    }
    // Card is at most 2/5 of the screen wide
    int max_card_width = std::max(MIN_CARD_WIDTH, screen.width * 2 / 5);
    int text_width = max_card_width - 2 - 2 * PADDING_X;
    return halo::util::wrap_text(*snap.overlay.message, text_width);
}

LayoutRect HudOverlay::card_rect(const LayoutRect& screen, const model::Snapshot& snap) {
    auto lines = message_lines(screen, snap);

    int content_width = INDICATOR_COLS;
    for (const auto& line : lines) {
        content_width = std::max(content_width, display_cols(line));
    }

    int width = std::max(MIN_CARD_WIDTH, content_width + 2 + 2 * PADDING_X);
    int height = 2 + 2 * PADDING_Y + INDICATOR_ROWS;
    if (!lines.empty()) {
        height += MESSAGE_GAP + static_cast<int>(lines.size());
    }

    width = std::min(width, screen.width);
    height = std::min(height, screen.height);
    return screen.centered(width, height);
}

void HudOverlay::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    const auto& anim = snap.animation;
    if (!anim.is_visible) return;

    render_mask(canvas, rect, snap);

    if (anim.card_opacity <= MIN_CARD_OPACITY) return;

    LayoutRect natural = card_rect(rect, snap);
    float scale = std::max(0.0f, anim.card_scale);
    int width = std::min(rect.width, static_cast<int>(std::lround(natural.width * scale)));
    int height = std::min(rect.height, static_cast<int>(std::lround(natural.height * scale)));
    if (width < 2 || height < 2) return;

    LayoutRect card = rect.centered(width, height);

    const auto& config = snap.overlay.config;
    Style card_style{config.text_color, config.background_color,
                     anim.card_opacity < FAINT_OPACITY ? Attribute::Dim : Attribute::None};

    canvas.fill_rect(card.x, card.y, card.width, card.height, Cell{" ", card_style});
    LayoutRect inner = draw_box_border(canvas, card, "", card_style, true);

    if (scale < MIN_CONTENT_SCALE || inner.width <= 0 || inner.height <= 0) return;

    auto lines = message_lines(rect, snap);
    int content_height = INDICATOR_ROWS;
    if (!lines.empty()) {
        content_height += MESSAGE_GAP + static_cast<int>(lines.size());
    }

    int y = inner.y + std::max(0, (inner.height - content_height) / 2);
    int inner_bottom = inner.y + inner.height;

    if (y + INDICATOR_ROWS <= inner_bottom && inner.width >= INDICATOR_COLS) {
        render_indicator(canvas, inner.x + (inner.width - INDICATOR_COLS) / 2, y, snap);
    }
    y += INDICATOR_ROWS + MESSAGE_GAP;

    for (const auto& line : lines) {
        if (y >= inner_bottom) break;
        std::string visible = take_cols(line, inner.width);
        canvas.draw_text(inner.x + center_offset(visible, inner.width), y, visible, card_style);
        ++y;
    }
}

void HudOverlay::render_mask(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    float mask = snap.animation.mask_opacity;
    if (mask <= 0.0f) return;

    // A terminal cannot blend; dim everything, and paint the mask color once
    // the mask is mostly opaque
    Color bg = mask >= 0.5f ? snap.overlay.config.mask_color : Color::Default;
    canvas.tint_rect(rect.x, rect.y, rect.width, rect.height, bg, Attribute::Dim);
}

void HudOverlay::render_indicator(Canvas& canvas, int x, int y, const model::Snapshot& snap) {
    const auto& config = snap.overlay.config;

    switch (snap.overlay.variant) {
        case model::HUDVariant::Loading: {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                snap.now.time_since_epoch()).count();
            int frame = static_cast<int>((ms / SPINNER_FRAME_MS) % blocks::SPINNER_FRAMES);
            canvas.put(x + INDICATOR_COLS / 2, y + INDICATOR_ROWS / 2, blocks::spinner_frame(frame),
                       Style{config.accent_color, config.background_color, Attribute::Bold});
            break;
        }
        case model::HUDVariant::Success:
        case model::HUDVariant::Failure: {
            bool success = snap.overlay.variant == model::HUDVariant::Success;
            blocks::BrailleRaster raster(INDICATOR_COLS, INDICATOR_ROWS);
            raster.draw_path(shape_path(success ? ShapeKind::Checkmark : ShapeKind::Cross,
                                        raster.bounds(), snap.animation.stroke_progress));
            raster.render(canvas, x, y,
                          Style{success ? config.accent_color : config.failure_color,
                                config.background_color, Attribute::Bold});
            break;
        }
    }
}

}  // namespace halo::ui::widgets
