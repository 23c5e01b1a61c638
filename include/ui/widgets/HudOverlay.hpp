#pragma once

#include "ui/Component.hpp"
#include <string>
#include <vector>

namespace halo::ui::widgets {

/**
 * Full-screen HUD layer: dims the screen behind it (mask) and draws the
 * status card, scaled and faded according to the frame's AnimationState.
 * Renders nothing once the hide sequence has finished.
 */
class HudOverlay : public Component {
public:
    static constexpr int INDICATOR_COLS = 6;
    static constexpr int INDICATOR_ROWS = 3;
    static constexpr int MIN_CARD_WIDTH = 16;

    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;

    // True when the overlay should swallow input instead of passing it on
    static bool blocks_input(const model::Snapshot& snap);

    // Unscaled card rectangle for the current message, centered in `screen`
    static LayoutRect card_rect(const LayoutRect& screen, const model::Snapshot& snap);

private:
    static std::vector<std::string> message_lines(const LayoutRect& screen, const model::Snapshot& snap);

    void render_mask(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap);
    void render_indicator(Canvas& canvas, int x, int y, const model::Snapshot& snap);
};

}  // namespace halo::ui::widgets
