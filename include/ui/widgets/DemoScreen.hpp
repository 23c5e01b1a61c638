#pragma once

#include "ui/Component.hpp"
#include "config/KeyMap.hpp"

namespace halo::ui::widgets {

/**
 * Backdrop the HUD is mounted over: key help on the left, live overlay
 * and sequencer state on the right.
 */
class DemoScreen : public Component {
public:
    explicit DemoScreen(const config::KeyMap& keymap);

    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;

private:
    void render_help(Canvas& canvas, const LayoutRect& rect);
    void render_status(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap);

    const config::KeyMap& keymap_;
};

}  // namespace halo::ui::widgets
