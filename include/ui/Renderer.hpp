#pragma once

#include "config/KeyMap.hpp"
#include "hud/HudContext.hpp"
#include "ui/Canvas.hpp"
#include "ui/widgets/DemoScreen.hpp"
#include "ui/widgets/HudOverlay.hpp"
#include <memory>
#include <string>

namespace halo::ui {

class Renderer {
public:
    Renderer(hud::HudContext& context, const config::KeyMap& keymap);
    ~Renderer();

    void render(bool force_redraw = false);
    void handle_input();
    void handle_input_event(const InputEvent& event);
    bool should_quit() const;

    // Frame state, also used by tests to render without a terminal
    model::Snapshot snapshot() const;

private:
    void dispatch(const std::string& action);

    // Canvas → Terminal rendering
    void flush_canvas();

    hud::HudContext& context_;
    const config::KeyMap& keymap_;
    bool should_quit_ = false;

    Canvas canvas_;
    Canvas prev_canvas_;  // For diffing (reduces flicker)
    int last_cols_ = 0;
    int last_rows_ = 0;

    std::unique_ptr<widgets::DemoScreen> demo_screen_;
    std::unique_ptr<widgets::HudOverlay> hud_overlay_;

    // Demo state shown on the DemoScreen
    std::string last_action_;
    int dismissed_count_ = 0;
    bool pass_through_ = false;
};

}  // namespace halo::ui
