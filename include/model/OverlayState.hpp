#pragma once

#include "ui/Color.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace halo::model {

enum class HUDVariant {
    Loading,
    Success,
    Failure,
};

struct HUDConfig {
    ui::Color background_color = ui::Color::BrightWhite;
    ui::Color text_color = ui::Color::BrightBlack;
    ui::Color mask_color = ui::Color::Black;
    ui::Color accent_color = ui::Color::Yellow;   // spinner and checkmark
    ui::Color failure_color = ui::Color::Red;     // cross

    // When true, input passes through to the screen underneath
    bool allow_user_interaction = false;

    bool operator==(const HUDConfig&) const = default;
};

struct OverlayState {
    bool is_presented = false;
    HUDVariant variant = HUDVariant::Loading;
    std::optional<std::string> message;
    HUDConfig config;

    // Incremented by every show and every effective hide
    std::uint64_t generation = 0;
};

// Per-cycle values driven by the AnimationSequencer
struct AnimationState {
    float card_scale = 0.001f;
    float card_opacity = 0.0f;
    float mask_opacity = 0.0f;
    float stroke_progress = 0.0f;
    bool is_visible = false;
};

inline const char* to_string(HUDVariant variant) {
    switch (variant) {
        case HUDVariant::Loading: return "loading";
        case HUDVariant::Success: return "success";
        case HUDVariant::Failure: return "failure";
    }
    return "unknown";
}

}  // namespace halo::model
