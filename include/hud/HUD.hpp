#pragma once

#include "hud/PresentationController.hpp"
#include <optional>
#include <string>

namespace halo {

/**
 * Static convenience API over HudContext::shared().
 *
 *   HUD::show_loading("Loading...");
 *   HUD::show_success("Done!");
 *   HUD::show_failure("Something went wrong");
 *   HUD::hide();
 *
 * The host still has to mount HudContext::shared() (tick it and render it).
 */
class HUD {
public:
    using Callback = hud::PresentationController::Callback;
    using Millis = hud::PresentationController::Millis;

    HUD() = delete;

    static void show_loading(std::optional<std::string> message = std::nullopt,
                             bool allow_user_interaction = false,
                             std::optional<Millis> auto_hide_after = std::nullopt);

    static void show_success(std::optional<std::string> message = std::nullopt,
                             bool allow_user_interaction = false,
                             Millis auto_hide_after = hud::PresentationController::kDefaultAutoHide,
                             Callback on_dismiss = nullptr);

    static void show_failure(std::optional<std::string> message = std::nullopt,
                             bool allow_user_interaction = false,
                             Millis auto_hide_after = hud::PresentationController::kDefaultAutoHide,
                             Callback on_dismiss = nullptr);

    static void hide(Callback on_dismiss = nullptr);
};

}  // namespace halo
