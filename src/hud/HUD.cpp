#include "hud/HUD.hpp"
#include "hud/HudContext.hpp"
#include <utility>

namespace halo {

void HUD::show_loading(std::optional<std::string> message,
                       bool allow_user_interaction,
                       std::optional<Millis> auto_hide_after) {
    hud::HudContext::shared().controller().show_loading(
        std::move(message), allow_user_interaction, auto_hide_after);
}

void HUD::show_success(std::optional<std::string> message,
                       bool allow_user_interaction,
                       Millis auto_hide_after,
                       Callback on_dismiss) {
    hud::HudContext::shared().controller().show_success(
        std::move(message), allow_user_interaction, auto_hide_after, std::move(on_dismiss));
}

void HUD::show_failure(std::optional<std::string> message,
                       bool allow_user_interaction,
                       Millis auto_hide_after,
                       Callback on_dismiss) {
    hud::HudContext::shared().controller().show_failure(
        std::move(message), allow_user_interaction, auto_hide_after, std::move(on_dismiss));
}

void HUD::hide(Callback on_dismiss) {
    hud::HudContext::shared().controller().hide(std::move(on_dismiss));
}

}  // namespace halo
