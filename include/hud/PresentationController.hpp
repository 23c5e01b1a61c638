#pragma once

#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "model/OverlayState.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace halo::hud {

/**
 * Owns the OverlayState and is the only thing allowed to mutate it.
 *
 * Every show replaces whatever is on screen (last call wins). Transitions
 * are published on the EventBus; auto-hide delays run on the Scheduler and
 * are tied to the presentation generation they were armed for, so a timer
 * that outlives its presentation does nothing when it fires.
 *
 * All methods must be called on the thread that drives the Scheduler.
 */
class PresentationController {
public:
    using Callback = std::function<void()>;
    using Millis = std::chrono::milliseconds;

    static constexpr Millis kDefaultAutoHide{1000};

    PresentationController(events::Scheduler& scheduler,
                           events::EventBus& bus,
                           model::HUDConfig config = {});
    ~PresentationController();

    PresentationController(const PresentationController&) = delete;
    PresentationController& operator=(const PresentationController&) = delete;

    void show_loading(std::optional<std::string> message = std::nullopt,
                      bool allow_user_interaction = false,
                      std::optional<Millis> auto_hide_after = std::nullopt);

    void show_success(std::optional<std::string> message = std::nullopt,
                      bool allow_user_interaction = false,
                      Millis auto_hide_after = kDefaultAutoHide,
                      Callback on_dismiss = nullptr);

    void show_failure(std::optional<std::string> message = std::nullopt,
                      bool allow_user_interaction = false,
                      Millis auto_hide_after = kDefaultAutoHide,
                      Callback on_dismiss = nullptr);

    /**
     * Dismiss the HUD. No-op (and `on_dismiss` is not called) when nothing
     * is presented. Otherwise `on_dismiss` runs once, after the state flips.
     */
    void hide(Callback on_dismiss = nullptr);

    const model::OverlayState& state() const { return state_; }
    bool is_presented() const { return state_.is_presented; }
    bool has_pending_auto_hide() const { return auto_hide_timer_.has_value(); }

    // Replace colors and the default interaction flag
    void set_config(const model::HUDConfig& config);

    // Drop the message left over from the last presentation once the hide
    // animation is done; ignored while presented.
    void clear_trailing_content();

private:
    void present(model::HUDVariant variant, std::optional<std::string> message,
                 bool allow_user_interaction);
    void schedule_hide(Millis delay, Callback on_dismiss);
    void cancel_auto_hide();

    events::Scheduler& scheduler_;
    events::EventBus& bus_;
    model::OverlayState state_;
    std::optional<events::Scheduler::TimerId> auto_hide_timer_;
};

}  // namespace halo::hud
