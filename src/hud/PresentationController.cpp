#include "hud/PresentationController.hpp"
#include "util/Logger.hpp"
#include <utility>

namespace halo::hud {

PresentationController::PresentationController(events::Scheduler& scheduler,
                                               events::EventBus& bus,
                                               model::HUDConfig config)
    : scheduler_(scheduler), bus_(bus) {
    state_.config = config;
}

PresentationController::~PresentationController() {
    cancel_auto_hide();
}

void PresentationController::show_loading(std::optional<std::string> message,
                                          bool allow_user_interaction,
                                          std::optional<Millis> auto_hide_after) {
    present(model::HUDVariant::Loading, std::move(message), allow_user_interaction);
    if (auto_hide_after) {
        schedule_hide(*auto_hide_after, nullptr);
    }
}

void PresentationController::show_success(std::optional<std::string> message,
                                          bool allow_user_interaction,
                                          Millis auto_hide_after,
                                          Callback on_dismiss) {
    present(model::HUDVariant::Success, std::move(message), allow_user_interaction);
    schedule_hide(auto_hide_after, std::move(on_dismiss));
}

void PresentationController::show_failure(std::optional<std::string> message,
                                          bool allow_user_interaction,
                                          Millis auto_hide_after,
                                          Callback on_dismiss) {
    present(model::HUDVariant::Failure, std::move(message), allow_user_interaction);
    schedule_hide(auto_hide_after, std::move(on_dismiss));
}

void PresentationController::hide(Callback on_dismiss) {
    if (!state_.is_presented) {
        halo::util::Logger::debug("PresentationController: hide() while hidden, ignoring");
        return;
    }

    cancel_auto_hide();
    state_.is_presented = false;
    ++state_.generation;

    halo::util::Logger::info("PresentationController: Hiding " +
        std::string(model::to_string(state_.variant)) + " HUD");

    bus_.publish({events::Event::Type::Dismissed, state_.variant, state_.generation});

    if (on_dismiss) {
        on_dismiss();
    }
}

void PresentationController::set_config(const model::HUDConfig& config) {
    state_.config = config;
}

void PresentationController::clear_trailing_content() {
    if (state_.is_presented) return;
    state_.message.reset();
}

void PresentationController::present(model::HUDVariant variant,
                                     std::optional<std::string> message,
                                     bool allow_user_interaction) {
    // A new presentation supersedes any pending auto-hide
    cancel_auto_hide();

    bool was_presented = state_.is_presented;

    state_.config.allow_user_interaction = allow_user_interaction;
    state_.variant = variant;
    state_.message = std::move(message);
    state_.is_presented = true;
    ++state_.generation;

    halo::util::Logger::info("PresentationController: Showing " +
        std::string(model::to_string(variant)) + " HUD" +
        (state_.message ? " \"" + *state_.message + "\"" : std::string()) +
        " (generation " + std::to_string(state_.generation) + ")");

    auto type = was_presented ? events::Event::Type::ContentChanged
                              : events::Event::Type::Presented;
    bus_.publish({type, variant, state_.generation});
}

void PresentationController::schedule_hide(Millis delay, Callback on_dismiss) {
    std::uint64_t generation = state_.generation;

    auto_hide_timer_ = scheduler_.schedule_after(delay,
        [this, generation, on_dismiss = std::move(on_dismiss)]() {
            if (state_.generation != generation || !state_.is_presented) {
                halo::util::Logger::debug("PresentationController: Stale auto-hide for generation " +
                    std::to_string(generation) + " suppressed");
                return;
            }
            auto_hide_timer_.reset();
            hide(on_dismiss);
        });
}

void PresentationController::cancel_auto_hide() {
    if (auto_hide_timer_) {
        scheduler_.cancel(*auto_hide_timer_);
        auto_hide_timer_.reset();
    }
}

}  // namespace halo::hud
