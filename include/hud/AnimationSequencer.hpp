#pragma once

#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "model/OverlayState.hpp"
#include "ui/Animation.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace halo::hud {

/**
 * Drives the HUD card's show/hide animation from presentation events.
 *
 *   Hidden -> Appearing -> Settled -> Disappearing -> Hidden
 *
 * Appearing: scale 0.001 -> 1.1 -> 0.9 -> 1.0 while mask and card fade in.
 * Disappearing: scale -> 0.9 -> 1.1 -> 0.1 while mask then card fade out.
 * Each phase is a Scheduler timer; the next phase is only started from the
 * previous phase's completion. Success/failure variants also run a linear
 * stroke-progress animation next to the appearing phases.
 */
class AnimationSequencer {
public:
    using Millis = std::chrono::milliseconds;

    enum class Phase {
        Hidden,
        Appearing,
        Settled,
        Disappearing,
    };

    struct Timing {
        Millis base{300};
        Millis stroke{600};

        Millis phase1() const { return Millis(base.count() * 2 / 3); }  // base / 1.5
        Millis phase2() const { return base / 2; }
        Millis phase3() const { return base / 2; }
        Millis sequence() const { return phase1() + phase2() + phase3(); }
    };

    AnimationSequencer(events::Scheduler& scheduler, events::EventBus& bus)
        : AnimationSequencer(scheduler, bus, Timing{}) {}
    AnimationSequencer(events::Scheduler& scheduler, events::EventBus& bus, Timing timing);
    ~AnimationSequencer();

    AnimationSequencer(const AnimationSequencer&) = delete;
    AnimationSequencer& operator=(const AnimationSequencer&) = delete;

    // Called after every completed hide sequence
    void set_on_hidden(std::function<void()> callback) { on_hidden_ = std::move(callback); }

    model::AnimationState sample(events::Scheduler::TimePoint now) const;
    model::AnimationState state() const { return sample(scheduler_.now()); }

    Phase phase() const { return phase_; }
    const Timing& timing() const { return timing_; }
    void set_timing(const Timing& timing) { timing_ = timing; }

private:
    void on_presented(const events::Event& event);
    void on_content_changed(const events::Event& event);
    void on_dismissed(const events::Event& event);

    void run_show_phase(int index);
    void run_hide_phase(int index);
    void finish_show();
    void finish_hide();

    void animate(ui::ValueAnimation& channel, float target, Millis duration, ui::EasingFunction easing);
    void hold(ui::ValueAnimation& channel, float value);
    void start_stroke(model::HUDVariant variant);
    void after(Millis delay, std::function<void()> step);
    void cancel_phase_timer();

    events::Scheduler& scheduler_;
    events::EventBus& bus_;
    Timing timing_;

    ui::ValueAnimation scale_;
    ui::ValueAnimation opacity_;
    ui::ValueAnimation mask_;
    ui::ValueAnimation stroke_;
    bool is_visible_ = false;

    Phase phase_ = Phase::Hidden;
    bool hide_requested_ = false;   // dismissed while still appearing
    std::uint64_t cycle_ = 0;
    std::optional<events::Scheduler::TimerId> phase_timer_;
    std::vector<events::EventBus::SubscriptionId> subscriptions_;
    std::function<void()> on_hidden_;
};

const char* to_string(AnimationSequencer::Phase phase);

}  // namespace halo::hud
