#include "hud/AnimationSequencer.hpp"
#include "util/Logger.hpp"
#include <utility>

namespace halo::hud {

namespace {
    constexpr float HIDDEN_SCALE = 0.001f;
    constexpr float OVERSHOOT_SCALE = 1.1f;
    constexpr float UNDERSHOOT_SCALE = 0.9f;
    constexpr float RESTING_SCALE = 1.0f;
    constexpr float EXIT_SCALE = 0.1f;
}

AnimationSequencer::AnimationSequencer(events::Scheduler& scheduler, events::EventBus& bus, Timing timing)
    : scheduler_(scheduler),
      bus_(bus),
      timing_(timing),
      scale_(ui::ValueAnimation::hold(HIDDEN_SCALE, scheduler.now())),
      opacity_(ui::ValueAnimation::hold(0.0f, scheduler.now())),
      mask_(ui::ValueAnimation::hold(0.0f, scheduler.now())),
      stroke_(ui::ValueAnimation::hold(0.0f, scheduler.now())) {
    subscriptions_.push_back(bus_.subscribe(events::Event::Type::Presented,
        [this](const events::Event& e) { on_presented(e); }));
    subscriptions_.push_back(bus_.subscribe(events::Event::Type::ContentChanged,
        [this](const events::Event& e) { on_content_changed(e); }));
    subscriptions_.push_back(bus_.subscribe(events::Event::Type::Dismissed,
        [this](const events::Event& e) { on_dismissed(e); }));
}

AnimationSequencer::~AnimationSequencer() {
    cancel_phase_timer();
    for (auto id : subscriptions_) {
        bus_.unsubscribe(id);
    }
}

model::AnimationState AnimationSequencer::sample(events::Scheduler::TimePoint now) const {
    model::AnimationState s;
    s.card_scale = scale_.value_at(now);
    s.card_opacity = opacity_.value_at(now);
    s.mask_opacity = mask_.value_at(now);
    s.stroke_progress = stroke_.value_at(now);
    s.is_visible = is_visible_;
    return s;
}

void AnimationSequencer::on_presented(const events::Event& event) {
    if (phase_ == Phase::Appearing && hide_requested_) {
        // Shown again before the pending hide started; keep the card coming in
        hide_requested_ = false;
        start_stroke(event.variant);
        return;
    }

    if (phase_ == Phase::Disappearing) {
        halo::util::Logger::debug("AnimationSequencer: Presented during hide, restarting show sequence");
    }

    // Forced reset: whatever was in flight belongs to an older cycle
    cancel_phase_timer();
    ++cycle_;
    hide_requested_ = false;

    is_visible_ = true;
    hold(scale_, HIDDEN_SCALE);
    hold(opacity_, 0.0f);
    hold(mask_, 0.0f);
    start_stroke(event.variant);

    phase_ = Phase::Appearing;
    run_show_phase(1);
}

void AnimationSequencer::on_content_changed(const events::Event& event) {
    if (phase_ != Phase::Appearing && phase_ != Phase::Settled) return;
    start_stroke(event.variant);
}

void AnimationSequencer::on_dismissed(const events::Event&) {
    switch (phase_) {
        case Phase::Appearing:
            // The show sequence runs to completion; the hide follows it
            hide_requested_ = true;
            return;
        case Phase::Settled:
            phase_ = Phase::Disappearing;
            run_hide_phase(1);
            return;
        case Phase::Hidden:
        case Phase::Disappearing:
            return;
    }
}

void AnimationSequencer::run_show_phase(int index) {
    halo::util::Logger::debug("AnimationSequencer: Show phase " + std::to_string(index));

    switch (index) {
        case 1:
            animate(mask_, 1.0f, timing_.phase1(), ui::EasingFunction::EaseOut);
            animate(opacity_, 1.0f, timing_.phase1(), ui::EasingFunction::EaseOut);
            animate(scale_, OVERSHOOT_SCALE, timing_.phase1(), ui::EasingFunction::EaseOut);
            after(timing_.phase1(), [this] { run_show_phase(2); });
            break;
        case 2:
            animate(scale_, UNDERSHOOT_SCALE, timing_.phase2(), ui::EasingFunction::EaseInOut);
            after(timing_.phase2(), [this] { run_show_phase(3); });
            break;
        case 3:
            animate(scale_, RESTING_SCALE, timing_.phase3(), ui::EasingFunction::EaseInOut);
            after(timing_.phase3(), [this] { finish_show(); });
            break;
    }
}

void AnimationSequencer::finish_show() {
    phase_ = Phase::Settled;
    halo::util::Logger::debug("AnimationSequencer: Settled");

    if (hide_requested_) {
        hide_requested_ = false;
        phase_ = Phase::Disappearing;
        run_hide_phase(1);
    }
}

void AnimationSequencer::run_hide_phase(int index) {
    halo::util::Logger::debug("AnimationSequencer: Hide phase " + std::to_string(index));

    switch (index) {
        case 1:
            animate(mask_, 0.0f, timing_.phase1(), ui::EasingFunction::EaseInOut);
            animate(scale_, UNDERSHOOT_SCALE, timing_.phase1(), ui::EasingFunction::EaseInOut);
            after(timing_.phase1(), [this] { run_hide_phase(2); });
            break;
        case 2:
            animate(scale_, OVERSHOOT_SCALE, timing_.phase2(), ui::EasingFunction::EaseInOut);
            after(timing_.phase2(), [this] { run_hide_phase(3); });
            break;
        case 3:
            animate(opacity_, 0.0f, timing_.phase3(), ui::EasingFunction::EaseInOut);
            animate(scale_, EXIT_SCALE, timing_.phase3(), ui::EasingFunction::EaseInOut);
            after(timing_.phase3(), [this] { finish_hide(); });
            break;
    }
}

void AnimationSequencer::finish_hide() {
    is_visible_ = false;
    hold(scale_, HIDDEN_SCALE);
    hold(opacity_, 0.0f);
    hold(mask_, 0.0f);
    hold(stroke_, 0.0f);
    phase_ = Phase::Hidden;

    halo::util::Logger::debug("AnimationSequencer: Hidden");

    if (on_hidden_) {
        on_hidden_();
    }
}

void AnimationSequencer::animate(ui::ValueAnimation& channel, float target,
                                 Millis duration, ui::EasingFunction easing) {
    auto now = scheduler_.now();
    channel = ui::ValueAnimation(channel.value_at(now), target, now, duration, easing);
}

void AnimationSequencer::hold(ui::ValueAnimation& channel, float value) {
    channel = ui::ValueAnimation::hold(value, scheduler_.now());
}

void AnimationSequencer::start_stroke(model::HUDVariant variant) {
    if (variant == model::HUDVariant::Loading) {
        hold(stroke_, 0.0f);
        return;
    }
    stroke_ = ui::ValueAnimation(0.0f, 1.0f, scheduler_.now(), timing_.stroke, ui::EasingFunction::Linear);
}

void AnimationSequencer::after(Millis delay, std::function<void()> step) {
    std::uint64_t cycle = cycle_;
    phase_timer_ = scheduler_.schedule_after(delay, [this, cycle, step = std::move(step)]() {
        if (cycle != cycle_) return;
        phase_timer_.reset();
        step();
    });
}

void AnimationSequencer::cancel_phase_timer() {
    if (phase_timer_) {
        scheduler_.cancel(*phase_timer_);
        phase_timer_.reset();
    }
}

const char* to_string(AnimationSequencer::Phase phase) {
    switch (phase) {
        case AnimationSequencer::Phase::Hidden:       return "hidden";
        case AnimationSequencer::Phase::Appearing:    return "appearing";
        case AnimationSequencer::Phase::Settled:      return "settled";
        case AnimationSequencer::Phase::Disappearing: return "disappearing";
    }
    return "unknown";
}

}  // namespace halo::hud
