#pragma once

#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "hud/AnimationSequencer.hpp"
#include "hud/PresentationController.hpp"
#include "model/OverlayState.hpp"

namespace halo::hud {

/**
 * Everything one mounted HUD overlay needs, with a single owner.
 *
 * The host that mounts the overlay constructs a context, pumps
 * scheduler().process() from its event loop and renders from
 * overlay_state() / animation_state(). shared() is a process-wide default
 * used by the HUD facade; nothing requires it.
 */
class HudContext {
public:
    HudContext();
    explicit HudContext(events::Scheduler::TimePoint start,
                        model::HUDConfig config = {},
                        AnimationSequencer::Timing timing = {});

    HudContext(const HudContext&) = delete;
    HudContext& operator=(const HudContext&) = delete;

    static HudContext& shared();

    events::Scheduler& scheduler() { return scheduler_; }
    events::EventBus& bus() { return bus_; }
    PresentationController& controller() { return controller_; }
    AnimationSequencer& sequencer() { return sequencer_; }

    const model::OverlayState& overlay_state() const { return controller_.state(); }
    model::AnimationState animation_state() const { return sequencer_.state(); }

    // Advance time and run every due phase / auto-hide
    std::size_t tick() { return scheduler_.process(); }
    std::size_t tick(events::Scheduler::TimePoint now) { return scheduler_.process(now); }

private:
    void wire();

    // Declaration order is destruction order in reverse: the sequencer and
    // controller go first while the bus and scheduler they reference remain.
    events::Scheduler scheduler_;
    events::EventBus bus_;
    PresentationController controller_;
    AnimationSequencer sequencer_;
};

}  // namespace halo::hud
