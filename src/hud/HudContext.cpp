#include "hud/HudContext.hpp"
#include "util/Logger.hpp"

namespace halo::hud {

HudContext::HudContext()
    : controller_(scheduler_, bus_),
      sequencer_(scheduler_, bus_) {
    wire();
}

HudContext::HudContext(events::Scheduler::TimePoint start,
                       model::HUDConfig config,
                       AnimationSequencer::Timing timing)
    : scheduler_(start),
      controller_(scheduler_, bus_, config),
      sequencer_(scheduler_, bus_, timing) {
    wire();
}

HudContext& HudContext::shared() {
    static HudContext instance;
    return instance;
}

void HudContext::wire() {
    sequencer_.set_on_hidden([this] { controller_.clear_trailing_content(); });
    halo::util::Logger::debug("HudContext: Overlay context ready");
}

}  // namespace halo::hud
