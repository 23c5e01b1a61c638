#pragma once

#include "model/OverlayState.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace halo::model {

/**
 * Everything a frame is rendered from, captured once per render pass.
 */
struct Snapshot {
    OverlayState overlay;
    AnimationState animation;
    std::chrono::steady_clock::time_point now;
    std::string sequencer_phase;

    // Demo screen state
    std::string last_action;
    int dismissed_count = 0;
    bool pass_through = false;
};

}  // namespace halo::model
