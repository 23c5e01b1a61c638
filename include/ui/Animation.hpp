#pragma once

#include <chrono>
#include <algorithm>

namespace halo::ui {

/**
 * Easing functions for smooth animations
 */
enum class EasingFunction {
    Linear,         // No easing, constant speed
    EaseOut,        // Starts fast, ends slow (deceleration)
    EaseInOut,      // Slow start and end, fast middle
    EaseOutCubic    // Smooth deceleration curve
};

/**
 * Time-based animation with easing.
 *
 * Progress is always evaluated against an explicit time point so that
 * callers driving a virtual clock (the Scheduler) get deterministic values.
 */
class Animation {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::milliseconds;

    Animation(TimePoint start, Duration duration, EasingFunction easing)
        : start_time_(start), duration_(duration), easing_(easing) {}

    /**
     * Get progress [0.0, 1.0] at `now` with easing applied
     * Returns 1.0 once the duration has elapsed
     */
    float progress_at(TimePoint now) const;

    bool is_complete_at(TimePoint now) const {
        return now - start_time_ >= duration_;
    }

    /**
     * Apply easing function to linear progress
     */
    static float apply_easing(float t, EasingFunction easing);

private:
    TimePoint start_time_;
    Duration duration_;
    EasingFunction easing_;
};

/**
 * Animates a single scalar from start to target value
 */
struct ValueAnimation {
    float start;
    float target;
    Animation animation;

    ValueAnimation(float from, float to, Animation::TimePoint begin,
                   Animation::Duration duration, EasingFunction easing)
        : start(from), target(to), animation(begin, duration, easing) {}

    /**
     * Interpolated value at `now`; settles on `target` after the duration
     */
    float value_at(Animation::TimePoint now) const {
        if (animation.is_complete_at(now)) {
            return target;
        }
        return lerp(start, target, animation.progress_at(now));
    }

    /**
     * A value that holds still at `value`
     */
    static ValueAnimation hold(float value, Animation::TimePoint at) {
        return ValueAnimation(value, value, at, Animation::Duration{0}, EasingFunction::Linear);
    }

private:
    static float lerp(float a, float b, float t) {
        return a + (b - a) * t;
    }
};

}  // namespace halo::ui
