#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

namespace halo::events {

/**
 * Single-threaded one-shot timer queue.
 *
 * The scheduler owns the notion of "now" for everything that runs on it.
 * process() advances that time and fires every due task in due-time order
 * (ties in scheduling order). While a task runs, now() reports the task's
 * due time, so work it schedules is anchored to the exact boundary rather
 * than to whenever the event loop happened to wake up.
 */
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;

    Scheduler();
    explicit Scheduler(TimePoint start);

    TimerId schedule_after(std::chrono::milliseconds delay, Task task);
    bool cancel(TimerId id);

    // Fire everything due up to the wall clock / up to `until`.
    // Returns the number of tasks run.
    std::size_t process();
    std::size_t process(TimePoint until);

    TimePoint now() const { return now_; }
    bool is_pending(TimerId id) const { return tasks_.count(id) != 0; }
    std::size_t pending() const { return tasks_.size(); }
    std::optional<TimePoint> next_due() const;

private:
    struct ScheduledTask {
        TimePoint due;
        Task task;
    };

    // Keyed by id; ids increase monotonically so map order is scheduling order
    std::map<TimerId, ScheduledTask> tasks_;
    TimePoint now_;
    TimerId next_id_ = 1;
};

}  // namespace halo::events
