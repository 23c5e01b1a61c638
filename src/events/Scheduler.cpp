#include "events/Scheduler.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <utility>

namespace halo::events {

Scheduler::Scheduler() : now_(Clock::now()) {}

Scheduler::Scheduler(TimePoint start) : now_(start) {}

Scheduler::TimerId Scheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds{0};
    }
    // Saturate at the end of the clock's range instead of overflowing
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::max() - now_);
    if (delay > headroom) {
        delay = headroom;
    }
    TimerId id = next_id_++;
    tasks_.emplace(id, ScheduledTask{now_ + delay, std::move(task)});
    halo::util::Logger::debug("Scheduler: Scheduled timer " + std::to_string(id) +
        " in " + std::to_string(delay.count()) + "ms");
    return id;
}

bool Scheduler::cancel(TimerId id) {
    if (tasks_.erase(id) == 0) {
        return false;
    }
    halo::util::Logger::debug("Scheduler: Cancelled timer " + std::to_string(id));
    return true;
}

std::size_t Scheduler::process() {
    return process(Clock::now());
}

std::size_t Scheduler::process(TimePoint until) {
    until = std::max(until, now_);
    std::size_t fired = 0;

    while (true) {
        // Earliest due task; map order breaks ties by scheduling order
        auto next = tasks_.end();
        for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
            if (it->second.due > until) continue;
            if (next == tasks_.end() || it->second.due < next->second.due) {
                next = it;
            }
        }
        if (next == tasks_.end()) break;

        ScheduledTask task = std::move(next->second);
        tasks_.erase(next);

        now_ = std::max(now_, task.due);
        task.task();
        ++fired;
    }

    now_ = until;
    return fired;
}

std::optional<Scheduler::TimePoint> Scheduler::next_due() const {
    std::optional<TimePoint> earliest;
    for (const auto& [id, task] : tasks_) {
        if (!earliest || task.due < *earliest) {
            earliest = task.due;
        }
    }
    return earliest;
}

}  // namespace halo::events
