// SandCastle Core
// scheduler.hpp - Delayed callbacks driven by simulation time

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sandcastle::core {

using TaskId = uint64_t;
inline constexpr TaskId INVALID_TASK = 0;

// Callbacks run on the simulation thread from advance(). Time only moves when the
// owner advances it, so a paused game never fires anything.
class Scheduler {
public:
    using Task = std::function<void()>;

    Scheduler() = default;

    // Non-copyable (tasks capture owner state), movable
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) noexcept = default;
    Scheduler& operator=(Scheduler&&) noexcept = default;

    // Run `task` once `delay_seconds` of simulation time have elapsed
    TaskId schedule(double delay_seconds, Task task, std::string label = {});
    bool cancel(TaskId id);
    void clear();

    // Advance the clock and run every task that became due, earliest first.
    // Tasks scheduled from inside a callback are eligible in the same call.
    // Returns the number of tasks executed.
    size_t advance(double delta_seconds);

    [[nodiscard]] double now() const { return now_; }
    [[nodiscard]] size_t pending_count() const { return entries_.size(); }
    [[nodiscard]] bool is_pending(TaskId id) const;

private:
    struct Entry {
        TaskId id = INVALID_TASK;
        double due = 0.0;
        Task task;
        std::string label;
    };

    std::vector<Entry> entries_;  // Sorted by (due, id)
    TaskId next_id_ = 1;
    double now_ = 0.0;
};

}  // namespace sandcastle::core
