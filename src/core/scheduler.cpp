// SandCastle Core
// scheduler.cpp - Delayed callback scheduler implementation

#include <algorithm>
#include <sandcastle/core/logger.hpp>
#include <sandcastle/core/scheduler.hpp>

namespace sandcastle::core {

TaskId Scheduler::schedule(double delay_seconds, Task task, std::string label) {
    if (!task) {
        return INVALID_TASK;
    }

    Entry entry;
    entry.id = next_id_++;
    entry.due = now_ + std::max(0.0, delay_seconds);
    entry.task = std::move(task);
    entry.label = std::move(label);

    // Stable insert: equal due times keep scheduling order
    auto it = std::upper_bound(entries_.begin(), entries_.end(), entry.due,
                               [](double due, const Entry& e) { return due < e.due; });
    TaskId id = entry.id;
    entries_.insert(it, std::move(entry));
    return id;
}

bool Scheduler::cancel(TaskId id) {
    auto it = std::find_if(entries_.begin(), entries_.end(), [id](const Entry& e) { return e.id == id; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

void Scheduler::clear() {
    entries_.clear();
}

bool Scheduler::is_pending(TaskId id) const {
    return std::any_of(entries_.begin(), entries_.end(), [id](const Entry& e) { return e.id == id; });
}

size_t Scheduler::advance(double delta_seconds) {
    now_ += std::max(0.0, delta_seconds);

    size_t executed = 0;
    while (!entries_.empty() && entries_.front().due <= now_) {
        Entry entry = std::move(entries_.front());
        entries_.erase(entries_.begin());

        if (!entry.label.empty()) {
            SANDCASTLE_LOG_TRACE(log_category::ENGINE, "Running task {} '{}' at t={:.3f}", entry.id, entry.label,
                                 now_);
        }
        entry.task();
        ++executed;
    }
    return executed;
}

}  // namespace sandcastle::core
