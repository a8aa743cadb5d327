// SandCastle Platform Layer
// timer.cpp - Stopwatch and frame pacer implementation

#include <sandcastle/platform/timer.hpp>

#include <thread>

namespace sandcastle::platform {

// ============================================================================
// Stopwatch
// ============================================================================

Stopwatch::Stopwatch() : origin_(Clock::now()), lap_mark_(origin_) {}

void Stopwatch::restart() {
    origin_ = Clock::now();
    lap_mark_ = origin_;
    banked_ = Clock::duration{0};
    running_ = true;
}

void Stopwatch::stop() {
    if (running_) {
        banked_ += Clock::now() - origin_;
        running_ = false;
    }
}

void Stopwatch::start() {
    if (!running_) {
        origin_ = Clock::now();
        running_ = true;
    }
}

Stopwatch::Clock::duration Stopwatch::running_span() const {
    return running_ ? banked_ + (Clock::now() - origin_) : banked_;
}

double Stopwatch::elapsed_seconds() const {
    return std::chrono::duration<double>(running_span()).count();
}

double Stopwatch::elapsed_ms() const {
    return std::chrono::duration<double, std::milli>(running_span()).count();
}

double Stopwatch::lap() {
    auto now = Clock::now();
    double seconds = std::chrono::duration<double>(now - lap_mark_).count();
    lap_mark_ = now;
    return seconds;
}

// ============================================================================
// Frame Pacer
// ============================================================================

FramePacer::FramePacer(double target_fps) {
    set_target_fps(target_fps);
}

double FramePacer::begin_frame() {
    double measured = frame_clock_.lap();
    frame_start_ = frame_clock_.elapsed_seconds();
    last_frame_time_ = frame_count_ == 0 ? 0.0 : measured;

    if (frame_count_ > 0) {
        history_[history_next_] = last_frame_time_;
        history_next_ = (history_next_ + 1) % HISTORY_SIZE;
        if (history_count_ < HISTORY_SIZE) {
            ++history_count_;
        }
    }

    ++frame_count_;
    return last_frame_time_;
}

void FramePacer::finish_frame() {
    if (!is_pacing() || frame_count_ == 0) {
        return;
    }

    double spent = frame_clock_.elapsed_seconds() - frame_start_;
    double remaining = frame_budget_ - spent;
    if (remaining > 0.0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(remaining));
    }
}

void FramePacer::set_target_fps(double fps) {
    frame_budget_ = fps > 0.0 ? 1.0 / fps : 0.0;
}

double FramePacer::get_target_fps() const {
    return frame_budget_ > 0.0 ? 1.0 / frame_budget_ : 0.0;
}

double FramePacer::get_average_frame_time() const {
    if (history_count_ == 0) {
        return 0.0;
    }
    double sum = 0.0;
    for (size_t i = 0; i < history_count_; ++i) {
        sum += history_[i];
    }
    return sum / static_cast<double>(history_count_);
}

}  // namespace sandcastle::platform
