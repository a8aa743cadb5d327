// SandCastle Platform Layer
// timer.hpp - Wall-clock stopwatch and frame pacing

#pragma once

#include <array>
#include <chrono>
#include <cstdint>

namespace sandcastle::platform {

// ============================================================================
// Stopwatch
// ============================================================================

// Runs from construction. Simulation code never reads wall time; this is only
// for frame pacing and profiling.
class Stopwatch {
public:
    using Clock = std::chrono::steady_clock;

    Stopwatch();

    void restart();
    void stop();
    void start();
    [[nodiscard]] bool is_running() const { return running_; }

    [[nodiscard]] double elapsed_seconds() const;
    [[nodiscard]] double elapsed_ms() const;

    // Seconds since the previous lap (or since construction/restart)
    double lap();

private:
    Clock::time_point origin_;
    Clock::time_point lap_mark_;
    Clock::duration banked_{0};
    bool running_ = true;

    [[nodiscard]] Clock::duration running_span() const;
};

// ============================================================================
// Frame Pacer
// ============================================================================

// Measures real frame times for GameLoop::run_frame() and sleeps out the
// remainder of the frame budget when a target rate is set.
class FramePacer {
public:
    explicit FramePacer(double target_fps = 0.0);

    // Time since the previous begin_frame(), 0 for the first frame
    double begin_frame();

    // Sleep until the frame budget is used up (no-op without a target rate)
    void finish_frame();

    // 0 disables pacing
    void set_target_fps(double fps);
    [[nodiscard]] double get_target_fps() const;
    [[nodiscard]] bool is_pacing() const { return frame_budget_ > 0.0; }

    [[nodiscard]] uint64_t get_frame_count() const { return frame_count_; }
    [[nodiscard]] double get_last_frame_time() const { return last_frame_time_; }

    // Mean of the recent measured frame times, in seconds
    [[nodiscard]] double get_average_frame_time() const;

private:
    static constexpr size_t HISTORY_SIZE = 64;

    Stopwatch frame_clock_;
    double frame_budget_ = 0.0;
    double frame_start_ = 0.0;
    double last_frame_time_ = 0.0;
    uint64_t frame_count_ = 0;

    std::array<double, HISTORY_SIZE> history_{};
    size_t history_count_ = 0;
    size_t history_next_ = 0;
};

}  // namespace sandcastle::platform
