// SandCastle Core
// game_loop.hpp - Fixed timestep simulation loop

#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace sandcastle::core {

using FixedUpdateCallback = std::function<void(double fixed_delta)>;
using UpdateCallback = std::function<void(double delta_time)>;

struct GameLoopConfig {
    double fixed_timestep = 1.0 / 60.0;  // 60 Hz physics
    double max_frame_time = 0.25;        // Prevent spiral of death
    double target_fps = 60.0;            // 0 = unlimited
};

// Fixed timestep loop. run_frame() measures wall time; step() takes an explicit
// frame time so headless runs and tests stay deterministic.
class GameLoop {
public:
    GameLoop();
    ~GameLoop();

    // Non-copyable, non-movable
    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
    GameLoop(GameLoop&&) = delete;
    GameLoop& operator=(GameLoop&&) = delete;

    void configure(const GameLoopConfig& config);
    [[nodiscard]] const GameLoopConfig& get_config() const;

    void set_fixed_update(FixedUpdateCallback callback);
    void set_update(UpdateCallback callback);

    // Run single frame paced against the wall clock
    void run_frame();

    // Advance by `frame_time` seconds; returns the number of fixed updates run
    int step(double frame_time);

    void request_exit();
    [[nodiscard]] bool should_exit() const;

    [[nodiscard]] double get_fixed_timestep() const;
    [[nodiscard]] double get_total_simulated_time() const;
    [[nodiscard]] uint64_t get_fixed_step_count() const;
    [[nodiscard]] double get_interpolation() const;

    // Pause state (stops fixed updates, variable update continues)
    void set_paused(bool paused);
    [[nodiscard]] bool is_paused() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sandcastle::core
