// SandCastle Core
// game_loop.cpp - Fixed timestep simulation loop implementation

#include <algorithm>
#include <sandcastle/core/game_loop.hpp>
#include <sandcastle/core/logger.hpp>
#include <sandcastle/platform/timer.hpp>

namespace sandcastle::core {

struct GameLoop::Impl {
    GameLoopConfig config;

    FixedUpdateCallback fixed_update_callback;
    UpdateCallback update_callback;

    platform::FramePacer pacer;
    double accumulator = 0.0;
    double interpolation = 0.0;
    double simulated_time = 0.0;
    uint64_t fixed_steps = 0;

    bool paused = false;
    bool exit_requested = false;
};

GameLoop::GameLoop() : impl_(std::make_unique<Impl>()) {
    impl_->pacer.set_target_fps(impl_->config.target_fps);
}

GameLoop::~GameLoop() = default;

void GameLoop::configure(const GameLoopConfig& config) {
    impl_->config = config;

    impl_->pacer.set_target_fps(config.target_fps);

    SANDCASTLE_LOG_INFO(log_category::ENGINE, "Game loop configured: fixed_dt={:.4f}s, max_frame={:.4f}s, target_fps={}",
                        config.fixed_timestep, config.max_frame_time,
                        config.target_fps > 0 ? std::to_string(static_cast<int>(config.target_fps)) : "unlimited");
}

const GameLoopConfig& GameLoop::get_config() const {
    return impl_->config;
}

void GameLoop::set_fixed_update(FixedUpdateCallback callback) {
    impl_->fixed_update_callback = std::move(callback);
}

void GameLoop::set_update(UpdateCallback callback) {
    impl_->update_callback = std::move(callback);
}

void GameLoop::run_frame() {
    const bool first_frame = impl_->pacer.get_frame_count() == 0;
    double frame_time = impl_->pacer.begin_frame();

    // The first frame has no measured delta yet, run exactly one fixed step
    step(first_frame ? impl_->config.fixed_timestep : frame_time);

    impl_->pacer.finish_frame();
}

int GameLoop::step(double frame_time) {
    frame_time = std::clamp(frame_time, 0.0, impl_->config.max_frame_time);

    if (impl_->update_callback) {
        impl_->update_callback(frame_time);
    }

    int steps = 0;
    if (!impl_->paused) {
        impl_->accumulator += frame_time;

        while (impl_->accumulator >= impl_->config.fixed_timestep) {
            if (impl_->fixed_update_callback) {
                impl_->fixed_update_callback(impl_->config.fixed_timestep);
            }
            impl_->accumulator -= impl_->config.fixed_timestep;
            impl_->simulated_time += impl_->config.fixed_timestep;
            ++impl_->fixed_steps;
            ++steps;

            if (impl_->exit_requested) {
                break;
            }
        }
    }

    impl_->interpolation = impl_->accumulator / impl_->config.fixed_timestep;
    return steps;
}

void GameLoop::request_exit() {
    impl_->exit_requested = true;
}

bool GameLoop::should_exit() const {
    return impl_->exit_requested;
}

double GameLoop::get_fixed_timestep() const {
    return impl_->config.fixed_timestep;
}

double GameLoop::get_total_simulated_time() const {
    return impl_->simulated_time;
}

uint64_t GameLoop::get_fixed_step_count() const {
    return impl_->fixed_steps;
}

double GameLoop::get_interpolation() const {
    return impl_->interpolation;
}

void GameLoop::set_paused(bool paused) {
    impl_->paused = paused;

    if (paused) {
        SANDCASTLE_LOG_DEBUG(log_category::ENGINE, "Game loop paused");
    } else {
        SANDCASTLE_LOG_DEBUG(log_category::ENGINE, "Game loop resumed");
    }
}

bool GameLoop::is_paused() const {
    return impl_->paused;
}

}  // namespace sandcastle::core
