// SandCastle - Stacking Construction Game Simulation
// main.cpp - Headless entry point: autoplays a run and persists a snapshot

#include <sandcastle/core/config.hpp>
#include <sandcastle/core/game_loop.hpp>
#include <sandcastle/core/logger.hpp>
#include <sandcastle/core/scheduler.hpp>
#include <sandcastle/gameplay/game_rules.hpp>
#include <sandcastle/gameplay/level_controller.hpp>
#include <sandcastle/gameplay/snapshot.hpp>
#include <sandcastle/physics/physics_world.hpp>
#include <sandcastle/platform/file_io.hpp>

#include <algorithm>
#include <cstdlib>
#include <string>

namespace {

constexpr const char* VERSION = "0.1.0";
constexpr const char* SNAPSHOT_FILENAME = "structure.json";
constexpr double DEFAULT_RUN_SECONDS = 120.0;

// x of a piece the held piece can legally rest on, 0 for the ground
double pick_target_x(const sandcastle::gameplay::LevelController& controller) {
    using namespace sandcastle::gameplay;

    const Piece* held = controller.get_piece(controller.get_current_piece());
    if (held == nullptr) {
        return 0.0;
    }

    const GameRules& rules = controller.get_rules();
    double best_x = 0.0;
    double best_top = -1.0;
    for (PieceId id : controller.get_structure().ids()) {
        const Piece* piece = controller.get_piece(id);
        if (piece == nullptr || piece->get_phase() != PiecePhase::ResolvedValid) {
            continue;
        }
        const bool legal_support = held->get_tier() == rules.base_tier ? piece->get_tier() == rules.base_tier
                                                                        : piece->get_tier() == held->get_tier() - 1;
        if (legal_support && piece->get_bounds().top() > best_top) {
            best_top = piece->get_bounds().top();
            best_x = piece->get_position().x;
        }
    }
    return best_x;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace sandcastle;

    const double run_seconds = argc > 1 ? std::strtod(argv[1], nullptr) : DEFAULT_RUN_SECONDS;

    // Configuration
    const auto data_dir = platform::FileSystem::get_user_data_directory();
    core::Config config;
    const bool config_loaded = config.load_or_create_default(data_dir / "sandcastle.json");

    core::LoggerConfig logger_config;
    logger_config.console_level =
        core::parse_log_level(config.get_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL, "info"));
    logger_config.log_directory = data_dir / "logs";
    core::Logger::initialize(logger_config);

    SANDCASTLE_LOG_INFO(core::log_category::ENGINE, "SandCastle {} starting", VERSION);
    if (!config_loaded) {
        SANDCASTLE_LOG_WARN(core::log_category::CONFIG, "Using default rules, config could not be loaded");
    }

    const gameplay::GameRules rules = gameplay::GameRules::from_config(config);

    // Physics World
    physics::PhysicsWorld physics_world;
    if (!physics_world.initialize(rules.physics_config())) {
        SANDCASTLE_LOG_CRITICAL(core::log_category::ENGINE, "Failed to initialize Physics World");
        core::Logger::shutdown();
        return 1;
    }

    // Level Controller
    core::Scheduler scheduler;
    gameplay::LevelController controller(rules, physics_world, scheduler);
    if (!controller.initialize()) {
        SANDCASTLE_LOG_CRITICAL(core::log_category::ENGINE, "Failed to initialize Level Controller");
        physics_world.shutdown();
        core::Logger::shutdown();
        return 1;
    }

    gameplay::GameHooks hooks;
    hooks.on_level_complete = [](const gameplay::GameEvent& event) {
        SANDCASTLE_LOG_INFO(core::log_category::GAME, "Level {} cleared, score {}", event.count, event.totals.score);
    };
    hooks.on_collapse = [](const gameplay::GameEvent& event) {
        SANDCASTLE_LOG_INFO(core::log_category::GAME, "Collapse with {} unstable pieces, {} lives left", event.count,
                            event.totals.lives);
    };
    controller.set_hooks(std::move(hooks));

    // Resume a recent structure if one was saved
    const auto snapshot_path = platform::FileSystem::get_user_saves_directory() / SNAPSHOT_FILENAME;
    if (auto record = gameplay::SnapshotSerializer::load_from_file(snapshot_path)) {
        if (controller.apply_snapshot(*record)) {
            SANDCASTLE_LOG_INFO(core::log_category::PERSISTENCE, "Resumed level {} with score {}", record->run.level,
                                record->run.score);
        }
    }

    // Game Loop
    core::GameLoop game_loop;
    core::GameLoopConfig loop_config;
    loop_config.fixed_timestep = rules.fixed_timestep;
    loop_config.target_fps =
        std::max(0.0, config.get_double(core::config_section::DEBUG, core::config_key::TARGET_FPS, 0.0));
    game_loop.configure(loop_config);

    game_loop.set_fixed_update([&controller](double dt) { controller.fixed_update(dt); });

    // Autoplay: aim at the tallest legal support and drop straight away
    game_loop.set_update([&controller, &game_loop](double) {
        switch (controller.get_state()) {
            case gameplay::ControllerState::AwaitingDrop:
                controller.move_current_piece_to(pick_target_x(controller));
                controller.drop_current_piece();
                break;
            case gameplay::ControllerState::LevelComplete:
                controller.continue_to_next_level();
                break;
            case gameplay::ControllerState::GameOver:
                game_loop.request_exit();
                break;
            default:
                break;
        }

        for (const auto& event : controller.drain_events()) {
            SANDCASTLE_LOG_DEBUG(core::log_category::GAME, "[{:.2f}s] {} piece={} delta={} score={}", event.time,
                                 gameplay::to_string(event.type), event.piece, event.score_delta, event.totals.score);
        }
    });

    // A target rate watches the run in real time, otherwise fast-forward
    const bool paced = loop_config.target_fps > 0.0;
    while (!game_loop.should_exit() && game_loop.get_total_simulated_time() < run_seconds) {
        if (paced) {
            game_loop.run_frame();
        } else {
            game_loop.step(rules.fixed_timestep);
        }
    }

    const auto& run = controller.get_run_state();
    SANDCASTLE_LOG_INFO(core::log_category::ENGINE,
                        "Run finished after {:.1f}s: level {}, score {}, lives {}, placements {}, rewards {}",
                        game_loop.get_total_simulated_time(), run.level, run.score, run.lives,
                        run.total_successful_placements, run.reward_events);

    const auto physics_stats = physics_world.get_stats();
    SANDCASTLE_LOG_DEBUG(core::log_category::PHYSICS, "Physics: {} steps, {} bodies, {} touching pairs, last step {:.3f} ms",
                         physics_stats.steps, physics_stats.rigid_body_count, physics_stats.active_contact_pairs,
                         physics_stats.last_step_time_ms);

    // Persist the structure unless the run is over
    if (run.game_over) {
        platform::FileSystem::remove(snapshot_path);
    } else if (platform::FileSystem::create_directories(snapshot_path.parent_path())) {
        gameplay::SnapshotSerializer::save_to_file(controller.request_snapshot(), snapshot_path);
    }

    // Shutdown in reverse order
    controller.shutdown();
    physics_world.shutdown();

    SANDCASTLE_LOG_INFO(core::log_category::ENGINE, "SandCastle shutdown complete");
    core::Logger::shutdown();

    return 0;
}
