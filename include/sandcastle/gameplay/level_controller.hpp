// SandCastle Gameplay
// level_controller.hpp - Level progression state machine and rule orchestration

#pragma once

#include "collapse_detector.hpp"
#include "events.hpp"
#include "game_rules.hpp"
#include "ground_violation.hpp"
#include "level.hpp"
#include "piece_registry.hpp"
#include "placement_validator.hpp"
#include "score_ledger.hpp"
#include "snapshot.hpp"
#include "structure.hpp"

#include <sandcastle/core/scheduler.hpp>
#include <sandcastle/physics/physics_world.hpp>

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace sandcastle::gameplay {

enum class ControllerState : uint8_t {
    AwaitingDrop,   // A held piece oscillates above the arena
    Settling,       // The dropped piece is falling/settling, or its outcome awaits the collapse check
    Continuing,     // Outcome accepted, next piece about to spawn
    LevelComplete,  // Target reached, waiting for continue_to_next_level()
    Collapsed,      // Structure failed, level restart pending
    GameOver        // No lives left
};

[[nodiscard]] constexpr std::string_view to_string(ControllerState state) {
    switch (state) {
        case ControllerState::AwaitingDrop:
            return "awaiting_drop";
        case ControllerState::Settling:
            return "settling";
        case ControllerState::Continuing:
            return "continuing";
        case ControllerState::LevelComplete:
            return "level_complete";
        case ControllerState::Collapsed:
            return "collapsed";
        case ControllerState::GameOver:
            return "game_over";
    }
    return "unknown";
}

// ============================================================================
// Level Controller
// ============================================================================

// Drives one run: spawns pieces, turns drained contact events and per-tick
// stability samples into placement outcomes, and schedules the deferred
// collapse/completion checks. Delayed callbacks carry a run epoch and check
// structure membership, so callbacks from a previous level or for a removed
// piece do nothing.
class LevelController {
public:
    LevelController(const GameRules& rules, physics::PhysicsWorld& world, core::Scheduler& scheduler);
    LevelController(const GameRules& rules, physics::PhysicsWorld& world, core::Scheduler& scheduler,
                    LevelCatalog catalog);
    ~LevelController();

    // Non-copyable, non-movable
    LevelController(const LevelController&) = delete;
    LevelController& operator=(const LevelController&) = delete;
    LevelController(LevelController&&) = delete;
    LevelController& operator=(LevelController&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Build the arena (ground, walls) in an initialized world and start a run
    bool initialize();
    void shutdown();
    [[nodiscard]] bool is_initialized() const;

    // One simulation tick: held-piece motion, physics step, contact events,
    // settling state machine, then delayed callbacks
    void fixed_update(double fixed_delta);

    // ========================================================================
    // Player Commands
    // ========================================================================

    bool drop_current_piece();
    bool move_current_piece_to(double x);

    // Replace the held piece with a piece of the given tier (debug/manual play)
    PieceId spawn_piece(Tier tier);

    bool continue_to_next_level();
    void start_new_run();

    // ========================================================================
    // Rule Entry Points
    // ========================================================================

    // Ground collision for a piece. Returns true if a penalty was applied.
    bool handle_ground_contact(PieceId id);

    // Judge a settled piece. No-op unless the piece is still a structure member.
    void validate_placement(PieceId id);

    // Sample the whole structure and, on collapse, restart the level
    CollapseReport check_for_collapse();

    // ========================================================================
    // Persistence
    // ========================================================================

    [[nodiscard]] SnapshotRecord request_snapshot() const;

    // Stale or unusable records are refused and a fresh run is started instead
    bool apply_snapshot(const SnapshotRecord& record);

    // ========================================================================
    // Events
    // ========================================================================

    [[nodiscard]] std::vector<GameEvent> drain_events();
    void set_hooks(GameHooks hooks);

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] ControllerState get_state() const;
    [[nodiscard]] const GameRules& get_rules() const;
    [[nodiscard]] const RunState& get_run_state() const;
    [[nodiscard]] const ScoreLedger& get_ledger() const;
    [[nodiscard]] const Structure& get_structure() const;
    [[nodiscard]] const PieceRegistry& get_pieces() const;
    [[nodiscard]] const GroundViolationLog& get_ground_violations() const;
    [[nodiscard]] const Level& get_level() const;

    [[nodiscard]] PieceId get_current_piece() const;  // Held piece
    [[nodiscard]] PieceId get_falling_piece() const;  // Dropped, not yet resolved
    [[nodiscard]] const Piece* get_piece(PieceId id) const;

    // Tiers the next spawn may take given the structure's current tiers
    [[nodiscard]] std::vector<Tier> legal_next_tiers() const;

    [[nodiscard]] physics::RigidBodyHandle get_ground_handle() const;
    [[nodiscard]] uint64_t get_epoch() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sandcastle::gameplay
