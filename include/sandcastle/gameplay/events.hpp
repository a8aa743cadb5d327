// SandCastle Gameplay
// events.hpp - Game events published to the outer layers

#pragma once

#include "score_ledger.hpp"
#include "types.hpp"

#include <functional>
#include <string_view>

namespace sandcastle::gameplay {

enum class GameEventType : uint8_t {
    PieceSpawned,
    PieceDropped,
    StabilityChanged,
    PlacementAccepted,
    PlacementRejected,
    GroundViolation,
    CapstoneClear,
    LevelComplete,
    LevelRestarted,
    Collapse,
    GameOver,
    RunStarted,
    SnapshotApplied,
    SnapshotRejected
};

[[nodiscard]] constexpr std::string_view to_string(GameEventType type) {
    switch (type) {
        case GameEventType::PieceSpawned:
            return "piece_spawned";
        case GameEventType::PieceDropped:
            return "piece_dropped";
        case GameEventType::StabilityChanged:
            return "stability_changed";
        case GameEventType::PlacementAccepted:
            return "placement_accepted";
        case GameEventType::PlacementRejected:
            return "placement_rejected";
        case GameEventType::GroundViolation:
            return "ground_violation";
        case GameEventType::CapstoneClear:
            return "capstone_clear";
        case GameEventType::LevelComplete:
            return "level_complete";
        case GameEventType::LevelRestarted:
            return "level_restarted";
        case GameEventType::Collapse:
            return "collapse";
        case GameEventType::GameOver:
            return "game_over";
        case GameEventType::RunStarted:
            return "run_started";
        case GameEventType::SnapshotApplied:
            return "snapshot_applied";
        case GameEventType::SnapshotRejected:
            return "snapshot_rejected";
    }
    return "unknown";
}

struct GameEvent {
    GameEventType type = GameEventType::PieceSpawned;
    double time = 0.0;  // Scheduler time in seconds
    PieceId piece = INVALID_PIECE;
    Tier tier = 0;
    StabilityLevel stability = StabilityLevel::Stable;
    int score_delta = 0;
    int count = 0;  // Cleared pieces, unstable pieces, etc.
    LedgerResult totals;
};

// Notification hooks for audio/UI/persistence. Invoked once per tick from the
// event dispatch, never from inside the physics step.
struct GameHooks {
    std::function<void(const GameEvent&)> on_piece_dropped;
    std::function<void(const GameEvent&)> on_level_complete;
    std::function<void(const GameEvent&)> on_collapse;
    std::function<void(const GameEvent&)> on_game_over;
};

}  // namespace sandcastle::gameplay
