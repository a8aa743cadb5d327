// SandCastle Gameplay
// score_ledger.hpp - Run state and score/penalty/lives mutations

#pragma once

#include "types.hpp"

#include <functional>
#include <string_view>
#include <utility>

namespace sandcastle::gameplay {

struct GameRules;

// ============================================================================
// Run State
// ============================================================================

struct RunState {
    int score = 0;
    int lives = 3;
    int level = 1;

    // Per-level counters
    int successful_placements = 0;
    int wrong_placements = 0;
    int level_attempts = 1;

    // Cross-level counters
    int total_successful_placements = 0;
    int reward_events = 0;
    int levels_completed = 0;

    // Held-piece movement
    double piece_speed = 2.0;
    int piece_direction = 1;

    // Next drop is exempt from the ground rule
    bool first_piece = true;
    bool game_over = false;

    bool operator==(const RunState&) const = default;
};

enum class ScoreReason : uint8_t {
    Placement,
    StabilityBonus,
    CapstoneClear,
    LevelComplete,
    WrongPlacement,
    GroundViolation,
    Adjustment
};

[[nodiscard]] constexpr std::string_view to_string(ScoreReason reason) {
    switch (reason) {
        case ScoreReason::Placement:
            return "placement";
        case ScoreReason::StabilityBonus:
            return "stability_bonus";
        case ScoreReason::CapstoneClear:
            return "capstone_clear";
        case ScoreReason::LevelComplete:
            return "level_complete";
        case ScoreReason::WrongPlacement:
            return "wrong_placement";
        case ScoreReason::GroundViolation:
            return "ground_violation";
        case ScoreReason::Adjustment:
            return "adjustment";
    }
    return "unknown";
}

// Totals after a mutation, so callers can render feedback without re-reading state
struct LedgerResult {
    int delta = 0;  // Score change actually applied
    int score = 0;
    int lives = 0;
    int level = 1;
    int successful_placements = 0;
    int wrong_placements = 0;
    int total_successful_placements = 0;
    int reward_events = 0;
    bool game_over = false;
};

// ============================================================================
// Score Ledger
// ============================================================================

class ScoreLedger {
public:
    using ChangeCallback = std::function<void(const LedgerResult&, ScoreReason)>;

    explicit ScoreLedger(const GameRules& rules);

    // ========================================================================
    // Score
    // ========================================================================

    LedgerResult award(int amount, ScoreReason reason);

    // Score is clamped at 0
    LedgerResult penalize(int amount, ScoreReason reason);

    // ========================================================================
    // Counters
    // ========================================================================

    LedgerResult record_successful_placement();
    LedgerResult record_wrong_placement();
    LedgerResult record_reward();

    // ========================================================================
    // Progression
    // ========================================================================

    // Award the bonus, advance the level, reset per-level counters
    LedgerResult complete_level(int bonus);

    // Deduct a life, reset per-level counters, count the attempt. Ends the run at 0 lives.
    LedgerResult restart_level();

    // Fresh run state (score 0, full lives, level 1)
    LedgerResult start_new_run();

    // ========================================================================
    // Run State
    // ========================================================================

    void clear_first_piece() { state_.first_piece = false; }
    void set_piece_direction(int direction) { state_.piece_direction = direction < 0 ? -1 : 1; }

    [[nodiscard]] const RunState& state() const { return state_; }
    [[nodiscard]] LedgerResult totals() const;

    // Snapshot import
    void restore(const RunState& state);

    // Push notification after every mutation
    void set_change_callback(ChangeCallback callback) { callback_ = std::move(callback); }

private:
    RunState state_;
    int initial_lives_;
    double initial_piece_speed_;
    ChangeCallback callback_;

    LedgerResult notify(int delta, ScoreReason reason);
    void reset_level_counters();
};

}  // namespace sandcastle::gameplay
