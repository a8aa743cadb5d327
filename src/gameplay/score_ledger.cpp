// SandCastle Gameplay
// score_ledger.cpp - Score ledger implementation

#include <sandcastle/core/logger.hpp>
#include <sandcastle/gameplay/game_rules.hpp>
#include <sandcastle/gameplay/score_ledger.hpp>

#include <algorithm>

namespace sandcastle::gameplay {

ScoreLedger::ScoreLedger(const GameRules& rules)
    : initial_lives_(rules.initial_lives), initial_piece_speed_(rules.piece_speed) {
    state_.lives = initial_lives_;
    state_.piece_speed = initial_piece_speed_;
}

// ============================================================================
// Score
// ============================================================================

LedgerResult ScoreLedger::award(int amount, ScoreReason reason) {
    int delta = std::max(0, amount);
    state_.score += delta;
    SANDCASTLE_LOG_DEBUG(core::log_category::SCORING, "+{} ({}) -> {}", delta, to_string(reason), state_.score);
    return notify(delta, reason);
}

LedgerResult ScoreLedger::penalize(int amount, ScoreReason reason) {
    int before = state_.score;
    state_.score = std::max(0, state_.score - std::max(0, amount));
    int delta = state_.score - before;
    SANDCASTLE_LOG_DEBUG(core::log_category::SCORING, "{} ({}) -> {}", delta, to_string(reason), state_.score);
    return notify(delta, reason);
}

// ============================================================================
// Counters
// ============================================================================

LedgerResult ScoreLedger::record_successful_placement() {
    ++state_.successful_placements;
    ++state_.total_successful_placements;
    return notify(0, ScoreReason::Placement);
}

LedgerResult ScoreLedger::record_wrong_placement() {
    ++state_.wrong_placements;
    return notify(0, ScoreReason::WrongPlacement);
}

LedgerResult ScoreLedger::record_reward() {
    ++state_.reward_events;
    return notify(0, ScoreReason::CapstoneClear);
}

// ============================================================================
// Progression
// ============================================================================

void ScoreLedger::reset_level_counters() {
    state_.successful_placements = 0;
    state_.wrong_placements = 0;
    state_.first_piece = true;
}

LedgerResult ScoreLedger::complete_level(int bonus) {
    int delta = std::max(0, bonus);
    state_.score += delta;
    ++state_.level;
    ++state_.levels_completed;
    state_.level_attempts = 1;
    reset_level_counters();

    SANDCASTLE_LOG_INFO(core::log_category::SCORING, "Level complete, bonus {} -> score {}, next level {}", delta,
                        state_.score, state_.level);
    return notify(delta, ScoreReason::LevelComplete);
}

LedgerResult ScoreLedger::restart_level() {
    if (state_.game_over) {
        return totals();
    }

    state_.lives = std::max(0, state_.lives - 1);
    ++state_.level_attempts;
    reset_level_counters();

    if (state_.lives == 0) {
        state_.game_over = true;
        SANDCASTLE_LOG_INFO(core::log_category::SCORING, "No lives left, final score {}", state_.score);
    } else {
        SANDCASTLE_LOG_INFO(core::log_category::SCORING, "Level {} restarted, {} lives left", state_.level,
                            state_.lives);
    }
    return notify(0, ScoreReason::Adjustment);
}

LedgerResult ScoreLedger::start_new_run() {
    state_ = RunState{};
    state_.lives = initial_lives_;
    state_.piece_speed = initial_piece_speed_;
    return notify(0, ScoreReason::Adjustment);
}

// ============================================================================
// Run State
// ============================================================================

LedgerResult ScoreLedger::totals() const {
    LedgerResult result;
    result.score = state_.score;
    result.lives = state_.lives;
    result.level = state_.level;
    result.successful_placements = state_.successful_placements;
    result.wrong_placements = state_.wrong_placements;
    result.total_successful_placements = state_.total_successful_placements;
    result.reward_events = state_.reward_events;
    result.game_over = state_.game_over;
    return result;
}

void ScoreLedger::restore(const RunState& state) {
    state_ = state;
    state_.score = std::max(0, state_.score);
    state_.lives = std::max(0, state_.lives);
    state_.level = std::max(1, state_.level);
    state_.piece_direction = state_.piece_direction < 0 ? -1 : 1;
}

LedgerResult ScoreLedger::notify(int delta, ScoreReason reason) {
    LedgerResult result = totals();
    result.delta = delta;
    if (callback_) {
        callback_(result, reason);
    }
    return result;
}

}  // namespace sandcastle::gameplay
