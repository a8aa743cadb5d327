// SandCastle Gameplay
// game_rules.hpp - Immutable rule set shared by every gameplay component

#pragma once

#include "types.hpp"

#include <sandcastle/physics/physics_world.hpp>

#include <cstdint>

namespace sandcastle::core {
class Config;
}

namespace sandcastle::gameplay {

// ============================================================================
// Game Rules
// ============================================================================

// Defaults are the reference tuning. Build from a Config with from_config().
struct GameRules {
    // Physics
    double gravity = -9.81;
    double fixed_timestep = 1.0 / 60.0;
    int max_substeps = 4;

    // Arena (world units, ground top at y = 0)
    double arena_width = 9.0;
    double spawn_height = 14.5;
    double ground_height = 1.25;

    // Stability classification
    double stable_speed = 0.1;
    double unstable_speed = 0.5;
    int sample_window = 4;
    int settle_ticks = 20;
    int max_settle_ticks = 300;

    // Placement
    double contact_tolerance = 0.25;
    Tier base_tier = 1;
    Tier max_tier = 6;

    // Collapse
    double unstable_fraction = 0.5;
    int min_pieces = 2;
    double collapse_check_delay = 0.5;

    // Scoring
    int base_score = 10;
    int tier_multiplier = 1;
    int placement_bonus = 10;
    int wrong_placement_penalty = 50;
    int ground_penalty = 50;
    int capstone_bonus_per_piece = 100;
    int level_complete_bonus = 100;
    int stability_bonus_stable = 100;
    int stability_bonus_warning = 75;
    int stability_bonus_unstable = 25;

    // Run
    int initial_lives = 3;
    double piece_speed = 2.0;
    double snapshot_max_age_hours = 24.0;
    uint32_t rng_seed = 0;  // 0 = seed from the clock
    double spawn_delay = 0.25;
    double restart_delay = 1.0;

    // ========================================================================
    // Construction
    // ========================================================================

    [[nodiscard]] static GameRules from_config(const core::Config& config);

    // Clamp inconsistent values (e.g. max tier below base tier). Returns false if anything changed.
    bool sanitize();

    // ========================================================================
    // Derived Values
    // ========================================================================

    [[nodiscard]] bool is_valid_tier(Tier tier) const { return tier >= base_tier && tier <= max_tier; }
    [[nodiscard]] bool is_capstone(Tier tier) const { return tier == max_tier; }

    // Pieces narrow and flatten as the tier rises
    [[nodiscard]] Footprint footprint_for_tier(Tier tier) const;

    // placement_bonus + base_score * tier * tier_multiplier
    [[nodiscard]] int placement_score(Tier tier) const;

    [[nodiscard]] int stability_bonus(StabilityLevel level) const;

    [[nodiscard]] double arena_half_width() const { return arena_width * 0.5; }

    [[nodiscard]] physics::PhysicsConfig physics_config() const;
};

}  // namespace sandcastle::gameplay
