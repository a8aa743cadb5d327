// SandCastle Gameplay
// game_rules.cpp - Rule set construction from configuration

#include <sandcastle/core/config.hpp>
#include <sandcastle/core/logger.hpp>
#include <sandcastle/gameplay/game_rules.hpp>

#include <algorithm>

namespace sandcastle::gameplay {

GameRules GameRules::from_config(const core::Config& config) {
    using namespace core::config_section;
    using namespace core::config_key;

    GameRules defaults;
    GameRules rules;

    rules.gravity = config.get_double(PHYSICS, GRAVITY, defaults.gravity);
    rules.fixed_timestep = config.get_double(PHYSICS, FIXED_TIMESTEP, defaults.fixed_timestep);
    rules.max_substeps = config.get_int(PHYSICS, MAX_SUBSTEPS, defaults.max_substeps);

    rules.arena_width = config.get_double(ARENA, ARENA_WIDTH, defaults.arena_width);
    rules.spawn_height = config.get_double(ARENA, SPAWN_HEIGHT, defaults.spawn_height);
    rules.ground_height = config.get_double(ARENA, GROUND_HEIGHT, defaults.ground_height);

    rules.stable_speed = config.get_double(STABILITY, STABLE_SPEED, defaults.stable_speed);
    rules.unstable_speed = config.get_double(STABILITY, UNSTABLE_SPEED, defaults.unstable_speed);
    rules.settle_ticks = config.get_int(STABILITY, SETTLE_TICKS, defaults.settle_ticks);
    rules.max_settle_ticks = config.get_int(STABILITY, MAX_SETTLE_TICKS, defaults.max_settle_ticks);

    rules.contact_tolerance = config.get_double(PLACEMENT, CONTACT_TOLERANCE, defaults.contact_tolerance);
    rules.base_tier = config.get_int(PLACEMENT, BASE_TIER, defaults.base_tier);
    rules.max_tier = config.get_int(PLACEMENT, MAX_TIER, defaults.max_tier);

    rules.unstable_fraction = config.get_double(COLLAPSE, UNSTABLE_FRACTION, defaults.unstable_fraction);
    rules.min_pieces = config.get_int(COLLAPSE, MIN_PIECES, defaults.min_pieces);
    rules.collapse_check_delay = config.get_double(COLLAPSE, CHECK_DELAY, defaults.collapse_check_delay);

    rules.base_score = config.get_int(SCORING, BASE_SCORE, defaults.base_score);
    rules.tier_multiplier = config.get_int(SCORING, TIER_MULTIPLIER, defaults.tier_multiplier);
    rules.placement_bonus = config.get_int(SCORING, PLACEMENT_BONUS, defaults.placement_bonus);
    rules.wrong_placement_penalty = config.get_int(SCORING, WRONG_PLACEMENT_PENALTY, defaults.wrong_placement_penalty);
    rules.ground_penalty = config.get_int(SCORING, GROUND_PENALTY, defaults.ground_penalty);
    rules.capstone_bonus_per_piece =
        config.get_int(SCORING, CAPSTONE_BONUS_PER_PIECE, defaults.capstone_bonus_per_piece);
    rules.level_complete_bonus = config.get_int(SCORING, LEVEL_COMPLETE_BONUS, defaults.level_complete_bonus);
    rules.stability_bonus_stable = config.get_int(SCORING, STABILITY_BONUS_STABLE, defaults.stability_bonus_stable);
    rules.stability_bonus_warning = config.get_int(SCORING, STABILITY_BONUS_WARNING, defaults.stability_bonus_warning);
    rules.stability_bonus_unstable =
        config.get_int(SCORING, STABILITY_BONUS_UNSTABLE, defaults.stability_bonus_unstable);

    rules.initial_lives = config.get_int(RUN, INITIAL_LIVES, defaults.initial_lives);
    rules.piece_speed = config.get_double(RUN, PIECE_SPEED, defaults.piece_speed);
    rules.snapshot_max_age_hours = config.get_double(RUN, SNAPSHOT_MAX_AGE_HOURS, defaults.snapshot_max_age_hours);
    rules.rng_seed = static_cast<uint32_t>(std::max(0, config.get_int(RUN, RNG_SEED, 0)));
    rules.spawn_delay = config.get_double(RUN, SPAWN_DELAY, defaults.spawn_delay);
    rules.restart_delay = config.get_double(RUN, RESTART_DELAY, defaults.restart_delay);

    if (!rules.sanitize()) {
        SANDCASTLE_LOG_WARN(core::log_category::CONFIG, "Game rules contained inconsistent values and were clamped");
    }

    return rules;
}

bool GameRules::sanitize() {
    GameRules before = *this;

    if (fixed_timestep <= 0.0) {
        fixed_timestep = 1.0 / 60.0;
    }
    max_substeps = std::max(1, max_substeps);
    arena_width = std::max(1.0, arena_width);
    stable_speed = std::max(0.0, stable_speed);
    unstable_speed = std::max(stable_speed, unstable_speed);
    sample_window = std::max(1, sample_window);
    settle_ticks = std::max(1, settle_ticks);
    max_settle_ticks = std::max(settle_ticks, max_settle_ticks);
    contact_tolerance = std::max(0.0, contact_tolerance);
    base_tier = std::max(1, base_tier);
    max_tier = std::max(base_tier, max_tier);
    unstable_fraction = std::clamp(unstable_fraction, 0.0, 1.0);
    min_pieces = std::max(1, min_pieces);
    collapse_check_delay = std::max(0.0, collapse_check_delay);
    initial_lives = std::max(1, initial_lives);
    piece_speed = std::max(0.0, piece_speed);
    spawn_delay = std::max(0.0, spawn_delay);
    restart_delay = std::max(0.0, restart_delay);

    return before.fixed_timestep == fixed_timestep && before.max_substeps == max_substeps &&
           before.arena_width == arena_width && before.stable_speed == stable_speed &&
           before.unstable_speed == unstable_speed && before.sample_window == sample_window &&
           before.settle_ticks == settle_ticks && before.max_settle_ticks == max_settle_ticks &&
           before.contact_tolerance == contact_tolerance && before.base_tier == base_tier &&
           before.max_tier == max_tier && before.unstable_fraction == unstable_fraction &&
           before.min_pieces == min_pieces && before.collapse_check_delay == collapse_check_delay &&
           before.initial_lives == initial_lives && before.piece_speed == piece_speed &&
           before.spawn_delay == spawn_delay && before.restart_delay == restart_delay;
}

Footprint GameRules::footprint_for_tier(Tier tier) const {
    int step = std::max(0, tier - base_tier);
    Footprint footprint;
    footprint.width = std::max(1.0, 2.0 - 0.2 * step);
    footprint.height = std::max(0.5, 1.25 - 0.125 * step);
    return footprint;
}

int GameRules::placement_score(Tier tier) const {
    return placement_bonus + base_score * tier * tier_multiplier;
}

int GameRules::stability_bonus(StabilityLevel level) const {
    switch (level) {
        case StabilityLevel::Stable:
            return stability_bonus_stable;
        case StabilityLevel::Warning:
            return stability_bonus_warning;
        case StabilityLevel::Unstable:
            return stability_bonus_unstable;
    }
    return 0;
}

physics::PhysicsConfig GameRules::physics_config() const {
    physics::PhysicsConfig config;
    config.gravity = glm::dvec3(0.0, gravity, 0.0);
    config.fixed_timestep = fixed_timestep;
    config.max_substeps = max_substeps;
    return config;
}

}  // namespace sandcastle::gameplay
