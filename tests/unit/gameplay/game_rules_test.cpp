// SandCastle Gameplay Tests
// game_rules_test.cpp - Tests for rule construction and derived values

#include <gtest/gtest.h>

#include <sandcastle/core/config.hpp>
#include <sandcastle/gameplay/game_rules.hpp>

namespace sandcastle::gameplay {
namespace {

using namespace core::config_section;
using namespace core::config_key;

TEST(GameRulesTest, ReferenceTuning) {
    GameRules rules;
    EXPECT_DOUBLE_EQ(rules.stable_speed, 0.1);
    EXPECT_DOUBLE_EQ(rules.unstable_speed, 0.5);
    EXPECT_DOUBLE_EQ(rules.contact_tolerance, 0.25);
    EXPECT_EQ(rules.base_tier, 1);
    EXPECT_EQ(rules.max_tier, 6);
    EXPECT_EQ(rules.initial_lives, 3);
    EXPECT_TRUE(rules.sanitize());
}

TEST(GameRulesTest, FromDefaultConfigMatchesDefaults) {
    core::Config config;
    GameRules rules = GameRules::from_config(config);
    GameRules defaults;

    EXPECT_DOUBLE_EQ(rules.gravity, defaults.gravity);
    EXPECT_DOUBLE_EQ(rules.fixed_timestep, defaults.fixed_timestep);
    EXPECT_EQ(rules.max_tier, defaults.max_tier);
    EXPECT_EQ(rules.ground_penalty, defaults.ground_penalty);
    EXPECT_DOUBLE_EQ(rules.snapshot_max_age_hours, defaults.snapshot_max_age_hours);
    EXPECT_EQ(rules.rng_seed, 0u);
}

TEST(GameRulesTest, FromConfigReadsOverrides) {
    core::Config config;
    config.set_int(PLACEMENT, MAX_TIER, 4);
    config.set_double(STABILITY, STABLE_SPEED, 0.2);
    config.set_int(SCORING, GROUND_PENALTY, 30);
    config.set_int(RUN, INITIAL_LIVES, 5);
    config.set_int(RUN, RNG_SEED, 42);

    GameRules rules = GameRules::from_config(config);
    EXPECT_EQ(rules.max_tier, 4);
    EXPECT_DOUBLE_EQ(rules.stable_speed, 0.2);
    EXPECT_EQ(rules.ground_penalty, 30);
    EXPECT_EQ(rules.initial_lives, 5);
    EXPECT_EQ(rules.rng_seed, 42u);
}

TEST(GameRulesTest, FromConfigClampsInconsistentValues) {
    core::Config config;
    config.set_int(PLACEMENT, BASE_TIER, 3);
    config.set_int(PLACEMENT, MAX_TIER, 2);
    config.set_double(STABILITY, UNSTABLE_SPEED, 0.01);

    GameRules rules = GameRules::from_config(config);
    EXPECT_EQ(rules.base_tier, 3);
    EXPECT_EQ(rules.max_tier, 3);
    EXPECT_DOUBLE_EQ(rules.unstable_speed, rules.stable_speed);
}

TEST(GameRulesTest, SanitizeReportsChanges) {
    GameRules rules;
    rules.fixed_timestep = 0.0;
    rules.initial_lives = 0;
    rules.unstable_fraction = 1.5;

    EXPECT_FALSE(rules.sanitize());
    EXPECT_DOUBLE_EQ(rules.fixed_timestep, 1.0 / 60.0);
    EXPECT_EQ(rules.initial_lives, 1);
    EXPECT_DOUBLE_EQ(rules.unstable_fraction, 1.0);
    EXPECT_TRUE(rules.sanitize());
}

TEST(GameRulesTest, FootprintShrinksWithTier) {
    GameRules rules;
    Footprint base = rules.footprint_for_tier(1);
    EXPECT_DOUBLE_EQ(base.width, 2.0);
    EXPECT_DOUBLE_EQ(base.height, 1.25);

    Footprint third = rules.footprint_for_tier(3);
    EXPECT_NEAR(third.width, 1.6, 1e-12);
    EXPECT_DOUBLE_EQ(third.height, 1.0);

    Footprint tall = rules.footprint_for_tier(20);
    EXPECT_DOUBLE_EQ(tall.width, 1.0);
    EXPECT_DOUBLE_EQ(tall.height, 0.5);
}

TEST(GameRulesTest, PlacementScore) {
    GameRules rules;
    EXPECT_EQ(rules.placement_score(1), 20);
    EXPECT_EQ(rules.placement_score(4), 50);

    rules.tier_multiplier = 2;
    EXPECT_EQ(rules.placement_score(3), 70);
}

TEST(GameRulesTest, StabilityBonus) {
    GameRules rules;
    EXPECT_EQ(rules.stability_bonus(StabilityLevel::Stable), 100);
    EXPECT_EQ(rules.stability_bonus(StabilityLevel::Warning), 75);
    EXPECT_EQ(rules.stability_bonus(StabilityLevel::Unstable), 25);
}

TEST(GameRulesTest, TierQueries) {
    GameRules rules;
    EXPECT_FALSE(rules.is_valid_tier(0));
    EXPECT_TRUE(rules.is_valid_tier(1));
    EXPECT_TRUE(rules.is_valid_tier(6));
    EXPECT_FALSE(rules.is_valid_tier(7));
    EXPECT_TRUE(rules.is_capstone(6));
    EXPECT_FALSE(rules.is_capstone(5));
}

TEST(GameRulesTest, PhysicsConfig) {
    GameRules rules;
    physics::PhysicsConfig config = rules.physics_config();
    EXPECT_DOUBLE_EQ(config.gravity.y, -9.81);
    EXPECT_DOUBLE_EQ(config.gravity.x, 0.0);
    EXPECT_DOUBLE_EQ(config.fixed_timestep, rules.fixed_timestep);
    EXPECT_EQ(config.max_substeps, rules.max_substeps);
}

}  // namespace
}  // namespace sandcastle::gameplay
