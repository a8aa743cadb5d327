// SandCastle Gameplay Tests
// level_controller_test.cpp - Scenario tests for the level controller on a live physics world

#include <gtest/gtest.h>

#include <sandcastle/gameplay/level_controller.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <memory>
#include <optional>

namespace sandcastle::gameplay {
namespace {

constexpr int64_t HOUR_MS = 3600LL * 1000LL;

class LevelControllerTest : public ::testing::Test {
protected:
    LevelControllerTest() { rules.rng_seed = 1234; }

    void TearDown() override {
        controller.reset();
        world.shutdown();
    }

    void start(std::optional<LevelCatalog> catalog = std::nullopt) {
        ASSERT_TRUE(world.initialize(rules.physics_config()));
        if (catalog) {
            controller = std::make_unique<LevelController>(rules, world, scheduler, std::move(*catalog));
        } else {
            controller = std::make_unique<LevelController>(rules, world, scheduler);
        }
        ASSERT_TRUE(controller->initialize());
        collect();
    }

    void tick() {
        controller->fixed_update(rules.fixed_timestep);
        collect();
    }

    void collect() {
        for (auto& event : controller->drain_events()) {
            events.push_back(event);
        }
    }

    bool run_until(const std::function<bool()>& done, int max_ticks = 3000) {
        for (int i = 0; i < max_ticks && !done(); ++i) {
            tick();
        }
        return done();
    }

    bool is_busy() const {
        ControllerState state = controller->get_state();
        return state == ControllerState::Settling || state == ControllerState::Continuing;
    }

    // Spawn a piece of the tier at x, drop it and run until the controller is idle again
    PieceId place(Tier tier, double x) {
        EXPECT_TRUE(run_until([this] { return controller->get_state() == ControllerState::AwaitingDrop; }));
        PieceId id = controller->spawn_piece(tier);
        EXPECT_NE(id, INVALID_PIECE);
        EXPECT_TRUE(controller->move_current_piece_to(x));
        EXPECT_TRUE(controller->drop_current_piece());
        EXPECT_TRUE(run_until([this] { return !is_busy(); }));
        return id;
    }

    size_t count(GameEventType type) const {
        return static_cast<size_t>(std::count_if(events.begin(), events.end(),
                                                 [type](const GameEvent& event) { return event.type == type; }));
    }

    const GameEvent* last(GameEventType type) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->type == type) {
                return &*it;
            }
        }
        return nullptr;
    }

    // Fresh snapshot of base pieces resting on the ground
    SnapshotRecord make_record(const std::vector<glm::dvec2>& velocities) const {
        SnapshotRecord record;
        record.timestamp_ms = SnapshotSerializer::now_ms();
        record.run.lives = rules.initial_lives;
        record.run.piece_speed = rules.piece_speed;
        record.run.first_piece = false;

        const Footprint footprint = rules.footprint_for_tier(rules.base_tier);
        PieceId id = 1;
        double x = -3.0;
        for (const glm::dvec2& velocity : velocities) {
            PieceRecord piece;
            piece.id = id++;
            piece.tier = rules.base_tier;
            piece.position = glm::dvec2(x, footprint.half_height());
            piece.footprint = footprint;
            piece.velocity = velocity;
            record.pieces.push_back(piece);
            x += 3.0;
        }
        record.next_piece_id = id;
        return record;
    }

    GameRules rules;
    physics::PhysicsWorld world;
    core::Scheduler scheduler;
    std::unique_ptr<LevelController> controller;
    std::vector<GameEvent> events;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(LevelControllerTest, RequiresInitializedWorld) {
    LevelController orphan(rules, world, scheduler);
    EXPECT_FALSE(orphan.initialize());
    EXPECT_FALSE(orphan.is_initialized());
}

TEST_F(LevelControllerTest, InitializeStartsRun) {
    start();

    EXPECT_TRUE(controller->is_initialized());
    EXPECT_EQ(controller->get_state(), ControllerState::AwaitingDrop);
    EXPECT_NE(controller->get_current_piece(), INVALID_PIECE);
    EXPECT_NE(controller->get_ground_handle(), physics::INVALID_RIGID_BODY);
    EXPECT_EQ(controller->get_level().id, 1);
    EXPECT_EQ(controller->get_run_state().lives, 3);
    EXPECT_EQ(count(GameEventType::RunStarted), 1u);
    EXPECT_EQ(count(GameEventType::PieceSpawned), 1u);

    // Only base pieces are legal on an empty arena
    EXPECT_EQ(controller->legal_next_tiers(), std::vector<Tier>{1});
    EXPECT_EQ(controller->get_piece(controller->get_current_piece())->get_tier(), 1);
}

TEST_F(LevelControllerTest, InitializeTwiceFails) {
    start();
    EXPECT_FALSE(controller->initialize());
}

TEST_F(LevelControllerTest, ShutdownReleasesBodies) {
    start();
    place(1, 0.0);
    EXPECT_GT(world.get_rigid_body_count(), 0u);

    controller->shutdown();
    EXPECT_EQ(world.get_rigid_body_count(), 0u);
    EXPECT_FALSE(controller->is_initialized());
}

TEST_F(LevelControllerTest, HeldPieceOscillatesWithinArena) {
    start();
    const Piece* held = controller->get_piece(controller->get_current_piece());
    ASSERT_NE(held, nullptr);
    const double limit = rules.arena_half_width() - held->get_footprint().half_width();

    double start_x = held->get_position().x;
    for (int i = 0; i < 600; ++i) {
        tick();
        EXPECT_LE(std::abs(held->get_position().x), limit + 1e-9);
    }
    EXPECT_NE(held->get_position().x, start_x);
    EXPECT_FALSE(held->has_body());
}

// ============================================================================
// Player Commands
// ============================================================================

TEST_F(LevelControllerTest, DropOnlyWhileAwaiting) {
    start();
    ASSERT_TRUE(controller->drop_current_piece());
    EXPECT_EQ(controller->get_state(), ControllerState::Settling);
    EXPECT_NE(controller->get_falling_piece(), INVALID_PIECE);
    EXPECT_EQ(controller->get_current_piece(), INVALID_PIECE);

    EXPECT_FALSE(controller->drop_current_piece());
    EXPECT_FALSE(controller->move_current_piece_to(1.0));
    EXPECT_EQ(controller->spawn_piece(1), INVALID_PIECE);
}

TEST_F(LevelControllerTest, SpawnPieceRejectsInvalidTier) {
    start();
    EXPECT_EQ(controller->spawn_piece(0), INVALID_PIECE);
    EXPECT_EQ(controller->spawn_piece(rules.max_tier + 1), INVALID_PIECE);
}

TEST_F(LevelControllerTest, SpawnPieceReplacesHeldPiece) {
    start();
    PieceId previous = controller->get_current_piece();

    PieceId id = controller->spawn_piece(3);
    ASSERT_NE(id, INVALID_PIECE);
    EXPECT_NE(id, previous);
    EXPECT_EQ(controller->get_piece(previous), nullptr);
    EXPECT_EQ(controller->get_piece(id)->get_tier(), 3);
}

TEST_F(LevelControllerTest, MoveIsClampedToArena) {
    start();
    ASSERT_TRUE(controller->move_current_piece_to(100.0));
    const Piece* held = controller->get_piece(controller->get_current_piece());
    EXPECT_DOUBLE_EQ(held->get_position().x, rules.arena_half_width() - held->get_footprint().half_width());
}

TEST_F(LevelControllerTest, PieceDroppedHook) {
    start();
    int dropped = 0;
    GameHooks hooks;
    hooks.on_piece_dropped = [&dropped](const GameEvent&) { ++dropped; };
    controller->set_hooks(std::move(hooks));

    ASSERT_TRUE(controller->drop_current_piece());
    EXPECT_EQ(dropped, 1);
}

// ============================================================================
// Placement
// ============================================================================

TEST_F(LevelControllerTest, BasePieceOnGroundIsAccepted) {
    start();
    PieceId id = place(1, 0.0);

    const GameEvent* accepted = last(GameEventType::PlacementAccepted);
    ASSERT_NE(accepted, nullptr);
    EXPECT_EQ(accepted->piece, id);
    EXPECT_EQ(accepted->score_delta, rules.placement_score(1) + rules.stability_bonus(accepted->stability));

    const RunState& run = controller->get_run_state();
    EXPECT_EQ(run.score, accepted->score_delta);
    EXPECT_EQ(run.successful_placements, 1);
    EXPECT_EQ(run.wrong_placements, 0);
    EXPECT_FALSE(run.first_piece);

    const Piece* piece = controller->get_piece(id);
    ASSERT_NE(piece, nullptr);
    EXPECT_EQ(piece->get_phase(), PiecePhase::ResolvedValid);
    EXPECT_NEAR(piece->get_bounds().bottom(), 0.0, 0.05);
    EXPECT_TRUE(controller->get_structure().contains(id));
    EXPECT_EQ(count(GameEventType::GroundViolation), 0u);

    // A resolved base piece unlocks the next tier
    EXPECT_EQ(controller->legal_next_tiers(), (std::vector<Tier>{1, 2}));
}

TEST_F(LevelControllerTest, WrongTierSupportIsPenalizedOnce) {
    start();
    place(1, 0.0);
    const int score_before = controller->get_run_state().score;

    PieceId id = place(3, 0.0);

    EXPECT_EQ(count(GameEventType::PlacementRejected), 1u);
    const GameEvent* rejected = last(GameEventType::PlacementRejected);
    ASSERT_NE(rejected, nullptr);
    EXPECT_EQ(rejected->piece, id);
    EXPECT_EQ(rejected->score_delta, -rules.wrong_placement_penalty);

    const RunState& run = controller->get_run_state();
    EXPECT_EQ(run.score, score_before - rules.wrong_placement_penalty);
    EXPECT_EQ(run.wrong_placements, 1);
    EXPECT_EQ(run.successful_placements, 1);
    EXPECT_EQ(controller->get_piece(id), nullptr);
    EXPECT_FALSE(controller->get_structure().contains(id));
    EXPECT_EQ(count(GameEventType::GroundViolation), 0u);
}

TEST_F(LevelControllerTest, SupportedHigherTierIsAccepted) {
    start();
    place(1, 0.0);
    PieceId id = place(2, 0.0);

    const GameEvent* accepted = last(GameEventType::PlacementAccepted);
    ASSERT_NE(accepted, nullptr);
    EXPECT_EQ(accepted->piece, id);
    EXPECT_EQ(accepted->tier, 2);
    EXPECT_EQ(controller->get_run_state().successful_placements, 2);
}

TEST_F(LevelControllerTest, FirstPieceIsExemptFromGroundRule) {
    start();
    PieceId exempt = place(2, 0.0);

    EXPECT_EQ(controller->get_ground_violations().get_exempt_piece(), exempt);
    EXPECT_EQ(count(GameEventType::GroundViolation), 0u);
    const GameEvent* accepted = last(GameEventType::PlacementAccepted);
    ASSERT_NE(accepted, nullptr);
    EXPECT_EQ(accepted->piece, exempt);

    // A later non-base piece on bare ground is penalized exactly once
    const int score_before = controller->get_run_state().score;
    PieceId offender = place(2, -3.0);

    EXPECT_EQ(count(GameEventType::GroundViolation), 1u);
    EXPECT_EQ(controller->get_ground_violations().records().size(), 1u);
    EXPECT_TRUE(controller->get_ground_violations().has_penalized(offender));
    EXPECT_EQ(controller->get_run_state().score, score_before - rules.ground_penalty);
    EXPECT_EQ(controller->get_run_state().wrong_placements, 0);
    EXPECT_EQ(controller->get_piece(offender), nullptr);
    EXPECT_EQ(count(GameEventType::PlacementRejected), 0u);
}

TEST_F(LevelControllerTest, GroundContactEntryPointIgnoresUnknownPieces) {
    start();
    EXPECT_FALSE(controller->handle_ground_contact(999));
    EXPECT_FALSE(controller->handle_ground_contact(controller->get_current_piece()));
    EXPECT_EQ(controller->get_run_state().score, 0);
}

TEST_F(LevelControllerTest, ValidateIgnoresNonMembers) {
    start();
    PieceId held = controller->get_current_piece();
    controller->validate_placement(held);
    controller->validate_placement(999);

    EXPECT_EQ(count(GameEventType::PlacementAccepted), 0u);
    EXPECT_EQ(count(GameEventType::PlacementRejected), 0u);
    EXPECT_EQ(controller->get_state(), ControllerState::AwaitingDrop);
}

TEST_F(LevelControllerTest, CapstoneClearsStructure) {
    rules.max_tier = 4;
    rules.piece_speed = 0.0;
    start(LevelCatalog({Level{1, "Tower", 50, {1, 2, 3, 4}, 3}}));

    place(1, 0.0);
    place(2, 0.0);
    place(3, 0.0);
    ASSERT_EQ(controller->get_structure().size(), 3u);
    PieceId capstone = place(4, 0.0);

    const GameEvent* clear = last(GameEventType::CapstoneClear);
    ASSERT_NE(clear, nullptr);
    EXPECT_EQ(clear->piece, capstone);
    EXPECT_EQ(clear->count, 4);
    EXPECT_EQ(clear->score_delta, 4 * rules.capstone_bonus_per_piece);

    const RunState& run = controller->get_run_state();
    EXPECT_EQ(run.reward_events, 1);
    EXPECT_EQ(run.successful_placements, 4);
    EXPECT_TRUE(controller->get_structure().empty());
    EXPECT_EQ(controller->get_state(), ControllerState::AwaitingDrop);
}

// ============================================================================
// Progression
// ============================================================================

TEST_F(LevelControllerTest, ReachingTargetCompletesLevel) {
    start();
    int completed_hook = 0;
    GameHooks hooks;
    hooks.on_level_complete = [&completed_hook](const GameEvent&) { ++completed_hook; };
    controller->set_hooks(std::move(hooks));

    place(1, -2.5);
    const int score_before_last = controller->get_run_state().score;
    place(1, 2.5);

    ASSERT_EQ(controller->get_state(), ControllerState::LevelComplete);
    const GameEvent* complete = last(GameEventType::LevelComplete);
    ASSERT_NE(complete, nullptr);
    EXPECT_EQ(complete->count, 1);
    EXPECT_EQ(complete->score_delta, rules.level_complete_bonus);
    EXPECT_EQ(completed_hook, 1);

    const RunState& run = controller->get_run_state();
    EXPECT_EQ(run.level, 2);
    EXPECT_EQ(run.levels_completed, 1);
    EXPECT_EQ(run.successful_placements, 0);
    EXPECT_EQ(run.total_successful_placements, 2);
    EXPECT_GT(run.score, score_before_last + rules.level_complete_bonus);

    // Nothing spawns until the player continues
    for (int i = 0; i < 120; ++i) {
        tick();
    }
    EXPECT_EQ(controller->get_state(), ControllerState::LevelComplete);
    EXPECT_EQ(controller->get_current_piece(), INVALID_PIECE);

    ASSERT_TRUE(controller->continue_to_next_level());
    EXPECT_EQ(controller->get_state(), ControllerState::AwaitingDrop);
    EXPECT_EQ(controller->get_level().id, 2);
    EXPECT_EQ(controller->get_level().target_piece_count, 3);
    EXPECT_TRUE(controller->get_structure().empty());
    EXPECT_TRUE(controller->get_run_state().first_piece);
    EXPECT_FALSE(controller->continue_to_next_level());
}

TEST_F(LevelControllerTest, StartNewRunResets) {
    start();
    place(1, 0.0);
    const uint64_t epoch = controller->get_epoch();

    controller->start_new_run();
    collect();

    EXPECT_GT(controller->get_epoch(), epoch);
    EXPECT_EQ(controller->get_run_state().score, 0);
    EXPECT_TRUE(controller->get_structure().empty());
    EXPECT_EQ(controller->get_state(), ControllerState::AwaitingDrop);
    EXPECT_EQ(count(GameEventType::RunStarted), 2u);
}

TEST_F(LevelControllerTest, LevelCompleteHookCanContinue) {
    start();
    int completed_hook = 0;
    int dropped_hook = 0;
    GameHooks hooks;
    hooks.on_level_complete = [this, &completed_hook](const GameEvent&) {
        ++completed_hook;
        EXPECT_TRUE(controller->continue_to_next_level());
    };
    hooks.on_piece_dropped = [&dropped_hook](const GameEvent&) { ++dropped_hook; };
    controller->set_hooks(std::move(hooks));

    place(1, -2.5);
    place(1, 2.5);

    EXPECT_EQ(completed_hook, 1);
    EXPECT_EQ(count(GameEventType::LevelComplete), 1u);
    EXPECT_EQ(controller->get_state(), ControllerState::AwaitingDrop);
    EXPECT_EQ(controller->get_level().id, 2);

    // Later events still reach their hooks
    place(1, 0.0);
    EXPECT_EQ(dropped_hook, 3);
}

TEST_F(LevelControllerTest, HookMayDrainEvents) {
    start();
    std::vector<GameEvent> drained;
    GameHooks hooks;
    hooks.on_piece_dropped = [this, &drained](const GameEvent& event) {
        EXPECT_EQ(event.type, GameEventType::PieceDropped);
        for (auto& e : controller->drain_events()) {
            drained.push_back(e);
        }
        EXPECT_EQ(event.type, GameEventType::PieceDropped);
    };
    controller->set_hooks(std::move(hooks));

    ASSERT_TRUE(controller->drop_current_piece());
    ASSERT_FALSE(drained.empty());
    EXPECT_EQ(drained.back().type, GameEventType::PieceDropped);
    EXPECT_TRUE(controller->drain_events().empty());
}

// ============================================================================
// Collapse
// ============================================================================

TEST_F(LevelControllerTest, CollapseRestartsLevel) {
    start();
    int collapse_hook = 0;
    GameHooks hooks;
    hooks.on_collapse = [&collapse_hook](const GameEvent&) { ++collapse_hook; };
    controller->set_hooks(std::move(hooks));

    ASSERT_TRUE(controller->apply_snapshot(make_record({{5.0, 0.0}, {5.0, 0.0}, {0.0, 0.0}})));
    ASSERT_EQ(controller->get_structure().size(), 3u);

    CollapseReport report = controller->check_for_collapse();
    collect();

    EXPECT_TRUE(report.collapsed);
    EXPECT_EQ(report.piece_count, 3u);
    EXPECT_EQ(report.unstable_count, 2u);
    EXPECT_EQ(collapse_hook, 1);
    EXPECT_EQ(count(GameEventType::Collapse), 1u);
    EXPECT_EQ(count(GameEventType::LevelRestarted), 1u);

    EXPECT_EQ(controller->get_state(), ControllerState::Collapsed);
    EXPECT_TRUE(controller->get_structure().empty());
    EXPECT_EQ(controller->get_run_state().lives, 2);
    EXPECT_EQ(controller->get_run_state().level_attempts, 2);
    EXPECT_TRUE(controller->get_run_state().first_piece);

    // The next piece spawns after the restart delay
    EXPECT_TRUE(run_until([this] { return controller->get_state() == ControllerState::AwaitingDrop; },
                          static_cast<int>(rules.restart_delay / rules.fixed_timestep) + 5));
    EXPECT_NE(controller->get_current_piece(), INVALID_PIECE);
}

TEST_F(LevelControllerTest, StableStructureDoesNotCollapse) {
    start();
    ASSERT_TRUE(controller->apply_snapshot(make_record({{0.0, 0.0}, {0.0, 0.0}, {5.0, 0.0}})));

    CollapseReport report = controller->check_for_collapse();
    EXPECT_FALSE(report.collapsed);
    EXPECT_EQ(controller->get_structure().size(), 3u);
    EXPECT_EQ(controller->get_run_state().lives, 3);
}

TEST_F(LevelControllerTest, CollapseOnLastLifeEndsRun) {
    start();
    int game_over_hook = 0;
    GameHooks hooks;
    hooks.on_game_over = [&game_over_hook](const GameEvent&) { ++game_over_hook; };
    controller->set_hooks(std::move(hooks));

    SnapshotRecord record = make_record({{5.0, 0.0}, {5.0, 0.0}});
    record.run.lives = 1;
    ASSERT_TRUE(controller->apply_snapshot(record));

    EXPECT_TRUE(controller->check_for_collapse().collapsed);
    collect();

    EXPECT_EQ(controller->get_state(), ControllerState::GameOver);
    EXPECT_TRUE(controller->get_run_state().game_over);
    EXPECT_EQ(controller->get_run_state().lives, 0);
    EXPECT_EQ(count(GameEventType::GameOver), 1u);
    EXPECT_EQ(game_over_hook, 1);

    // Nothing spawns after the run ends
    for (int i = 0; i < 120; ++i) {
        tick();
    }
    EXPECT_EQ(controller->get_current_piece(), INVALID_PIECE);
    EXPECT_FALSE(controller->drop_current_piece());
}

TEST_F(LevelControllerTest, GameOverHookCanStartNewRun) {
    start();
    int game_over_hook = 0;
    GameHooks hooks;
    hooks.on_game_over = [this, &game_over_hook](const GameEvent&) {
        ++game_over_hook;
        controller->start_new_run();
    };
    controller->set_hooks(std::move(hooks));

    SnapshotRecord record = make_record({{5.0, 0.0}, {5.0, 0.0}});
    record.run.lives = 1;
    ASSERT_TRUE(controller->apply_snapshot(record));

    EXPECT_TRUE(controller->check_for_collapse().collapsed);
    collect();

    EXPECT_EQ(game_over_hook, 1);
    EXPECT_EQ(count(GameEventType::GameOver), 1u);
    EXPECT_EQ(count(GameEventType::RunStarted), 2u);
    EXPECT_EQ(controller->get_state(), ControllerState::AwaitingDrop);
    EXPECT_FALSE(controller->get_run_state().game_over);
    EXPECT_EQ(controller->get_run_state().lives, rules.initial_lives);
    EXPECT_NE(controller->get_current_piece(), INVALID_PIECE);
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(LevelControllerTest, SnapshotCapturesStructure) {
    start();
    PieceId id = place(1, 0.0);

    SnapshotRecord record = controller->request_snapshot();
    EXPECT_EQ(record.run, controller->get_run_state());
    ASSERT_EQ(record.pieces.size(), 1u);
    EXPECT_EQ(record.pieces[0].id, id);
    EXPECT_EQ(record.pieces[0].tier, 1);
    EXPECT_NEAR(record.pieces[0].position.y, rules.footprint_for_tier(1).half_height(), 0.05);
    EXPECT_EQ(record.exempt_piece, id);
    EXPECT_GT(record.next_piece_id, controller->get_current_piece());
    EXPECT_TRUE(SnapshotSerializer::is_fresh(record, SnapshotSerializer::now_ms(), rules.snapshot_max_age_hours));
}

TEST_F(LevelControllerTest, SnapshotRestoresIntoNewController) {
    start();
    place(1, 0.0);
    SnapshotRecord record = controller->request_snapshot();

    physics::PhysicsWorld other_world;
    ASSERT_TRUE(other_world.initialize(rules.physics_config()));
    core::Scheduler other_scheduler;
    {
        LevelController restored(rules, other_world, other_scheduler);
        ASSERT_TRUE(restored.initialize());
        ASSERT_TRUE(restored.apply_snapshot(record));

        EXPECT_EQ(restored.get_run_state(), record.run);
        ASSERT_EQ(restored.get_structure().size(), 1u);
        const Piece* piece = restored.get_piece(record.pieces[0].id);
        ASSERT_NE(piece, nullptr);
        EXPECT_EQ(piece->get_phase(), PiecePhase::ResolvedValid);
        EXPECT_EQ(restored.get_ground_violations().get_exempt_piece(), record.exempt_piece);

        // Fresh ids continue past the saved counter
        EXPECT_EQ(restored.get_state(), ControllerState::AwaitingDrop);
        EXPECT_GE(restored.get_current_piece(), record.next_piece_id);
        EXPECT_EQ(restored.get_piece(restored.get_current_piece())->get_direction(), record.run.piece_direction);
    }
    other_world.shutdown();
}

TEST_F(LevelControllerTest, SnapshotSkipsUnvalidatedPiece) {
    start();
    PieceId base = place(1, 0.0);

    PieceId pending = controller->spawn_piece(3);
    ASSERT_NE(pending, INVALID_PIECE);
    ASSERT_TRUE(controller->move_current_piece_to(0.0));
    ASSERT_TRUE(controller->drop_current_piece());
    ASSERT_TRUE(run_until([this, pending] { return controller->get_structure().contains(pending); }));
    ASSERT_NE(controller->get_piece(pending)->get_phase(), PiecePhase::ResolvedValid);

    SnapshotRecord record = controller->request_snapshot();
    ASSERT_EQ(record.pieces.size(), 1u);
    EXPECT_EQ(record.pieces[0].id, base);

    physics::PhysicsWorld other_world;
    ASSERT_TRUE(other_world.initialize(rules.physics_config()));
    core::Scheduler other_scheduler;
    {
        LevelController restored(rules, other_world, other_scheduler);
        ASSERT_TRUE(restored.initialize());
        ASSERT_TRUE(restored.apply_snapshot(record));

        EXPECT_EQ(restored.get_piece(pending), nullptr);
        EXPECT_EQ(restored.get_structure().size(), 1u);
        EXPECT_EQ(restored.legal_next_tiers(), (std::vector<Tier>{1, 2}));
        EXPECT_EQ(restored.get_run_state().successful_placements, 1);
    }
    other_world.shutdown();
}

TEST_F(LevelControllerTest, SnapshotBetweenLevelsCarriesNoPieces) {
    start();
    place(1, -2.5);
    place(1, 2.5);
    ASSERT_EQ(controller->get_state(), ControllerState::LevelComplete);
    ASSERT_FALSE(controller->get_structure().empty());

    SnapshotRecord record = controller->request_snapshot();
    EXPECT_EQ(record.run.level, 2);
    EXPECT_TRUE(record.pieces.empty());
    EXPECT_TRUE(record.ground_violations.empty());
    EXPECT_EQ(record.exempt_piece, INVALID_PIECE);

    physics::PhysicsWorld other_world;
    ASSERT_TRUE(other_world.initialize(rules.physics_config()));
    core::Scheduler other_scheduler;
    {
        LevelController restored(rules, other_world, other_scheduler);
        ASSERT_TRUE(restored.initialize());
        ASSERT_TRUE(restored.apply_snapshot(record));

        EXPECT_EQ(restored.get_level().id, 2);
        EXPECT_TRUE(restored.get_structure().empty());
        EXPECT_EQ(restored.get_state(), ControllerState::AwaitingDrop);
    }
    other_world.shutdown();
}

TEST_F(LevelControllerTest, StaleSnapshotStartsFreshRun) {
    start();
    SnapshotRecord record = make_record({{0.0, 0.0}});
    record.run.score = 900;
    record.timestamp_ms -= 48 * HOUR_MS;

    EXPECT_FALSE(controller->apply_snapshot(record));
    collect();

    EXPECT_EQ(count(GameEventType::SnapshotRejected), 1u);
    EXPECT_EQ(count(GameEventType::SnapshotApplied), 0u);
    EXPECT_EQ(controller->get_run_state().score, 0);
    EXPECT_TRUE(controller->get_structure().empty());
    EXPECT_EQ(controller->get_state(), ControllerState::AwaitingDrop);
}

TEST_F(LevelControllerTest, FutureSnapshotIsRefused) {
    start();
    SnapshotRecord record = make_record({{0.0, 0.0}});
    record.timestamp_ms += HOUR_MS;
    EXPECT_FALSE(controller->apply_snapshot(record));
}

TEST_F(LevelControllerTest, SnapshotWithDuplicateIdsIsRefused) {
    start();
    SnapshotRecord record = make_record({{0.0, 0.0}, {0.0, 0.0}});
    record.pieces[1].id = record.pieces[0].id;
    record.run.score = 300;

    EXPECT_FALSE(controller->apply_snapshot(record));
    collect();
    EXPECT_EQ(count(GameEventType::SnapshotRejected), 1u);
    EXPECT_EQ(controller->get_run_state().score, 0);
    EXPECT_TRUE(controller->get_structure().empty());
}

TEST_F(LevelControllerTest, SnapshotOfFinishedRunStaysOver) {
    start();
    SnapshotRecord record = make_record({});
    record.run.lives = 0;
    record.run.game_over = true;

    ASSERT_TRUE(controller->apply_snapshot(record));
    EXPECT_EQ(controller->get_state(), ControllerState::GameOver);
    EXPECT_EQ(controller->get_current_piece(), INVALID_PIECE);
}

}  // namespace
}  // namespace sandcastle::gameplay
