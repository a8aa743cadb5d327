// SandCastle Gameplay
// level_controller.cpp - Level progression implementation

#include <sandcastle/core/logger.hpp>
#include <sandcastle/gameplay/level_controller.hpp>

#include <algorithm>
#include <functional>
#include <random>
#include <utility>

namespace sandcastle::gameplay {

// ============================================================================
// Implementation
// ============================================================================

struct LevelController::Impl {
    GameRules rules;
    physics::PhysicsWorld& world;
    core::Scheduler& scheduler;

    LevelCatalog catalog;
    StabilityClassifier classifier;
    PlacementValidator validator;
    CollapseDetector collapse_detector;
    ScoreLedger ledger;
    GroundViolationLog ground_log;
    PieceRegistry pieces;
    Structure structure;
    Level level;

    ControllerState state = ControllerState::AwaitingDrop;
    PieceId current_piece = INVALID_PIECE;
    PieceId falling_piece = INVALID_PIECE;

    physics::RigidBodyHandle ground = physics::INVALID_RIGID_BODY;
    physics::RigidBodyHandle left_wall = physics::INVALID_RIGID_BODY;
    physics::RigidBodyHandle right_wall = physics::INVALID_RIGID_BODY;

    // Bumped whenever pending callbacks must stop acting (restart, new level, new run)
    uint64_t epoch = 0;

    std::mt19937 rng;
    std::vector<core::TaskId> tasks;

    std::vector<GameEvent> events;
    size_t hook_cursor = 0;
    bool dispatching = false;
    GameHooks hooks;

    bool initialized = false;

    Impl(const GameRules& r, physics::PhysicsWorld& w, core::Scheduler& s, LevelCatalog c)
        : rules(r), world(w), scheduler(s), catalog(std::move(c)), classifier(rules), validator(rules),
          collapse_detector(rules), ledger(rules), ground_log(rules.base_tier), level(catalog.get(1)),
          rng(rules.rng_seed != 0 ? rules.rng_seed : std::random_device{}()) {}

    // ========================================================================
    // Arena
    // ========================================================================

    physics::RigidBodyHandle create_static_box(const glm::dvec3& center, const glm::dvec3& half_extents,
                                               physics::CollisionLayer layer) {
        physics::RigidBodyDesc desc;
        desc.position = center;
        desc.half_extents = half_extents;
        desc.motion_type = physics::MotionType::Static;
        desc.material = physics::PhysicsMaterial::ground();
        desc.collision_layer = static_cast<uint32_t>(layer);
        desc.collision_mask = static_cast<uint32_t>(physics::CollisionLayer::Piece);
        return world.create_rigid_body(desc);
    }

    bool build_arena() {
        const double half_width = rules.arena_half_width();
        const double wall_height = rules.spawn_height + 4.0;

        // Ground top sits at y = 0
        ground = create_static_box(glm::dvec3(0.0, -rules.ground_height * 0.5, 0.0),
                                   glm::dvec3(half_width + 1.0, rules.ground_height * 0.5, 0.5),
                                   physics::CollisionLayer::Ground);
        left_wall = create_static_box(glm::dvec3(-half_width - 0.5, wall_height * 0.5, 0.0),
                                      glm::dvec3(0.5, wall_height * 0.5, 0.5), physics::CollisionLayer::Wall);
        right_wall = create_static_box(glm::dvec3(half_width + 0.5, wall_height * 0.5, 0.0),
                                       glm::dvec3(0.5, wall_height * 0.5, 0.5), physics::CollisionLayer::Wall);

        return ground != physics::INVALID_RIGID_BODY && left_wall != physics::INVALID_RIGID_BODY &&
               right_wall != physics::INVALID_RIGID_BODY;
    }

    void destroy_arena() {
        world.destroy_rigid_body(ground);
        world.destroy_rigid_body(left_wall);
        world.destroy_rigid_body(right_wall);
        ground = left_wall = right_wall = physics::INVALID_RIGID_BODY;
    }

    // ========================================================================
    // Events
    // ========================================================================

    void publish(GameEventType type, PieceId piece = INVALID_PIECE, Tier tier = 0, int score_delta = 0,
                 int count = 0, StabilityLevel stability = StabilityLevel::Stable) {
        GameEvent event;
        event.type = type;
        event.time = scheduler.now();
        event.piece = piece;
        event.tier = tier;
        event.score_delta = score_delta;
        event.count = count;
        event.stability = stability;
        event.totals = ledger.totals();
        events.push_back(event);
    }

    // Hooks may call back into the controller. Nested flushes return at once and
    // the outer loop picks up whatever the hook published.
    void flush_hooks() {
        if (dispatching) {
            return;
        }
        struct DispatchGuard {
            bool& flag;
            explicit DispatchGuard(bool& f) : flag(f) { flag = true; }
            ~DispatchGuard() { flag = false; }
        } guard(dispatching);

        while (hook_cursor < events.size()) {
            const GameEvent event = events[hook_cursor++];
            dispatch_hook(event);
        }
    }

    void dispatch_hook(const GameEvent& event) const {
        std::function<void(const GameEvent&)> hook;
        switch (event.type) {
            case GameEventType::PieceDropped:
                hook = hooks.on_piece_dropped;
                break;
            case GameEventType::LevelComplete:
                hook = hooks.on_level_complete;
                break;
            case GameEventType::Collapse:
                hook = hooks.on_collapse;
                break;
            case GameEventType::GameOver:
                hook = hooks.on_game_over;
                break;
            default:
                break;
        }
        // Copied so a hook may replace the hooks while running
        if (hook) {
            hook(event);
        }
    }

    // ========================================================================
    // Pieces
    // ========================================================================

    // Centre limits for a held piece of the given footprint
    std::pair<double, double> held_range(const Footprint& footprint) const {
        double limit = std::max(0.0, rules.arena_half_width() - footprint.half_width());
        return {-limit, limit};
    }

    std::vector<Tier> legal_next_tiers() const {
        std::vector<Tier> tiers;
        auto allowed = [this](Tier tier) { return level.allowed_tiers.empty() || level.allows(tier); };

        tiers.push_back(rules.base_tier);
        for (Tier tier = rules.base_tier + 1; tier <= rules.max_tier; ++tier) {
            bool has_support_tier = false;
            for (PieceId id : structure.ids()) {
                const Piece* piece = pieces.get(id);
                if (piece != nullptr && piece->get_phase() == PiecePhase::ResolvedValid &&
                    piece->get_tier() == tier - 1) {
                    has_support_tier = true;
                    break;
                }
            }
            if (has_support_tier && allowed(tier)) {
                tiers.push_back(tier);
            }
        }
        return tiers;
    }

    void release_held_piece() {
        if (current_piece != INVALID_PIECE) {
            pieces.release(current_piece, world);
            current_piece = INVALID_PIECE;
        }
    }

    PieceId spawn_held_piece(Tier tier, int direction) {
        release_held_piece();

        Footprint footprint = rules.footprint_for_tier(tier);
        Piece& piece = pieces.spawn(tier, footprint, glm::dvec2(0.0, rules.spawn_height), scheduler.now());
        piece.set_sample_window(static_cast<size_t>(rules.sample_window));
        piece.begin_oscillation(ledger.state().piece_speed, direction);
        ledger.set_piece_direction(direction);

        current_piece = piece.get_id();
        state = ControllerState::AwaitingDrop;

        SANDCASTLE_LOG_DEBUG(core::log_category::GAME, "Spawned piece {} (tier {})", piece.get_id(), tier);
        publish(GameEventType::PieceSpawned, piece.get_id(), tier);
        return piece.get_id();
    }

    // direction 0 picks a random sweep direction
    PieceId spawn_next_piece(int direction = 0) {
        std::vector<Tier> tiers = legal_next_tiers();
        std::uniform_int_distribution<size_t> pick(0, tiers.size() - 1);
        Tier tier = tiers[pick(rng)];
        if (direction == 0) {
            direction = std::bernoulli_distribution(0.5)(rng) ? 1 : -1;
        }
        return spawn_held_piece(tier, direction);
    }

    void schedule_guarded(double delay, std::string label, std::function<void()> task) {
        tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                                   [this](core::TaskId id) { return !scheduler.is_pending(id); }),
                    tasks.end());

        uint64_t scheduled_epoch = epoch;
        tasks.push_back(scheduler.schedule(
            delay,
            [this, scheduled_epoch, task = std::move(task)]() {
                if (scheduled_epoch != epoch) {
                    return;
                }
                task();
            },
            std::move(label)));
    }

    // Pending callbacks capture this controller; drop them before it goes away
    void cancel_tasks() {
        for (core::TaskId id : tasks) {
            scheduler.cancel(id);
        }
        tasks.clear();
    }

    void schedule_spawn() {
        state = ControllerState::Continuing;
        schedule_guarded(rules.spawn_delay, "spawn", [this]() {
            if (state == ControllerState::Continuing) {
                spawn_next_piece();
            }
        });
    }

    // Remove a piece from the structure and release its body
    void remove_piece(PieceId id) {
        structure.remove(id);
        pieces.release(id, world);
        if (falling_piece == id) {
            falling_piece = INVALID_PIECE;
        }
        if (current_piece == id) {
            current_piece = INVALID_PIECE;
        }
    }

    void clear_pieces() {
        structure.clear();
        pieces.clear(world);
        current_piece = INVALID_PIECE;
        falling_piece = INVALID_PIECE;
    }

    // Fresh samples for every structure member, refreshing cached positions
    std::vector<KinematicSample> sample_structure() {
        std::vector<KinematicSample> samples;
        samples.reserve(structure.size());
        for (PieceId id : structure.ids()) {
            Piece* piece = pieces.get(id);
            if (piece == nullptr) {
                samples.push_back(KinematicSample::at_rest());
                continue;
            }
            samples.push_back(piece->refresh(world));
        }
        return samples;
    }

    // ========================================================================
    // Contacts
    // ========================================================================

    void process_contacts() {
        for (const physics::ContactEvent& contact : world.drain_contact_events()) {
            if (contact.phase != physics::ContactPhase::Began) {
                continue;
            }

            PieceId piece_a = pieces.find_by_body(contact.body_a);
            PieceId piece_b = pieces.find_by_body(contact.body_b);

            if (contact.involves(ground)) {
                PieceId id = piece_a != INVALID_PIECE ? piece_a : piece_b;
                if (id != INVALID_PIECE) {
                    on_touchdown(id);
                    handle_ground_contact(id);
                }
                continue;
            }

            // Piece-on-piece contact marks touchdown for a falling piece
            if (piece_a != INVALID_PIECE && piece_b != INVALID_PIECE) {
                on_touchdown(piece_a);
                on_touchdown(piece_b);
            }
        }
    }

    void on_touchdown(PieceId id) {
        if (id != falling_piece) {
            return;
        }
        Piece* piece = pieces.get(id);
        if (piece == nullptr || piece->get_phase() != PiecePhase::Falling) {
            return;
        }
        piece->begin_settling();
        structure.add(*piece);
        SANDCASTLE_LOG_TRACE(core::log_category::GAME, "Piece {} touched down", id);
    }

    // ========================================================================
    // Rules
    // ========================================================================

    bool handle_ground_contact(PieceId id) {
        Piece* piece = pieces.get(id);
        if (piece == nullptr || !piece->has_body()) {
            return false;
        }

        GroundContactVerdict verdict = ground_log.assess(id, piece->get_tier(), piece->is_placement_valid());
        if (verdict != GroundContactVerdict::Violation) {
            SANDCASTLE_LOG_TRACE(core::log_category::GAME, "Ground contact by piece {}: {}", id, to_string(verdict));
            return false;
        }

        const Tier tier = piece->get_tier();
        const bool was_falling = id == falling_piece;

        ground_log.record(id, rules.ground_penalty, SnapshotSerializer::now_ms());
        LedgerResult result = ledger.penalize(rules.ground_penalty, ScoreReason::GroundViolation);
        remove_piece(id);

        SANDCASTLE_LOG_INFO(core::log_category::GAME, "Ground violation by piece {} (tier {}), penalty {}", id, tier,
                            -result.delta);
        publish(GameEventType::GroundViolation, id, tier, result.delta);

        if (was_falling) {
            on_piece_outcome();
        }
        return true;
    }

    void validate_placement(PieceId id) {
        Piece* piece = pieces.get(id);
        if (piece == nullptr || !structure.contains(id) || piece->get_phase() != PiecePhase::Settling) {
            SANDCASTLE_LOG_TRACE(core::log_category::GAME, "Skipping validation of piece {}: no longer pending", id);
            return;
        }

        sample_structure();

        std::vector<PieceBounds> others;
        for (PieceId other_id : structure.ids()) {
            const Piece* other = pieces.get(other_id);
            if (other != nullptr && other_id != id) {
                others.push_back(other->get_bounds());
            }
        }

        const bool ground_exempt = id == ground_log.get_exempt_piece();
        PlacementResult result = validator.validate(piece->get_bounds(), others, ground_exempt);
        const Tier tier = piece->get_tier();

        if (!result.valid) {
            piece->reject();
            LedgerResult penalty = ledger.penalize(rules.wrong_placement_penalty, ScoreReason::WrongPlacement);
            ledger.record_wrong_placement();
            remove_piece(id);

            SANDCASTLE_LOG_INFO(core::log_category::GAME, "Placement of piece {} (tier {}) rejected: {}", id, tier,
                                to_string(result.reason));
            publish(GameEventType::PlacementRejected, id, tier, penalty.delta);
        } else {
            piece->freeze(world);
            int awarded = ledger.award(rules.placement_score(tier), ScoreReason::Placement).delta;
            awarded += ledger.award(rules.stability_bonus(piece->get_stability()), ScoreReason::StabilityBonus).delta;
            ledger.record_successful_placement();

            SANDCASTLE_LOG_INFO(core::log_category::GAME, "Placement of piece {} (tier {}) accepted: {}", id, tier,
                                to_string(result.reason));
            publish(GameEventType::PlacementAccepted, id, tier, awarded, 0, piece->get_stability());

            if (rules.is_capstone(tier)) {
                clear_beneath_capstone(id);
            }
        }

        if (falling_piece == id) {
            falling_piece = INVALID_PIECE;
        }
        on_piece_outcome();
    }

    void clear_beneath_capstone(PieceId capstone_id) {
        const Piece* capstone = pieces.get(capstone_id);
        if (capstone == nullptr) {
            return;
        }
        const PieceBounds cap = capstone->get_bounds();

        std::vector<PieceId> cleared;
        for (PieceId id : structure.ids()) {
            const Piece* piece = pieces.get(id);
            if (piece == nullptr) {
                continue;
            }
            const PieceBounds bounds = piece->get_bounds();
            const bool beneath = bounds.center.y <= cap.center.y && bounds.horizontal_overlap(cap) > 0.0;
            if (id == capstone_id || beneath) {
                cleared.push_back(id);
            }
        }

        for (PieceId id : cleared) {
            remove_piece(id);
        }

        const int count = static_cast<int>(cleared.size());
        LedgerResult result = ledger.award(rules.capstone_bonus_per_piece * count, ScoreReason::CapstoneClear);
        ledger.record_reward();

        SANDCASTLE_LOG_INFO(core::log_category::GAME, "Capstone {} cleared {} pieces, bonus {}", capstone_id, count,
                            result.delta);
        publish(GameEventType::CapstoneClear, capstone_id, cap.tier, result.delta, count);
    }

    // A dropped piece was accepted or removed: defer the collapse/completion check
    void on_piece_outcome() {
        state = ControllerState::Settling;
        schedule_guarded(rules.collapse_check_delay, "post-outcome check", [this]() { post_outcome_check(); });
    }

    void post_outcome_check() {
        if (state != ControllerState::Settling || falling_piece != INVALID_PIECE) {
            return;
        }

        CollapseReport report = check_for_collapse();
        if (report.collapsed) {
            return;
        }

        if (ledger.state().successful_placements >= level.target_piece_count) {
            complete_level();
        } else {
            schedule_spawn();
        }
    }

    void complete_level() {
        const int completed = level.id;
        LedgerResult result = ledger.complete_level(rules.level_complete_bonus);
        state = ControllerState::LevelComplete;
        ++epoch;

        SANDCASTLE_LOG_INFO(core::log_category::GAME, "Level {} complete, score {}", completed, result.score);
        publish(GameEventType::LevelComplete, INVALID_PIECE, 0, result.delta, completed);
    }

    CollapseReport check_for_collapse() {
        std::vector<KinematicSample> samples = sample_structure();
        CollapseReport report = collapse_detector.evaluate(samples);
        if (report.collapsed) {
            handle_collapse(report);
        }
        return report;
    }

    void handle_collapse(const CollapseReport& report) {
        SANDCASTLE_LOG_INFO(core::log_category::GAME, "Structure collapsed: {}/{} pieces unstable",
                            report.unstable_count, report.piece_count);
        publish(GameEventType::Collapse, INVALID_PIECE, 0, 0, static_cast<int>(report.unstable_count));

        ++epoch;
        clear_pieces();
        ground_log.reset();

        LedgerResult result = ledger.restart_level();
        if (result.game_over) {
            state = ControllerState::GameOver;
            SANDCASTLE_LOG_INFO(core::log_category::GAME, "Game over, final score {}", result.score);
            publish(GameEventType::GameOver, INVALID_PIECE, 0, 0, result.score);
            return;
        }

        state = ControllerState::Collapsed;
        publish(GameEventType::LevelRestarted, INVALID_PIECE, 0, 0, ledger.state().level_attempts);
        schedule_guarded(rules.restart_delay, "restart level", [this]() {
            if (state == ControllerState::Collapsed) {
                spawn_next_piece();
            }
        });
    }

    // ========================================================================
    // Settling State Machine
    // ========================================================================

    void update_falling_piece() {
        if (falling_piece == INVALID_PIECE) {
            return;
        }
        Piece* piece = pieces.get(falling_piece);
        if (piece == nullptr) {
            falling_piece = INVALID_PIECE;
            return;
        }

        StabilityObservation observation = piece->observe(piece->sample_kinematics(world), classifier);
        if (observation.changed) {
            publish(GameEventType::StabilityChanged, piece->get_id(), piece->get_tier(), 0, 0, observation.level);
        }

        const bool settled = piece->get_phase() == PiecePhase::Settling &&
                             observation.consecutive_stable_ticks >= rules.settle_ticks;
        const bool timed_out = piece->get_settle_ticks() >= rules.max_settle_ticks;

        if (timed_out && piece->get_phase() == PiecePhase::Falling) {
            // Never touched anything we track; judge it where it is
            piece->begin_settling();
            structure.add(*piece);
        }
        if (settled || timed_out) {
            validate_placement(piece->get_id());
        }
    }

    void reset_for_level() {
        ++epoch;
        clear_pieces();
        ground_log.reset();
        level = catalog.get(ledger.state().level);
    }
};

// ============================================================================
// Lifecycle
// ============================================================================

LevelController::LevelController(const GameRules& rules, physics::PhysicsWorld& world, core::Scheduler& scheduler)
    : LevelController(rules, world, scheduler, LevelCatalog(rules)) {}

LevelController::LevelController(const GameRules& rules, physics::PhysicsWorld& world, core::Scheduler& scheduler,
                                 LevelCatalog catalog)
    : impl_(std::make_unique<Impl>(rules, world, scheduler, std::move(catalog))) {}

LevelController::~LevelController() {
    shutdown();
    impl_->cancel_tasks();
}

bool LevelController::initialize() {
    if (impl_->initialized) {
        SANDCASTLE_LOG_WARN(core::log_category::GAME, "LevelController already initialized");
        return false;
    }
    if (!impl_->world.is_initialized()) {
        SANDCASTLE_LOG_ERROR(core::log_category::GAME, "LevelController needs an initialized physics world");
        return false;
    }
    if (!impl_->build_arena()) {
        SANDCASTLE_LOG_ERROR(core::log_category::GAME, "Failed to build arena");
        impl_->destroy_arena();
        return false;
    }

    impl_->initialized = true;
    SANDCASTLE_LOG_INFO(core::log_category::GAME, "LevelController initialized (arena {:.1f} wide, {} tiers)",
                        impl_->rules.arena_width, impl_->rules.max_tier - impl_->rules.base_tier + 1);

    start_new_run();
    return true;
}

void LevelController::shutdown() {
    if (!impl_->initialized) {
        return;
    }
    ++impl_->epoch;
    impl_->cancel_tasks();
    impl_->clear_pieces();
    impl_->destroy_arena();
    impl_->initialized = false;
    SANDCASTLE_LOG_INFO(core::log_category::GAME, "LevelController shutdown");
}

bool LevelController::is_initialized() const {
    return impl_->initialized;
}

void LevelController::fixed_update(double fixed_delta) {
    if (!impl_->initialized) {
        return;
    }

    if (impl_->state == ControllerState::AwaitingDrop && impl_->current_piece != INVALID_PIECE) {
        if (Piece* held = impl_->pieces.get(impl_->current_piece)) {
            auto [min_x, max_x] = impl_->held_range(held->get_footprint());
            held->advance_oscillation(fixed_delta, min_x, max_x);
            if (held->get_direction() != impl_->ledger.state().piece_direction) {
                impl_->ledger.set_piece_direction(held->get_direction());
            }
        }
    }

    impl_->world.fixed_update(fixed_delta);
    impl_->process_contacts();
    impl_->update_falling_piece();
    impl_->scheduler.advance(fixed_delta);
    impl_->flush_hooks();
}

// ============================================================================
// Player Commands
// ============================================================================

bool LevelController::drop_current_piece() {
    if (!impl_->initialized || impl_->state != ControllerState::AwaitingDrop ||
        impl_->current_piece == INVALID_PIECE) {
        return false;
    }

    const PieceId id = impl_->current_piece;
    if (!impl_->pieces.drop(id, impl_->world)) {
        return false;
    }

    if (impl_->ledger.state().first_piece) {
        impl_->ground_log.set_exempt_piece(id);
        impl_->ledger.clear_first_piece();
    }

    impl_->current_piece = INVALID_PIECE;
    impl_->falling_piece = id;
    impl_->state = ControllerState::Settling;

    const Piece* piece = impl_->pieces.get(id);
    impl_->publish(GameEventType::PieceDropped, id, piece->get_tier());
    impl_->flush_hooks();
    return true;
}

bool LevelController::move_current_piece_to(double x) {
    if (impl_->state != ControllerState::AwaitingDrop) {
        return false;
    }
    Piece* held = impl_->pieces.get(impl_->current_piece);
    if (held == nullptr) {
        return false;
    }
    auto [min_x, max_x] = impl_->held_range(held->get_footprint());
    return held->move_to(x, min_x, max_x);
}

PieceId LevelController::spawn_piece(Tier tier) {
    if (!impl_->initialized || !impl_->rules.is_valid_tier(tier) || impl_->state != ControllerState::AwaitingDrop) {
        return INVALID_PIECE;
    }
    PieceId id = impl_->spawn_held_piece(tier, impl_->ledger.state().piece_direction);
    impl_->flush_hooks();
    return id;
}

bool LevelController::continue_to_next_level() {
    if (impl_->state != ControllerState::LevelComplete) {
        return false;
    }
    impl_->reset_for_level();
    SANDCASTLE_LOG_INFO(core::log_category::GAME, "Starting level {} '{}' (target {})", impl_->level.id,
                        impl_->level.name, impl_->level.target_piece_count);
    impl_->spawn_next_piece();
    impl_->flush_hooks();
    return true;
}

void LevelController::start_new_run() {
    impl_->ledger.start_new_run();
    impl_->reset_for_level();

    SANDCASTLE_LOG_INFO(core::log_category::GAME, "New run: level {} '{}' (target {}), {} lives", impl_->level.id,
                        impl_->level.name, impl_->level.target_piece_count, impl_->ledger.state().lives);
    impl_->publish(GameEventType::RunStarted, INVALID_PIECE, 0, 0, impl_->level.id);

    if (impl_->initialized) {
        impl_->spawn_next_piece();
    }
    impl_->flush_hooks();
}

// ============================================================================
// Rule Entry Points
// ============================================================================

bool LevelController::handle_ground_contact(PieceId id) {
    bool penalized = impl_->handle_ground_contact(id);
    impl_->flush_hooks();
    return penalized;
}

void LevelController::validate_placement(PieceId id) {
    impl_->validate_placement(id);
    impl_->flush_hooks();
}

CollapseReport LevelController::check_for_collapse() {
    CollapseReport report = impl_->check_for_collapse();
    impl_->flush_hooks();
    return report;
}

// ============================================================================
// Persistence
// ============================================================================

SnapshotRecord LevelController::request_snapshot() const {
    SnapshotRecord record;
    record.timestamp_ms = SnapshotSerializer::now_ms();
    record.run = impl_->ledger.state();
    record.next_piece_id = impl_->pieces.peek_next_id();

    // The ledger already points at the next level, whose structure starts empty
    if (impl_->state == ControllerState::LevelComplete) {
        SANDCASTLE_LOG_DEBUG(core::log_category::PERSISTENCE, "Snapshot requested between levels, score {}",
                             record.run.score);
        return record;
    }

    record.ground_violations = impl_->ground_log.records();
    record.exempt_piece = impl_->ground_log.get_exempt_piece();

    // Pieces still settling have not been validated; a resumed run drops them
    for (PieceId id : impl_->structure.ids()) {
        const Piece* piece = impl_->pieces.get(id);
        if (piece == nullptr || piece->get_phase() != PiecePhase::ResolvedValid) {
            continue;
        }
        KinematicSample sample = piece->sample_kinematics(impl_->world);
        PieceRecord entry;
        entry.id = id;
        entry.tier = piece->get_tier();
        entry.position = sample.position;
        entry.velocity = sample.velocity;
        entry.footprint = piece->get_footprint();
        record.pieces.push_back(entry);
    }

    SANDCASTLE_LOG_DEBUG(core::log_category::PERSISTENCE, "Snapshot requested: {} pieces, score {}",
                         record.pieces.size(), record.run.score);
    return record;
}

bool LevelController::apply_snapshot(const SnapshotRecord& record) {
    const int64_t now = SnapshotSerializer::now_ms();
    if (!SnapshotSerializer::is_fresh(record, now, impl_->rules.snapshot_max_age_hours)) {
        SANDCASTLE_LOG_WARN(core::log_category::PERSISTENCE, "Discarding stale snapshot ({} ms old)",
                            now - record.timestamp_ms);
        impl_->publish(GameEventType::SnapshotRejected);
        start_new_run();
        return false;
    }

    impl_->ledger.restore(record.run);
    impl_->reset_for_level();
    impl_->ground_log.restore(record.ground_violations, record.exempt_piece);

    for (const PieceRecord& entry : record.pieces) {
        Piece* piece =
            impl_->pieces.spawn_with_id(entry.id, entry.tier, entry.footprint, entry.position, impl_->scheduler.now());
        if (piece == nullptr || !impl_->rules.is_valid_tier(entry.tier)) {
            SANDCASTLE_LOG_WARN(core::log_category::PERSISTENCE, "Snapshot piece {} is unusable, discarding snapshot",
                                entry.id);
            impl_->publish(GameEventType::SnapshotRejected);
            start_new_run();
            return false;
        }
        piece->set_sample_window(static_cast<size_t>(impl_->rules.sample_window));
        if (!impl_->pieces.restore(entry.id, impl_->world, entry.position, entry.velocity)) {
            SANDCASTLE_LOG_WARN(core::log_category::PERSISTENCE, "Could not restore body for piece {}", entry.id);
            impl_->publish(GameEventType::SnapshotRejected);
            start_new_run();
            return false;
        }
        impl_->structure.add(*piece);
    }

    impl_->pieces.reserve_ids(record.next_piece_id);

    SANDCASTLE_LOG_INFO(core::log_category::PERSISTENCE, "Snapshot applied: level {}, {} pieces, score {}",
                        record.run.level, record.pieces.size(), record.run.score);
    impl_->publish(GameEventType::SnapshotApplied, INVALID_PIECE, 0, 0, static_cast<int>(record.pieces.size()));

    if (record.run.game_over) {
        impl_->state = ControllerState::GameOver;
    } else if (impl_->initialized) {
        impl_->spawn_next_piece(record.run.piece_direction);
    }
    impl_->flush_hooks();
    return true;
}

// ============================================================================
// Events
// ============================================================================

std::vector<GameEvent> LevelController::drain_events() {
    impl_->flush_hooks();
    std::vector<GameEvent> drained;
    drained.swap(impl_->events);
    impl_->hook_cursor = 0;
    return drained;
}

void LevelController::set_hooks(GameHooks hooks) {
    impl_->hooks = std::move(hooks);
}

// ============================================================================
// Queries
// ============================================================================

ControllerState LevelController::get_state() const {
    return impl_->state;
}

const GameRules& LevelController::get_rules() const {
    return impl_->rules;
}

const RunState& LevelController::get_run_state() const {
    return impl_->ledger.state();
}

const ScoreLedger& LevelController::get_ledger() const {
    return impl_->ledger;
}

const Structure& LevelController::get_structure() const {
    return impl_->structure;
}

const PieceRegistry& LevelController::get_pieces() const {
    return impl_->pieces;
}

const GroundViolationLog& LevelController::get_ground_violations() const {
    return impl_->ground_log;
}

const Level& LevelController::get_level() const {
    return impl_->level;
}

PieceId LevelController::get_current_piece() const {
    return impl_->current_piece;
}

PieceId LevelController::get_falling_piece() const {
    return impl_->falling_piece;
}

const Piece* LevelController::get_piece(PieceId id) const {
    return impl_->pieces.get(id);
}

std::vector<Tier> LevelController::legal_next_tiers() const {
    return impl_->legal_next_tiers();
}

physics::RigidBodyHandle LevelController::get_ground_handle() const {
    return impl_->ground;
}

uint64_t LevelController::get_epoch() const {
    return impl_->epoch;
}

}  // namespace sandcastle::gameplay
