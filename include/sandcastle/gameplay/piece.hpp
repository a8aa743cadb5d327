// SandCastle Gameplay
// piece.hpp - One dropped building piece: identity, geometry, physics handle, lifecycle

#pragma once

#include "types.hpp"

#include <sandcastle/physics/physics_world.hpp>

#include <deque>

namespace sandcastle::gameplay {

class StabilityClassifier;

// Axis-aligned bounds of a piece in world space (y up, ground top at y = 0)
struct PieceBounds {
    PieceId id = INVALID_PIECE;
    Tier tier = 0;
    glm::dvec2 center{0.0};
    Footprint footprint;

    [[nodiscard]] double left() const { return center.x - footprint.half_width(); }
    [[nodiscard]] double right() const { return center.x + footprint.half_width(); }
    [[nodiscard]] double bottom() const { return center.y - footprint.half_height(); }
    [[nodiscard]] double top() const { return center.y + footprint.half_height(); }

    // Width of the shared x-interval, 0 when disjoint
    [[nodiscard]] double horizontal_overlap(const PieceBounds& other) const;
};

// Result of feeding one kinematic sample through a piece's stability tracker
struct StabilityObservation {
    StabilityLevel level = StabilityLevel::Stable;
    StabilityLevel previous = StabilityLevel::Stable;
    bool changed = false;
    int consecutive_stable_ticks = 0;
};

// ============================================================================
// Piece
// ============================================================================

// Position is owned by the piece until drop(); from then on the physics world
// owns it and the piece only caches the last sample.
class Piece {
public:
    Piece(PieceId id, Tier tier, const Footprint& footprint, const glm::dvec2& start_position, double spawn_time);
    ~Piece() = default;

    // Non-copyable (owns a physics handle)
    Piece(const Piece&) = delete;
    Piece& operator=(const Piece&) = delete;

    // ========================================================================
    // Identity
    // ========================================================================

    [[nodiscard]] PieceId get_id() const { return id_; }
    [[nodiscard]] Tier get_tier() const { return tier_; }
    [[nodiscard]] const Footprint& get_footprint() const { return footprint_; }
    [[nodiscard]] double get_spawn_time() const { return spawn_time_; }
    [[nodiscard]] PiecePhase get_phase() const { return phase_; }
    [[nodiscard]] physics::RigidBodyHandle get_body() const { return body_; }
    [[nodiscard]] bool has_body() const { return body_ != physics::INVALID_RIGID_BODY; }
    [[nodiscard]] bool is_placement_valid() const { return placement_valid_; }

    // ========================================================================
    // Pre-drop Movement
    // ========================================================================

    // Spawned -> Moving. direction is +1 or -1.
    void begin_oscillation(double speed, int direction);

    // Horizontal sweep with bounce at [min_x, max_x] (piece centre limits)
    void advance_oscillation(double delta, double min_x, double max_x);

    // Place the held piece at an explicit x, clamped to [min_x, max_x]. False once dropped.
    bool move_to(double x, double min_x, double max_x);

    [[nodiscard]] double get_speed() const { return speed_; }
    [[nodiscard]] int get_direction() const { return direction_; }

    // ========================================================================
    // Physics Lifecycle
    // ========================================================================

    // Moving/Spawned -> Falling. Creates the dynamic body. Returns false (no-op)
    // when the piece is already dropped or the world refuses the body.
    bool drop(physics::PhysicsWorld& world);

    // Re-create a body at a saved pose for snapshot import. Phase becomes ResolvedValid.
    bool restore(physics::PhysicsWorld& world, const glm::dvec2& position, const glm::dvec2& velocity);

    // Falling -> Settling
    void begin_settling();

    // Current position/velocity. A missing body yields an at-rest sample at the last known position.
    [[nodiscard]] KinematicSample sample_kinematics(const physics::PhysicsWorld& world) const;

    // Pull the current pose into the cached position without touching the stability window
    KinematicSample refresh(const physics::PhysicsWorld& world);

    // Record a sample, classify the recent window and detect a level transition
    StabilityObservation observe(const KinematicSample& sample, const StabilityClassifier& classifier);

    // Settling -> ResolvedValid; damp the body so it only drifts passively
    void freeze(physics::PhysicsWorld& world);

    // Settling/Falling -> ResolvedInvalid
    void reject();

    // Release the physics body. Any phase -> Removed. Safe to call repeatedly.
    void destroy(physics::PhysicsWorld& world);

    // ========================================================================
    // State
    // ========================================================================

    [[nodiscard]] glm::dvec2 get_position() const { return position_; }
    [[nodiscard]] glm::dvec2 get_velocity() const { return velocity_; }
    [[nodiscard]] PieceBounds get_bounds() const;

    [[nodiscard]] StabilityLevel get_stability() const { return stability_; }
    [[nodiscard]] int get_stable_ticks() const { return stable_ticks_; }
    [[nodiscard]] int get_settle_ticks() const { return settle_ticks_; }
    [[nodiscard]] const std::deque<KinematicSample>& get_samples() const { return samples_; }

    // Maximum samples kept for the stability window
    void set_sample_window(size_t window) { sample_window_ = window == 0 ? 1 : window; }

private:
    PieceId id_;
    Tier tier_;
    Footprint footprint_;
    double spawn_time_;
    PiecePhase phase_ = PiecePhase::Spawned;
    bool placement_valid_ = false;

    physics::RigidBodyHandle body_ = physics::INVALID_RIGID_BODY;

    glm::dvec2 position_;
    glm::dvec2 velocity_{0.0};
    double speed_ = 0.0;
    int direction_ = 1;

    std::deque<KinematicSample> samples_;
    size_t sample_window_ = 4;
    StabilityLevel stability_ = StabilityLevel::Stable;
    int stable_ticks_ = 0;
    int settle_ticks_ = 0;

    physics::RigidBodyDesc make_body_desc(const glm::dvec2& position, const glm::dvec2& velocity) const;
};

}  // namespace sandcastle::gameplay
