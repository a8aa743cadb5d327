// SandCastle Gameplay
// piece.cpp - Piece lifecycle implementation

#include <sandcastle/core/logger.hpp>
#include <sandcastle/gameplay/piece.hpp>
#include <sandcastle/gameplay/stability_classifier.hpp>

#include <algorithm>

namespace sandcastle::gameplay {

double PieceBounds::horizontal_overlap(const PieceBounds& other) const {
    return std::max(0.0, std::min(right(), other.right()) - std::max(left(), other.left()));
}

// ============================================================================
// Construction
// ============================================================================

Piece::Piece(PieceId id, Tier tier, const Footprint& footprint, const glm::dvec2& start_position,
             double spawn_time)
    : id_(id), tier_(tier), footprint_(footprint), spawn_time_(spawn_time), position_(start_position) {}

// ============================================================================
// Pre-drop Movement
// ============================================================================

void Piece::begin_oscillation(double speed, int direction) {
    if (phase_ != PiecePhase::Spawned && phase_ != PiecePhase::Moving) {
        return;
    }
    speed_ = std::max(0.0, speed);
    direction_ = direction < 0 ? -1 : 1;
    phase_ = PiecePhase::Moving;
}

void Piece::advance_oscillation(double delta, double min_x, double max_x) {
    if (phase_ != PiecePhase::Moving || speed_ <= 0.0 || delta <= 0.0) {
        return;
    }

    double x = position_.x + speed_ * static_cast<double>(direction_) * delta;
    if (x <= min_x) {
        x = min_x;
        direction_ = 1;
    } else if (x >= max_x) {
        x = max_x;
        direction_ = -1;
    }
    position_.x = x;
}

bool Piece::move_to(double x, double min_x, double max_x) {
    if (phase_ != PiecePhase::Spawned && phase_ != PiecePhase::Moving) {
        return false;
    }
    position_.x = std::clamp(x, min_x, max_x);
    return true;
}

// ============================================================================
// Physics Lifecycle
// ============================================================================

physics::RigidBodyDesc Piece::make_body_desc(const glm::dvec2& position, const glm::dvec2& velocity) const {
    physics::RigidBodyDesc desc;
    desc.position = glm::dvec3(position, 0.0);
    desc.half_extents = glm::dvec3(footprint_.half_width(), footprint_.half_height(), 0.5);
    desc.mass = footprint_.width * footprint_.height;
    desc.motion_type = physics::MotionType::Dynamic;
    desc.material = physics::PhysicsMaterial::sand();
    desc.collision_layer = static_cast<uint32_t>(physics::CollisionLayer::Piece);
    desc.collision_mask = static_cast<uint32_t>(physics::CollisionLayer::All);
    desc.linear_velocity = glm::dvec3(velocity, 0.0);
    desc.planar = true;
    desc.lock_rotation = true;
    return desc;
}

bool Piece::drop(physics::PhysicsWorld& world) {
    if (phase_ != PiecePhase::Spawned && phase_ != PiecePhase::Moving) {
        return false;
    }

    physics::RigidBodyHandle handle = world.create_rigid_body(make_body_desc(position_, glm::dvec2{0.0}));
    if (handle == physics::INVALID_RIGID_BODY) {
        SANDCASTLE_LOG_ERROR(core::log_category::GAME, "Piece {} could not create a physics body", id_);
        return false;
    }

    body_ = handle;
    phase_ = PiecePhase::Falling;
    samples_.clear();
    stable_ticks_ = 0;
    settle_ticks_ = 0;
    stability_ = StabilityLevel::Stable;

    SANDCASTLE_LOG_DEBUG(core::log_category::GAME, "Piece {} (tier {}) dropped at x={:.2f}", id_, tier_,
                         position_.x);
    return true;
}

bool Piece::restore(physics::PhysicsWorld& world, const glm::dvec2& position, const glm::dvec2& velocity) {
    if (has_body() || phase_ == PiecePhase::Removed) {
        return false;
    }

    physics::RigidBodyDesc desc = make_body_desc(position, velocity);
    desc.material = physics::PhysicsMaterial::settled();
    physics::RigidBodyHandle handle = world.create_rigid_body(desc);
    if (handle == physics::INVALID_RIGID_BODY) {
        return false;
    }

    body_ = handle;
    position_ = position;
    velocity_ = velocity;
    phase_ = PiecePhase::ResolvedValid;
    placement_valid_ = true;
    return true;
}

void Piece::begin_settling() {
    if (phase_ == PiecePhase::Falling) {
        phase_ = PiecePhase::Settling;
    }
}

KinematicSample Piece::sample_kinematics(const physics::PhysicsWorld& world) const {
    const physics::RigidBody* body = has_body() ? world.get_rigid_body(body_) : nullptr;
    if (body == nullptr) {
        return KinematicSample::at_rest(position_);
    }

    KinematicSample sample;
    glm::dvec3 position = body->get_position();
    glm::dvec3 velocity = body->get_linear_velocity();
    sample.position = glm::dvec2(position.x, position.y);
    sample.velocity = glm::dvec2(velocity.x, velocity.y);
    return sample;
}

KinematicSample Piece::refresh(const physics::PhysicsWorld& world) {
    KinematicSample sample = sample_kinematics(world);
    if (!sample.absent) {
        position_ = sample.position;
        velocity_ = sample.velocity;
    }
    return sample;
}

StabilityObservation Piece::observe(const KinematicSample& sample, const StabilityClassifier& classifier) {
    if (!sample.absent) {
        position_ = sample.position;
        velocity_ = sample.velocity;
    }

    samples_.push_back(sample);
    while (samples_.size() > sample_window_) {
        samples_.pop_front();
    }

    StabilityObservation observation;
    observation.previous = stability_;
    observation.level = classifier.classify(samples_);
    observation.changed = observation.level != stability_;

    stability_ = observation.level;
    stable_ticks_ = observation.level == StabilityLevel::Stable ? stable_ticks_ + 1 : 0;
    ++settle_ticks_;

    observation.consecutive_stable_ticks = stable_ticks_;

    if (observation.changed) {
        SANDCASTLE_LOG_TRACE(core::log_category::GAME, "Piece {} stability {} -> {}", id_,
                             to_string(observation.previous), to_string(observation.level));
    }
    return observation;
}

void Piece::freeze(physics::PhysicsWorld& world) {
    if (phase_ != PiecePhase::Settling && phase_ != PiecePhase::Falling) {
        return;
    }

    phase_ = PiecePhase::ResolvedValid;
    placement_valid_ = true;

    if (physics::RigidBody* body = world.get_rigid_body(body_)) {
        body->set_material(physics::PhysicsMaterial::settled());
    }
}

void Piece::reject() {
    if (phase_ != PiecePhase::Settling && phase_ != PiecePhase::Falling) {
        return;
    }
    phase_ = PiecePhase::ResolvedInvalid;
    placement_valid_ = false;
}

void Piece::destroy(physics::PhysicsWorld& world) {
    if (has_body()) {
        world.destroy_rigid_body(body_);
        body_ = physics::INVALID_RIGID_BODY;
    }
    phase_ = PiecePhase::Removed;
    velocity_ = glm::dvec2{0.0};
}

// ============================================================================
// State
// ============================================================================

PieceBounds Piece::get_bounds() const {
    PieceBounds bounds;
    bounds.id = id_;
    bounds.tier = tier_;
    bounds.center = position_;
    bounds.footprint = footprint_;
    return bounds;
}

}  // namespace sandcastle::gameplay
