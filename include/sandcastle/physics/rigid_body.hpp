// SandCastle Physics Adapter
// rigid_body.hpp - Box rigid body backed by Bullet Physics

#pragma once

#include "types.hpp"

#include <glm/glm.hpp>

#include <memory>

// Forward declarations for Bullet types
class btRigidBody;
class btCollisionShape;
class btMotionState;

namespace sandcastle::physics {

// ============================================================================
// Rigid Body Descriptor
// ============================================================================

struct RigidBodyDesc {
    glm::dvec3 position{0.0};

    // Mass (ignored for Static bodies)
    double mass = 1.0;

    MotionType motion_type = MotionType::Dynamic;

    // Box shape
    glm::dvec3 half_extents{0.5};

    PhysicsMaterial material;

    // Collision filtering
    uint32_t collision_layer = static_cast<uint32_t>(CollisionLayer::Default);
    uint32_t collision_mask = static_cast<uint32_t>(CollisionLayer::All);

    glm::dvec3 linear_velocity{0.0};

    // Keep the body in the z = const plane (2D play field)
    bool planar = true;

    // Axis-aligned pieces: no rotation at all
    bool lock_rotation = true;
};

// ============================================================================
// Rigid Body
// ============================================================================

class RigidBody {
public:
    RigidBody(RigidBodyHandle handle, const RigidBodyDesc& desc);
    ~RigidBody();

    // Non-copyable, non-movable (Bullet keeps a back pointer)
    RigidBody(const RigidBody&) = delete;
    RigidBody& operator=(const RigidBody&) = delete;
    RigidBody(RigidBody&&) = delete;
    RigidBody& operator=(RigidBody&&) = delete;

    [[nodiscard]] MotionType get_motion_type() const { return motion_type_; }

    [[nodiscard]] glm::dvec3 get_position() const;
    [[nodiscard]] glm::dvec3 get_linear_velocity() const;

    // Friction and damping take effect from the next step
    [[nodiscard]] const PhysicsMaterial& get_material() const { return material_; }
    void set_material(const PhysicsMaterial& material);

    // ========================================================================
    // Bullet Access
    // ========================================================================

    [[nodiscard]] btRigidBody* get_bullet_body() { return rigid_body_.get(); }
    [[nodiscard]] const btRigidBody* get_bullet_body() const { return rigid_body_.get(); }

private:
    RigidBodyHandle handle_;
    MotionType motion_type_;
    double mass_;
    PhysicsMaterial material_;

    std::unique_ptr<btCollisionShape> shape_;
    std::unique_ptr<btMotionState> motion_state_;
    std::unique_ptr<btRigidBody> rigid_body_;

    void create_rigid_body(const RigidBodyDesc& desc);
};

}  // namespace sandcastle::physics
