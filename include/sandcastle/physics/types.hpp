// SandCastle Physics Adapter
// types.hpp - Core physics types: handles, layers, materials, contact events

#pragma once

#include <glm/glm.hpp>

#include <cstdint>

namespace sandcastle::physics {

// ============================================================================
// Rigid Body Handle
// ============================================================================

using RigidBodyHandle = uint32_t;
inline constexpr RigidBodyHandle INVALID_RIGID_BODY = 0;

// ============================================================================
// Collision Layers
// ============================================================================

enum class CollisionLayer : uint32_t {
    None = 0,
    Default = 1 << 0,
    Ground = 1 << 1,  // Static floor, the privileged "tier 0" surface
    Wall = 1 << 2,    // Arena side walls
    Piece = 1 << 3,   // Dropped building pieces
    All = 0xFFFFFFFF
};

// ============================================================================
// Motion Type
// ============================================================================

enum class MotionType : uint8_t {
    Static,  // Never moves, infinite mass
    Dynamic  // Fully simulated
};

// ============================================================================
// Physics Material
// ============================================================================

struct PhysicsMaterial {
    double friction = 0.5;
    double restitution = 0.0;
    double linear_damping = 0.0;
    double angular_damping = 0.0;

    // High-friction, low-bounce pieces that pile like packed sand
    [[nodiscard]] static PhysicsMaterial sand() { return PhysicsMaterial{1.2, 0.02, 0.03, 0.1}; }

    [[nodiscard]] static PhysicsMaterial ground() { return PhysicsMaterial{1.2, 0.05, 0.0, 0.0}; }

    // Applied to resolved pieces so they only drift by passive micro-adjustment
    [[nodiscard]] static PhysicsMaterial settled() { return PhysicsMaterial{1.5, 0.0, 0.6, 0.9}; }
};

// ============================================================================
// Contact Events
// ============================================================================

enum class ContactPhase : uint8_t { Began, Ended };

// A pair of bodies starting or stopping touching during a step. body_a < body_b.
struct ContactEvent {
    ContactPhase phase = ContactPhase::Began;
    RigidBodyHandle body_a = INVALID_RIGID_BODY;
    RigidBodyHandle body_b = INVALID_RIGID_BODY;
    glm::dvec3 contact_point{0.0};
    glm::dvec3 contact_normal{0.0};

    [[nodiscard]] bool involves(RigidBodyHandle handle) const { return body_a == handle || body_b == handle; }
};

}  // namespace sandcastle::physics
