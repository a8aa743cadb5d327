// SandCastle Physics Adapter
// physics_world.hpp - Bullet dynamics world with a drained contact-event queue

#pragma once

#include "rigid_body.hpp"
#include "types.hpp"

#include <memory>
#include <vector>

namespace sandcastle::physics {

// ============================================================================
// Physics Configuration
// ============================================================================

struct PhysicsConfig {
    glm::dvec3 gravity = {0.0, -9.81, 0.0};
    double fixed_timestep = 1.0 / 60.0;
    int max_substeps = 4;

    // Manifold points closer than this count as touching
    double contact_distance = 0.02;
};

// ============================================================================
// Physics World
// ============================================================================

// Owns every rigid body. Contact began/ended transitions are recorded during
// fixed_update() and handed to the caller through drain_contact_events(), so
// no game logic runs from inside the Bullet step.
class PhysicsWorld {
public:
    PhysicsWorld();
    ~PhysicsWorld();

    // Non-copyable, non-movable
    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;
    PhysicsWorld(PhysicsWorld&&) = delete;
    PhysicsWorld& operator=(PhysicsWorld&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    bool initialize(const PhysicsConfig& config = {});
    void shutdown();
    [[nodiscard]] bool is_initialized() const;

    // Fixed timestep update (call from game loop's fixed_update)
    void fixed_update(double fixed_delta);

    [[nodiscard]] const PhysicsConfig& get_config() const;

    // ========================================================================
    // Rigid Body Management
    // ========================================================================

    [[nodiscard]] RigidBodyHandle create_rigid_body(const RigidBodyDesc& desc);
    void destroy_rigid_body(RigidBodyHandle handle);

    [[nodiscard]] RigidBody* get_rigid_body(RigidBodyHandle handle);
    [[nodiscard]] const RigidBody* get_rigid_body(RigidBodyHandle handle) const;
    [[nodiscard]] size_t get_rigid_body_count() const;

    // ========================================================================
    // Contacts
    // ========================================================================

    // Returns and clears the events produced since the last drain, in step order
    [[nodiscard]] std::vector<ContactEvent> drain_contact_events();

    // ========================================================================
    // Stats
    // ========================================================================

    struct Stats {
        size_t rigid_body_count = 0;
        size_t active_contact_pairs = 0;
        uint64_t steps = 0;
        double last_step_time_ms = 0.0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace sandcastle::physics
