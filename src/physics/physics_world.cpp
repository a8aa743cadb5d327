// SandCastle Physics Adapter
// physics_world.cpp - Bullet dynamics world implementation

#include <btBulletDynamicsCommon.h>
#include <sandcastle/core/logger.hpp>
#include <sandcastle/physics/physics_world.hpp>
#include <sandcastle/platform/timer.hpp>

#include <map>
#include <unordered_map>
#include <utility>

namespace sandcastle::physics {

namespace {

using ContactKey = std::pair<RigidBodyHandle, RigidBodyHandle>;

ContactKey make_key(RigidBodyHandle a, RigidBodyHandle b) {
    return a < b ? ContactKey{a, b} : ContactKey{b, a};
}

glm::dvec3 to_glm(const btVector3& v) {
    return glm::dvec3(static_cast<double>(v.getX()), static_cast<double>(v.getY()), static_cast<double>(v.getZ()));
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct PhysicsWorld::Impl {
    PhysicsConfig config;
    bool initialized = false;

    // Bullet core components
    std::unique_ptr<btDefaultCollisionConfiguration> collision_config;
    std::unique_ptr<btCollisionDispatcher> dispatcher;
    std::unique_ptr<btDbvtBroadphase> broadphase;
    std::unique_ptr<btSequentialImpulseConstraintSolver> solver;
    std::unique_ptr<btDiscreteDynamicsWorld> dynamics_world;

    std::unordered_map<RigidBodyHandle, std::unique_ptr<RigidBody>> rigid_bodies;
    RigidBodyHandle next_rigid_body_handle = 1;

    // Pairs touching at the end of the last step, with a representative contact
    std::map<ContactKey, ContactEvent> active_contacts;
    std::vector<ContactEvent> pending_events;

    uint64_t steps = 0;
    double last_step_time_ms = 0.0;

    bool initialize_bullet() {
        collision_config = std::make_unique<btDefaultCollisionConfiguration>();
        dispatcher = std::make_unique<btCollisionDispatcher>(collision_config.get());
        broadphase = std::make_unique<btDbvtBroadphase>();
        solver = std::make_unique<btSequentialImpulseConstraintSolver>();
        dynamics_world = std::make_unique<btDiscreteDynamicsWorld>(dispatcher.get(), broadphase.get(), solver.get(),
                                                                   collision_config.get());

        dynamics_world->setGravity(btVector3(static_cast<btScalar>(config.gravity.x),
                                             static_cast<btScalar>(config.gravity.y),
                                             static_cast<btScalar>(config.gravity.z)));
        return true;
    }

    void remove_all_bodies() {
        for (auto& [handle, body] : rigid_bodies) {
            if (dynamics_world && body->get_bullet_body()) {
                dynamics_world->removeRigidBody(body->get_bullet_body());
            }
        }
        rigid_bodies.clear();
        active_contacts.clear();
    }

    void shutdown_bullet() {
        remove_all_bodies();
        pending_events.clear();

        // Destroy Bullet components in reverse order
        dynamics_world.reset();
        solver.reset();
        broadphase.reset();
        dispatcher.reset();
        collision_config.reset();
    }

    // Diff the manifold contact set against the previous step
    void update_contacts() {
        std::map<ContactKey, ContactEvent> current;
        const btScalar threshold = static_cast<btScalar>(config.contact_distance);

        int num_manifolds = dispatcher->getNumManifolds();
        for (int i = 0; i < num_manifolds; ++i) {
            btPersistentManifold* manifold = dispatcher->getManifoldByIndexInternal(i);
            if (!manifold) {
                continue;
            }

            auto handle_a = static_cast<RigidBodyHandle>(manifold->getBody0()->getUserIndex());
            auto handle_b = static_cast<RigidBodyHandle>(manifold->getBody1()->getUserIndex());
            if (handle_a == INVALID_RIGID_BODY || handle_b == INVALID_RIGID_BODY) {
                continue;
            }

            for (int j = 0; j < manifold->getNumContacts(); ++j) {
                const btManifoldPoint& pt = manifold->getContactPoint(j);
                if (pt.getDistance() > threshold) {
                    continue;
                }

                ContactKey key = make_key(handle_a, handle_b);
                if (current.count(key) == 0) {
                    ContactEvent event;
                    event.phase = ContactPhase::Began;
                    event.body_a = key.first;
                    event.body_b = key.second;
                    event.contact_point = to_glm(pt.getPositionWorldOnA());
                    event.contact_normal = to_glm(pt.m_normalWorldOnB);
                    current.emplace(key, event);
                }
                break;
            }
        }

        for (const auto& [key, event] : current) {
            if (active_contacts.count(key) == 0) {
                pending_events.push_back(event);
            }
        }
        for (const auto& [key, event] : active_contacts) {
            if (current.count(key) == 0) {
                ContactEvent ended = event;
                ended.phase = ContactPhase::Ended;
                pending_events.push_back(ended);
            }
        }

        active_contacts = std::move(current);
    }
};

// ============================================================================
// PhysicsWorld Public API
// ============================================================================

PhysicsWorld::PhysicsWorld() : impl_(std::make_unique<Impl>()) {}

PhysicsWorld::~PhysicsWorld() {
    shutdown();
}

bool PhysicsWorld::initialize(const PhysicsConfig& config) {
    if (impl_->initialized) {
        SANDCASTLE_LOG_WARN(core::log_category::PHYSICS, "PhysicsWorld already initialized");
        return false;
    }

    if (config.fixed_timestep <= 0.0 || config.max_substeps < 1) {
        SANDCASTLE_LOG_ERROR(core::log_category::PHYSICS, "Invalid physics config: timestep={} substeps={}",
                             config.fixed_timestep, config.max_substeps);
        return false;
    }

    impl_->config = config;

    if (!impl_->initialize_bullet()) {
        SANDCASTLE_LOG_ERROR(core::log_category::PHYSICS, "Failed to initialize Bullet Physics");
        return false;
    }

    impl_->initialized = true;
    SANDCASTLE_LOG_INFO(core::log_category::PHYSICS, "PhysicsWorld initialized (gravity {:.2f})", config.gravity.y);

    return true;
}

void PhysicsWorld::shutdown() {
    if (!impl_->initialized) {
        return;
    }

    impl_->shutdown_bullet();
    impl_->initialized = false;

    SANDCASTLE_LOG_INFO(core::log_category::PHYSICS, "PhysicsWorld shutdown");
}

bool PhysicsWorld::is_initialized() const {
    return impl_->initialized;
}

const PhysicsConfig& PhysicsWorld::get_config() const {
    return impl_->config;
}

void PhysicsWorld::fixed_update(double fixed_delta) {
    if (!impl_->initialized || !impl_->dynamics_world) {
        return;
    }

    platform::Stopwatch step_clock;

    impl_->dynamics_world->stepSimulation(static_cast<btScalar>(fixed_delta), impl_->config.max_substeps,
                                          static_cast<btScalar>(impl_->config.fixed_timestep));
    impl_->update_contacts();
    ++impl_->steps;

    impl_->last_step_time_ms = step_clock.elapsed_ms();
}

// ============================================================================
// Rigid Body Management
// ============================================================================

RigidBodyHandle PhysicsWorld::create_rigid_body(const RigidBodyDesc& desc) {
    if (!impl_->initialized) {
        return INVALID_RIGID_BODY;
    }

    RigidBodyHandle handle = impl_->next_rigid_body_handle++;
    auto body = std::make_unique<RigidBody>(handle, desc);

    impl_->dynamics_world->addRigidBody(body->get_bullet_body(), static_cast<int>(desc.collision_layer),
                                        static_cast<int>(desc.collision_mask));

    impl_->rigid_bodies[handle] = std::move(body);

    SANDCASTLE_LOG_TRACE(core::log_category::PHYSICS, "Created rigid body {}", handle);

    return handle;
}

void PhysicsWorld::destroy_rigid_body(RigidBodyHandle handle) {
    if (!impl_->initialized || handle == INVALID_RIGID_BODY) {
        return;
    }

    auto it = impl_->rigid_bodies.find(handle);
    if (it == impl_->rigid_bodies.end()) {
        return;
    }

    impl_->dynamics_world->removeRigidBody(it->second->get_bullet_body());
    impl_->rigid_bodies.erase(it);

    // Destroyed bodies leave the contact set silently
    for (auto contact = impl_->active_contacts.begin(); contact != impl_->active_contacts.end();) {
        if (contact->first.first == handle || contact->first.second == handle) {
            contact = impl_->active_contacts.erase(contact);
        } else {
            ++contact;
        }
    }

    SANDCASTLE_LOG_TRACE(core::log_category::PHYSICS, "Destroyed rigid body {}", handle);
}

RigidBody* PhysicsWorld::get_rigid_body(RigidBodyHandle handle) {
    auto it = impl_->rigid_bodies.find(handle);
    return (it != impl_->rigid_bodies.end()) ? it->second.get() : nullptr;
}

const RigidBody* PhysicsWorld::get_rigid_body(RigidBodyHandle handle) const {
    auto it = impl_->rigid_bodies.find(handle);
    return (it != impl_->rigid_bodies.end()) ? it->second.get() : nullptr;
}

size_t PhysicsWorld::get_rigid_body_count() const {
    return impl_->rigid_bodies.size();
}

// ============================================================================
// Contacts
// ============================================================================

std::vector<ContactEvent> PhysicsWorld::drain_contact_events() {
    std::vector<ContactEvent> events;
    events.swap(impl_->pending_events);
    return events;
}

// ============================================================================
// Stats
// ============================================================================

PhysicsWorld::Stats PhysicsWorld::get_stats() const {
    Stats stats;
    stats.rigid_body_count = impl_->rigid_bodies.size();
    stats.active_contact_pairs = impl_->active_contacts.size();
    stats.steps = impl_->steps;
    stats.last_step_time_ms = impl_->last_step_time_ms;
    return stats;
}

}  // namespace sandcastle::physics
