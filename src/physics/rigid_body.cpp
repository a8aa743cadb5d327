// SandCastle Physics Adapter
// rigid_body.cpp - Box rigid body implementation

#include <btBulletDynamicsCommon.h>
#include <sandcastle/physics/rigid_body.hpp>

namespace sandcastle::physics {

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

glm::dvec3 bullet_to_glm(const btVector3& v) {
    return glm::dvec3(static_cast<double>(v.getX()), static_cast<double>(v.getY()), static_cast<double>(v.getZ()));
}

btVector3 glm_to_bullet(const glm::dvec3& v) {
    return btVector3(static_cast<btScalar>(v.x), static_cast<btScalar>(v.y), static_cast<btScalar>(v.z));
}

}  // namespace

// ============================================================================
// RigidBody Implementation
// ============================================================================

RigidBody::RigidBody(RigidBodyHandle handle, const RigidBodyDesc& desc)
    : handle_(handle), motion_type_(desc.motion_type), mass_(desc.motion_type == MotionType::Static ? 0.0 : desc.mass),
      material_(desc.material) {
    shape_ = std::make_unique<btBoxShape>(glm_to_bullet(desc.half_extents));
    create_rigid_body(desc);
}

RigidBody::~RigidBody() {
    // Bullet objects are destroyed in reverse order of creation
    rigid_body_.reset();
    motion_state_.reset();
    shape_.reset();
}

void RigidBody::create_rigid_body(const RigidBodyDesc& desc) {
    btTransform start_transform;
    start_transform.setIdentity();
    start_transform.setOrigin(glm_to_bullet(desc.position));
    motion_state_ = std::make_unique<btDefaultMotionState>(start_transform);

    btVector3 local_inertia(0, 0, 0);
    btScalar bt_mass = static_cast<btScalar>(mass_);

    if (motion_type_ == MotionType::Dynamic && mass_ > 0.0) {
        shape_->calculateLocalInertia(bt_mass, local_inertia);
    }

    btRigidBody::btRigidBodyConstructionInfo rb_info(bt_mass, motion_state_.get(), shape_.get(), local_inertia);
    rb_info.m_friction = static_cast<btScalar>(material_.friction);
    rb_info.m_restitution = static_cast<btScalar>(material_.restitution);
    rb_info.m_linearDamping = static_cast<btScalar>(material_.linear_damping);
    rb_info.m_angularDamping = static_cast<btScalar>(material_.angular_damping);

    rigid_body_ = std::make_unique<btRigidBody>(rb_info);

    switch (motion_type_) {
        case MotionType::Dynamic:
            break;
        case MotionType::Static:
            rigid_body_->setCollisionFlags(rigid_body_->getCollisionFlags() | btCollisionObject::CF_STATIC_OBJECT);
            break;
    }

    // The play field is the xy plane: no z travel, no tipping
    if (desc.planar) {
        rigid_body_->setLinearFactor(btVector3(1, 1, 0));
    }
    if (desc.lock_rotation) {
        rigid_body_->setAngularFactor(btVector3(0, 0, 0));
    }

    if (motion_type_ == MotionType::Dynamic) {
        rigid_body_->setLinearVelocity(glm_to_bullet(desc.linear_velocity));
    }

    // Store handle for contact lookups
    rigid_body_->setUserIndex(static_cast<int>(handle_));
    rigid_body_->setUserPointer(this);
}

// ============================================================================
// Transform & Velocity
// ============================================================================

glm::dvec3 RigidBody::get_position() const {
    if (!rigid_body_) {
        return glm::dvec3{0.0};
    }
    return bullet_to_glm(rigid_body_->getWorldTransform().getOrigin());
}

glm::dvec3 RigidBody::get_linear_velocity() const {
    if (!rigid_body_) {
        return glm::dvec3{0.0};
    }
    return bullet_to_glm(rigid_body_->getLinearVelocity());
}

// ============================================================================
// Physics Properties
// ============================================================================

void RigidBody::set_material(const PhysicsMaterial& material) {
    material_ = material;
    if (rigid_body_) {
        rigid_body_->setFriction(static_cast<btScalar>(material_.friction));
        rigid_body_->setRestitution(static_cast<btScalar>(material_.restitution));
        rigid_body_->setDamping(static_cast<btScalar>(material_.linear_damping),
                                static_cast<btScalar>(material_.angular_damping));
    }
}

}  // namespace sandcastle::physics
