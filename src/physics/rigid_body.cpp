// Creative2D Physics Engine
// rigid_body.cpp - Rigid body state implementation

#include <creative2d/physics/rigid_body.hpp>

#include <algorithm>

namespace creative2d::physics {

namespace {

constexpr double TORQUE_SCALE = 100.0;

}  // namespace

double RigidBody::inverse_mass() const {
    if (!is_dynamic()) {
        return 0.0;
    }
    return mass > 0.0 ? 1.0 / mass : 1.0;
}

void RigidBody::add_force(const Vec2& force) {
    velocity += force / std::max(MIN_FORCE_MASS, mass);
}

void RigidBody::add_impulse(const Vec2& impulse) {
    velocity += impulse / std::max(MIN_FORCE_MASS, mass);
}

void RigidBody::add_torque(double torque) {
    angular_velocity += torque / (std::max(MIN_FORCE_MASS, mass) * TORQUE_SCALE);
}

void RigidBody::stop() {
    velocity = Vec2(0.0);
    angular_velocity = 0.0;
}

}  // namespace creative2d::physics
