// Creative2D Physics Engine
// rigid_body.hpp - Rigid body state advanced by integration and collision resolution

#pragma once

#include "types.hpp"

namespace creative2d::physics {

// ============================================================================
// Rigid Body Constraints
// ============================================================================

struct RigidBodyConstraints {
    bool freeze_rotation = false;
    bool freeze_position_x = false;
    bool freeze_position_y = false;
};

// ============================================================================
// Rigid Body
// ============================================================================

// Velocities are in physics units; integration multiplies them by the world's
// physics scale to get pixels per second.
struct RigidBody {
    static constexpr double MIN_FORCE_MASS = 0.1;

    BodyType type = BodyType::Dynamic;
    bool simulated = true;

    double mass = 1.0;
    Vec2 velocity{0.0};
    double angular_velocity = 0.0;  // Degrees per physics unit of time

    double gravity_scale = 1.0;
    double linear_drag = 0.0;
    double angular_drag = 0.05;
    double restitution = 0.0;  // 0 = inelastic, 1 = perfectly elastic

    RigidBodyConstraints constraints;

    // Buoyancy: bodies heavier than the threshold sink, lighter ones float
    double buoyancy_weight = 1.0;
    double sink_threshold = 1.5;

    RigidBody() = default;
    explicit RigidBody(BodyType body_type, double body_mass = 1.0) : type(body_type), mass(body_mass) {}

    [[nodiscard]] bool is_dynamic() const { return type == BodyType::Dynamic; }
    [[nodiscard]] bool is_static() const { return type == BodyType::Static; }

    // Integration applies to simulated dynamic bodies only
    [[nodiscard]] bool is_integrated() const { return simulated && is_dynamic(); }

    [[nodiscard]] bool sinks() const { return buoyancy_weight > sink_threshold; }

    // Zero for anything that is not dynamic
    [[nodiscard]] double inverse_mass() const;

    // Instantaneous velocity changes scaled by 1 / max(0.1, mass)
    void add_force(const Vec2& force);
    void add_impulse(const Vec2& impulse);
    void add_torque(double torque);

    void stop();
};

}  // namespace creative2d::physics
