// Creative2D Physics Engine
// collision_resolver.cpp - Positional correction and impulse response

#include <creative2d/physics/collision_resolver.hpp>

#include <algorithm>

namespace creative2d::physics {

namespace {

constexpr double DEFAULT_INERTIA_EXTENT = 100.0;

// Velocity of a point at offset `r` from the body's origin
Vec2 point_velocity(const RigidBody* rigid_body, const Vec2& r) {
    if (!rigid_body) {
        return Vec2(0.0);
    }
    double omega = rigid_body->angular_velocity;
    return rigid_body->velocity + Vec2(-omega * r.y, omega * r.x);
}

}  // namespace

double moment_of_inertia(const RigidBody* rigid_body, const Collider* collider, const Vec2& scale) {
    if (!rigid_body || rigid_body->constraints.freeze_rotation) {
        return 0.0;
    }

    Vec2 extent(DEFAULT_INERTIA_EXTENT);
    if (collider) {
        if (auto size = collider->nominal_size()) {
            extent = *size * scale;
        }
    }
    return rigid_body->mass * (extent.x * extent.x + extent.y * extent.y) / 12.0;
}

ResolutionResult resolve_collision(ContactBody& a, ContactBody& b, const Mtv& mtv) {
    ResolutionResult result;

    Vec2 contact = mtv.contact_point.value_or((a.position + b.position) * 0.5);

    // Positional correction
    bool a_dynamic = a.is_dynamic();
    bool b_dynamic = b.is_dynamic();
    if (a_dynamic && b_dynamic) {
        result.correction_a = mtv.vector * 0.5;
        result.correction_b = -mtv.vector * 0.5;
    } else if (a_dynamic) {
        result.correction_a = mtv.vector;
    } else if (b_dynamic) {
        result.correction_b = -mtv.vector;
    }
    a.position += result.correction_a;
    b.position += result.correction_b;

    // Impulse along the contact normal
    Vec2 normal = mtv.normal();
    Vec2 ra = contact - a.position;
    Vec2 rb = contact - b.position;

    Vec2 relative_velocity = point_velocity(a.rigid_body, ra) - point_velocity(b.rigid_body, rb);
    double velocity_along_normal = glm::dot(relative_velocity, normal);
    if (velocity_along_normal > 0.0) {
        return result;
    }

    double restitution_a = a.rigid_body ? a.rigid_body->restitution : 0.0;
    double restitution_b = b.rigid_body ? b.rigid_body->restitution : 0.0;
    double e = std::max(restitution_a, restitution_b);

    double inv_mass_a = a_dynamic ? a.rigid_body->inverse_mass() : 0.0;
    double inv_mass_b = b_dynamic ? b.rigid_body->inverse_mass() : 0.0;
    double inv_inertia_a = a.inertia > 0.0 ? 1.0 / a.inertia : 0.0;
    double inv_inertia_b = b.inertia > 0.0 ? 1.0 / b.inertia : 0.0;

    double ra_cross_n = cross(ra, normal);
    double rb_cross_n = cross(rb, normal);
    double denominator = inv_mass_a + inv_mass_b + ra_cross_n * ra_cross_n * inv_inertia_a +
                         rb_cross_n * rb_cross_n * inv_inertia_b;
    if (denominator <= 0.0) {
        return result;
    }

    double j = -(1.0 + e) * velocity_along_normal / denominator;
    Vec2 impulse = normal * j;

    if (a_dynamic) {
        a.rigid_body->velocity += impulse * inv_mass_a;
        if (!a.rigid_body->constraints.freeze_rotation) {
            a.rigid_body->angular_velocity += cross(ra, impulse) * inv_inertia_a;
        }
    }
    if (b_dynamic) {
        b.rigid_body->velocity -= impulse * inv_mass_b;
        if (!b.rigid_body->constraints.freeze_rotation) {
            b.rigid_body->angular_velocity -= cross(rb, impulse) * inv_inertia_b;
        }
    }

    result.impulse = j;
    result.impulse_applied = true;
    return result;
}

}  // namespace creative2d::physics
