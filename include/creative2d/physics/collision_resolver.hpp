// Creative2D Physics Engine
// collision_resolver.hpp - Positional correction and impulse response for solid contacts

#pragma once

#include "colliders.hpp"
#include "rigid_body.hpp"
#include "types.hpp"

namespace creative2d::physics {

// ============================================================================
// Resolution Input
// ============================================================================

// One side of a contact. A null rigid body is treated as static.
struct ContactBody {
    Vec2 position{0.0};  // World position; corrected in place
    RigidBody* rigid_body = nullptr;
    double inertia = 0.0;  // Zero disables the angular response

    [[nodiscard]] bool is_dynamic() const { return rigid_body && rigid_body->is_dynamic(); }
};

struct ResolutionResult {
    Vec2 correction_a{0.0};
    Vec2 correction_b{0.0};
    double impulse = 0.0;  // Scalar along the contact normal; zero when skipped
    bool impulse_applied = false;
};

// ============================================================================
// Resolution
// ============================================================================

// Moment of inertia of a rectangle m(w^2 + h^2)/12 sized from the collider's box or
// capsule extent times `scale`; 100x100 for other shapes. Zero when there is no rigid
// body or its rotation is frozen.
[[nodiscard]] double moment_of_inertia(const RigidBody* rigid_body, const Collider* collider, const Vec2& scale);

// Pushes the pair apart along `mtv` (which points from B toward A), splitting the
// correction between dynamic bodies, then applies a restitution impulse unless the
// bodies are already separating.
ResolutionResult resolve_collision(ContactBody& a, ContactBody& b, const Mtv& mtv);

}  // namespace creative2d::physics
