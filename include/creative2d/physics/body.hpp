// Creative2D Physics Engine
// body.hpp - A simulated body: transform plus optional collider, rigid body and water

#pragma once

#include "colliders.hpp"
#include "collision_events.hpp"
#include "fluid_body.hpp"
#include "rigid_body.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace creative2d::physics {

// ============================================================================
// Body Descriptor
// ============================================================================

struct BodyDesc {
    std::string name;
    std::string tag;
    bool active = true;
    BodyId parent = INVALID_BODY;

    Transform transform;
    std::optional<Collider> collider;
    std::optional<RigidBody> rigid_body;
    std::optional<WaterParams> water;
};

// ============================================================================
// Body
// ============================================================================

// Bodies live in the world's arena and are addressed by id. A body without a
// collider never collides; a collider without a rigid body behaves as static.
struct Body {
    BodyId id = INVALID_BODY;
    std::string name;
    std::string tag;
    bool active = true;
    BodyId parent = INVALID_BODY;

    Transform transform;  // Relative to the parent when there is one
    std::optional<Collider> collider;
    std::optional<RigidBody> rigid_body;
    std::optional<FluidBody> water;

    std::vector<std::shared_ptr<CollisionListener>> listeners;

    [[nodiscard]] bool has_collider() const { return collider.has_value(); }
    [[nodiscard]] bool is_trigger() const { return collider && collider->is_trigger; }

    [[nodiscard]] bool is_dynamic() const { return rigid_body && rigid_body->is_dynamic(); }

    // No rigid body counts as static when resolving contacts
    [[nodiscard]] bool is_static() const { return !rigid_body || rigid_body->is_static(); }

    [[nodiscard]] bool has_static_rigid_body() const { return rigid_body && rigid_body->is_static(); }

    [[nodiscard]] Vec2 get_velocity() const { return rigid_body ? rigid_body->velocity : Vec2(0.0); }
};

}  // namespace creative2d::physics
