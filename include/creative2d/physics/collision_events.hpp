// Creative2D Physics Engine
// collision_events.hpp - Collision records and the listener interface bodies attach

#pragma once

#include "types.hpp"

#include <optional>
#include <string_view>

namespace creative2d::physics {

struct Body;
struct Collider;

// ============================================================================
// Collision Info
// ============================================================================

// One participant's view of a contact. Pointers are only valid for the duration
// of the callback or until the world is next stepped.
struct CollisionInfo {
    BodyId self = INVALID_BODY;
    BodyId other = INVALID_BODY;
    const Body* other_body = nullptr;
    Transform other_transform;  // World space
    const Collider* other_collider = nullptr;

    Vec2 normal{0.0};             // Points from the other body toward this one
    Vec2 relative_velocity{0.0};  // This body's velocity minus the other's
    std::optional<Vec2> contact_point;

    CollisionType type = CollisionType::Collision;
    CollisionState state = CollisionState::Enter;
};

// "CollisionEnter", "TriggerStay", ...
[[nodiscard]] std::string_view event_name(CollisionType type, CollisionState state);

// ============================================================================
// Collision Listener
// ============================================================================

class CollisionListener {
public:
    virtual ~CollisionListener() = default;

    virtual void on_collision_enter(const CollisionInfo& /*info*/) {}
    virtual void on_collision_stay(const CollisionInfo& /*info*/) {}
    virtual void on_collision_exit(const CollisionInfo& /*info*/) {}

    virtual void on_trigger_enter(const CollisionInfo& /*info*/) {}
    virtual void on_trigger_stay(const CollisionInfo& /*info*/) {}
    virtual void on_trigger_exit(const CollisionInfo& /*info*/) {}

    // Routes to the callback matching info.type and info.state
    void notify(const CollisionInfo& info);

protected:
    CollisionListener() = default;
};

}  // namespace creative2d::physics
