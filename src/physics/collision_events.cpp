// Creative2D Physics Engine
// collision_events.cpp - Listener routing and event names

#include <creative2d/physics/collision_events.hpp>

namespace creative2d::physics {

std::string_view event_name(CollisionType type, CollisionState state) {
    if (type == CollisionType::Trigger) {
        switch (state) {
            case CollisionState::Enter:
                return "TriggerEnter";
            case CollisionState::Stay:
                return "TriggerStay";
            case CollisionState::Exit:
                return "TriggerExit";
        }
    } else {
        switch (state) {
            case CollisionState::Enter:
                return "CollisionEnter";
            case CollisionState::Stay:
                return "CollisionStay";
            case CollisionState::Exit:
                return "CollisionExit";
        }
    }
    return "Unknown";
}

void CollisionListener::notify(const CollisionInfo& info) {
    bool trigger = info.type == CollisionType::Trigger;
    switch (info.state) {
        case CollisionState::Enter:
            trigger ? on_trigger_enter(info) : on_collision_enter(info);
            break;
        case CollisionState::Stay:
            trigger ? on_trigger_stay(info) : on_collision_stay(info);
            break;
        case CollisionState::Exit:
            trigger ? on_trigger_exit(info) : on_collision_exit(info);
            break;
    }
}

}  // namespace creative2d::physics
