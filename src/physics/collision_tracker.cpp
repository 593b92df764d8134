// Creative2D Physics Engine
// collision_tracker.cpp - Per-pair collision state implementation

#include <creative2d/physics/collision_tracker.hpp>

#include <utility>

namespace creative2d::physics {

void CollisionTracker::update(uint64_t frame, ContactMap contacts) {
    frame_ = frame;

    for (const auto& [key, contact] : contacts) {
        CollisionEntry& entry = entries_[key];
        entry.state = active_.count(key) > 0 ? CollisionState::Stay : CollisionState::Enter;
        entry.body_a = contact.body_a;
        entry.body_b = contact.body_b;
        entry.type = contact.type;
        entry.frame = frame;
        entry.mtv = contact.mtv;
    }

    for (const auto& [key, contact] : active_) {
        if (contacts.count(key) > 0) {
            continue;
        }
        CollisionEntry& entry = entries_[key];
        entry.state = CollisionState::Exit;
        entry.body_a = contact.body_a;
        entry.body_b = contact.body_b;
        entry.type = contact.type;
        entry.frame = frame;
        entry.mtv = contact.mtv;
    }

    active_ = std::move(contacts);

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.state == CollisionState::Exit && it->second.frame < frame_) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<const CollisionEntry*> CollisionTracker::current_entries() const {
    std::vector<const CollisionEntry*> result;
    for (const auto& [key, entry] : entries_) {
        if (entry.frame == frame_) {
            result.push_back(&entry);
        }
    }
    return result;
}

const CollisionEntry* CollisionTracker::find(BodyId a, BodyId b) const {
    auto it = entries_.find(make_pair_key(a, b));
    return it != entries_.end() ? &it->second : nullptr;
}

bool CollisionTracker::is_active(BodyId a, BodyId b) const {
    return active_.count(make_pair_key(a, b)) > 0;
}

void CollisionTracker::remove_body(BodyId id) {
    for (auto it = active_.begin(); it != active_.end();) {
        if (it->second.body_a == id || it->second.body_b == id) {
            it = active_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.involves(id)) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void CollisionTracker::clear() {
    active_.clear();
    entries_.clear();
    frame_ = 0;
}

}  // namespace creative2d::physics
