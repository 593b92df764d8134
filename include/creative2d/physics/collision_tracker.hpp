// Creative2D Physics Engine
// collision_tracker.hpp - Per-pair enter/stay/exit bookkeeping across frames

#pragma once

#include "types.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <vector>

namespace creative2d::physics {

// Order-independent identity of a body pair
using PairKey = uint64_t;

[[nodiscard]] inline PairKey make_pair_key(BodyId a, BodyId b) {
    BodyId low = std::min(a, b);
    BodyId high = std::max(a, b);
    return (static_cast<PairKey>(low) << 32) | high;
}

// ============================================================================
// Contacts and Entries
// ============================================================================

// An overlap found by the narrow phase. The MTV points from body_b toward body_a.
struct Contact {
    BodyId body_a = INVALID_BODY;
    BodyId body_b = INVALID_BODY;
    CollisionType type = CollisionType::Collision;
    Mtv mtv;
};

struct CollisionEntry {
    BodyId body_a = INVALID_BODY;
    BodyId body_b = INVALID_BODY;
    CollisionState state = CollisionState::Enter;
    CollisionType type = CollisionType::Collision;
    uint64_t frame = 0;
    Mtv mtv;  // Last overlap; kept for exits

    [[nodiscard]] bool involves(BodyId id) const { return body_a == id || body_b == id; }
    [[nodiscard]] BodyId other(BodyId id) const { return body_a == id ? body_b : body_a; }
};

// ============================================================================
// Collision Tracker
// ============================================================================

class CollisionTracker {
public:
    using ContactMap = std::map<PairKey, Contact>;

    // Classifies every pair once for `frame`: pairs new to `contacts` enter, pairs in
    // both sets stay, pairs only in the previous set exit. Exits reported on an
    // earlier frame are purged.
    void update(uint64_t frame, ContactMap contacts);

    // Entries classified on the latest frame, in pair-key order
    [[nodiscard]] std::vector<const CollisionEntry*> current_entries() const;

    [[nodiscard]] const CollisionEntry* find(BodyId a, BodyId b) const;

    // Overlapping as of the latest update
    [[nodiscard]] bool is_active(BodyId a, BodyId b) const;
    [[nodiscard]] const ContactMap& get_active() const { return active_; }

    // Forget a destroyed body without reporting exits for it
    void remove_body(BodyId id);
    void clear();

    [[nodiscard]] uint64_t get_frame() const { return frame_; }
    [[nodiscard]] size_t get_entry_count() const { return entries_.size(); }

private:
    ContactMap active_;
    std::map<PairKey, CollisionEntry> entries_;
    uint64_t frame_ = 0;
};

}  // namespace creative2d::physics
