// Creative2D Physics Engine
// physics_world.hpp - Body arena, simulation step, collision events and queries

#pragma once

#include "body.hpp"
#include "collision_events.hpp"
#include "physics_config.hpp"
#include "types.hpp"

#include <limits>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace creative2d::physics {

// ============================================================================
// Physics World
// ============================================================================

class PhysicsWorld {
public:
    PhysicsWorld();
    ~PhysicsWorld();

    // Non-copyable, non-movable
    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;
    PhysicsWorld(PhysicsWorld&&) = delete;
    PhysicsWorld& operator=(PhysicsWorld&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    bool initialize(const PhysicsConfig& config = {});
    void shutdown();
    [[nodiscard]] bool is_initialized() const;

    // Advances the simulation by `delta_time` seconds: water first, then
    // `sub_steps` rounds of integration and collision, then one round of
    // enter/stay/exit classification and listener dispatch.
    void step(double delta_time);

    [[nodiscard]] uint64_t get_frame() const;

    // ========================================================================
    // Body Management
    // ========================================================================

    // Ids are never reused. Returns INVALID_BODY if the world is not initialized.
    [[nodiscard]] BodyId create_body(const BodyDesc& desc);

    // Children of a destroyed body are re-parented to the world, keeping their world transform
    bool destroy_body(BodyId id);

    [[nodiscard]] Body* get_body(BodyId id);
    [[nodiscard]] const Body* get_body(BodyId id) const;
    [[nodiscard]] Body* find_body(std::string_view name);

    // Live bodies in creation order
    [[nodiscard]] std::vector<BodyId> get_body_ids() const;
    [[nodiscard]] size_t get_body_count() const;

    // Rejects unknown ids and parent cycles. INVALID_BODY detaches.
    bool set_parent(BodyId child, BodyId parent);

    // Transform composed through the parent chain
    [[nodiscard]] std::optional<Transform> world_transform(BodyId id) const;

    // ========================================================================
    // Listeners
    // ========================================================================

    bool add_listener(BodyId id, std::shared_ptr<CollisionListener> listener);
    bool remove_listener(BodyId id, const CollisionListener* listener);

    // ========================================================================
    // Queries
    // ========================================================================

    // Nearest box, capsule or polygon hit in front of `origin`. A non-empty tag must
    // match the body tag exactly.
    [[nodiscard]] std::optional<RayHit> raycast(const Vec2& origin, const Vec2& direction,
                                                double max_distance = std::numeric_limits<double>::infinity(),
                                                std::string_view tag = {}) const;

    // Narrow-phase test of two bodies without resolving or recording anything.
    // The MTV points from `b` toward `a`.
    [[nodiscard]] std::optional<Mtv> test_collision(BodyId a, BodyId b);

    // Collisions classified on the latest frame. With a body, records are from that
    // body's point of view and the tag filters the other body; without one, the tag
    // may match either body. Tags are compared whitespace-trimmed.
    [[nodiscard]] std::vector<CollisionInfo> collision_info(std::optional<BodyId> body, CollisionState state,
                                                            std::optional<CollisionType> type = std::nullopt,
                                                            std::string_view tag = {}) const;

    [[nodiscard]] std::vector<CollisionInfo> collision_enter(BodyId body, std::string_view tag = {}) const;
    [[nodiscard]] std::vector<CollisionInfo> collision_stay(BodyId body, std::string_view tag = {}) const;
    [[nodiscard]] std::vector<CollisionInfo> collision_exit(BodyId body, std::string_view tag = {}) const;

    // Entering or staying in contact of either type
    [[nodiscard]] bool is_touching(BodyId body, std::string_view tag = {}) const;

    // ========================================================================
    // Configuration
    // ========================================================================

    [[nodiscard]] const PhysicsConfig& get_config() const;
    void set_gravity(const Vec2& gravity);
    [[nodiscard]] Vec2 get_gravity() const;

    // ========================================================================
    // Debug / Statistics
    // ========================================================================

    struct DebugStats {
        size_t bodies = 0;
        size_t active_pairs = 0;
        size_t narrow_phase_tests = 0;
        size_t water_particles = 0;
        size_t events_dispatched = 0;
        double last_step_time_ms = 0.0;
    };

    [[nodiscard]] DebugStats get_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace creative2d::physics
