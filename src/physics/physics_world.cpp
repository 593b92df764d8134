// Creative2D Physics Engine
// physics_world.cpp - Simulation step, collision bookkeeping and queries

#include <creative2d/core/logger.hpp>
#include <creative2d/physics/collision_resolver.hpp>
#include <creative2d/physics/collision_tracker.hpp>
#include <creative2d/physics/narrow_phase.hpp>
#include <creative2d/physics/physics_world.hpp>
#include <creative2d/physics/ray_caster.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace creative2d::physics {

namespace {

constexpr std::string_view NO_WATER_TAG = "NoWater";

std::string_view trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

bool tag_matches(const Body& body, std::string_view trimmed_tag) {
    return trim(body.tag) == trimmed_tag;
}

double clamp_axis(double value, double limit) {
    return std::clamp(value, -limit, limit);
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct PhysicsWorld::Impl {
    PhysicsConfig config;
    bool initialized = false;

    // Slot i holds body id i + 1; destroyed slots stay empty
    std::vector<std::unique_ptr<Body>> bodies;
    size_t live_bodies = 0;

    NarrowPhase narrow_phase;
    CollisionTracker tracker;
    uint64_t frame = 0;

    // Stats
    size_t narrow_phase_tests = 0;
    size_t events_dispatched = 0;
    double last_step_time_ms = 0.0;

    Body* lookup(BodyId id) const {
        if (id == INVALID_BODY || id > bodies.size()) {
            return nullptr;
        }
        return bodies[id - 1].get();
    }

    std::optional<Transform> world_transform(BodyId id) const {
        const Body* body = lookup(id);
        if (!body) {
            return std::nullopt;
        }

        // Walk up to the root, bounded in case of a corrupted chain
        std::vector<const Body*> chain{body};
        while (chain.back()->parent != INVALID_BODY && chain.size() <= bodies.size()) {
            const Body* parent = lookup(chain.back()->parent);
            if (!parent) {
                break;
            }
            chain.push_back(parent);
        }

        Transform result = chain.back()->transform;
        for (auto it = std::next(chain.rbegin()); it != chain.rend(); ++it) {
            result = result.combine((*it)->transform);
        }
        return result;
    }

    // Moves a body by a world-space offset, converting through its parent's frame
    void translate_world(Body& body, const Vec2& delta) {
        if (delta.x == 0.0 && delta.y == 0.0) {
            return;
        }

        std::optional<Transform> parent = body.parent != INVALID_BODY ? world_transform(body.parent) : std::nullopt;
        if (!parent) {
            body.transform.position += delta;
            return;
        }

        Vec2 local = rotate_degrees(delta, -parent->rotation);
        local.x = parent->scale.x != 0.0 ? local.x / parent->scale.x : 0.0;
        local.y = parent->scale.y != 0.0 ? local.y / parent->scale.y : 0.0;
        if (parent->flip_x) {
            local.x = -local.x;
        }
        if (parent->flip_y) {
            local.y = -local.y;
        }
        body.transform.position += local;
    }

    double buoyancy_radius(const Body& body, const Transform& world) const {
        if (body.collider) {
            if (auto size = body.collider->nominal_size()) {
                Vec2 scaled = *size * glm::abs(world.scale);
                return std::max(scaled.x, scaled.y) * 0.5;
            }
        }
        return config.fluid.buoyancy_base_radius;
    }

    // ========================================================================
    // Step Stages
    // ========================================================================

    std::vector<FluidObstacle> gather_fluid_obstacles(const Body& water_body) {
        std::vector<FluidObstacle> obstacles;
        for (auto& slot : bodies) {
            Body* body = slot.get();
            if (!body || body == &water_body || !body->active || !body->collider || body->is_trigger()) {
                continue;
            }
            if (body->tag.find(NO_WATER_TAG) != std::string::npos) {
                continue;
            }

            Transform world = *world_transform(body->id);
            Collider& collider = *body->collider;

            FluidObstacle obstacle;
            obstacle.position = world.apply(collider.offset);
            obstacle.dynamic = body->is_dynamic();
            obstacle.body_velocity = body->get_velocity();

            switch (collider.kind()) {
                case ShapeKind::Box:
                    obstacle.size = collider.get<BoxShape>()->size * glm::abs(world.scale);
                    break;
                case ShapeKind::Capsule:
                case ShapeKind::Polygon:
                    obstacle.position = world.position;
                    obstacle.solid = false;
                    break;
                case ShapeKind::Tilemap:
                case ShapeKind::Terrain:
                    obstacle.rects = &collider.generated_geometry()->rects;
                    obstacle.generated = true;
                    break;
                case ShapeKind::LineChain:
                    continue;
            }
            obstacles.push_back(obstacle);
        }
        return obstacles;
    }

    void step_water(double delta_time) {
        for (auto& slot : bodies) {
            Body* body = slot.get();
            if (!body || !body->active || !body->water) {
                continue;
            }

            bool was_generated = body->water->is_generated();
            Vec2 origin = world_transform(body->id)->position;
            body->water->step(delta_time, origin, gather_fluid_obstacles(*body), config.fluid);

            if (!was_generated) {
                CREATIVE2D_LOG_DEBUG(core::log_category::FLUID, "Water '{}' generated {} particles", body->name,
                                     body->water->get_particle_count());
            }
        }
    }

    void integrate(double delta_time) {
        std::vector<const FluidBody*> waters;
        for (const auto& slot : bodies) {
            if (slot && slot->active && slot->water && slot->water->get_particle_count() > 0) {
                waters.push_back(&*slot->water);
            }
        }

        for (auto& slot : bodies) {
            Body* body = slot.get();
            if (!body || !body->active || !body->rigid_body || !body->rigid_body->is_integrated()) {
                continue;
            }

            RigidBody& rb = *body->rigid_body;
            rb.velocity.x = clamp_axis(rb.velocity.x, config.max_velocity);
            rb.velocity.y = clamp_axis(rb.velocity.y, config.max_velocity);

            rb.velocity += config.gravity * rb.gravity_scale * delta_time;

            Transform world = *world_transform(body->id);
            if (!waters.empty()) {
                double radius = buoyancy_radius(*body, world);
                for (const FluidBody* water : waters) {
                    water->apply_buoyancy(rb, world.position, radius, delta_time, config.fluid);
                }
            }

            if (rb.linear_drag > 0.0) {
                rb.velocity *= std::pow(std::max(0.0, 1.0 - rb.linear_drag), delta_time);
            }

            if (rb.constraints.freeze_position_x) {
                rb.velocity.x = 0.0;
            }
            if (rb.constraints.freeze_position_y) {
                rb.velocity.y = 0.0;
            }

            translate_world(*body, rb.velocity * config.physics_scale * delta_time);

            if (!rb.constraints.freeze_rotation) {
                body->transform.rotation += rb.angular_velocity * config.physics_scale * delta_time;
                rb.angular_velocity *= std::pow(std::max(0.0, 1.0 - rb.angular_drag), delta_time);
            }
        }
    }

    CollisionTracker::ContactMap detect_and_resolve() {
        std::vector<Body*> collidables;
        for (auto& slot : bodies) {
            if (slot && slot->active && slot->collider) {
                collidables.push_back(slot.get());
            }
        }

        CollisionTracker::ContactMap contacts;
        for (size_t i = 0; i < collidables.size(); ++i) {
            for (size_t j = i + 1; j < collidables.size(); ++j) {
                Body& a = *collidables[i];
                Body& b = *collidables[j];

                // Only two static rigid bodies skip the test; colliders without a
                // rigid body still report contact but are never resolved
                bool trigger = a.is_trigger() || b.is_trigger();
                if (!trigger && a.has_static_rigid_body() && b.has_static_rigid_body()) {
                    continue;
                }

                // Earlier resolutions in this pass may have moved either body
                Transform transform_a = *world_transform(a.id);
                Transform transform_b = *world_transform(b.id);

                auto mtv = narrow_phase.test(transform_a, *a.collider, transform_b, *b.collider);
                if (!mtv) {
                    continue;
                }

                if (!trigger) {
                    resolve(a, transform_a, b, transform_b, *mtv);
                }

                Contact contact;
                contact.body_a = a.id;
                contact.body_b = b.id;
                contact.type = trigger ? CollisionType::Trigger : CollisionType::Collision;
                contact.mtv = *mtv;
                contacts[make_pair_key(a.id, b.id)] = contact;
            }
        }
        return contacts;
    }

    void resolve(Body& a, const Transform& transform_a, Body& b, const Transform& transform_b, const Mtv& mtv) {
        RigidBody* rb_a = a.rigid_body ? &*a.rigid_body : nullptr;
        RigidBody* rb_b = b.rigid_body ? &*b.rigid_body : nullptr;

        ContactBody contact_a{transform_a.position, rb_a, moment_of_inertia(rb_a, &*a.collider, transform_a.scale)};
        ContactBody contact_b{transform_b.position, rb_b, moment_of_inertia(rb_b, &*b.collider, transform_b.scale)};

        ResolutionResult result = resolve_collision(contact_a, contact_b, mtv);
        translate_world(a, result.correction_a);
        translate_world(b, result.correction_b);
    }

    // ========================================================================
    // Events
    // ========================================================================

    CollisionInfo make_info(const Body& self, const Body& other, const CollisionEntry& entry) const {
        CollisionInfo info;
        info.self = self.id;
        info.other = other.id;
        info.other_body = &other;
        info.other_transform = world_transform(other.id).value_or(other.transform);
        info.other_collider = other.collider ? &*other.collider : nullptr;

        // Stored MTV points from body_b toward body_a
        Vec2 normal = entry.mtv.normal();
        info.normal = self.id == entry.body_a ? normal : -normal;
        info.relative_velocity = self.get_velocity() - other.get_velocity();
        info.contact_point = entry.mtv.contact_point;
        info.type = entry.type;
        info.state = entry.state;
        return info;
    }

    // Returns false once either participant was destroyed by a listener
    bool notify_listeners(BodyId self_id, BodyId other_id, const CollisionInfo& info) {
        const Body* self = lookup(self_id);
        if (!self || self->listeners.empty()) {
            return self != nullptr;
        }

        // Copies: listeners may add or remove listeners, or destroy either body
        auto listeners = self->listeners;
        std::string self_name = self->name;
        std::string other_name = info.other_body ? info.other_body->name : std::string();
        std::string_view event = event_name(info.type, info.state);

        for (const auto& listener : listeners) {
            ++events_dispatched;
            try {
                listener->notify(info);
            } catch (const std::exception& e) {
                CREATIVE2D_LOG_ERROR(core::log_category::COLLISION, "{} listener on '{}' (other '{}') threw: {}",
                                     event, self_name, other_name, e.what());
            } catch (...) {
                CREATIVE2D_LOG_ERROR(core::log_category::COLLISION,
                                     "{} listener on '{}' (other '{}') threw an unknown exception", event, self_name,
                                     other_name);
            }

            // info points into the arena; stop before handing out a dangling body
            if (!lookup(self_id) || !lookup(other_id)) {
                return false;
            }
        }
        return true;
    }

    void dispatch_events() {
        // Copy first: listeners may destroy bodies, which edits the tracker
        std::vector<CollisionEntry> entries;
        for (const CollisionEntry* entry : tracker.current_entries()) {
            entries.push_back(*entry);
        }

        for (const auto& entry : entries) {
            const Body* a = lookup(entry.body_a);
            const Body* b = lookup(entry.body_b);
            if (!a || !b) {
                continue;
            }

            CREATIVE2D_LOG_TRACE(core::log_category::COLLISION, "{} '{}' <-> '{}'", event_name(entry.type, entry.state),
                                 a->name, b->name);

            if (!notify_listeners(a->id, b->id, make_info(*a, *b, entry))) {
                continue;
            }

            // Re-resolve both: listeners may have edited the arena
            a = lookup(entry.body_a);
            b = lookup(entry.body_b);
            notify_listeners(b->id, a->id, make_info(*b, *a, entry));
        }
    }
};

// ============================================================================
// PhysicsWorld Public Interface
// ============================================================================

PhysicsWorld::PhysicsWorld() : impl_(std::make_unique<Impl>()) {}

PhysicsWorld::~PhysicsWorld() {
    if (impl_ && impl_->initialized) {
        shutdown();
    }
}

bool PhysicsWorld::initialize(const PhysicsConfig& config) {
    if (impl_->initialized) {
        CREATIVE2D_LOG_WARN(core::log_category::PHYSICS, "PhysicsWorld already initialized");
        return false;
    }

    impl_->config = config;
    if (impl_->config.sub_steps < 1) {
        CREATIVE2D_LOG_WARN(core::log_category::PHYSICS, "Invalid sub-step count {}, using 1", config.sub_steps);
        impl_->config.sub_steps = 1;
    }
    impl_->narrow_phase.set_line_thickness(impl_->config.line_thickness);
    impl_->initialized = true;

    CREATIVE2D_LOG_INFO(core::log_category::PHYSICS, "PhysicsWorld initialized (gravity {}, {}; {} sub-steps)",
                        impl_->config.gravity.x, impl_->config.gravity.y, impl_->config.sub_steps);
    return true;
}

void PhysicsWorld::shutdown() {
    if (!impl_->initialized) {
        return;
    }

    impl_->bodies.clear();
    impl_->live_bodies = 0;
    impl_->tracker.clear();
    impl_->frame = 0;
    impl_->initialized = false;

    CREATIVE2D_LOG_INFO(core::log_category::PHYSICS, "PhysicsWorld shutdown");
}

bool PhysicsWorld::is_initialized() const {
    return impl_->initialized;
}

void PhysicsWorld::step(double delta_time) {
    if (!impl_->initialized || delta_time <= 0.0) {
        return;
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    ++impl_->frame;
    impl_->narrow_phase.reset_stats();
    impl_->events_dispatched = 0;

    impl_->step_water(delta_time);

    // Events are classified from the final sub-step only
    const int sub_steps = impl_->config.sub_steps;
    const double sub_delta = delta_time / sub_steps;
    CollisionTracker::ContactMap contacts;
    for (int i = 0; i < sub_steps; ++i) {
        impl_->integrate(sub_delta);
        contacts = impl_->detect_and_resolve();
    }

    impl_->tracker.update(impl_->frame, std::move(contacts));
    impl_->dispatch_events();

    auto end_time = std::chrono::high_resolution_clock::now();
    impl_->narrow_phase_tests = impl_->narrow_phase.get_stats().tests;
    impl_->last_step_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
}

uint64_t PhysicsWorld::get_frame() const {
    return impl_->frame;
}

// ============================================================================
// Body Management
// ============================================================================

BodyId PhysicsWorld::create_body(const BodyDesc& desc) {
    if (!impl_->initialized) {
        CREATIVE2D_LOG_WARN(core::log_category::PHYSICS, "Cannot create body '{}': world not initialized",
                            desc.name);
        return INVALID_BODY;
    }

    auto body = std::make_unique<Body>();
    body->id = static_cast<BodyId>(impl_->bodies.size() + 1);
    body->name = desc.name;
    body->tag = desc.tag;
    body->active = desc.active;
    body->transform = desc.transform;
    body->collider = desc.collider;
    body->rigid_body = desc.rigid_body;
    if (desc.water) {
        body->water.emplace(*desc.water);
    }

    if (desc.parent != INVALID_BODY) {
        if (impl_->lookup(desc.parent)) {
            body->parent = desc.parent;
        } else {
            CREATIVE2D_LOG_WARN(core::log_category::PHYSICS, "Body '{}' has unknown parent {}, ignoring", desc.name,
                                desc.parent);
        }
    }

    BodyId id = body->id;
    impl_->bodies.push_back(std::move(body));
    ++impl_->live_bodies;

    CREATIVE2D_LOG_DEBUG(core::log_category::PHYSICS, "Created body {} '{}'", id, desc.name);
    return id;
}

bool PhysicsWorld::destroy_body(BodyId id) {
    Body* body = impl_->lookup(id);
    if (!body) {
        return false;
    }

    for (auto& slot : impl_->bodies) {
        if (slot && slot->parent == id) {
            slot->transform = impl_->world_transform(slot->id).value_or(slot->transform);
            slot->parent = INVALID_BODY;
        }
    }

    impl_->tracker.remove_body(id);

    CREATIVE2D_LOG_DEBUG(core::log_category::PHYSICS, "Destroyed body {} '{}'", id, body->name);
    impl_->bodies[id - 1].reset();
    --impl_->live_bodies;
    return true;
}

Body* PhysicsWorld::get_body(BodyId id) {
    return impl_->lookup(id);
}

const Body* PhysicsWorld::get_body(BodyId id) const {
    return impl_->lookup(id);
}

Body* PhysicsWorld::find_body(std::string_view name) {
    for (auto& slot : impl_->bodies) {
        if (slot && slot->name == name) {
            return slot.get();
        }
    }
    return nullptr;
}

std::vector<BodyId> PhysicsWorld::get_body_ids() const {
    std::vector<BodyId> ids;
    ids.reserve(impl_->live_bodies);
    for (const auto& slot : impl_->bodies) {
        if (slot) {
            ids.push_back(slot->id);
        }
    }
    return ids;
}

size_t PhysicsWorld::get_body_count() const {
    return impl_->live_bodies;
}

bool PhysicsWorld::set_parent(BodyId child, BodyId parent) {
    Body* body = impl_->lookup(child);
    if (!body) {
        return false;
    }
    if (parent == INVALID_BODY) {
        body->parent = INVALID_BODY;
        return true;
    }
    if (parent == child || !impl_->lookup(parent)) {
        return false;
    }

    for (BodyId ancestor = parent; ancestor != INVALID_BODY;) {
        if (ancestor == child) {
            CREATIVE2D_LOG_WARN(core::log_category::PHYSICS, "Rejected parent {} for body {}: cycle", parent, child);
            return false;
        }
        const Body* node = impl_->lookup(ancestor);
        ancestor = node ? node->parent : INVALID_BODY;
    }

    // The local transform is kept and now reads relative to the new parent
    body->parent = parent;
    return true;
}

std::optional<Transform> PhysicsWorld::world_transform(BodyId id) const {
    return impl_->world_transform(id);
}

// ============================================================================
// Listeners
// ============================================================================

bool PhysicsWorld::add_listener(BodyId id, std::shared_ptr<CollisionListener> listener) {
    Body* body = impl_->lookup(id);
    if (!body || !listener) {
        return false;
    }
    body->listeners.push_back(std::move(listener));
    return true;
}

bool PhysicsWorld::remove_listener(BodyId id, const CollisionListener* listener) {
    Body* body = impl_->lookup(id);
    if (!body) {
        return false;
    }
    auto& listeners = body->listeners;
    auto it = std::find_if(listeners.begin(), listeners.end(),
                           [listener](const auto& entry) { return entry.get() == listener; });
    if (it == listeners.end()) {
        return false;
    }
    listeners.erase(it);
    return true;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<RayHit> PhysicsWorld::raycast(const Vec2& origin, const Vec2& direction, double max_distance,
                                            std::string_view tag) const {
    if (!impl_->initialized || glm::length(direction) <= 0.0) {
        return std::nullopt;
    }

    Ray ray(origin, direction);
    std::optional<RayHit> closest;
    double closest_distance = max_distance;

    for (const auto& slot : impl_->bodies) {
        const Body* body = slot.get();
        if (!body || !body->active || !body->collider) {
            continue;
        }
        if (!tag.empty() && body->tag != tag) {
            continue;
        }

        auto hit = ShapeRayCaster::cast(ray, *impl_->world_transform(body->id), *body->collider);
        if (hit && hit->distance < closest_distance) {
            closest_distance = hit->distance;
            closest = hit;
            closest->body = body->id;
        }
    }
    return closest;
}

std::optional<Mtv> PhysicsWorld::test_collision(BodyId a, BodyId b) {
    Body* body_a = impl_->lookup(a);
    Body* body_b = impl_->lookup(b);
    if (!body_a || !body_b || a == b || !body_a->collider || !body_b->collider) {
        return std::nullopt;
    }

    // Always test in id order, as step() does, so concentric ties resolve the same
    // way for both argument orders and the reversed query is an exact negation
    if (a > b) {
        auto mtv = impl_->narrow_phase.test(*impl_->world_transform(b), *body_b->collider,
                                            *impl_->world_transform(a), *body_a->collider);
        if (mtv) {
            return mtv->negated();
        }
        return std::nullopt;
    }
    return impl_->narrow_phase.test(*impl_->world_transform(a), *body_a->collider, *impl_->world_transform(b),
                                    *body_b->collider);
}

std::vector<CollisionInfo> PhysicsWorld::collision_info(std::optional<BodyId> body, CollisionState state,
                                                        std::optional<CollisionType> type,
                                                        std::string_view tag) const {
    std::vector<CollisionInfo> result;
    std::string_view trimmed = trim(tag);

    for (const CollisionEntry* entry : impl_->tracker.current_entries()) {
        if (entry->state != state || (type && entry->type != *type)) {
            continue;
        }

        if (body) {
            if (!entry->involves(*body)) {
                continue;
            }
            const Body* self = impl_->lookup(*body);
            const Body* other = impl_->lookup(entry->other(*body));
            if (!self || !other) {
                continue;
            }
            if (trimmed.empty() || tag_matches(*other, trimmed)) {
                result.push_back(impl_->make_info(*self, *other, *entry));
            }
        } else {
            const Body* a = impl_->lookup(entry->body_a);
            const Body* b = impl_->lookup(entry->body_b);
            if (!a || !b) {
                continue;
            }
            if (trimmed.empty() || tag_matches(*a, trimmed) || tag_matches(*b, trimmed)) {
                result.push_back(impl_->make_info(*a, *b, *entry));
            }
        }
    }
    return result;
}

std::vector<CollisionInfo> PhysicsWorld::collision_enter(BodyId body, std::string_view tag) const {
    return collision_info(body, CollisionState::Enter, std::nullopt, tag);
}

std::vector<CollisionInfo> PhysicsWorld::collision_stay(BodyId body, std::string_view tag) const {
    return collision_info(body, CollisionState::Stay, std::nullopt, tag);
}

std::vector<CollisionInfo> PhysicsWorld::collision_exit(BodyId body, std::string_view tag) const {
    return collision_info(body, CollisionState::Exit, std::nullopt, tag);
}

bool PhysicsWorld::is_touching(BodyId body, std::string_view tag) const {
    return !collision_enter(body, tag).empty() || !collision_stay(body, tag).empty();
}

// ============================================================================
// Configuration
// ============================================================================

const PhysicsConfig& PhysicsWorld::get_config() const {
    return impl_->config;
}

void PhysicsWorld::set_gravity(const Vec2& gravity) {
    impl_->config.gravity = gravity;
}

Vec2 PhysicsWorld::get_gravity() const {
    return impl_->config.gravity;
}

PhysicsWorld::DebugStats PhysicsWorld::get_stats() const {
    DebugStats stats;
    stats.bodies = impl_->live_bodies;
    stats.active_pairs = impl_->tracker.get_active().size();
    stats.narrow_phase_tests = impl_->narrow_phase_tests;
    stats.events_dispatched = impl_->events_dispatched;
    stats.last_step_time_ms = impl_->last_step_time_ms;
    for (const auto& slot : impl_->bodies) {
        if (slot && slot->water) {
            stats.water_particles += slot->water->get_particle_count();
        }
    }
    return stats;
}

}  // namespace creative2d::physics
