// Creative2D Physics Engine
// ray_caster.hpp - Ray intersection against box, capsule and polygon colliders

#pragma once

#include "colliders.hpp"
#include "types.hpp"

#include <optional>
#include <vector>

namespace creative2d::physics {

// ============================================================================
// Shape Ray Caster
// ============================================================================

// Stateless ray tests. Hits are only reported at t >= 0 (in front of the origin);
// the returned RayHit has no body set.
class ShapeRayCaster {
public:
    // Dispatch on the collider shape. Tilemap, terrain and line chain colliders are not
    // ray targets and always miss.
    [[nodiscard]] static std::optional<RayHit> cast(const Ray& ray, const Transform& transform,
                                                    const Collider& collider);

    // Slab test in the box's unrotated frame. An origin inside the box hits the far side.
    [[nodiscard]] static std::optional<RayHit> ray_vs_box(const Ray& ray, const Vec2& center, const Vec2& half_extents,
                                                          double rotation_degrees);

    // Capsules are cast as a circle of the capsule's radius at its centre
    [[nodiscard]] static std::optional<RayHit> ray_vs_circle(const Ray& ray, const Vec2& center, double radius);

    // Nearest edge crossing; the normal faces back along the ray
    [[nodiscard]] static std::optional<RayHit> ray_vs_polygon(const Ray& ray, const std::vector<Vec2>& vertices);

    struct SegmentHit {
        double t = 0.0;
        Vec2 normal{0.0};
    };

    [[nodiscard]] static std::optional<SegmentHit> ray_vs_segment(const Ray& ray, const Vec2& p1, const Vec2& p2);

private:
    ShapeRayCaster() = delete;
};

}  // namespace creative2d::physics
