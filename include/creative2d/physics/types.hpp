// Creative2D Physics Engine
// types.hpp - Core physics types: Transform, AABB, Ray, RayHit, Mtv, body identity

#pragma once

#include <glm/glm.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

namespace creative2d::physics {

// Screen space: +x right, +y down. Angles are stored in degrees.
using Vec2 = glm::dvec2;

// ============================================================================
// Body Identity
// ============================================================================

using BodyId = uint32_t;
inline constexpr BodyId INVALID_BODY = 0;

enum class BodyType : uint8_t { Dynamic, Kinematic, Static };

// ============================================================================
// Collision Classification
// ============================================================================

enum class CollisionType : uint8_t { Collision, Trigger };

enum class CollisionState : uint8_t { Enter, Stay, Exit };

[[nodiscard]] inline const char* to_string(CollisionType type) {
    return type == CollisionType::Trigger ? "trigger" : "collision";
}

[[nodiscard]] inline const char* to_string(CollisionState state) {
    switch (state) {
        case CollisionState::Enter:
            return "enter";
        case CollisionState::Stay:
            return "stay";
        case CollisionState::Exit:
            return "exit";
    }
    return "stay";
}

// ============================================================================
// Transform
// ============================================================================

inline constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;
inline constexpr double RAD_TO_DEG = 180.0 / 3.14159265358979323846;

[[nodiscard]] inline Vec2 rotate(const Vec2& v, double cos_a, double sin_a) {
    return Vec2(v.x * cos_a - v.y * sin_a, v.x * sin_a + v.y * cos_a);
}

[[nodiscard]] inline Vec2 rotate_degrees(const Vec2& v, double degrees) {
    double radians = degrees * DEG_TO_RAD;
    return rotate(v, std::cos(radians), std::sin(radians));
}

// 2D cross product (z component of the 3D cross)
[[nodiscard]] inline double cross(const Vec2& a, const Vec2& b) {
    return a.x * b.y - a.y * b.x;
}

struct Transform {
    Vec2 position{0.0};
    double rotation = 0.0;  // Degrees, clockwise on screen
    Vec2 scale{1.0};
    bool flip_x = false;
    bool flip_y = false;

    Transform() = default;
    explicit Transform(const Vec2& pos, double rotation_degrees = 0.0, const Vec2& scl = Vec2(1.0))
        : position(pos), rotation(rotation_degrees), scale(scl) {}

    // Mirror, scale, rotate, translate
    [[nodiscard]] Vec2 apply(const Vec2& local) const {
        return position + rotate_degrees(scaled(local), rotation);
    }

    // Shape-local point scaled (and mirrored) but not rotated
    [[nodiscard]] Vec2 scaled(const Vec2& local) const {
        return Vec2((flip_x ? -local.x : local.x) * scale.x, (flip_y ? -local.y : local.y) * scale.y);
    }

    // Compose a child transform expressed relative to this one
    [[nodiscard]] Transform combine(const Transform& child) const {
        Transform result;
        result.position = apply(child.position);
        result.rotation = rotation + child.rotation;
        result.scale = scale * child.scale;
        result.flip_x = flip_x != child.flip_x;
        result.flip_y = flip_y != child.flip_y;
        return result;
    }
};

// ============================================================================
// Axis-Aligned Bounding Box
// ============================================================================

struct AABB {
    Vec2 min{0.0};
    Vec2 max{0.0};

    AABB() = default;
    AABB(const Vec2& min_point, const Vec2& max_point) : min(min_point), max(max_point) {}

    [[nodiscard]] Vec2 center() const { return (min + max) * 0.5; }

    [[nodiscard]] Vec2 extents() const { return max - min; }

    [[nodiscard]] Vec2 half_extents() const { return extents() * 0.5; }

    [[nodiscard]] bool contains(const Vec2& point) const {
        return point.x >= min.x && point.x <= max.x && point.y >= min.y && point.y <= max.y;
    }

    [[nodiscard]] bool intersects(const AABB& other) const {
        return min.x <= other.max.x && max.x >= other.min.x && min.y <= other.max.y && max.y >= other.min.y;
    }

    [[nodiscard]] AABB expanded(double margin) const { return AABB(min - Vec2(margin), max + Vec2(margin)); }

    void include(const Vec2& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    [[nodiscard]] static AABB from_center_extents(const Vec2& center, const Vec2& half_ext) {
        return AABB(center - half_ext, center + half_ext);
    }

    // Starts inverted so the first include() sets both corners
    [[nodiscard]] static AABB empty() {
        constexpr double inf = std::numeric_limits<double>::infinity();
        return AABB(Vec2(inf), Vec2(-inf));
    }
};

// ============================================================================
// Ray
// ============================================================================

struct Ray {
    Vec2 origin{0.0};
    Vec2 direction{1.0, 0.0};  // Normalized

    Ray() = default;
    Ray(const Vec2& orig, const Vec2& dir) : origin(orig), direction(glm::normalize(dir)) {}

    [[nodiscard]] Vec2 point_at(double t) const { return origin + direction * t; }
};

struct RayHit {
    Vec2 point{0.0};
    Vec2 normal{0.0, -1.0};
    double distance = 0.0;
    BodyId body = INVALID_BODY;

    [[nodiscard]] bool hit_body() const { return body != INVALID_BODY; }
};

// ============================================================================
// Minimum Translation Vector
// ============================================================================

// Translation that separates A from B, pointing from B toward A.
struct Mtv {
    Vec2 vector{0.0};
    double magnitude = 0.0;
    std::optional<Vec2> contact_point;

    Mtv() = default;
    Mtv(const Vec2& axis, double depth, std::optional<Vec2> contact = std::nullopt)
        : vector(axis * depth), magnitude(depth), contact_point(contact) {}

    [[nodiscard]] Mtv negated() const {
        Mtv result = *this;
        result.vector = -vector;
        return result;
    }

    // Unit normal from B toward A, zero when the vector is degenerate
    [[nodiscard]] Vec2 normal() const {
        double length = glm::length(vector);
        return length > 0.0 ? vector / length : Vec2(0.0);
    }
};

}  // namespace creative2d::physics
