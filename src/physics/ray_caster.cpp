// Creative2D Physics Engine
// ray_caster.cpp - Ray intersection implementation

#include <creative2d/physics/geometry.hpp>
#include <creative2d/physics/ray_caster.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace creative2d::physics {

namespace {

constexpr double FACE_EPSILON = 1e-4;
constexpr double PARALLEL_EPSILON = 1e-6;

}  // namespace

std::optional<RayHit> ShapeRayCaster::cast(const Ray& ray, const Transform& transform, const Collider& collider) {
    switch (collider.kind()) {
        case ShapeKind::Box: {
            const auto* box = collider.get<BoxShape>();
            Vec2 half = box->size * glm::abs(transform.scale) * 0.5;
            return ray_vs_box(ray, transform.apply(collider.offset), half, transform.rotation);
        }
        case ShapeKind::Capsule: {
            // Offset is scaled but not rotated
            const auto* capsule = collider.get<CapsuleShape>();
            Vec2 center = transform.position + collider.offset * transform.scale;
            double radius = std::abs(capsule->size.x * transform.scale.x) * 0.5;
            return ray_vs_circle(ray, center, radius);
        }
        case ShapeKind::Polygon: {
            const auto* polygon = collider.get<PolygonShape>();
            return ray_vs_polygon(ray, geometry::polygon_vertices(transform, collider.offset, polygon->vertices));
        }
        case ShapeKind::Tilemap:
        case ShapeKind::Terrain:
        case ShapeKind::LineChain:
            break;
    }
    return std::nullopt;
}

std::optional<RayHit> ShapeRayCaster::ray_vs_box(const Ray& ray, const Vec2& center, const Vec2& half_extents,
                                                 double rotation_degrees) {
    double radians = rotation_degrees * DEG_TO_RAD;
    double cos_a = std::cos(radians);
    double sin_a = std::sin(radians);

    Vec2 origin = rotate(ray.origin - center, cos_a, -sin_a);
    Vec2 direction = rotate(ray.direction, cos_a, -sin_a);

    double t_min = -std::numeric_limits<double>::infinity();
    double t_max = std::numeric_limits<double>::infinity();

    for (int axis = 0; axis < 2; ++axis) {
        if (direction[axis] != 0.0) {
            double t1 = (-half_extents[axis] - origin[axis]) / direction[axis];
            double t2 = (half_extents[axis] - origin[axis]) / direction[axis];
            t_min = std::max(t_min, std::min(t1, t2));
            t_max = std::min(t_max, std::max(t1, t2));
        } else if (origin[axis] < -half_extents[axis] || origin[axis] > half_extents[axis]) {
            return std::nullopt;
        }
    }

    if (t_max < t_min || t_max < 0.0) {
        return std::nullopt;
    }

    double t = t_min > 0.0 ? t_min : t_max;
    Vec2 local_hit = origin + direction * t;

    Vec2 local_normal(0.0);
    if (std::abs(local_hit.x - half_extents.x) < FACE_EPSILON) {
        local_normal.x = 1.0;
    } else if (std::abs(local_hit.x + half_extents.x) < FACE_EPSILON) {
        local_normal.x = -1.0;
    } else if (std::abs(local_hit.y - half_extents.y) < FACE_EPSILON) {
        local_normal.y = 1.0;
    } else if (std::abs(local_hit.y + half_extents.y) < FACE_EPSILON) {
        local_normal.y = -1.0;
    }

    RayHit hit;
    hit.distance = t;
    hit.point = center + rotate(local_hit, cos_a, sin_a);
    hit.normal = rotate(local_normal, cos_a, sin_a);
    return hit;
}

std::optional<RayHit> ShapeRayCaster::ray_vs_circle(const Ray& ray, const Vec2& center, double radius) {
    Vec2 oc = ray.origin - center;
    double b = glm::dot(oc, ray.direction);
    double c = glm::dot(oc, oc) - radius * radius;
    double discriminant = b * b - c;
    if (discriminant < 0.0) {
        return std::nullopt;
    }

    double t = -b - std::sqrt(discriminant);
    if (t < 0.0) {
        return std::nullopt;
    }

    RayHit hit;
    hit.distance = t;
    hit.point = ray.point_at(t);
    Vec2 outward = hit.point - center;
    double length = glm::length(outward);
    hit.normal = length > 0.0 ? outward / length : -ray.direction;
    return hit;
}

std::optional<RayHit> ShapeRayCaster::ray_vs_polygon(const Ray& ray, const std::vector<Vec2>& vertices) {
    std::optional<SegmentHit> closest;
    for (size_t i = 0; i < vertices.size(); ++i) {
        auto segment_hit = ray_vs_segment(ray, vertices[i], vertices[(i + 1) % vertices.size()]);
        if (segment_hit && (!closest || segment_hit->t < closest->t)) {
            closest = segment_hit;
        }
    }

    if (!closest) {
        return std::nullopt;
    }

    RayHit hit;
    hit.distance = closest->t;
    hit.point = ray.point_at(closest->t);
    hit.normal = closest->normal;
    return hit;
}

std::optional<ShapeRayCaster::SegmentHit> ShapeRayCaster::ray_vs_segment(const Ray& ray, const Vec2& p1,
                                                                         const Vec2& p2) {
    Vec2 v1 = ray.origin - p1;
    Vec2 v2 = p2 - p1;
    Vec2 v3(-ray.direction.y, ray.direction.x);

    double denom = glm::dot(v2, v3);
    if (std::abs(denom) < PARALLEL_EPSILON) {
        return std::nullopt;
    }

    double t = cross(v2, v1) / denom;
    double u = glm::dot(v1, v3) / denom;
    if (t < 0.0 || u < 0.0 || u > 1.0) {
        return std::nullopt;
    }

    Vec2 normal = glm::normalize(Vec2(-v2.y, v2.x));
    if (glm::dot(ray.direction, normal) > 0.0) {
        normal = -normal;
    }
    return SegmentHit{t, normal};
}

}  // namespace creative2d::physics
