// Creative2D Physics Engine
// narrow_phase.cpp - Shape-pair dispatch and pairwise collision tests

#include <creative2d/physics/narrow_phase.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace creative2d::physics {

namespace {

std::optional<Mtv> negated(std::optional<Mtv> mtv) {
    if (mtv) {
        return mtv->negated();
    }
    return std::nullopt;
}

// Keeps the deeper of two results
void keep_deepest(std::optional<Mtv>& best, std::optional<Mtv> candidate) {
    if (candidate && (!best || candidate->magnitude > best->magnitude)) {
        best = std::move(candidate);
    }
}

std::vector<Vec2> polygon_like_vertices(const Transform& transform, const Collider& collider) {
    if (const auto* box = collider.get<BoxShape>()) {
        return geometry::box_vertices(transform, collider.offset, box->size);
    }
    if (const auto* polygon = collider.get<PolygonShape>()) {
        return geometry::polygon_vertices(transform, collider.offset, polygon->vertices);
    }
    return {};
}

geometry::CapsuleSegment capsule_of(const Transform& transform, const Collider& collider) {
    const auto* capsule = collider.get<CapsuleShape>();
    return geometry::capsule_segment(transform, collider.offset, capsule->size,
                                     capsule->direction == CapsuleDirection::Horizontal);
}

}  // namespace

NarrowPhase::NarrowPhase(double line_thickness)
    : line_thickness_(line_thickness), scratch_box_(BoxShape{}), scratch_polygon_(PolygonShape{}) {}

// ============================================================================
// Dispatch
// ============================================================================

std::optional<Mtv> NarrowPhase::test(const Transform& transform_a, Collider& a, const Transform& transform_b,
                                     Collider& b) {
    ++stats_.tests;

    ShapeKind kind_a = a.kind();
    ShapeKind kind_b = b.kind();
    bool line_a = kind_a == ShapeKind::LineChain;
    bool line_b = kind_b == ShapeKind::LineChain;

    std::optional<Mtv> result;
    if (a.is_generated() || line_a) {
        // Generated and line geometry never collide with each other
        if (b.is_generated() || line_b) {
            return std::nullopt;
        }
        if (line_a) {
            result = negated(test_line_chain(transform_b, b, transform_a, a));
        } else {
            result = negated(test_generated(transform_b, b, transform_a, a));
        }
    } else if (b.is_generated()) {
        result = test_generated(transform_a, a, transform_b, b);
    } else if (line_b) {
        result = test_line_chain(transform_a, a, transform_b, b);
    } else {
        result = test_primitive(transform_a, a, transform_b, b);
    }

    if (result) {
        ++stats_.hits;
    }
    return result;
}

std::optional<Mtv> NarrowPhase::test_primitive(const Transform& transform_a, const Collider& a,
                                               const Transform& transform_b, const Collider& b) {
    ++stats_.sub_shape_tests;

    bool capsule_a = a.kind() == ShapeKind::Capsule;
    bool capsule_b = b.kind() == ShapeKind::Capsule;

    if (!capsule_a && !capsule_b) {
        return polygon_vs_polygon(polygon_like_vertices(transform_a, a), polygon_like_vertices(transform_b, b));
    }
    if (capsule_a && capsule_b) {
        return capsule_vs_capsule(capsule_of(transform_a, a), capsule_of(transform_b, b));
    }

    // One side is a capsule. The shared tests take the capsule as B, so a capsule
    // on the A side is tested in reverse and the result negated.
    const Transform& shape_transform = capsule_a ? transform_b : transform_a;
    const Collider& shape = capsule_a ? b : a;
    geometry::CapsuleSegment capsule = capsule_a ? capsule_of(transform_a, a) : capsule_of(transform_b, b);

    std::optional<Mtv> result;
    if (const auto* box = shape.get<BoxShape>()) {
        Vec2 center = shape_transform.apply(shape.offset);
        Vec2 half = box->size * glm::abs(shape_transform.scale) * 0.5;
        result = box_vs_capsule(center, half, shape_transform.rotation, capsule);
    } else {
        result = polygon_vs_capsule(polygon_like_vertices(shape_transform, shape), capsule);
    }

    return capsule_a ? negated(std::move(result)) : result;
}

std::optional<Mtv> NarrowPhase::test_generated(const Transform& other_transform, const Collider& other,
                                               const Transform& generated_transform, Collider& generated) {
    const TileGeometry* tiles = generated.generated_geometry();
    if (!tiles) {
        return std::nullopt;
    }

    scratch_transform_ = generated_transform;

    std::optional<Mtv> best;

    auto* box = scratch_box_.get<BoxShape>();
    for (const auto& rect : tiles->rects) {
        scratch_box_.offset = generated.offset + rect.center;
        box->size = rect.size;
        keep_deepest(best, test_primitive(other_transform, other, scratch_transform_, scratch_box_));
    }

    auto* polygon = scratch_polygon_.get<PolygonShape>();
    scratch_polygon_.offset = generated.offset;
    for (const auto& triangle : tiles->polygons) {
        polygon->vertices = triangle.vertices;
        keep_deepest(best, test_primitive(other_transform, other, scratch_transform_, scratch_polygon_));
    }

    return best;
}

std::optional<Mtv> NarrowPhase::test_line_chain(const Transform& other_transform, const Collider& other,
                                                const Transform& line_transform, const Collider& line) {
    const auto* chain = line.get<LineChainShape>();
    if (!chain || chain->points.size() < 2) {
        return std::nullopt;
    }

    std::vector<Vec2> points;
    points.reserve(chain->points.size());
    for (const auto& point : chain->points) {
        points.push_back(line_transform.apply(line.offset + point));
    }

    scratch_transform_ = Transform();
    scratch_box_.offset = Vec2(0.0);
    auto* box = scratch_box_.get<BoxShape>();

    std::optional<Mtv> best;
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        Vec2 delta = points[i + 1] - points[i];
        double length = glm::length(delta);
        if (length <= 0.0) {
            continue;
        }

        scratch_transform_.position = (points[i] + points[i + 1]) * 0.5;
        scratch_transform_.rotation = std::atan2(delta.y, delta.x) * RAD_TO_DEG;
        box->size = Vec2(length, line_thickness_);
        keep_deepest(best, test_primitive(other_transform, other, scratch_transform_, scratch_box_));
    }

    return best;
}

// ============================================================================
// Polygon vs Polygon
// ============================================================================

std::optional<Mtv> NarrowPhase::polygon_vs_polygon(const std::vector<Vec2>& vertices_a,
                                                   const std::vector<Vec2>& vertices_b) {
    if (vertices_a.empty() || vertices_b.empty()) {
        return std::nullopt;
    }

    std::vector<Vec2> test_axes = geometry::axes(vertices_a);
    std::vector<Vec2> axes_b = geometry::axes(vertices_b);
    test_axes.insert(test_axes.end(), axes_b.begin(), axes_b.end());
    if (test_axes.empty()) {
        return std::nullopt;
    }

    double min_overlap = std::numeric_limits<double>::infinity();
    Vec2 mtv_axis = test_axes.front();
    for (const auto& axis : test_axes) {
        double overlap = geometry::project(vertices_a, axis).overlap(geometry::project(vertices_b, axis));
        if (overlap < 0.0) {
            return std::nullopt;
        }
        if (overlap < min_overlap) {
            min_overlap = overlap;
            mtv_axis = axis;
        }
    }

    Vec2 center_a = geometry::vertex_centroid(vertices_a);
    Vec2 center_b = geometry::vertex_centroid(vertices_b);
    if (glm::dot(center_a - center_b, mtv_axis) < 0.0) {
        mtv_axis = -mtv_axis;
    }

    // Contact: centroid of the vertices of each polygon that lie inside the other
    Vec2 manifold_sum(0.0);
    int manifold_count = 0;
    for (const auto& vertex : vertices_a) {
        if (geometry::point_in_convex_polygon(vertex, vertices_b)) {
            manifold_sum += vertex;
            ++manifold_count;
        }
    }
    for (const auto& vertex : vertices_b) {
        if (geometry::point_in_convex_polygon(vertex, vertices_a)) {
            manifold_sum += vertex;
            ++manifold_count;
        }
    }

    Vec2 contact;
    if (manifold_count > 0) {
        contact = manifold_sum / static_cast<double>(manifold_count);
    } else {
        // No vertex is inside: fall back to the most deeply penetrating vertex
        contact = (center_a + center_b) * 0.5;
        double deepest = -std::numeric_limits<double>::infinity();

        double b_max = geometry::project(vertices_b, mtv_axis).max;
        for (const auto& vertex : vertices_a) {
            double depth = b_max - glm::dot(vertex, mtv_axis);
            if (depth > deepest) {
                deepest = depth;
                contact = vertex;
            }
        }

        double a_max = geometry::project(vertices_a, -mtv_axis).max;
        for (const auto& vertex : vertices_b) {
            double depth = a_max - glm::dot(vertex, -mtv_axis);
            if (depth > deepest) {
                deepest = depth;
                contact = vertex;
            }
        }
    }

    return Mtv(mtv_axis, min_overlap, contact);
}

// ============================================================================
// Capsule Tests
// ============================================================================

std::optional<Mtv> NarrowPhase::box_vs_capsule(const Vec2& box_center, const Vec2& half_extents,
                                               double rotation_degrees, const geometry::CapsuleSegment& capsule) {
    double radians = rotation_degrees * DEG_TO_RAD;
    double cos_a = std::cos(radians);
    double sin_a = std::sin(radians);

    Vec2 on_segment = geometry::closest_point_on_segment(box_center, capsule.a, capsule.b);

    // Clamp in the box's unrotated frame, then rotate back
    Vec2 local = rotate(on_segment - box_center, cos_a, -sin_a);
    Vec2 clamped(std::clamp(local.x, -half_extents.x, half_extents.x),
                 std::clamp(local.y, -half_extents.y, half_extents.y));
    Vec2 in_box = box_center + rotate(clamped, cos_a, sin_a);

    double distance = glm::length(on_segment - in_box);
    if (distance >= capsule.radius) {
        return std::nullopt;
    }

    Vec2 normal = in_box - on_segment;
    if (normal.x == 0.0 && normal.y == 0.0) {
        // Segment passes through the box: push along the centre offset
        normal = box_center - on_segment;
        if (normal.x == 0.0 && normal.y == 0.0) {
            normal = Vec2(1.0, 0.0);
        }
    }

    return Mtv(glm::normalize(normal), capsule.radius - distance, in_box);
}

std::optional<Mtv> NarrowPhase::polygon_vs_capsule(const std::vector<Vec2>& polygon,
                                                   const geometry::CapsuleSegment& capsule) {
    if (polygon.empty()) {
        return std::nullopt;
    }
    Vec2 reference = geometry::vertex_centroid(polygon);
    Vec2 on_segment = geometry::closest_point_on_segment(reference, capsule.a, capsule.b);
    return circle_vs_polygon(on_segment, capsule.radius, polygon);
}

std::optional<Mtv> NarrowPhase::capsule_vs_capsule(const geometry::CapsuleSegment& a,
                                                   const geometry::CapsuleSegment& b) {
    auto closest = geometry::closest_points_on_segments(a.a, a.b, b.a, b.b);

    double distance = glm::length(closest.on_first - closest.on_second);
    double total_radius = a.radius + b.radius;
    if (distance >= total_radius) {
        return std::nullopt;
    }

    Vec2 normal = distance > 0.0 ? (closest.on_first - closest.on_second) / distance : Vec2(1.0, 0.0);
    return Mtv(normal, total_radius - distance, (closest.on_first + closest.on_second) * 0.5);
}

std::optional<Mtv> NarrowPhase::circle_vs_polygon(const Vec2& center, double radius,
                                                  const std::vector<Vec2>& polygon) {
    if (polygon.empty()) {
        return std::nullopt;
    }

    std::vector<Vec2> test_axes = geometry::axes(polygon);

    Vec2 closest = geometry::closest_point_on_polygon(center, polygon);
    Vec2 to_circle = center - closest;
    if (to_circle.x != 0.0 || to_circle.y != 0.0) {
        test_axes.push_back(glm::normalize(to_circle));
    }
    if (test_axes.empty()) {
        test_axes.emplace_back(1.0, 0.0);
    }

    double min_overlap = std::numeric_limits<double>::infinity();
    Vec2 mtv_axis = test_axes.front();
    for (const auto& axis : test_axes) {
        double c = glm::dot(center, axis);
        geometry::Projection circle_projection{c - radius, c + radius};
        double overlap = geometry::project(polygon, axis).overlap(circle_projection);
        if (overlap < 0.0) {
            return std::nullopt;
        }
        if (overlap < min_overlap) {
            min_overlap = overlap;
            mtv_axis = axis;
        }
    }

    if (glm::dot(geometry::vertex_centroid(polygon) - center, mtv_axis) < 0.0) {
        mtv_axis = -mtv_axis;
    }

    return Mtv(mtv_axis, min_overlap, closest);
}

}  // namespace creative2d::physics
