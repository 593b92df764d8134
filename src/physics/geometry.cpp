// Creative2D Physics Engine
// geometry.cpp - Stateless 2D geometry helpers

#include <creative2d/physics/geometry.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace creative2d::physics::geometry {

namespace {

constexpr double PARALLEL_EPSILON = 1e-6;
constexpr double INSIDE_EPSILON = 1e-6;

double clamp01(double value) {
    return std::clamp(value, 0.0, 1.0);
}

}  // namespace

// ============================================================================
// World-Space Shape Extraction
// ============================================================================

std::vector<Vec2> box_vertices(const Transform& transform, const Vec2& offset, const Vec2& size) {
    // Mirroring a box only moves its centre; half extents stay positive so the
    // corner winding is the same for every transform.
    Vec2 center = transform.apply(offset);
    Vec2 half = size * glm::abs(transform.scale) * 0.5;

    double radians = transform.rotation * DEG_TO_RAD;
    double cos_a = std::cos(radians);
    double sin_a = std::sin(radians);

    return {
        center + rotate(Vec2(-half.x, -half.y), cos_a, sin_a),
        center + rotate(Vec2(half.x, -half.y), cos_a, sin_a),
        center + rotate(Vec2(half.x, half.y), cos_a, sin_a),
        center + rotate(Vec2(-half.x, half.y), cos_a, sin_a),
    };
}

std::vector<Vec2> polygon_vertices(const Transform& transform, const Vec2& offset,
                                   const std::vector<Vec2>& local_vertices) {
    std::vector<Vec2> result;
    result.reserve(local_vertices.size());
    for (const auto& vertex : local_vertices) {
        result.push_back(transform.apply(offset + vertex));
    }
    return result;
}

CapsuleSegment capsule_segment(const Transform& transform, const Vec2& offset, const Vec2& size, bool horizontal) {
    Vec2 scaled_size = size * glm::abs(transform.scale);

    CapsuleSegment segment;
    segment.center = transform.apply(offset);

    Vec2 half_axis(0.0);
    if (horizontal) {
        segment.radius = scaled_size.y * 0.5;
        half_axis.x = std::max(0.0, scaled_size.x - scaled_size.y) * 0.5;
    } else {
        segment.radius = scaled_size.x * 0.5;
        half_axis.y = std::max(0.0, scaled_size.y - scaled_size.x) * 0.5;
    }

    Vec2 rotated = rotate_degrees(half_axis, transform.rotation);
    segment.a = segment.center - rotated;
    segment.b = segment.center + rotated;
    return segment;
}

// ============================================================================
// Separating Axis Helpers
// ============================================================================

std::vector<Vec2> axes(const std::vector<Vec2>& vertices) {
    std::vector<Vec2> result;
    result.reserve(vertices.size());
    for (size_t i = 0; i < vertices.size(); ++i) {
        Vec2 edge = vertices[(i + 1) % vertices.size()] - vertices[i];
        double length = glm::length(edge);
        if (length <= 0.0) {
            continue;
        }
        result.emplace_back(-edge.y / length, edge.x / length);
    }
    return result;
}

Projection project(const std::vector<Vec2>& vertices, const Vec2& axis) {
    if (vertices.empty()) {
        return {};
    }

    Projection projection{std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity()};
    for (const auto& vertex : vertices) {
        double d = glm::dot(vertex, axis);
        projection.min = std::min(projection.min, d);
        projection.max = std::max(projection.max, d);
    }
    return projection;
}

Vec2 vertex_centroid(const std::vector<Vec2>& vertices) {
    if (vertices.empty()) {
        return Vec2(0.0);
    }
    Vec2 sum(0.0);
    for (const auto& vertex : vertices) {
        sum += vertex;
    }
    return sum / static_cast<double>(vertices.size());
}

double signed_area(const std::vector<Vec2>& vertices) {
    double area = 0.0;
    for (size_t i = 0; i < vertices.size(); ++i) {
        area += cross(vertices[i], vertices[(i + 1) % vertices.size()]);
    }
    return area * 0.5;
}

// ============================================================================
// Closest Points and Containment
// ============================================================================

Vec2 closest_point_on_segment(const Vec2& point, const Vec2& a, const Vec2& b) {
    Vec2 ab = b - a;
    double length_sq = glm::dot(ab, ab);
    if (length_sq <= 0.0) {
        return a;
    }
    double t = clamp01(glm::dot(point - a, ab) / length_sq);
    return a + ab * t;
}

SegmentClosestPoints closest_points_on_segments(const Vec2& p1, const Vec2& q1, const Vec2& p2, const Vec2& q2) {
    Vec2 d1 = q1 - p1;
    Vec2 d2 = q2 - p2;
    Vec2 r = p1 - p2;
    double a = glm::dot(d1, d1);
    double e = glm::dot(d2, d2);
    double f = glm::dot(d2, r);

    double s = 0.0;
    double t = 0.0;

    if (a <= PARALLEL_EPSILON && e <= PARALLEL_EPSILON) {
        // Both segments degenerate into points
    } else if (a <= PARALLEL_EPSILON) {
        t = clamp01(f / e);
    } else {
        double c = glm::dot(d1, r);
        if (e <= PARALLEL_EPSILON) {
            s = clamp01(-c / a);
        } else {
            double b = glm::dot(d1, d2);
            double denom = a * e - b * b;
            s = denom != 0.0 ? clamp01((b * f - c * e) / denom) : 0.0;
            t = (b * s + f) / e;
            if (t < 0.0) {
                t = 0.0;
                s = clamp01(-c / a);
            } else if (t > 1.0) {
                t = 1.0;
                s = clamp01((b - c) / a);
            }
        }
    }

    return {p1 + d1 * s, p2 + d2 * t, s, t};
}

Vec2 closest_point_on_polygon(const Vec2& point, const std::vector<Vec2>& vertices) {
    if (vertices.empty()) {
        return point;
    }

    Vec2 best = vertices.front();
    double best_dist_sq = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < vertices.size(); ++i) {
        Vec2 candidate = closest_point_on_segment(point, vertices[i], vertices[(i + 1) % vertices.size()]);
        Vec2 delta = point - candidate;
        double dist_sq = glm::dot(delta, delta);
        if (dist_sq < best_dist_sq) {
            best_dist_sq = dist_sq;
            best = candidate;
        }
    }
    return best;
}

bool point_in_convex_polygon(const Vec2& point, const std::vector<Vec2>& vertices) {
    if (vertices.size() < 3) {
        return false;
    }

    bool clockwise = signed_area(vertices) > 0.0;
    for (size_t i = 0; i < vertices.size(); ++i) {
        const Vec2& v1 = vertices[i];
        const Vec2& v2 = vertices[(i + 1) % vertices.size()];
        double side = cross(v2 - v1, point - v1);
        if (clockwise ? side < -INSIDE_EPSILON : side > INSIDE_EPSILON) {
            return false;
        }
    }
    return true;
}

bool point_in_triangle(const Vec2& point, const Vec2& a, const Vec2& b, const Vec2& c) {
    double det = (b.y - c.y) * (a.x - c.x) + (c.x - b.x) * (a.y - c.y);
    if (det == 0.0) {
        return false;
    }
    double s = ((b.y - c.y) * (point.x - c.x) + (c.x - b.x) * (point.y - c.y)) / det;
    double t = ((c.y - a.y) * (point.x - c.x) + (a.x - c.x) * (point.y - c.y)) / det;
    double u = 1.0 - s - t;
    return s >= 0.0 && t >= 0.0 && u >= 0.0;
}

double distance_to_segment(const Vec2& point, const Vec2& a, const Vec2& b) {
    return glm::length(point - closest_point_on_segment(point, a, b));
}

}  // namespace creative2d::physics::geometry
