// Creative2D Physics Engine
// geometry.hpp - Stateless 2D geometry helpers shared by the narrow phase, raycaster and fluid

#pragma once

#include "types.hpp"

#include <vector>

namespace creative2d::physics::geometry {

// ============================================================================
// Result Types
// ============================================================================

struct Projection {
    double min = 0.0;
    double max = 0.0;

    // Negative when the ranges are disjoint
    [[nodiscard]] double overlap(const Projection& other) const {
        return std::min(max, other.max) - std::max(min, other.min);
    }
};

struct CapsuleSegment {
    Vec2 a{0.0};
    Vec2 b{0.0};
    Vec2 center{0.0};
    double radius = 0.0;
};

struct SegmentClosestPoints {
    Vec2 on_first{0.0};
    Vec2 on_second{0.0};
    double s = 0.0;  // Parameter along the first segment
    double t = 0.0;  // Parameter along the second segment
};

// ============================================================================
// World-Space Shape Extraction
// ============================================================================

// Corners of a box of `size` centred on `offset`, in clockwise screen order
// starting at the top-left corner.
[[nodiscard]] std::vector<Vec2> box_vertices(const Transform& transform, const Vec2& offset, const Vec2& size);

[[nodiscard]] std::vector<Vec2> polygon_vertices(const Transform& transform, const Vec2& offset,
                                                 const std::vector<Vec2>& local_vertices);

[[nodiscard]] CapsuleSegment capsule_segment(const Transform& transform, const Vec2& offset, const Vec2& size,
                                             bool horizontal);

// ============================================================================
// Separating Axis Helpers
// ============================================================================

// One unit normal (-e.y, e.x) per edge. Zero-length edges are skipped.
[[nodiscard]] std::vector<Vec2> axes(const std::vector<Vec2>& vertices);

[[nodiscard]] Projection project(const std::vector<Vec2>& vertices, const Vec2& axis);

[[nodiscard]] Vec2 vertex_centroid(const std::vector<Vec2>& vertices);

// Signed shoelace area. Positive when the vertices run clockwise on screen (y down).
[[nodiscard]] double signed_area(const std::vector<Vec2>& vertices);

// ============================================================================
// Closest Points and Containment
// ============================================================================

[[nodiscard]] Vec2 closest_point_on_segment(const Vec2& point, const Vec2& a, const Vec2& b);

// Closest points between segments p1-q1 and p2-q2 (Ericson, Real-Time Collision Detection 5.1.9)
[[nodiscard]] SegmentClosestPoints closest_points_on_segments(const Vec2& p1, const Vec2& q1, const Vec2& p2,
                                                              const Vec2& q2);

[[nodiscard]] Vec2 closest_point_on_polygon(const Vec2& point, const std::vector<Vec2>& vertices);

// Works for either winding; points on an edge count as inside.
[[nodiscard]] bool point_in_convex_polygon(const Vec2& point, const std::vector<Vec2>& vertices);

// Barycentric test, inclusive of the edges. Degenerate triangles contain nothing.
[[nodiscard]] bool point_in_triangle(const Vec2& point, const Vec2& a, const Vec2& b, const Vec2& c);

// Perpendicular distance from `point` to the segment a-b (clamped to the segment)
[[nodiscard]] double distance_to_segment(const Vec2& point, const Vec2& a, const Vec2& b);

}  // namespace creative2d::physics::geometry
