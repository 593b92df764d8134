// Creative2D Physics Engine
// narrow_phase.hpp - Pairwise collision tests producing minimum translation vectors

#pragma once

#include "colliders.hpp"
#include "geometry.hpp"
#include "types.hpp"

#include <optional>
#include <vector>

namespace creative2d::physics {

// ============================================================================
// Narrow Phase
// ============================================================================

// Every result points from B toward A: moving A by the MTV (or B by its negation)
// separates the pair. Concentric shapes have no preferred direction and fall back
// to a fixed axis, so callers that need test(B, A) == -test(A, B) test pairs in a
// fixed order and negate (PhysicsWorld orders by body id).
//
// Tilemap, terrain and line chain colliders are split into sub-shapes that are
// tested one at a time through an internal scratch collider. The scratch is
// reused between calls, so an instance must not be used re-entrantly.
class NarrowPhase {
public:
    static constexpr double DEFAULT_LINE_THICKNESS = 2.0;

    explicit NarrowPhase(double line_thickness = DEFAULT_LINE_THICKNESS);

    NarrowPhase(const NarrowPhase&) = delete;
    NarrowPhase& operator=(const NarrowPhase&) = delete;

    // Transforms are world transforms. Generated colliders regenerate here when dirty.
    [[nodiscard]] std::optional<Mtv> test(const Transform& transform_a, Collider& a, const Transform& transform_b,
                                          Collider& b);

    [[nodiscard]] double get_line_thickness() const { return line_thickness_; }
    void set_line_thickness(double thickness) { line_thickness_ = thickness; }

    // ========================================================================
    // Primitive Tests (world space)
    // ========================================================================

    // SAT over both edge sets. Boxes go through here as four-vertex polygons.
    [[nodiscard]] static std::optional<Mtv> polygon_vs_polygon(const std::vector<Vec2>& vertices_a,
                                                               const std::vector<Vec2>& vertices_b);

    // Box is A, capsule is B
    [[nodiscard]] static std::optional<Mtv> box_vs_capsule(const Vec2& box_center, const Vec2& half_extents,
                                                           double rotation_degrees,
                                                           const geometry::CapsuleSegment& capsule);

    // Polygon is A, capsule is B
    [[nodiscard]] static std::optional<Mtv> polygon_vs_capsule(const std::vector<Vec2>& polygon,
                                                               const geometry::CapsuleSegment& capsule);

    [[nodiscard]] static std::optional<Mtv> capsule_vs_capsule(const geometry::CapsuleSegment& a,
                                                               const geometry::CapsuleSegment& b);

    // Polygon is A, circle is B
    [[nodiscard]] static std::optional<Mtv> circle_vs_polygon(const Vec2& center, double radius,
                                                              const std::vector<Vec2>& polygon);

    // ========================================================================
    // Statistics
    // ========================================================================

    struct Stats {
        size_t tests = 0;
        size_t sub_shape_tests = 0;
        size_t hits = 0;
    };

    [[nodiscard]] const Stats& get_stats() const { return stats_; }
    void reset_stats() { stats_ = {}; }

private:
    // Box, capsule and polygon only
    [[nodiscard]] std::optional<Mtv> test_primitive(const Transform& transform_a, const Collider& a,
                                                    const Transform& transform_b, const Collider& b);

    // `other` is A, the generated collider is B
    [[nodiscard]] std::optional<Mtv> test_generated(const Transform& other_transform, const Collider& other,
                                                    const Transform& generated_transform, Collider& generated);

    // `other` is A, the line chain is B
    [[nodiscard]] std::optional<Mtv> test_line_chain(const Transform& other_transform, const Collider& other,
                                                     const Transform& line_transform, const Collider& line);

    double line_thickness_;
    Stats stats_;

    Transform scratch_transform_;
    Collider scratch_box_;
    Collider scratch_polygon_;
};

}  // namespace creative2d::physics
