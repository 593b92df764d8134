// Creative2D Physics Engine Tests
// narrow_phase_test.cpp - Pairwise collision tests and shape dispatch

#include <gtest/gtest.h>

#include <creative2d/physics/narrow_phase.hpp>

#include <cmath>

namespace creative2d::physics {
namespace {

class NarrowPhaseTest : public ::testing::Test {
protected:
    std::optional<Mtv> test(const Vec2& pos_a, Collider a, const Vec2& pos_b, Collider b) {
        collider_a_ = std::move(a);
        collider_b_ = std::move(b);
        return narrow_.test(Transform(pos_a), collider_a_, Transform(pos_b), collider_b_);
    }

    static void expect_vector(const Vec2& actual, const Vec2& expected, double tolerance = 1e-9) {
        EXPECT_NEAR(actual.x, expected.x, tolerance);
        EXPECT_NEAR(actual.y, expected.y, tolerance);
    }

    static TilemapShape solid_row(int columns) {
        TilemapShape tiles(columns, 1, Vec2(10.0));
        tiles.fill(0, 0, columns, 1);
        return tiles;
    }

    NarrowPhase narrow_;
    Collider collider_a_;
    Collider collider_b_;
};

// ============================================================================
// Box vs Box
// ============================================================================

TEST_F(NarrowPhaseTest, OverlappingBoxes) {
    auto mtv = test(Vec2(0.0), Collider::box(Vec2(20.0)), Vec2(15.0, 0.0), Collider::box(Vec2(20.0)));

    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->magnitude, 5.0, 1e-9);
    // Points from B toward A
    expect_vector(mtv->vector, Vec2(-5.0, 0.0));
    ASSERT_TRUE(mtv->contact_point.has_value());
    expect_vector(*mtv->contact_point, Vec2(7.5, 0.0));
}

TEST_F(NarrowPhaseTest, SwappingOrderNegatesMtv) {
    auto forward = test(Vec2(0.0), Collider::box(Vec2(20.0)), Vec2(15.0, 3.0), Collider::box(Vec2(20.0)));
    auto reverse = test(Vec2(15.0, 3.0), Collider::box(Vec2(20.0)), Vec2(0.0), Collider::box(Vec2(20.0)));

    ASSERT_TRUE(forward.has_value());
    ASSERT_TRUE(reverse.has_value());
    expect_vector(reverse->vector, -forward->vector);
    EXPECT_NEAR(reverse->magnitude, forward->magnitude, 1e-9);
}

TEST_F(NarrowPhaseTest, SeparatedBoxesMiss) {
    EXPECT_FALSE(test(Vec2(0.0), Collider::box(Vec2(20.0)), Vec2(25.0, 0.0), Collider::box(Vec2(20.0))));
    EXPECT_FALSE(test(Vec2(0.0), Collider::box(Vec2(20.0)), Vec2(0.0, -21.0), Collider::box(Vec2(20.0))));
}

TEST_F(NarrowPhaseTest, RotatedBoxReachesFarther) {
    Collider a = Collider::box(Vec2(20.0));
    Collider b = Collider::box(Vec2(20.0));
    Transform diamond(Vec2(0.0), 45.0);

    // A 45 degree square reaches 10 * sqrt(2) along x
    auto mtv = narrow_.test(diamond, a, Transform(Vec2(24.0, 0.0)), b);
    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->magnitude, 10.0 * std::sqrt(2.0) - 14.0, 1e-9);
    EXPECT_LT(mtv->vector.x, 0.0);

    EXPECT_FALSE(narrow_.test(diamond, a, Transform(Vec2(25.0, 0.0)), b));
}

TEST_F(NarrowPhaseTest, BoxOffsetAndScale) {
    Collider a = Collider::box(Vec2(10.0));
    a.offset = Vec2(50.0, 0.0);
    Collider b = Collider::box(Vec2(10.0));

    // Offset (50, 0) is scaled to (100, 0) together with the extents
    Transform scaled(Vec2(0.0), 0.0, Vec2(2.0));
    EXPECT_TRUE(narrow_.test(scaled, a, Transform(Vec2(110.0, 0.0)), b));
    EXPECT_FALSE(narrow_.test(scaled, a, Transform(Vec2(116.0, 0.0)), b));
}

// ============================================================================
// Capsules
// ============================================================================

TEST_F(NarrowPhaseTest, BoxVsCapsule) {
    auto mtv = test(Vec2(0.0), Collider::box(Vec2(20.0)), Vec2(0.0, 35.0), Collider::capsule(Vec2(20.0, 60.0)));

    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->magnitude, 5.0, 1e-9);
    expect_vector(mtv->vector, Vec2(0.0, -5.0));
    expect_vector(*mtv->contact_point, Vec2(0.0, 10.0));
}

TEST_F(NarrowPhaseTest, CapsuleVsBoxIsNegated) {
    auto mtv = test(Vec2(0.0, 35.0), Collider::capsule(Vec2(20.0, 60.0)), Vec2(0.0), Collider::box(Vec2(20.0)));

    ASSERT_TRUE(mtv.has_value());
    expect_vector(mtv->vector, Vec2(0.0, 5.0));
}

TEST_F(NarrowPhaseTest, BoxVsCapsuleMiss) {
    EXPECT_FALSE(test(Vec2(0.0), Collider::box(Vec2(20.0)), Vec2(0.0, 41.0), Collider::capsule(Vec2(20.0, 60.0))));
}

TEST_F(NarrowPhaseTest, CapsuleVsCapsule) {
    auto mtv =
        test(Vec2(0.0), Collider::capsule(Vec2(20.0, 60.0)), Vec2(15.0, 0.0), Collider::capsule(Vec2(20.0, 60.0)));

    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->magnitude, 5.0, 1e-9);
    expect_vector(mtv->normal(), Vec2(-1.0, 0.0));
}

TEST_F(NarrowPhaseTest, CoincidentCapsulesUseFallbackAxis) {
    auto mtv = NarrowPhase::capsule_vs_capsule(geometry::CapsuleSegment{Vec2(0.0), Vec2(0.0), Vec2(0.0), 5.0},
                                               geometry::CapsuleSegment{Vec2(0.0), Vec2(0.0), Vec2(0.0), 5.0});

    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->magnitude, 10.0, 1e-12);
    expect_vector(mtv->normal(), Vec2(1.0, 0.0));
}

TEST_F(NarrowPhaseTest, PolygonVsHorizontalCapsule) {
    Collider square = Collider::polygon({{-10.0, -10.0}, {10.0, -10.0}, {10.0, 10.0}, {-10.0, 10.0}});
    Collider pill = Collider::capsule(Vec2(60.0, 20.0), CapsuleDirection::Horizontal);
    auto mtv = test(Vec2(0.0), square, Vec2(0.0, -18.0), pill);

    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->magnitude, 2.0, 1e-9);
    expect_vector(mtv->normal(), Vec2(0.0, 1.0));
}

// ============================================================================
// Circle vs Polygon
// ============================================================================

TEST_F(NarrowPhaseTest, CircleVsPolygonPointsTowardPolygon) {
    std::vector<Vec2> square{{-10.0, -10.0}, {10.0, -10.0}, {10.0, 10.0}, {-10.0, 10.0}};
    auto mtv = NarrowPhase::circle_vs_polygon(Vec2(0.0, -14.0), 5.0, square);

    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->magnitude, 1.0, 1e-9);
    expect_vector(mtv->normal(), Vec2(0.0, 1.0));
    expect_vector(*mtv->contact_point, Vec2(0.0, -10.0));
}

TEST_F(NarrowPhaseTest, CircleNearCornerUsesClosestPointAxis) {
    std::vector<Vec2> square{{-10.0, -10.0}, {10.0, -10.0}, {10.0, 10.0}, {-10.0, 10.0}};

    // Within range of both edge axes but outside the rounded corner
    EXPECT_FALSE(NarrowPhase::circle_vs_polygon(Vec2(14.0, -14.0), 5.0, square));
    EXPECT_TRUE(NarrowPhase::circle_vs_polygon(Vec2(13.0, -13.0), 5.0, square));
}

// ============================================================================
// Generated Colliders
// ============================================================================

TEST_F(NarrowPhaseTest, BoxVsTilemap) {
    auto mtv = test(Vec2(0.0, -8.0), Collider::box(Vec2(10.0)), Vec2(0.0), Collider::tilemap(solid_row(4)));

    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->magnitude, 2.0, 1e-9);
    expect_vector(mtv->vector, Vec2(0.0, -2.0));
}

TEST_F(NarrowPhaseTest, TilemapAsFirstBodyIsNegated) {
    auto mtv = test(Vec2(0.0), Collider::tilemap(solid_row(4)), Vec2(0.0, -8.0), Collider::box(Vec2(10.0)));

    ASSERT_TRUE(mtv.has_value());
    expect_vector(mtv->vector, Vec2(0.0, 2.0));
}

TEST_F(NarrowPhaseTest, TilemapHonoursColliderOffset) {
    Collider tiles = Collider::tilemap(solid_row(4));
    tiles.offset = Vec2(100.0, 0.0);

    EXPECT_FALSE(test(Vec2(0.0, -8.0), Collider::box(Vec2(10.0)), Vec2(0.0), tiles));
    EXPECT_TRUE(test(Vec2(100.0, -8.0), Collider::box(Vec2(10.0)), Vec2(0.0), tiles));
}

TEST_F(NarrowPhaseTest, TilemapEditsAreSeen) {
    Collider box = Collider::box(Vec2(10.0));
    Collider tiles = Collider::tilemap(TilemapShape(4, 1, Vec2(10.0)));
    Transform box_at(Vec2(0.0, -8.0));

    EXPECT_FALSE(narrow_.test(box_at, box, Transform(), tiles));

    tiles.get<TilemapShape>()->set_tile(2, 0, true);
    EXPECT_TRUE(narrow_.test(box_at, box, Transform(), tiles));
}

TEST_F(NarrowPhaseTest, DeepestTileWins) {
    // Cells (0, 0) and (2, 0) become separate rects
    TilemapShape tiles(3, 1, Vec2(10.0));
    tiles.set_tile(0, 0, true);
    tiles.set_tile(2, 0, true);

    // Overlaps the left tile by 4 and the right tile by 6 on x
    auto mtv = test(Vec2(1.0, 0.0), Collider::box(Vec2(20.0, 40.0)), Vec2(0.0), Collider::tilemap(std::move(tiles)));
    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->magnitude, 6.0, 1e-9);
}

TEST_F(NarrowPhaseTest, BoxVsTerrainRectangles) {
    TerrainShape terrain(32, 32, std::vector<uint8_t>(32 * 32, 255));
    auto mtv = test(Vec2(0.0, -19.0), Collider::box(Vec2(10.0)), Vec2(0.0), Collider::terrain(std::move(terrain)));

    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->magnitude, 2.0, 1e-9);
    expect_vector(mtv->normal(), Vec2(0.0, -1.0));
}

TEST_F(NarrowPhaseTest, BoxVsTerrainPolygons) {
    TerrainShape terrain(32, 32, std::vector<uint8_t>(32 * 32, 255));
    terrain.set_mode(TerrainMode::Polygon);
    Collider ground = Collider::terrain(std::move(terrain));

    EXPECT_TRUE(test(Vec2(0.0), Collider::box(Vec2(10.0)), Vec2(0.0), ground));
    EXPECT_FALSE(test(Vec2(0.0, -40.0), Collider::box(Vec2(10.0)), Vec2(0.0), ground));
}

TEST_F(NarrowPhaseTest, GeneratedPairsNeverCollide) {
    EXPECT_FALSE(test(Vec2(0.0), Collider::tilemap(solid_row(4)), Vec2(0.0), Collider::tilemap(solid_row(4))));
    EXPECT_FALSE(test(Vec2(0.0), Collider::tilemap(solid_row(4)), Vec2(0.0),
                      Collider::line_chain({{-50.0, 0.0}, {50.0, 0.0}})));
}

// ============================================================================
// Line Chains
// ============================================================================

TEST_F(NarrowPhaseTest, BoxRestingOnLineChain) {
    auto mtv = test(Vec2(0.0, -5.5), Collider::box(Vec2(10.0)), Vec2(0.0),
                    Collider::line_chain({{-50.0, 0.0}, {50.0, 0.0}}));

    ASSERT_TRUE(mtv.has_value());
    // Segments collide as boxes of the default 2 pixel thickness
    EXPECT_NEAR(mtv->magnitude, 0.5, 1e-9);
    expect_vector(mtv->normal(), Vec2(0.0, -1.0));
}

TEST_F(NarrowPhaseTest, LineChainAsFirstBodyIsNegated) {
    auto mtv = test(Vec2(0.0), Collider::line_chain({{-50.0, 0.0}, {50.0, 0.0}}), Vec2(0.0, -5.5),
                    Collider::box(Vec2(10.0)));

    ASSERT_TRUE(mtv.has_value());
    expect_vector(mtv->normal(), Vec2(0.0, 1.0));
}

TEST_F(NarrowPhaseTest, LineChainSkipsZeroLengthSegments) {
    Collider chain = Collider::line_chain({{0.0, 0.0}, {0.0, 0.0}, {50.0, 0.0}});

    EXPECT_TRUE(test(Vec2(25.0, -5.5), Collider::box(Vec2(10.0)), Vec2(0.0), chain));
    EXPECT_FALSE(test(Vec2(-25.0, -5.5), Collider::box(Vec2(10.0)), Vec2(0.0), chain));
}

TEST_F(NarrowPhaseTest, SlopedLineChain) {
    // 45 degree slope through the origin, circle just above it
    Collider chain = Collider::line_chain({{-50.0, -50.0}, {50.0, 50.0}});
    auto mtv = test(Vec2(-3.0, 3.0), Collider::capsule(Vec2(10.0, 10.0)), Vec2(0.0), chain);

    ASSERT_TRUE(mtv.has_value());
    Vec2 n = mtv->normal();
    EXPECT_NEAR(std::abs(n.x), std::sqrt(0.5), 1e-9);
    EXPECT_NEAR(std::abs(n.y), std::sqrt(0.5), 1e-9);
}

TEST_F(NarrowPhaseTest, LineThicknessIsConfigurable) {
    Collider chain = Collider::line_chain({{-50.0, 0.0}, {50.0, 0.0}});

    EXPECT_FALSE(test(Vec2(0.0, -14.0), Collider::box(Vec2(10.0)), Vec2(0.0), chain));

    narrow_.set_line_thickness(20.0);
    auto mtv = test(Vec2(0.0, -14.0), Collider::box(Vec2(10.0)), Vec2(0.0), chain);
    ASSERT_TRUE(mtv.has_value());
    EXPECT_NEAR(mtv->magnitude, 1.0, 1e-9);
}

// ============================================================================
// Statistics
// ============================================================================

TEST_F(NarrowPhaseTest, StatsCountTestsAndSubShapes) {
    (void)test(Vec2(0.0), Collider::box(Vec2(20.0)), Vec2(15.0, 0.0), Collider::box(Vec2(20.0)));
    Collider empty_tiles = Collider::tilemap(TilemapShape(3, 1, Vec2(10.0)));
    (void)test(Vec2(0.0, -8.0), Collider::box(Vec2(10.0)), Vec2(0.0), empty_tiles);

    const auto& stats = narrow_.get_stats();
    EXPECT_EQ(stats.tests, 2u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.sub_shape_tests, 1u);

    narrow_.reset_stats();
    EXPECT_EQ(narrow_.get_stats().tests, 0u);
}

}  // namespace
}  // namespace creative2d::physics
