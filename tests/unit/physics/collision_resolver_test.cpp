// Creative2D Physics Engine Tests
// collision_resolver_test.cpp - Positional correction, restitution impulses and inertia

#include <gtest/gtest.h>

#include <creative2d/physics/collision_resolver.hpp>

namespace creative2d::physics {
namespace {

class CollisionResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        body_a_ = RigidBody(BodyType::Dynamic, 1.0);
        body_b_ = RigidBody(BodyType::Dynamic, 1.0);
    }

    RigidBody body_a_;
    RigidBody body_b_;
};

// ============================================================================
// Moment of Inertia
// ============================================================================

TEST_F(CollisionResolverTest, InertiaFromBoxSize) {
    body_a_.mass = 2.0;
    Collider box = Collider::box(Vec2(20.0));

    EXPECT_NEAR(moment_of_inertia(&body_a_, &box, Vec2(1.0)), 2.0 * 800.0 / 12.0, 1e-9);
    EXPECT_NEAR(moment_of_inertia(&body_a_, &box, Vec2(2.0, 1.0)), 2.0 * 2000.0 / 12.0, 1e-9);
}

TEST_F(CollisionResolverTest, InertiaDefaultExtent) {
    Collider polygon = Collider::polygon({{0.0, 0.0}, {10.0, 0.0}, {0.0, 10.0}});

    EXPECT_NEAR(moment_of_inertia(&body_a_, &polygon, Vec2(1.0)), 20000.0 / 12.0, 1e-9);
    EXPECT_NEAR(moment_of_inertia(&body_a_, nullptr, Vec2(1.0)), 20000.0 / 12.0, 1e-9);
}

TEST_F(CollisionResolverTest, NoInertiaWithoutRotation) {
    Collider box = Collider::box(Vec2(20.0));
    EXPECT_DOUBLE_EQ(moment_of_inertia(nullptr, &box, Vec2(1.0)), 0.0);

    body_a_.constraints.freeze_rotation = true;
    EXPECT_DOUBLE_EQ(moment_of_inertia(&body_a_, &box, Vec2(1.0)), 0.0);
}

// ============================================================================
// Head-on Collisions
// ============================================================================

TEST_F(CollisionResolverTest, ElasticCollisionExchangesVelocities) {
    body_a_.velocity = Vec2(1.0, 0.0);
    body_b_.velocity = Vec2(-1.0, 0.0);
    body_a_.restitution = 1.0;

    ContactBody a{Vec2(-9.0, 0.0), &body_a_, 100.0};
    ContactBody b{Vec2(9.0, 0.0), &body_b_, 100.0};
    auto result = resolve_collision(a, b, Mtv(Vec2(-1.0, 0.0), 2.0, Vec2(0.0)));

    // Correction is split evenly between two dynamic bodies
    EXPECT_NEAR(a.position.x, -10.0, 1e-12);
    EXPECT_NEAR(b.position.x, 10.0, 1e-12);
    EXPECT_NEAR(result.correction_a.x, -1.0, 1e-12);
    EXPECT_NEAR(result.correction_b.x, 1.0, 1e-12);

    ASSERT_TRUE(result.impulse_applied);
    EXPECT_NEAR(result.impulse, 2.0, 1e-12);
    EXPECT_NEAR(body_a_.velocity.x, -1.0, 1e-12);
    EXPECT_NEAR(body_b_.velocity.x, 1.0, 1e-12);

    // Contact on the line of centres produces no spin
    EXPECT_NEAR(body_a_.angular_velocity, 0.0, 1e-12);
    EXPECT_NEAR(body_b_.angular_velocity, 0.0, 1e-12);
}

TEST_F(CollisionResolverTest, RestitutionUsesTheLargerValue) {
    body_a_.velocity = Vec2(1.0, 0.0);
    body_b_.velocity = Vec2(-1.0, 0.0);
    body_b_.restitution = 1.0;

    ContactBody a{Vec2(-9.0, 0.0), &body_a_, 0.0};
    ContactBody b{Vec2(9.0, 0.0), &body_b_, 0.0};
    resolve_collision(a, b, Mtv(Vec2(-1.0, 0.0), 2.0, Vec2(0.0)));

    EXPECT_NEAR(body_a_.velocity.x, -1.0, 1e-12);
    EXPECT_NEAR(body_b_.velocity.x, 1.0, 1e-12);
}

TEST_F(CollisionResolverTest, InelasticCollisionStops) {
    body_a_.velocity = Vec2(1.0, 0.0);
    body_b_.velocity = Vec2(-1.0, 0.0);

    ContactBody a{Vec2(-9.0, 0.0), &body_a_, 0.0};
    ContactBody b{Vec2(9.0, 0.0), &body_b_, 0.0};
    resolve_collision(a, b, Mtv(Vec2(-1.0, 0.0), 2.0, Vec2(0.0)));

    EXPECT_NEAR(body_a_.velocity.x, 0.0, 1e-12);
    EXPECT_NEAR(body_b_.velocity.x, 0.0, 1e-12);
}

TEST_F(CollisionResolverTest, MomentumIsConserved) {
    body_a_.mass = 3.0;
    body_a_.velocity = Vec2(1.0, 0.0);
    body_b_.velocity = Vec2(-1.0, 0.0);

    ContactBody a{Vec2(-9.0, 0.0), &body_a_, 0.0};
    ContactBody b{Vec2(9.0, 0.0), &body_b_, 0.0};
    resolve_collision(a, b, Mtv(Vec2(-1.0, 0.0), 2.0, Vec2(0.0)));

    EXPECT_NEAR(body_a_.velocity.x, 0.5, 1e-12);
    EXPECT_NEAR(body_b_.velocity.x, 0.5, 1e-12);
    EXPECT_NEAR(3.0 * body_a_.velocity.x + body_b_.velocity.x, 2.0, 1e-12);
}

// ============================================================================
// Static Contacts
// ============================================================================

TEST_F(CollisionResolverTest, DynamicTakesFullCorrectionAgainstStatic) {
    body_a_.velocity = Vec2(0.0, 5.0);

    ContactBody a{Vec2(0.0, -9.0), &body_a_, 0.0};
    ContactBody ground{Vec2(0.0, 10.0), nullptr, 0.0};
    auto result = resolve_collision(a, ground, Mtv(Vec2(0.0, -1.0), 1.0, Vec2(0.0)));

    EXPECT_NEAR(a.position.y, -10.0, 1e-12);
    EXPECT_NEAR(ground.position.y, 10.0, 1e-12);
    EXPECT_TRUE(result.impulse_applied);
    EXPECT_NEAR(body_a_.velocity.y, 0.0, 1e-12);
}

TEST_F(CollisionResolverTest, StaticFirstBodyPushesSecond) {
    body_b_.velocity = Vec2(0.0, 3.0);

    // B lies above the static A; the MTV from B to A points down, so B moves up
    ContactBody ground{Vec2(0.0, 10.0), nullptr, 0.0};
    ContactBody b{Vec2(0.0, -9.0), &body_b_, 0.0};
    auto result = resolve_collision(ground, b, Mtv(Vec2(0.0, 1.0), 1.0, Vec2(0.0)));

    EXPECT_NEAR(b.position.y, -10.0, 1e-12);
    EXPECT_NEAR(result.correction_a.y, 0.0, 1e-12);
    EXPECT_NEAR(body_b_.velocity.y, 0.0, 1e-12);
}

TEST_F(CollisionResolverTest, SeparatingBodiesOnlyGetCorrected) {
    body_a_.velocity = Vec2(0.0, -2.0);

    ContactBody a{Vec2(0.0, -9.0), &body_a_, 0.0};
    ContactBody ground{Vec2(0.0, 10.0), nullptr, 0.0};
    auto result = resolve_collision(a, ground, Mtv(Vec2(0.0, -1.0), 1.0, Vec2(0.0)));

    EXPECT_FALSE(result.impulse_applied);
    EXPECT_NEAR(a.position.y, -10.0, 1e-12);
    EXPECT_NEAR(body_a_.velocity.y, -2.0, 1e-12);
}

TEST_F(CollisionResolverTest, TwoStaticBodiesAreUntouched) {
    ContactBody a{Vec2(0.0), nullptr, 0.0};
    ContactBody b{Vec2(1.0, 0.0), nullptr, 0.0};
    auto result = resolve_collision(a, b, Mtv(Vec2(-1.0, 0.0), 5.0));

    EXPECT_FALSE(result.impulse_applied);
    EXPECT_DOUBLE_EQ(a.position.x, 0.0);
    EXPECT_DOUBLE_EQ(b.position.x, 1.0);
}

TEST_F(CollisionResolverTest, KinematicBodyIsNotMoved) {
    RigidBody platform(BodyType::Kinematic);
    body_a_.velocity = Vec2(0.0, 5.0);

    ContactBody a{Vec2(0.0, -9.0), &body_a_, 0.0};
    ContactBody b{Vec2(0.0, 10.0), &platform, 0.0};
    resolve_collision(a, b, Mtv(Vec2(0.0, -1.0), 1.0, Vec2(0.0)));

    EXPECT_NEAR(b.position.y, 10.0, 1e-12);
    EXPECT_NEAR(a.position.y, -10.0, 1e-12);
    EXPECT_DOUBLE_EQ(platform.velocity.y, 0.0);
}

// ============================================================================
// Angular Response
// ============================================================================

TEST_F(CollisionResolverTest, OffCentreContactSpins) {
    body_a_.velocity = Vec2(0.0, 5.0);
    Collider box = Collider::box(Vec2(20.0));
    double inertia = moment_of_inertia(&body_a_, &box, Vec2(1.0));

    ContactBody a{Vec2(0.0, -9.0), &body_a_, inertia};
    ContactBody ground{Vec2(0.0, 10.0), nullptr, 0.0};
    auto result = resolve_collision(a, ground, Mtv(Vec2(0.0, -1.0), 1.0, Vec2(5.0, 0.0)));

    // r = (5, 10), r x n = -5
    double denominator = 1.0 + 25.0 / inertia;
    EXPECT_NEAR(result.impulse, 5.0 / denominator, 1e-9);
    EXPECT_NEAR(body_a_.angular_velocity, -5.0 * result.impulse / inertia, 1e-9);
    EXPECT_LT(body_a_.angular_velocity, 0.0);
}

TEST_F(CollisionResolverTest, FrozenRotationDoesNotSpin) {
    body_a_.velocity = Vec2(0.0, 5.0);
    body_a_.constraints.freeze_rotation = true;

    ContactBody a{Vec2(0.0, -9.0), &body_a_, 100.0};
    ContactBody ground{Vec2(0.0, 10.0), nullptr, 0.0};
    resolve_collision(a, ground, Mtv(Vec2(0.0, -1.0), 1.0, Vec2(5.0, 0.0)));

    EXPECT_DOUBLE_EQ(body_a_.angular_velocity, 0.0);
}

TEST_F(CollisionResolverTest, MissingContactUsesMidpoint) {
    body_a_.velocity = Vec2(1.0, 0.0);
    body_b_.velocity = Vec2(-1.0, 0.0);

    ContactBody a{Vec2(-9.0, 0.0), &body_a_, 100.0};
    ContactBody b{Vec2(9.0, 0.0), &body_b_, 100.0};
    auto result = resolve_collision(a, b, Mtv(Vec2(-1.0, 0.0), 2.0));

    EXPECT_TRUE(result.impulse_applied);
    EXPECT_NEAR(body_a_.angular_velocity, 0.0, 1e-12);
}

}  // namespace
}  // namespace creative2d::physics
