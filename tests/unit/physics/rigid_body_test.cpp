// Creative2D Physics Engine Tests
// rigid_body_test.cpp - Rigid body defaults, mass handling and velocity changes

#include <gtest/gtest.h>

#include <creative2d/physics/rigid_body.hpp>

namespace creative2d::physics {
namespace {

TEST(RigidBodyTest, Defaults) {
    RigidBody body;

    EXPECT_EQ(body.type, BodyType::Dynamic);
    EXPECT_TRUE(body.simulated);
    EXPECT_DOUBLE_EQ(body.mass, 1.0);
    EXPECT_DOUBLE_EQ(body.gravity_scale, 1.0);
    EXPECT_DOUBLE_EQ(body.linear_drag, 0.0);
    EXPECT_DOUBLE_EQ(body.angular_drag, 0.05);
    EXPECT_DOUBLE_EQ(body.restitution, 0.0);
    EXPECT_FALSE(body.constraints.freeze_rotation);
    EXPECT_FALSE(body.sinks());
}

TEST(RigidBodyTest, TypeQueries) {
    RigidBody dynamic(BodyType::Dynamic);
    RigidBody kinematic(BodyType::Kinematic);
    RigidBody fixed(BodyType::Static);

    EXPECT_TRUE(dynamic.is_integrated());
    EXPECT_FALSE(kinematic.is_integrated());
    EXPECT_TRUE(fixed.is_static());

    dynamic.simulated = false;
    EXPECT_FALSE(dynamic.is_integrated());
    EXPECT_TRUE(dynamic.is_dynamic());
}

TEST(RigidBodyTest, InverseMass) {
    EXPECT_DOUBLE_EQ(RigidBody(BodyType::Dynamic, 4.0).inverse_mass(), 0.25);
    EXPECT_DOUBLE_EQ(RigidBody(BodyType::Dynamic, 0.0).inverse_mass(), 1.0);
    EXPECT_DOUBLE_EQ(RigidBody(BodyType::Kinematic, 4.0).inverse_mass(), 0.0);
    EXPECT_DOUBLE_EQ(RigidBody(BodyType::Static, 4.0).inverse_mass(), 0.0);
}

TEST(RigidBodyTest, ForceAndImpulseScaleByMass) {
    RigidBody body(BodyType::Dynamic, 2.0);
    body.add_force(Vec2(4.0, 0.0));
    body.add_impulse(Vec2(0.0, -2.0));

    EXPECT_DOUBLE_EQ(body.velocity.x, 2.0);
    EXPECT_DOUBLE_EQ(body.velocity.y, -1.0);
}

TEST(RigidBodyTest, LightBodiesClampDivisor) {
    RigidBody body(BodyType::Dynamic, 0.01);
    body.add_force(Vec2(1.0, 0.0));

    EXPECT_DOUBLE_EQ(body.velocity.x, 10.0);
}

TEST(RigidBodyTest, Torque) {
    RigidBody body(BodyType::Dynamic, 2.0);
    body.add_torque(50.0);

    EXPECT_DOUBLE_EQ(body.angular_velocity, 0.25);
}

TEST(RigidBodyTest, Stop) {
    RigidBody body;
    body.velocity = Vec2(3.0, 4.0);
    body.angular_velocity = 12.0;
    body.stop();

    EXPECT_DOUBLE_EQ(body.velocity.x, 0.0);
    EXPECT_DOUBLE_EQ(body.velocity.y, 0.0);
    EXPECT_DOUBLE_EQ(body.angular_velocity, 0.0);
}

TEST(RigidBodyTest, SinkThreshold) {
    RigidBody body;
    body.buoyancy_weight = 1.5;
    EXPECT_FALSE(body.sinks());

    body.buoyancy_weight = 2.0;
    EXPECT_TRUE(body.sinks());
}

}  // namespace
}  // namespace creative2d::physics
