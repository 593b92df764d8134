// Creative2D Physics Engine Tests
// fluid_body_test.cpp - Particle water generation, settling, sampling and buoyancy

#include <gtest/gtest.h>

#include <creative2d/physics/fluid_body.hpp>

#include <algorithm>
#include <cmath>

namespace creative2d::physics {
namespace {

constexpr double DT = 1.0 / 60.0;

class FluidBodyTest : public ::testing::Test {
protected:
    void SetUp() override {
        WaterParams params;
        params.width = 180.0;
        params.height = 90.0;
        water_ = FluidBody(params);
    }

    FluidBody water_;
    FluidConfig config_;
    std::vector<FluidObstacle> no_obstacles_;
};

// ============================================================================
// Generation
// ============================================================================

TEST_F(FluidBodyTest, GridLayout) {
    water_.generate(Vec2(0.0));

    ASSERT_TRUE(water_.is_generated());
    ASSERT_EQ(water_.get_particle_count(), 50u);

    const auto& particles = water_.get_particles();
    EXPECT_DOUBLE_EQ(particles.front().position.x, -81.0);
    EXPECT_DOUBLE_EQ(particles.front().position.y, -36.0);
    EXPECT_DOUBLE_EQ(particles.back().position.x, 81.0);
    EXPECT_DOUBLE_EQ(particles.back().position.y, 36.0);

    // Padded by one smoothing radius
    EXPECT_DOUBLE_EQ(water_.get_smoothing_radius(), 27.0);
    EXPECT_DOUBLE_EQ(water_.get_bounds().min.x, -108.0);
    EXPECT_DOUBLE_EQ(water_.get_bounds().max.y, 63.0);
}

TEST_F(FluidBodyTest, GenerateAtOrigin) {
    water_.generate(Vec2(500.0, 200.0));
    EXPECT_DOUBLE_EQ(water_.get_particles().front().position.x, 419.0);
    EXPECT_DOUBLE_EQ(water_.get_particles().front().position.y, 164.0);
}

TEST_F(FluidBodyTest, FirstStepGenerates) {
    EXPECT_FALSE(water_.is_generated());
    water_.step(DT, Vec2(0.0), no_obstacles_, config_);

    EXPECT_TRUE(water_.is_generated());
    EXPECT_EQ(water_.get_particle_count(), 50u);
    EXPECT_EQ(water_.get_stats().particles, 50u);
}

TEST_F(FluidBodyTest, ZeroSpacingHasNoParticles) {
    WaterParams params = water_.get_params();
    params.spacing = 0.0;
    water_.set_params(params);
    water_.generate(Vec2(0.0));

    EXPECT_TRUE(water_.is_generated());
    EXPECT_EQ(water_.get_particle_count(), 0u);

    water_.step(DT, Vec2(0.0), no_obstacles_, config_);
    EXPECT_EQ(water_.get_particle_count(), 0u);
}

TEST_F(FluidBodyTest, LayoutChangesRegenerate) {
    water_.generate(Vec2(0.0));

    WaterParams params = water_.get_params();
    params.viscosity = 0.5;
    water_.set_params(params);
    EXPECT_TRUE(water_.is_generated());

    water_.set_size(360.0, 90.0);
    EXPECT_FALSE(water_.is_generated());
    EXPECT_EQ(water_.get_particle_count(), 0u);

    water_.step(DT, Vec2(0.0), no_obstacles_, config_);
    EXPECT_EQ(water_.get_particle_count(), 100u);
}

// ============================================================================
// Simulation
// ============================================================================

TEST_F(FluidBodyTest, PressureSpreadsPairsSymmetrically) {
    water_.step(DT, Vec2(0.0), no_obstacles_, config_);

    // The initial grid is denser than rest density, so pressure acts
    const auto& stats = water_.get_stats();
    EXPECT_GT(stats.pressure_pairs, 0u);
    EXPECT_GT(stats.grid_cells, 0u);
    EXPECT_GT(stats.max_density, water_.get_params().rest_density);

    // Pair displacements cancel; only gravity moves the mean
    auto sample = water_.sample(Vec2(0.0), 1000.0);
    EXPECT_EQ(sample.count, 50);
    EXPECT_NEAR(sample.average_y, 980.0 * DT * DT, 1e-9);
}

TEST_F(FluidBodyTest, SettlesOnGround) {
    FluidObstacle ground;
    ground.position = Vec2(0.0, 80.0);
    ground.size = Vec2(10000.0, 40.0);
    std::vector<FluidObstacle> obstacles{ground};

    for (int i = 0; i < 300; ++i) {
        water_.step(DT, Vec2(0.0), obstacles, config_);
    }

    ASSERT_EQ(water_.get_particle_count(), 50u);
    double min_x = 0.0;
    for (const auto& particle : water_.get_particles()) {
        EXPECT_LE(particle.position.y, 60.0 + 1e-6);
        EXPECT_GE(particle.density, 1.0 - 1e-9);
        EXPECT_LT(particle.density, 1.3);
        min_x = std::min(min_x, particle.position.x);
    }

    // The pool spreads sideways past its starting width
    EXPECT_LT(min_x, -81.0);
    EXPECT_LT(water_.get_stats().average_density, 1.2);
    EXPECT_EQ(water_.get_stats().obstacles, 1u);
}

TEST_F(FluidBodyTest, IdlePoolConvergesToRestDensity) {
    FluidObstacle ground;
    ground.position = Vec2(0.0, 80.0);
    ground.size = Vec2(10000.0, 40.0);
    std::vector<FluidObstacle> obstacles{ground};

    const double rest = water_.get_params().rest_density;
    // A lone particle still counts itself, so density never drops below 1
    const double tolerance = rest - 1.0;

    double early_average = 0.0;
    for (int i = 1; i <= 600; ++i) {
        water_.step(DT, Vec2(0.0), obstacles, config_);
        ASSERT_EQ(water_.get_particle_count(), 50u);
        if (i == 500) {
            early_average = water_.get_stats().average_density;
        }
    }

    // Relaxation leaves no particle compressed past rest density
    for (const auto& particle : water_.get_particles()) {
        EXPECT_NEAR(particle.density, rest, tolerance + 1e-9);
        EXPECT_LE(particle.density, rest);
    }
    EXPECT_LE(water_.get_stats().max_density, rest);

    // Settled: the average barely moves over the last hundred steps
    double late_average = water_.get_stats().average_density;
    EXPECT_NEAR(late_average, early_average, 0.01);
    EXPECT_NEAR(late_average, rest, tolerance);
}

TEST_F(FluidBodyTest, DistantObstaclesAreCulled) {
    FluidObstacle far_box;
    far_box.position = Vec2(0.0, 5000.0);
    far_box.size = Vec2(10.0);

    FluidObstacle far_tiles = far_box;
    far_tiles.generated = true;

    water_.step(DT, Vec2(0.0), {far_box}, config_);
    EXPECT_EQ(water_.get_stats().obstacles, 0u);

    water_.step(DT, Vec2(0.0), {far_box, far_tiles}, config_);
    EXPECT_EQ(water_.get_stats().obstacles, 1u);
}

TEST_F(FluidBodyTest, TidesOffsetSurface) {
    WaterParams params = water_.get_params();
    params.tides_enabled = true;
    water_.set_params(params);

    water_.step(DT, Vec2(0.0), no_obstacles_, config_);
    EXPECT_NEAR(water_.get_tide_offset(), std::sin(DT * params.tide_speed) * params.tide_amplitude, 1e-12);
}

// ============================================================================
// Sampling and Buoyancy
// ============================================================================

TEST_F(FluidBodyTest, SampleBeforeFirstStepIsEmpty) {
    water_.generate(Vec2(0.0));
    EXPECT_EQ(water_.sample(Vec2(0.0), 100.0).count, 0);
}

TEST_F(FluidBodyTest, SampleRadius) {
    water_.step(DT, Vec2(0.0), no_obstacles_, config_);

    EXPECT_EQ(water_.sample(Vec2(0.0, -1000.0), 50.0).count, 0);
    EXPECT_EQ(water_.sample(Vec2(0.0), 0.0).count, 0);
    EXPECT_GT(water_.sample(Vec2(0.0), 30.0).count, 0);
    EXPECT_LT(water_.sample(Vec2(0.0), 30.0).count, 50);
}

TEST_F(FluidBodyTest, FloatingBodyIsLifted) {
    water_.step(DT, Vec2(0.0), no_obstacles_, config_);

    RigidBody floater;
    RigidBody sinker;
    sinker.buoyancy_weight = 2.0;

    ASSERT_TRUE(water_.apply_buoyancy(floater, Vec2(0.0), 25.0, DT, config_));
    ASSERT_TRUE(water_.apply_buoyancy(sinker, Vec2(0.0), 25.0, DT, config_));

    // Up is negative y; a sinking body is only slowed
    EXPECT_LT(floater.velocity.y, 0.0);
    EXPECT_LT(sinker.velocity.y, 0.0);
    EXPECT_LT(floater.velocity.y, sinker.velocity.y);
}

TEST_F(FluidBodyTest, DragSlowsBodies) {
    water_.step(DT, Vec2(0.0), no_obstacles_, config_);

    RigidBody body;
    body.velocity = Vec2(100.0, 0.0);
    water_.apply_buoyancy(body, Vec2(0.0), 25.0, DT, config_);

    EXPECT_LT(body.velocity.x, 100.0);
    EXPECT_GT(body.velocity.x, 0.0);
}

TEST_F(FluidBodyTest, BodyOutsideWaterIsUnaffected) {
    water_.step(DT, Vec2(0.0), no_obstacles_, config_);

    RigidBody body;
    body.velocity = Vec2(3.0, 4.0);
    EXPECT_FALSE(water_.apply_buoyancy(body, Vec2(0.0, -1000.0), 25.0, DT, config_));
    EXPECT_DOUBLE_EQ(body.velocity.x, 3.0);
    EXPECT_DOUBLE_EQ(body.velocity.y, 4.0);
}

}  // namespace
}  // namespace creative2d::physics
