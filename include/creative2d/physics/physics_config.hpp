// Creative2D Physics Engine
// physics_config.hpp - Explicit world configuration

#pragma once

#include "fluid_body.hpp"
#include "types.hpp"

namespace creative2d::core {
class Config;
}

namespace creative2d::physics {

// ============================================================================
// Physics Configuration
// ============================================================================

struct PhysicsConfig {
    Vec2 gravity{0.0, 9.8};          // Physics units per second squared
    double max_velocity = 100.0;     // Per-axis clamp, physics units per second
    double physics_scale = 100.0;    // Pixels per physics unit
    int sub_steps = 2;
    double line_thickness = 2.0;     // Thickness of the boxes line chain segments collide as
    double fixed_timestep = 1.0 / 60.0;

    FluidConfig fluid;

    // Reads the physics and fluid sections; missing keys keep the defaults above
    [[nodiscard]] static PhysicsConfig from_config(const core::Config& config);
};

}  // namespace creative2d::physics
