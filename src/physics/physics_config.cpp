// Creative2D Physics Engine
// physics_config.cpp - PhysicsConfig from the JSON configuration store

#include <creative2d/core/config.hpp>
#include <creative2d/core/logger.hpp>
#include <creative2d/physics/physics_config.hpp>

#include <algorithm>

namespace creative2d::physics {

PhysicsConfig PhysicsConfig::from_config(const core::Config& config) {
    using namespace core;

    PhysicsConfig result;
    const auto* physics = config_section::PHYSICS;
    const auto* fluid = config_section::FLUID;

    result.gravity.x = config.get_double(physics, config_key::GRAVITY_X, result.gravity.x);
    result.gravity.y = config.get_double(physics, config_key::GRAVITY_Y, result.gravity.y);
    result.max_velocity = config.get_double(physics, config_key::MAX_VELOCITY, result.max_velocity);
    result.physics_scale = config.get_double(physics, config_key::PHYSICS_SCALE, result.physics_scale);
    result.line_thickness = config.get_double(physics, config_key::LINE_THICKNESS, result.line_thickness);
    result.fixed_timestep = config.get_double(physics, config_key::FIXED_TIMESTEP, result.fixed_timestep);

    int sub_steps = config.get_int(physics, config_key::SUB_STEPS, result.sub_steps);
    if (sub_steps < 1) {
        CREATIVE2D_LOG_WARN(log_category::CONFIG, "Invalid sub_steps {}, using 1", sub_steps);
        sub_steps = 1;
    }
    result.sub_steps = sub_steps;

    auto& f = result.fluid;
    f.particle_gravity = config.get_double(fluid, config_key::PARTICLE_GRAVITY, f.particle_gravity);
    f.push_radius = config.get_double(fluid, config_key::PUSH_RADIUS, f.push_radius);
    f.push_strength = config.get_double(fluid, config_key::PUSH_STRENGTH, f.push_strength);
    f.body_velocity_transfer = config.get_double(fluid, config_key::BODY_VELOCITY_TRANSFER, f.body_velocity_transfer);
    f.collider_margin = std::max(0.0, config.get_double(fluid, config_key::COLLIDER_MARGIN, f.collider_margin));
    f.buoyancy_base_radius = config.get_double(fluid, config_key::BUOYANCY_BASE_RADIUS, f.buoyancy_base_radius);
    f.buoyancy_influence_padding =
        config.get_double(fluid, config_key::BUOYANCY_INFLUENCE_PADDING, f.buoyancy_influence_padding);

    return result;
}

}  // namespace creative2d::physics
