// Creative2D Physics Engine
// physics.hpp - Main include header for physics subsystem

#pragma once

#include "body.hpp"
#include "colliders.hpp"
#include "collision_events.hpp"
#include "fluid_body.hpp"
#include "physics_config.hpp"
#include "physics_world.hpp"
#include "ray_caster.hpp"
#include "rigid_body.hpp"
#include "types.hpp"
