// Creative2D Physics Engine
// fluid_body.hpp - Particle water with position-based pressure relaxation and buoyancy

#pragma once

#include "rigid_body.hpp"
#include "tile_geometry_builder.hpp"
#include "types.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace creative2d::physics {

// ============================================================================
// Water Parameters
// ============================================================================

struct WaterParams {
    double width = 400.0;
    double height = 200.0;
    double density = 1.0;
    double viscosity = 0.2;

    double particle_radius = 14.0;  // Visual size only
    double rest_density = 1.2;
    double stiffness = 0.15;
    double spacing = 18.0;  // Initial particle spacing; smoothing radius is 1.5x this

    bool tides_enabled = false;
    double tide_amplitude = 10.0;
    double tide_speed = 1.0;
};

// World-level constants shared by every water body
struct FluidConfig {
    double particle_gravity = 980.0;  // Pixels per second squared
    double push_radius = 60.0;
    double push_strength = 400.0;
    double body_velocity_transfer = 20.0;
    double collider_margin = 500.0;  // Obstacles farther than this from the water are culled
    double collision_bounce = -0.1;  // Velocity factor on the resolved axis

    double buoyancy_base_radius = 25.0;  // Body radius when the collider has no size
    double buoyancy_influence_padding = 40.0;
};

// ============================================================================
// Particles and Obstacles
// ============================================================================

struct FluidParticle {
    Vec2 position{0.0};
    Vec2 velocity{0.0};
    Vec2 previous{0.0};
    double density = 0.0;
};

// Geometry the particles collide with, gathered by the world once per step
struct FluidObstacle {
    Vec2 position{0.0};  // World position of the owning body
    Vec2 size{0.0};      // Scaled box size; unused when rects is set
    const std::vector<TileRect>* rects = nullptr;  // Generated rectangles, offset from position
    bool generated = false;                        // Tilemap/terrain obstacles are never culled

    // Dynamic bodies also stir nearby particles
    bool dynamic = false;
    Vec2 body_velocity{0.0};
    bool solid = true;  // False for capsules and polygons, which only stir
};

// ============================================================================
// Fluid Body
// ============================================================================

class FluidBody {
public:
    explicit FluidBody(const WaterParams& params = {});

    [[nodiscard]] const WaterParams& get_params() const { return params_; }

    // Width, height or spacing changes drop the particle set; it is regenerated on the next step
    void set_params(const WaterParams& params);
    void set_size(double width, double height);

    // ========================================================================
    // Simulation
    // ========================================================================

    // Places particles on a grid centred on `origin` (world space). Called once by
    // the first step; call again to restart the simulation.
    void generate(const Vec2& origin);
    [[nodiscard]] bool is_generated() const { return generated_; }

    // Advances particles by `delta_time` seconds. `origin` is the owning body's
    // world position, used only if the particles still need generating.
    void step(double delta_time, const Vec2& origin, const std::vector<FluidObstacle>& obstacles,
              const FluidConfig& config);

    // ========================================================================
    // Queries
    // ========================================================================

    struct Sample {
        int count = 0;
        double average_y = 0.0;
    };

    // Particles within `radius` of `point`, found through the spatial hash
    [[nodiscard]] Sample sample(const Vec2& point, double radius) const;

    // Applies lift or sinking force, drag and splash damping to a body at `position`
    // with the given effective radius. Returns false when the body is not in the water.
    bool apply_buoyancy(RigidBody& body, const Vec2& position, double body_radius, double delta_time,
                        const FluidConfig& config) const;

    [[nodiscard]] const std::vector<FluidParticle>& get_particles() const { return particles_; }
    [[nodiscard]] size_t get_particle_count() const { return particles_.size(); }

    // Particle extents padded by one smoothing radius
    [[nodiscard]] const AABB& get_bounds() const { return bounds_; }
    [[nodiscard]] double get_smoothing_radius() const { return params_.spacing * 1.5; }
    [[nodiscard]] double get_tide_offset() const { return tide_offset_; }

    struct Stats {
        size_t particles = 0;
        size_t grid_cells = 0;
        size_t obstacles = 0;
        size_t pressure_pairs = 0;
        double average_density = 0.0;
        double max_density = 0.0;
    };

    [[nodiscard]] const Stats& get_stats() const { return stats_; }

    [[nodiscard]] static uint32_t cell_key(int gx, int gy) {
        return (static_cast<uint32_t>(gx) & 0xFFFFu) | ((static_cast<uint32_t>(gy) & 0xFFFFu) << 16);
    }

private:
    void integrate(double delta_time, const std::vector<FluidObstacle>& obstacles, const FluidConfig& config);
    void update_bounds();
    void rebuild_grid();
    void compute_densities();
    void relax_pressure();
    void apply_tides();

    [[nodiscard]] int grid_coord(double value, double origin) const;

    WaterParams params_;
    std::vector<FluidParticle> particles_;
    std::unordered_map<uint32_t, std::vector<uint32_t>> grid_;
    AABB bounds_;
    bool generated_ = false;
    double tide_phase_ = 0.0;
    double tide_offset_ = 0.0;
    Stats stats_;
};

}  // namespace creative2d::physics
