// Creative2D Physics Engine
// fluid_body.cpp - Particle water implementation

#include <creative2d/core/logger.hpp>
#include <creative2d/physics/fluid_body.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace creative2d::physics {

namespace {

constexpr double MIN_PAIR_DISTANCE_SQ = 1e-4;
constexpr double TIDE_DEPTH = 100.0;
constexpr double SURFACE_DENSITY_RATIO = 0.8;

// Buoyancy tuning
constexpr int MIN_BUOYANCY_PARTICLES = 3;
constexpr double IMMERSION_PARTICLES = 12.0;
constexpr double IMMERSION_DEPTH = 50.0;
constexpr double MAX_IMMERSION = 1.2;
constexpr double BUOYANCY_STRENGTH = 45.0;
constexpr double SINK_RESISTANCE = 0.2;
constexpr double SURFACE_BAND = 20.0;
constexpr double SURFACE_PULL = 10.0;
constexpr double DRAG_STRENGTH = 0.4;
constexpr double MIN_DRAG_FACTOR = 0.1;
constexpr double SPLASH_SPEED = 5.0;
constexpr double SPLASH_DAMPING = 0.8;
constexpr double REFERENCE_RATE = 60.0;

// Push a particle out of an axis-aligned rectangle through its nearest side
void resolve_particle_vs_rect(FluidParticle& p, const Vec2& center, const Vec2& size, double bounce) {
    Vec2 half = size * 0.5;
    Vec2 min = center - half;
    Vec2 max = center + half;
    if (!(p.position.x > min.x && p.position.x < max.x && p.position.y > min.y && p.position.y < max.y)) {
        return;
    }

    double top = p.position.y - min.y;
    double bottom = max.y - p.position.y;
    double left = p.position.x - min.x;
    double right = max.x - p.position.x;
    double smallest = std::min({top, bottom, left, right});

    if (smallest == top) {
        p.position.y = min.y;
        p.velocity.y *= bounce;
    } else if (smallest == bottom) {
        p.position.y = max.y;
        p.velocity.y *= bounce;
    } else if (smallest == left) {
        p.position.x = min.x;
        p.velocity.x *= bounce;
    } else {
        p.position.x = max.x;
        p.velocity.x *= bounce;
    }
}

}  // namespace

// ============================================================================
// Configuration
// ============================================================================

FluidBody::FluidBody(const WaterParams& params) : params_(params) {}

void FluidBody::set_params(const WaterParams& params) {
    bool layout_changed =
        params.width != params_.width || params.height != params_.height || params.spacing != params_.spacing;
    params_ = params;
    if (layout_changed) {
        particles_.clear();
        grid_.clear();
        generated_ = false;
    }
}

void FluidBody::set_size(double width, double height) {
    WaterParams params = params_;
    params.width = width;
    params.height = height;
    set_params(params);
}

// ============================================================================
// Simulation
// ============================================================================

void FluidBody::generate(const Vec2& origin) {
    particles_.clear();
    grid_.clear();
    tide_phase_ = 0.0;
    tide_offset_ = 0.0;

    if (params_.spacing > 0.0) {
        int columns = static_cast<int>(std::floor(params_.width / params_.spacing));
        int rows = static_cast<int>(std::floor(params_.height / params_.spacing));
        particles_.reserve(static_cast<size_t>(std::max(0, columns)) * static_cast<size_t>(std::max(0, rows)));

        for (int row = 0; row < rows; ++row) {
            for (int col = 0; col < columns; ++col) {
                FluidParticle particle;
                particle.position = origin + Vec2(col * params_.spacing - params_.width * 0.5 + params_.spacing * 0.5,
                                                  row * params_.spacing - params_.height * 0.5 + params_.spacing * 0.5);
                particle.previous = particle.position;
                particles_.push_back(particle);
            }
        }
    }

    generated_ = true;
    update_bounds();

    CREATIVE2D_LOG_DEBUG(core::log_category::FLUID, "Generated {} water particles ({}x{}, spacing {})",
                         particles_.size(), params_.width, params_.height, params_.spacing);
}

void FluidBody::step(double delta_time, const Vec2& origin, const std::vector<FluidObstacle>& obstacles,
                     const FluidConfig& config) {
    if (!generated_) {
        generate(origin);
    }
    if (delta_time <= 0.0 || particles_.empty()) {
        return;
    }

    tide_offset_ = 0.0;
    if (params_.tides_enabled) {
        tide_phase_ += delta_time * params_.tide_speed;
        tide_offset_ = std::sin(tide_phase_) * params_.tide_amplitude;
    }

    integrate(delta_time, obstacles, config);
    update_bounds();
    rebuild_grid();
    compute_densities();
    relax_pressure();
    if (params_.tides_enabled) {
        apply_tides();
    }

    // Positions drive the simulation; velocities are reconstructed from the displacement
    double inv_dt = 1.0 / delta_time;
    double density_sum = 0.0;
    stats_.max_density = 0.0;
    for (auto& p : particles_) {
        p.velocity = (p.position - p.previous) * inv_dt;
        density_sum += p.density;
        stats_.max_density = std::max(stats_.max_density, p.density);
    }
    stats_.particles = particles_.size();
    stats_.grid_cells = grid_.size();
    stats_.average_density = density_sum / static_cast<double>(particles_.size());
}

void FluidBody::integrate(double delta_time, const std::vector<FluidObstacle>& obstacles,
                          const FluidConfig& config) {
    // Bounds from the previous step decide which obstacles are close enough to matter
    AABB reach = bounds_.expanded(config.collider_margin);
    std::vector<const FluidObstacle*> nearby;
    nearby.reserve(obstacles.size());
    for (const auto& obstacle : obstacles) {
        if (obstacle.generated || reach.contains(obstacle.position)) {
            nearby.push_back(&obstacle);
        }
    }
    stats_.obstacles = nearby.size();

    const double damping = 1.0 - params_.viscosity * delta_time;
    const double push_radius_sq = config.push_radius * config.push_radius;

    for (auto& p : particles_) {
        p.velocity *= damping;
        p.velocity.y += config.particle_gravity * delta_time;

        for (const FluidObstacle* obstacle : nearby) {
            if (!obstacle->dynamic) {
                continue;
            }
            Vec2 delta = p.position - obstacle->position;
            double dist_sq = glm::dot(delta, delta);
            if (dist_sq >= push_radius_sq) {
                continue;
            }
            double dist = std::sqrt(dist_sq);
            double push = (1.0 - dist / config.push_radius) * config.push_strength;
            double inv_dist = 1.0 / (dist > 0.0 ? dist : 1.0);
            p.velocity += delta * inv_dist * push * delta_time;
            p.velocity += obstacle->body_velocity * config.body_velocity_transfer * delta_time;
        }

        p.previous = p.position;
        p.position += p.velocity * delta_time;

        for (const FluidObstacle* obstacle : nearby) {
            if (!obstacle->solid) {
                continue;
            }
            if (obstacle->rects != nullptr) {
                for (const auto& rect : *obstacle->rects) {
                    resolve_particle_vs_rect(p, obstacle->position + rect.center, rect.size, config.collision_bounce);
                }
            } else {
                resolve_particle_vs_rect(p, obstacle->position, obstacle->size, config.collision_bounce);
            }
        }
    }
}

void FluidBody::update_bounds() {
    if (particles_.empty()) {
        bounds_ = AABB();
        return;
    }

    AABB bounds = AABB::empty();
    for (const auto& p : particles_) {
        bounds.include(p.position);
    }
    bounds_ = bounds.expanded(get_smoothing_radius());
}

int FluidBody::grid_coord(double value, double origin) const {
    return static_cast<int>(std::floor((value - origin) / get_smoothing_radius()));
}

void FluidBody::rebuild_grid() {
    for (auto& [key, cell] : grid_) {
        cell.clear();
    }

    for (uint32_t i = 0; i < particles_.size(); ++i) {
        const Vec2& pos = particles_[i].position;
        grid_[cell_key(grid_coord(pos.x, bounds_.min.x), grid_coord(pos.y, bounds_.min.y))].push_back(i);
    }

    // Drop cells emptied since the last step so the map does not grow without bound
    for (auto it = grid_.begin(); it != grid_.end();) {
        it = it->second.empty() ? grid_.erase(it) : std::next(it);
    }
}

void FluidBody::compute_densities() {
    const double h = get_smoothing_radius();
    const double h_sq = h * h;

    for (auto& pi : particles_) {
        pi.density = 0.0;
        int gx = grid_coord(pi.position.x, bounds_.min.x);
        int gy = grid_coord(pi.position.y, bounds_.min.y);

        for (int ox = -1; ox <= 1; ++ox) {
            for (int oy = -1; oy <= 1; ++oy) {
                auto it = grid_.find(cell_key(gx + ox, gy + oy));
                if (it == grid_.end()) {
                    continue;
                }
                for (uint32_t j : it->second) {
                    Vec2 delta = pi.position - particles_[j].position;
                    double dist_sq = glm::dot(delta, delta);
                    if (dist_sq < h_sq) {
                        double weight = 1.0 - std::sqrt(dist_sq) / h;
                        pi.density += weight * weight;
                    }
                }
            }
        }
    }
}

void FluidBody::relax_pressure() {
    const double h = get_smoothing_radius();
    const double h_sq = h * h;
    stats_.pressure_pairs = 0;

    // Neighbours are displaced in place, so later particles see earlier corrections
    for (uint32_t i = 0; i < particles_.size(); ++i) {
        FluidParticle& pi = particles_[i];
        double pressure = (pi.density - params_.rest_density) * params_.stiffness;
        if (pressure <= 0.0) {
            continue;
        }

        int gx = grid_coord(pi.position.x, bounds_.min.x);
        int gy = grid_coord(pi.position.y, bounds_.min.y);

        for (int ox = -1; ox <= 1; ++ox) {
            for (int oy = -1; oy <= 1; ++oy) {
                auto it = grid_.find(cell_key(gx + ox, gy + oy));
                if (it == grid_.end()) {
                    continue;
                }
                for (uint32_t j : it->second) {
                    if (i == j) {
                        continue;
                    }
                    FluidParticle& pj = particles_[j];
                    Vec2 delta = pi.position - pj.position;
                    double dist_sq = glm::dot(delta, delta);
                    if (dist_sq >= h_sq || dist_sq <= MIN_PAIR_DISTANCE_SQ) {
                        continue;
                    }

                    double dist = std::sqrt(dist_sq);
                    double weight = 1.0 - dist / h;
                    double shared = (pressure + (pj.density - params_.rest_density) * params_.stiffness) * 0.5;
                    double displacement = shared * weight * (0.5 / dist);
                    pi.position += delta * displacement;
                    pj.position -= delta * displacement;
                    ++stats_.pressure_pairs;
                }
            }
        }
    }
}

void FluidBody::apply_tides() {
    const double surface_density = params_.rest_density * SURFACE_DENSITY_RATIO;
    for (auto& p : particles_) {
        if (p.density < surface_density) {
            double depth_factor = std::max(0.0, 1.0 - (p.position.y - bounds_.min.y) / TIDE_DEPTH);
            p.position.y += tide_offset_ * depth_factor * 0.5;
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

FluidBody::Sample FluidBody::sample(const Vec2& point, double radius) const {
    Sample result;
    if (grid_.empty() || radius <= 0.0) {
        return result;
    }

    const double radius_sq = radius * radius;
    int gx = grid_coord(point.x, bounds_.min.x);
    int gy = grid_coord(point.y, bounds_.min.y);
    int range = static_cast<int>(std::ceil(radius / get_smoothing_radius()));

    double sum_y = 0.0;
    for (int ox = -range; ox <= range; ++ox) {
        for (int oy = -range; oy <= range; ++oy) {
            auto it = grid_.find(cell_key(gx + ox, gy + oy));
            if (it == grid_.end()) {
                continue;
            }
            for (uint32_t index : it->second) {
                const Vec2& pos = particles_[index].position;
                Vec2 delta = pos - point;
                if (glm::dot(delta, delta) < radius_sq) {
                    ++result.count;
                    sum_y += pos.y;
                }
            }
        }
    }

    if (result.count > 0) {
        result.average_y = sum_y / result.count;
    }
    return result;
}

bool FluidBody::apply_buoyancy(RigidBody& body, const Vec2& position, double body_radius, double delta_time,
                               const FluidConfig& config) const {
    Sample nearby = sample(position, body_radius + config.buoyancy_influence_padding);
    if (nearby.count <= MIN_BUOYANCY_PARTICLES) {
        return false;
    }

    double depth = std::max(0.0, nearby.average_y - position.y);
    double immersion = std::min(MAX_IMMERSION, nearby.count / IMMERSION_PARTICLES + depth / IMMERSION_DEPTH);
    double buoyancy = immersion * params_.density * BUOYANCY_STRENGTH;

    // Screen space: lifting means decreasing y
    if (body.sinks()) {
        body.velocity.y -= buoyancy * SINK_RESISTANCE * delta_time;
    } else {
        double lift = buoyancy * std::max(0.5, 2.0 - body.buoyancy_weight);
        body.velocity.y -= lift * delta_time;
        if (position.y < nearby.average_y - SURFACE_BAND) {
            body.velocity.y += SURFACE_PULL * delta_time;
        }
    }

    double drag = std::pow(std::max(MIN_DRAG_FACTOR, 1.0 - DRAG_STRENGTH * params_.viscosity * immersion),
                           delta_time * REFERENCE_RATE);
    body.velocity *= drag;

    if (body.velocity.y > SPLASH_SPEED) {
        body.velocity.y *= std::pow(SPLASH_DAMPING, delta_time * REFERENCE_RATE);
    }
    return true;
}

}  // namespace creative2d::physics
