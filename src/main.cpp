// Creative2D - 2D Physics and Particle Fluid Engine
// main.cpp - Headless sandbox: builds a demo scene and steps it

#include <creative2d/core/config.hpp>
#include <creative2d/core/logger.hpp>
#include <creative2d/physics/physics.hpp>
#include <creative2d/platform/file_io.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr const char* VERSION = "0.1.0";

using namespace creative2d;

// Logs every collision and trigger event seen by the body it is attached to
class EventLogger : public physics::CollisionListener {
public:
    explicit EventLogger(std::string owner) : owner_(std::move(owner)) {}

    void on_collision_enter(const physics::CollisionInfo& info) override { log(info); }
    void on_collision_exit(const physics::CollisionInfo& info) override { log(info); }
    void on_trigger_enter(const physics::CollisionInfo& info) override { log(info); }
    void on_trigger_exit(const physics::CollisionInfo& info) override { log(info); }

    void on_collision_stay(const physics::CollisionInfo& /*info*/) override { ++stays_; }

    [[nodiscard]] int get_stays() const { return stays_; }

private:
    void log(const physics::CollisionInfo& info) const {
        CREATIVE2D_LOG_INFO(core::log_category::ENGINE, "[{}] {} with '{}' normal ({:.2f}, {:.2f})", owner_,
                            physics::event_name(info.type, info.state),
                            info.other_body ? info.other_body->name : std::string("?"), info.normal.x, info.normal.y);
    }

    std::string owner_;
    int stays_ = 0;
};

void build_scene(physics::PhysicsWorld& world, std::vector<std::shared_ptr<EventLogger>>& loggers) {
    using namespace physics;

    // Ground
    BodyDesc ground;
    ground.name = "ground";
    ground.tag = "Ground";
    ground.transform = Transform(Vec2(0.0, 300.0));
    ground.collider = Collider::box(Vec2(1600.0, 40.0));
    world.create_body(ground);

    // Falling crate
    BodyDesc crate;
    crate.name = "crate";
    crate.transform = Transform(Vec2(-300.0, -200.0));
    crate.collider = Collider::box(Vec2(50.0));
    crate.rigid_body = RigidBody(BodyType::Dynamic, 1.0);
    BodyId crate_id = world.create_body(crate);

    // Capsule rolling down a line chain ramp
    BodyDesc ramp;
    ramp.name = "ramp";
    ramp.transform = Transform(Vec2(200.0, 150.0));
    ramp.collider = Collider::line_chain({{-150.0, -100.0}, {0.0, 0.0}, {150.0, 40.0}});
    world.create_body(ramp);

    BodyDesc pill;
    pill.name = "pill";
    pill.transform = Transform(Vec2(80.0, -50.0));
    pill.collider = Collider::capsule(Vec2(30.0, 60.0));
    pill.rigid_body = RigidBody(BodyType::Dynamic, 0.5);
    pill.rigid_body->restitution = 0.2;
    BodyId pill_id = world.create_body(pill);

    // Tilemap platform
    TilemapShape tiles(8, 2, Vec2(32.0));
    tiles.fill(0, 0, 8, 1);
    tiles.fill(3, 1, 2, 1);
    BodyDesc platform;
    platform.name = "platform";
    platform.tag = "Ground";
    platform.transform = Transform(Vec2(-300.0, 120.0));
    platform.collider = Collider::tilemap(std::move(tiles));
    world.create_body(platform);

    // Trigger zone under the ramp
    BodyDesc zone;
    zone.name = "zone";
    zone.transform = Transform(Vec2(250.0, 250.0));
    zone.collider = Collider::box(Vec2(200.0, 60.0), true);
    BodyId zone_id = world.create_body(zone);

    // Water pool with a floating crate
    BodyDesc pool;
    pool.name = "pool";
    pool.transform = Transform(Vec2(600.0, 200.0));
    pool.water = WaterParams();
    pool.water->width = 240.0;
    pool.water->height = 120.0;
    world.create_body(pool);

    BodyDesc floater;
    floater.name = "floater";
    floater.transform = Transform(Vec2(600.0, 100.0));
    floater.collider = Collider::box(Vec2(40.0));
    floater.rigid_body = RigidBody(BodyType::Dynamic, 0.5);
    floater.rigid_body->buoyancy_weight = 0.6;
    world.create_body(floater);

    for (BodyId id : {crate_id, pill_id, zone_id}) {
        auto logger = std::make_shared<EventLogger>(world.get_body(id)->name);
        world.add_listener(id, logger);
        loggers.push_back(std::move(logger));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace creative2d;

    core::LoggerConfig log_config;
    log_config.file_output = false;
    core::Logger::initialize(log_config);

    CREATIVE2D_LOG_INFO(core::log_category::ENGINE, "Creative2D sandbox {}", VERSION);

    core::Config config;
    std::filesystem::path config_path = argc > 1 ? std::filesystem::path(argv[1])
                                                 : platform::FileSystem::get_user_config_directory() / "sandbox.json";
    if (!config.load_or_create_default(config_path)) {
        CREATIVE2D_LOG_WARN(core::log_category::ENGINE, "Using built-in defaults");
        config.set_defaults();
    }

    std::string level_name = config.get_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL, "info");
    if (auto level = core::parse_log_level(level_name)) {
        core::Logger::set_global_level(*level);
    } else {
        CREATIVE2D_LOG_WARN(core::log_category::CONFIG, "Unknown log level '{}'", level_name);
    }

    physics::PhysicsConfig physics_config = physics::PhysicsConfig::from_config(config);
    physics::PhysicsWorld world;
    if (!world.initialize(physics_config)) {
        CREATIVE2D_LOG_ERROR(core::log_category::ENGINE, "Failed to initialize physics world");
        core::Logger::shutdown();
        return 1;
    }

    std::vector<std::shared_ptr<EventLogger>> loggers;
    build_scene(world, loggers);

    int frames = config.get_int(core::config_section::DEBUG, core::config_key::SANDBOX_FRAMES, 600);
    for (int frame = 0; frame < frames; ++frame) {
        world.step(physics_config.fixed_timestep);
    }

    for (physics::BodyId id : world.get_body_ids()) {
        const physics::Body* body = world.get_body(id);
        if (!body->rigid_body) {
            continue;
        }
        CREATIVE2D_LOG_INFO(core::log_category::ENGINE,
                            "{}: position ({:.1f}, {:.1f}) rotation {:.1f} velocity ({:.2f}, {:.2f})", body->name,
                            body->transform.position.x, body->transform.position.y, body->transform.rotation,
                            body->rigid_body->velocity.x, body->rigid_body->velocity.y);
    }

    auto stats = world.get_stats();
    CREATIVE2D_LOG_INFO(core::log_category::ENGINE,
                        "{} frames, {} bodies, {} active pairs, {} water particles, last step {:.3f} ms", frames,
                        stats.bodies, stats.active_pairs, stats.water_particles, stats.last_step_time_ms);
    for (const auto& logger : loggers) {
        CREATIVE2D_LOG_DEBUG(core::log_category::ENGINE, "Listener saw {} stay events", logger->get_stays());
    }

    world.shutdown();
    core::Logger::shutdown();
    return 0;
}
