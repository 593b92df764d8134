// Creative2D Engine Core
// config.hpp - JSON-backed configuration store

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace creative2d::core {

// Section/key configuration persisted as a JSON document.
// Getters never throw: a missing key or a type mismatch yields the supplied default.
class Config {
public:
    Config();
    ~Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view json_text);
    bool save(const std::filesystem::path& path) const;
    bool save() const;
    bool load_or_create_default(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path get_path() const;

    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    bool remove(std::string_view section, std::string_view key);

    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    // Reset to the engine defaults (physics, fluid and debug sections)
    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace config_section {
    inline constexpr const char* PHYSICS = "physics";
    inline constexpr const char* FLUID = "fluid";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

namespace config_key {
    // Physics section
    inline constexpr const char* GRAVITY_X = "gravity_x";
    inline constexpr const char* GRAVITY_Y = "gravity_y";
    inline constexpr const char* MAX_VELOCITY = "max_velocity";
    inline constexpr const char* PHYSICS_SCALE = "physics_scale";
    inline constexpr const char* SUB_STEPS = "sub_steps";
    inline constexpr const char* LINE_THICKNESS = "line_thickness";
    inline constexpr const char* FIXED_TIMESTEP = "fixed_timestep";

    // Fluid section
    inline constexpr const char* PARTICLE_GRAVITY = "particle_gravity";
    inline constexpr const char* PUSH_RADIUS = "push_radius";
    inline constexpr const char* PUSH_STRENGTH = "push_strength";
    inline constexpr const char* BODY_VELOCITY_TRANSFER = "body_velocity_transfer";
    inline constexpr const char* COLLIDER_MARGIN = "collider_margin";
    inline constexpr const char* BUOYANCY_BASE_RADIUS = "buoyancy_base_radius";
    inline constexpr const char* BUOYANCY_INFLUENCE_PADDING = "buoyancy_influence_padding";

    // Debug section
    inline constexpr const char* LOG_LEVEL = "log_level";
    inline constexpr const char* SANDBOX_FRAMES = "sandbox_frames";
}  // namespace config_key

}  // namespace creative2d::core
