// Creative2D Engine Core
// config.cpp - JSON-backed configuration store implementation

#include <nlohmann/json.hpp>

#include <creative2d/core/config.hpp>
#include <creative2d/core/logger.hpp>
#include <creative2d/platform/file_io.hpp>

namespace creative2d::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    ChangeCallback change_callback;
    bool dirty = false;

    [[nodiscard]] const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &(*key_it);
    }

    template<typename T>
    T get_or(std::string_view section, std::string_view key, T default_value) const {
        const json* value = find(section, key);
        if (value == nullptr) {
            return default_value;
        }
        try {
            return value->get<T>();
        } catch (const json::exception& e) {
            CREATIVE2D_LOG_WARN(log_category::CONFIG, "Config {}.{} has the wrong type: {}", section, key, e.what());
            return default_value;
        }
    }

    template<typename T>
    void assign(std::string_view section, std::string_view key, T&& value) {
        data[std::string(section)][std::string(key)] = std::forward<T>(value);
        dirty = true;
        if (change_callback) {
            change_callback(section, key);
        }
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    set_defaults();
}

Config::~Config() = default;

Config::Config(Config&&) noexcept = default;
Config& Config::operator=(Config&&) noexcept = default;

bool Config::load(const std::filesystem::path& path) {
    auto content = platform::FileSystem::read_text(path);
    if (!content) {
        CREATIVE2D_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        CREATIVE2D_LOG_ERROR(log_category::CONFIG, "Rejected config file: {}", path.string());
        return false;
    }

    impl_->path = path;
    CREATIVE2D_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view json_text) {
    try {
        json parsed = json::parse(json_text);
        if (!parsed.is_object()) {
            CREATIVE2D_LOG_ERROR(log_category::CONFIG, "Config root must be a JSON object");
            return false;
        }

        // Loaded values override defaults section by section; unknown keys are kept
        set_defaults();
        for (auto& [section, entries] : parsed.items()) {
            if (entries.is_object()) {
                impl_->data[section].update(entries);
            } else {
                impl_->data[section] = entries;
            }
        }
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        CREATIVE2D_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    auto parent = path.parent_path();
    if (!parent.empty() && !platform::FileSystem::exists(parent)) {
        if (!platform::FileSystem::create_directories(parent)) {
            CREATIVE2D_LOG_ERROR(log_category::CONFIG, "Failed to create config directory: {}", parent.string());
            return false;
        }
    }

    if (!platform::FileSystem::write_text(path, impl_->data.dump(4))) {
        CREATIVE2D_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    CREATIVE2D_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        CREATIVE2D_LOG_ERROR(log_category::CONFIG, "Cannot save config: no path specified");
        return false;
    }
    return save(impl_->path);
}

bool Config::load_or_create_default(const std::filesystem::path& path) {
    if (platform::FileSystem::exists(path)) {
        return load(path);
    }

    set_defaults();
    impl_->path = path;

    if (save(path)) {
        impl_->dirty = false;
    } else {
        CREATIVE2D_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    }
    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    return impl_->get_or<int>(section, key, default_value);
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    return impl_->get_or<double>(section, key, default_value);
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    return impl_->get_or<bool>(section, key, default_value);
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    return impl_->get_or<std::string>(section, key, std::string(default_value));
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->assign(section, key, value);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->assign(section, key, value);
}

void Config::set_bool(std::string_view section, std::string_view key, bool value) {
    impl_->assign(section, key, value);
}

void Config::set_string(std::string_view section, std::string_view key, std::string_view value) {
    impl_->assign(section, key, std::string(value));
}

bool Config::has(std::string_view section, std::string_view key) const {
    return impl_->find(section, key) != nullptr;
}

bool Config::has_section(std::string_view section) const {
    return impl_->data.contains(std::string(section));
}

bool Config::remove(std::string_view section, std::string_view key) {
    if (!has(section, key)) {
        return false;
    }
    impl_->data[std::string(section)].erase(std::string(key));
    impl_->dirty = true;
    return true;
}

void Config::set_change_callback(ChangeCallback callback) {
    impl_->change_callback = std::move(callback);
}

bool Config::is_dirty() const {
    return impl_->dirty;
}

void Config::mark_clean() {
    impl_->dirty = false;
}

void Config::set_defaults() {
    impl_->data = json{{config_section::PHYSICS,
                        {{config_key::GRAVITY_X, 0.0},
                         {config_key::GRAVITY_Y, 9.8},
                         {config_key::MAX_VELOCITY, 100.0},
                         {config_key::PHYSICS_SCALE, 100.0},
                         {config_key::SUB_STEPS, 2},
                         {config_key::LINE_THICKNESS, 2.0},
                         {config_key::FIXED_TIMESTEP, 1.0 / 60.0}}},
                       {config_section::FLUID,
                        {{config_key::PARTICLE_GRAVITY, 980.0},
                         {config_key::PUSH_RADIUS, 60.0},
                         {config_key::PUSH_STRENGTH, 400.0},
                         {config_key::BODY_VELOCITY_TRANSFER, 20.0},
                         {config_key::COLLIDER_MARGIN, 500.0},
                         {config_key::BUOYANCY_BASE_RADIUS, 25.0},
                         {config_key::BUOYANCY_INFLUENCE_PADDING, 40.0}}},
                       {config_section::DEBUG, {{config_key::LOG_LEVEL, "info"}, {config_key::SANDBOX_FRAMES, 600}}}};
    impl_->dirty = true;
}

}  // namespace creative2d::core
