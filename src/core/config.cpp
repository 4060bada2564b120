// VoxelCore Engine Core
// config.cpp - JSON-based configuration system implementation

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

#include <voxelcore/core/config.hpp>
#include <voxelcore/core/logger.hpp>
#include <voxelcore/platform/file_io.hpp>

namespace voxelcore::core {

using json = nlohmann::json;

struct Config::Impl {
    json data;
    std::filesystem::path path;
    ChangeCallback change_callback;
    bool dirty = false;

    // nullptr when the section or key is absent
    [[nodiscard]] const json* find(std::string_view section, std::string_view key) const {
        auto section_it = data.find(std::string(section));
        if (section_it == data.end() || !section_it->is_object()) {
            return nullptr;
        }
        auto key_it = section_it->find(std::string(key));
        if (key_it == section_it->end()) {
            return nullptr;
        }
        return &*key_it;
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
        VOXELCORE_LOG_ERROR(log_category::CONFIG, "Failed to read config file: {}", path.string());
        return false;
    }

    if (!load_from_string(*content)) {
        VOXELCORE_LOG_ERROR(log_category::CONFIG, "Ignoring config file: {}", path.string());
        return false;
    }

    impl_->path = path;
    VOXELCORE_LOG_INFO(log_category::CONFIG, "Loaded config from: {}", path.string());
    return true;
}

bool Config::load_from_string(std::string_view text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            VOXELCORE_LOG_ERROR(log_category::CONFIG, "Config root must be a JSON object");
            return false;
        }
        impl_->data = std::move(parsed);
        impl_->dirty = false;
        return true;
    } catch (const json::parse_error& e) {
        VOXELCORE_LOG_ERROR(log_category::CONFIG, "Failed to parse config: {}", e.what());
        return false;
    }
}

bool Config::save(const std::filesystem::path& path) const {
    std::string content = impl_->data.dump(4);

    if (!platform::FileSystem::write_text(path, content)) {
        VOXELCORE_LOG_ERROR(log_category::CONFIG, "Failed to write config file: {}", path.string());
        return false;
    }

    VOXELCORE_LOG_INFO(log_category::CONFIG, "Saved config to: {}", path.string());
    return true;
}

bool Config::save() const {
    if (impl_->path.empty()) {
        VOXELCORE_LOG_ERROR(log_category::CONFIG, "Cannot save config: no path specified");
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

    if (!save(path)) {
        VOXELCORE_LOG_WARN(log_category::CONFIG, "Failed to save default config, using in-memory defaults");
    }

    return true;
}

std::filesystem::path Config::get_path() const {
    return impl_->path;
}

int Config::get_int(std::string_view section, std::string_view key, int default_value) const {
    const json* value = impl_->find(section, key);
    if (value == nullptr || !value->is_number_integer()) {
        return default_value;
    }

    if (value->is_number_unsigned()) {
        const auto wide = value->get<uint64_t>();
        if (wide <= static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return static_cast<int>(wide);
        }
    } else {
        const auto wide = value->get<int64_t>();
        if (wide >= std::numeric_limits<int>::min() && wide <= std::numeric_limits<int>::max()) {
            return static_cast<int>(wide);
        }
    }

    VOXELCORE_LOG_WARN(log_category::CONFIG, "{}.{} is out of int range, using {}", section, key, default_value);
    return default_value;
}

double Config::get_double(std::string_view section, std::string_view key, double default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_number()) {
        return value->get<double>();
    }
    return default_value;
}

float Config::get_float(std::string_view section, std::string_view key, float default_value) const {
    return static_cast<float>(get_double(section, key, static_cast<double>(default_value)));
}

bool Config::get_bool(std::string_view section, std::string_view key, bool default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_boolean()) {
        return value->get<bool>();
    }
    return default_value;
}

std::string Config::get_string(std::string_view section, std::string_view key, std::string_view default_value) const {
    const json* value = impl_->find(section, key);
    if (value != nullptr && value->is_string()) {
        return value->get<std::string>();
    }
    return std::string(default_value);
}

void Config::set_int(std::string_view section, std::string_view key, int value) {
    impl_->assign(section, key, value);
}

void Config::set_double(std::string_view section, std::string_view key, double value) {
    impl_->assign(section, key, value);
}

void Config::set_float(std::string_view section, std::string_view key, float value) {
    set_double(section, key, static_cast<double>(value));
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
    auto it = impl_->data.find(std::string(section));
    return it != impl_->data.end() && it->is_object();
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
    impl_->data = json{{config_section::WORLD, {{config_key::LOAD_RADIUS, 3}, {config_key::SEED, 42}}},
                       {config_section::TERRAIN,
                        {{config_key::WORLD_HEIGHT, 64},
                         {config_key::NOISE_FREQUENCY, 0.05},
                         {config_key::HEIGHT_AMPLITUDE, 15},
                         {config_key::FLOOR_OFFSET, 5},
                         {config_key::DIRT_DEPTH, 3}}},
                       {config_section::INTERACTION, {{config_key::MAX_DISTANCE, 10}}},
                       {config_section::DEBUG, {{config_key::LOG_LEVEL, "info"}, {config_key::LOG_TO_FILE, true}}}};
    impl_->dirty = true;
}

}  // namespace voxelcore::core
