// VoxelCore Engine Core
// config.hpp - JSON-based configuration system

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace voxelcore::core {

// Section/key configuration store with JSON file persistence
class Config {
public:
    Config();
    ~Config();

    // Non-copyable but movable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) noexcept;
    Config& operator=(Config&&) noexcept;

    // Replaces the whole document; on failure the current values are kept
    bool load(const std::filesystem::path& path);
    bool load_from_string(std::string_view text);
    bool save(const std::filesystem::path& path) const;
    bool save() const;  // Save to loaded path
    bool load_or_create_default(const std::filesystem::path& path);

    [[nodiscard]] std::filesystem::path get_path() const;

    // Typed getters, default on missing key, type mismatch or (get_int) a value outside int
    [[nodiscard]] int get_int(std::string_view section, std::string_view key, int default_value = 0) const;
    [[nodiscard]] double get_double(std::string_view section, std::string_view key,
                                    double default_value = 0.0) const;
    [[nodiscard]] float get_float(std::string_view section, std::string_view key, float default_value = 0.0f) const;
    [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool default_value = false) const;
    [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                         std::string_view default_value = "") const;

    void set_int(std::string_view section, std::string_view key, int value);
    void set_double(std::string_view section, std::string_view key, double value);
    void set_float(std::string_view section, std::string_view key, float value);
    void set_bool(std::string_view section, std::string_view key, bool value);
    void set_string(std::string_view section, std::string_view key, std::string_view value);

    [[nodiscard]] bool has(std::string_view section, std::string_view key) const;
    [[nodiscard]] bool has_section(std::string_view section) const;

    using ChangeCallback = std::function<void(std::string_view section, std::string_view key)>;
    void set_change_callback(ChangeCallback callback);

    [[nodiscard]] bool is_dirty() const;
    void mark_clean();

    void set_defaults();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace config_section {
    inline constexpr const char* WORLD = "world";
    inline constexpr const char* TERRAIN = "terrain";
    inline constexpr const char* INTERACTION = "interaction";
    inline constexpr const char* DEBUG = "debug";
}  // namespace config_section

namespace config_key {
    // World section
    inline constexpr const char* LOAD_RADIUS = "load_radius";
    inline constexpr const char* SEED = "seed";

    // Terrain section
    inline constexpr const char* WORLD_HEIGHT = "world_height";
    inline constexpr const char* NOISE_FREQUENCY = "noise_frequency";
    inline constexpr const char* HEIGHT_AMPLITUDE = "height_amplitude";
    inline constexpr const char* FLOOR_OFFSET = "floor_offset";
    inline constexpr const char* DIRT_DEPTH = "dirt_depth";

    // Interaction section
    inline constexpr const char* MAX_DISTANCE = "max_distance";

    // Debug section
    inline constexpr const char* LOG_LEVEL = "log_level";
    inline constexpr const char* LOG_TO_FILE = "log_to_file";
}  // namespace config_key

}  // namespace voxelcore::core
