// VoxelCore Simulation
// simulation.cpp - World state ownership and event routing

#include <voxelcore/core/config.hpp>
#include <voxelcore/core/logger.hpp>
#include <voxelcore/sim/simulation.hpp>
#include <voxelcore/world/block_catalog.hpp>

namespace voxelcore::sim {

SimulationConfig settings_from_config(const core::Config& config) {
    using namespace core::config_section;
    using namespace core::config_key;

    SimulationConfig settings;

    settings.load_radius = config.get_int(WORLD, LOAD_RADIUS, settings.load_radius);
    if (settings.load_radius < 0) {
        VOXELCORE_LOG_WARN(core::log_category::CONFIG, "load_radius {} is negative, using {}", settings.load_radius,
                           world::DEFAULT_LOAD_RADIUS);
        settings.load_radius = world::DEFAULT_LOAD_RADIUS;
    } else if (settings.load_radius > world::MAX_LOAD_RADIUS) {
        VOXELCORE_LOG_WARN(core::log_category::CONFIG, "load_radius {} is too large, using {}", settings.load_radius,
                           world::MAX_LOAD_RADIUS);
        settings.load_radius = world::MAX_LOAD_RADIUS;
    }

    const int seed = config.get_int(WORLD, SEED, static_cast<int>(settings.terrain.seed));
    settings.terrain.seed = static_cast<uint32_t>(seed);

    settings.terrain.world_height = config.get_int(TERRAIN, WORLD_HEIGHT, settings.terrain.world_height);
    settings.terrain.noise_frequency = config.get_float(TERRAIN, NOISE_FREQUENCY, settings.terrain.noise_frequency);
    settings.terrain.height_amplitude = config.get_int(TERRAIN, HEIGHT_AMPLITUDE, settings.terrain.height_amplitude);
    settings.terrain.floor_offset = config.get_int(TERRAIN, FLOOR_OFFSET, settings.terrain.floor_offset);
    settings.terrain.dirt_depth = config.get_int(TERRAIN, DIRT_DEPTH, settings.terrain.dirt_depth);

    settings.interaction.max_distance = config.get_int(INTERACTION, MAX_DISTANCE, settings.interaction.max_distance);

    return settings;
}

Simulation::Simulation(const SimulationConfig& config)
    : config_(config),
      generator_(config.terrain),
      streamer_(generator_),
      resolver_(config.interaction),
      selected_(world::BlockKind::Grass) {
    if (config_.load_radius < 0) {
        VOXELCORE_LOG_WARN(core::log_category::WORLD, "load_radius {} is negative, using 0", config_.load_radius);
        config_.load_radius = 0;
    } else if (config_.load_radius > world::MAX_LOAD_RADIUS) {
        VOXELCORE_LOG_WARN(core::log_category::WORLD, "load_radius {} is too large, using {}", config_.load_radius,
                           world::MAX_LOAD_RADIUS);
        config_.load_radius = world::MAX_LOAD_RADIUS;
    }
    if (!select_kind(config_.initial_selection)) {
        VOXELCORE_LOG_WARN(core::log_category::GAME, "Initial selection is not placeable, keeping {}",
                           world::BlockCatalog::name(selected_));
    }
}

Simulation::~Simulation() = default;

void Simulation::initialize() {
    const size_t generated = streamer_.ensure_loaded(grid_, world::ChunkCoord(0, 0), config_.load_radius);
    VOXELCORE_LOG_INFO(core::log_category::WORLD, "World initialized: {} chunks, {} blocks", generated, grid_.size());
}

size_t Simulation::update_viewpoint(const world::WorldPos& viewpoint) {
    return streamer_.ensure_loaded_around(grid_, viewpoint, config_.load_radius);
}

gameplay::InteractionResult Simulation::interact(const world::WorldPos& origin, const glm::dvec3& direction,
                                                 gameplay::InteractionAction action) {
    return resolver_.resolve(grid_, origin, direction, action, selected_);
}

bool Simulation::select_kind(world::BlockKind kind) {
    if (!world::BlockCatalog::is_placeable(kind)) {
        return false;
    }
    selected_ = kind;
    VOXELCORE_LOG_INFO(core::log_category::GAME, "Selected: {}", world::BlockCatalog::display_name(kind));
    return true;
}

bool Simulation::select_hotbar_slot(int slot) {
    auto kind = world::BlockCatalog::kind_for_hotbar_slot(slot);
    if (!kind) {
        return false;
    }
    return select_kind(*kind);
}

std::vector<world::ExposedBlock> Simulation::exposed_blocks() const {
    return world::VisibilityFilter::collect_exposed(grid_);
}

std::vector<world::ExposedBlock> Simulation::exposed_blocks_near(const world::WorldPos& viewpoint) const {
    return world::VisibilityFilter::collect_exposed_near(grid_, viewpoint, render_distance());
}

double Simulation::render_distance() const {
    return static_cast<double>(config_.load_radius) * static_cast<double>(world::CHUNK_SIZE);
}

}  // namespace voxelcore::sim
