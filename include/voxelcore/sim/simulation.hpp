// VoxelCore Simulation
// simulation.hpp - Owns the world state and routes viewpoint/input events to it

#pragma once

#include <voxelcore/gameplay/interaction_resolver.hpp>
#include <voxelcore/world/chunk_streamer.hpp>
#include <voxelcore/world/terrain_generator.hpp>
#include <voxelcore/world/visibility_filter.hpp>
#include <voxelcore/world/world_grid.hpp>

#include <cstdint>
#include <vector>

namespace voxelcore::core {
class Config;
}  // namespace voxelcore::core

namespace voxelcore::sim {

// ============================================================================
// Simulation Configuration
// ============================================================================

struct SimulationConfig {
    world::TerrainConfig terrain;
    gameplay::InteractionConfig interaction;
    int32_t load_radius = world::DEFAULT_LOAD_RADIUS;  // Chunks around the viewpoint, [0, MAX_LOAD_RADIUS]
    world::BlockKind initial_selection = world::BlockKind::Grass;
};

// Build a SimulationConfig from the [world], [terrain] and [interaction] sections
[[nodiscard]] SimulationConfig settings_from_config(const core::Config& config);

// ============================================================================
// Simulation
// ============================================================================

// One independent world: grid, loaded chunk set and placement selection.
// Several can live in one process. Single-threaded.
class Simulation {
public:
    explicit Simulation(const SimulationConfig& config = {});
    ~Simulation();

    // Non-copyable, non-movable (the streamer references the generator)
    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) = delete;
    Simulation& operator=(Simulation&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /// Generate the load radius around the world origin
    void initialize();

    /// Call every tick with the observer position; returns chunks generated
    size_t update_viewpoint(const world::WorldPos& viewpoint);

    // ========================================================================
    // Input
    // ========================================================================

    /// One interaction per input edge, using the current selection for Place
    gameplay::InteractionResult interact(const world::WorldPos& origin, const glm::dvec3& direction,
                                         gameplay::InteractionAction action);

    /// False (selection unchanged) for Empty
    bool select_kind(world::BlockKind kind);

    /// False (selection unchanged) for slots outside 1..HOTBAR_SLOT_COUNT
    bool select_hotbar_slot(int slot);

    [[nodiscard]] world::BlockKind selected_kind() const { return selected_; }

    // ========================================================================
    // Render-facing Queries
    // ========================================================================

    [[nodiscard]] std::vector<world::ExposedBlock> exposed_blocks() const;

    /// Exposed blocks within load_radius * CHUNK_SIZE of the viewpoint
    [[nodiscard]] std::vector<world::ExposedBlock> exposed_blocks_near(const world::WorldPos& viewpoint) const;

    /// Render distance in blocks
    [[nodiscard]] double render_distance() const;

    // ========================================================================
    // State Access
    // ========================================================================

    [[nodiscard]] const world::WorldGrid& grid() const { return grid_; }
    [[nodiscard]] world::WorldGrid& grid() { return grid_; }
    [[nodiscard]] const world::ChunkStreamer& streamer() const { return streamer_; }
    [[nodiscard]] const world::TerrainGenerator& generator() const { return generator_; }
    [[nodiscard]] const SimulationConfig& get_config() const { return config_; }

private:
    SimulationConfig config_;
    world::WorldGrid grid_;
    world::TerrainGenerator generator_;
    world::ChunkStreamer streamer_;
    gameplay::InteractionResolver resolver_;
    world::BlockKind selected_;
};

}  // namespace voxelcore::sim
