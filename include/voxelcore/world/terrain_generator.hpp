// VoxelCore World System
// terrain_generator.hpp - Deterministic heightfield terrain using FastNoise2

#pragma once

#include "types.hpp"
#include "world_grid.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>

namespace voxelcore::world {

// ============================================================================
// Terrain Configuration
// ============================================================================

struct TerrainConfig {
    // Same seed, same terrain
    uint32_t seed = 42;

    // Noise is sampled at (world_x * noise_frequency, world_z * noise_frequency)
    float noise_frequency = 0.05f;

    // height = round((noise + 1) / 2 * height_amplitude) + floor_offset
    int32_t height_amplitude = 15;
    int32_t floor_offset = 5;

    // Dirt layers directly below the grass surface
    int32_t dirt_depth = 3;

    // Columns are clamped to [0, world_height - 1]
    int32_t world_height = WORLD_HEIGHT;
};

// Number of columns in one chunk footprint
inline constexpr size_t CHUNK_COLUMNS = static_cast<size_t>(CHUNK_SIZE) * static_cast<size_t>(CHUNK_SIZE);

// ============================================================================
// Terrain Generator
// ============================================================================

class TerrainGenerator {
public:
    explicit TerrainGenerator(const TerrainConfig& config = {});
    ~TerrainGenerator();

    // Non-copyable but movable
    TerrainGenerator(const TerrainGenerator&) = delete;
    TerrainGenerator& operator=(const TerrainGenerator&) = delete;
    TerrainGenerator(TerrainGenerator&&) noexcept;
    TerrainGenerator& operator=(TerrainGenerator&&) noexcept;

    // ========================================================================
    // Main Generation Interface
    // ========================================================================

    /// Write every column of the chunk footprint into the grid.
    /// Pure with respect to (chunk, seed): running it twice writes the same blocks.
    /// Returns false, leaving the grid untouched, for chunks outside
    /// [MIN_CHUNK_COORD, MAX_CHUNK_COORD].
    bool generate(WorldGrid& grid, const ChunkCoord& chunk) const;

    /// Column heights for a chunk, indexed [z * CHUNK_SIZE + x]; nullopt outside the chunk domain
    [[nodiscard]] std::optional<std::array<int32_t, CHUNK_COLUMNS>> generate_heightmap(const ChunkCoord& chunk) const;

    // ========================================================================
    // Queries
    // ========================================================================

    /// Surface (grass) y of the column at world x,z
    [[nodiscard]] int32_t get_height(int32_t world_x, int32_t world_z) const;

    /// Kind generated at height y of a column whose surface is at `height`
    [[nodiscard]] BlockKind layer_kind(int32_t y, int32_t height) const;

    [[nodiscard]] const TerrainConfig& get_config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace voxelcore::world
