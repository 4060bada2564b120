// VoxelCore World System
// terrain_generator.cpp - Deterministic heightfield terrain using FastNoise2

#include <FastNoise/FastNoise.h>
#include <algorithm>
#include <cmath>
#include <voxelcore/core/logger.hpp>
#include <voxelcore/world/terrain_generator.hpp>

namespace voxelcore::world {

// ============================================================================
// Implementation Details
// ============================================================================

struct TerrainGenerator::Impl {
    TerrainConfig config;

    // Built once; GenSingle2D does not mutate the node
    FastNoise::SmartNode<FastNoise::Perlin> height_node;

    void sanitize_config() {
        if (config.world_height < 1) {
            VOXELCORE_LOG_WARN(core::log_category::WORLD, "world_height {} is invalid, using 1", config.world_height);
            config.world_height = 1;
        }
        if (config.height_amplitude < 0) {
            VOXELCORE_LOG_WARN(core::log_category::WORLD, "height_amplitude {} is negative, using 0",
                               config.height_amplitude);
            config.height_amplitude = 0;
        }
        if (config.floor_offset < 0) {
            VOXELCORE_LOG_WARN(core::log_category::WORLD, "floor_offset {} is negative, using 0", config.floor_offset);
            config.floor_offset = 0;
        }
        if (config.dirt_depth < 0) {
            VOXELCORE_LOG_WARN(core::log_category::WORLD, "dirt_depth {} is negative, using 0", config.dirt_depth);
            config.dirt_depth = 0;
        }
    }

    void build_nodes() { height_node = FastNoise::New<FastNoise::Perlin>(); }

    [[nodiscard]] int32_t compute_height(int32_t world_x, int32_t world_z) const {
        float noise = height_node->GenSingle2D(static_cast<float>(world_x) * config.noise_frequency,
                                               static_cast<float>(world_z) * config.noise_frequency,
                                               static_cast<int>(config.seed));

        // Perlin output is nominally [-1, 1]; clamp so the mapping stays inside the amplitude
        noise = std::clamp(noise, -1.0f, 1.0f);

        float normalized = (noise + 1.0f) * 0.5f;
        int32_t height = static_cast<int32_t>(std::lround(normalized * static_cast<float>(config.height_amplitude))) +
                         config.floor_offset;

        return std::clamp(height, 0, config.world_height - 1);
    }

    [[nodiscard]] BlockKind kind_at(int32_t y, int32_t height) const {
        if (y == height) {
            return BlockKind::Grass;
        }
        if (y >= height - config.dirt_depth) {
            return BlockKind::Dirt;
        }
        return BlockKind::Stone;
    }
};

// ============================================================================
// TerrainGenerator Implementation
// ============================================================================

TerrainGenerator::TerrainGenerator(const TerrainConfig& config) : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->sanitize_config();
    impl_->build_nodes();

    VOXELCORE_LOG_DEBUG(core::log_category::WORLD,
                        "Terrain generator: seed={} frequency={:.3f} amplitude={} offset={} dirt_depth={}",
                        impl_->config.seed, impl_->config.noise_frequency, impl_->config.height_amplitude,
                        impl_->config.floor_offset, impl_->config.dirt_depth);
}

TerrainGenerator::~TerrainGenerator() = default;

TerrainGenerator::TerrainGenerator(TerrainGenerator&&) noexcept = default;
TerrainGenerator& TerrainGenerator::operator=(TerrainGenerator&&) noexcept = default;

bool TerrainGenerator::generate(WorldGrid& grid, const ChunkCoord& chunk) const {
    const auto chunk_min = chunk_origin(chunk);
    if (!chunk_min) {
        VOXELCORE_LOG_ERROR(core::log_category::WORLD, "Chunk ({}, {}) is outside the block coordinate range",
                            chunk.x, chunk.y);
        return false;
    }

    const BlockPos origin = *chunk_min;
    size_t written = 0;

    for (int32_t x = 0; x < CHUNK_SIZE; ++x) {
        for (int32_t z = 0; z < CHUNK_SIZE; ++z) {
            const int32_t world_x = origin.x + x;
            const int32_t world_z = origin.z + z;
            const int32_t height = impl_->compute_height(world_x, world_z);

            for (int32_t y = 0; y <= height; ++y) {
                grid.set(BlockPos(world_x, y, world_z), impl_->kind_at(y, height));
            }
            written += static_cast<size_t>(height) + 1;
        }
    }

    VOXELCORE_LOG_TRACE(core::log_category::WORLD, "Generated chunk ({}, {}): {} blocks", chunk.x, chunk.y, written);
    return true;
}

std::optional<std::array<int32_t, CHUNK_COLUMNS>> TerrainGenerator::generate_heightmap(const ChunkCoord& chunk) const {
    const auto chunk_min = chunk_origin(chunk);
    if (!chunk_min) {
        return std::nullopt;
    }

    std::array<int32_t, CHUNK_COLUMNS> heights{};
    const BlockPos origin = *chunk_min;

    for (int32_t z = 0; z < CHUNK_SIZE; ++z) {
        for (int32_t x = 0; x < CHUNK_SIZE; ++x) {
            heights[static_cast<size_t>(z * CHUNK_SIZE + x)] = impl_->compute_height(origin.x + x, origin.z + z);
        }
    }
    return heights;
}

int32_t TerrainGenerator::get_height(int32_t world_x, int32_t world_z) const {
    return impl_->compute_height(world_x, world_z);
}

BlockKind TerrainGenerator::layer_kind(int32_t y, int32_t height) const {
    if (y < 0 || y > height) {
        return BlockKind::Empty;
    }
    return impl_->kind_at(y, height);
}

const TerrainConfig& TerrainGenerator::get_config() const {
    return impl_->config;
}

}  // namespace voxelcore::world
