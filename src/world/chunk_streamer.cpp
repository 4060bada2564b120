// VoxelCore World System
// chunk_streamer.cpp - Viewpoint-driven chunk generation

#include <algorithm>
#include <voxelcore/core/logger.hpp>
#include <voxelcore/world/chunk_streamer.hpp>

namespace voxelcore::world {

ChunkStreamer::ChunkStreamer(const TerrainGenerator& generator) : generator_(generator) {}

size_t ChunkStreamer::ensure_loaded(WorldGrid& grid, const ChunkCoord& center, int32_t radius) {
    if (radius < 0) {
        VOXELCORE_LOG_ERROR(core::log_category::WORLD, "ensure_loaded called with negative radius {}", radius);
        return 0;
    }

    if (!is_valid_chunk(center)) {
        VOXELCORE_LOG_ERROR(core::log_category::WORLD, "ensure_loaded called with out-of-range center ({}, {})",
                            center.x, center.y);
        return 0;
    }

    // Square clipped to the chunk domain
    const int64_t min_x = std::max<int64_t>(static_cast<int64_t>(center.x) - radius, MIN_CHUNK_COORD);
    const int64_t max_x = std::min<int64_t>(static_cast<int64_t>(center.x) + radius, MAX_CHUNK_COORD);
    const int64_t min_z = std::max<int64_t>(static_cast<int64_t>(center.y) - radius, MIN_CHUNK_COORD);
    const int64_t max_z = std::min<int64_t>(static_cast<int64_t>(center.y) + radius, MAX_CHUNK_COORD);

    size_t generated = 0;
    for (int64_t chunk_x = min_x; chunk_x <= max_x; ++chunk_x) {
        for (int64_t chunk_z = min_z; chunk_z <= max_z; ++chunk_z) {
            ChunkCoord chunk(static_cast<int32_t>(chunk_x), static_cast<int32_t>(chunk_z));
            if (loaded_.count(chunk) > 0) {
                continue;
            }
            if (!generator_.generate(grid, chunk)) {
                continue;
            }
            loaded_.insert(chunk);
            ++generated;
        }
    }

    if (generated > 0) {
        VOXELCORE_LOG_DEBUG(core::log_category::WORLD, "Loaded {} chunks around ({}, {}), {} total", generated,
                            center.x, center.y, loaded_.size());
    }
    return generated;
}

size_t ChunkStreamer::ensure_loaded_around(WorldGrid& grid, const WorldPos& viewpoint, int32_t radius) {
    const auto center = world_to_chunk(viewpoint);
    if (!center) {
        VOXELCORE_LOG_ERROR(core::log_category::WORLD, "Viewpoint ({:.1f}, {:.1f}, {:.1f}) is outside the block range",
                            viewpoint.x, viewpoint.y, viewpoint.z);
        return 0;
    }
    return ensure_loaded(grid, *center, radius);
}

std::vector<ChunkCoord> ChunkStreamer::loaded_chunks() const {
    return std::vector<ChunkCoord>(loaded_.begin(), loaded_.end());
}

}  // namespace voxelcore::world
