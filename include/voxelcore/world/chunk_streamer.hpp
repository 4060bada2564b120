// VoxelCore World System
// chunk_streamer.hpp - Generates chunks as they come into range of the viewpoint

#pragma once

#include "terrain_generator.hpp"
#include "types.hpp"
#include "world_grid.hpp"

#include <unordered_set>
#include <vector>

namespace voxelcore::world {

// ============================================================================
// Chunk Streamer
// ============================================================================

// Owns the set of generated chunk coordinates. The set only grows: a chunk is
// added exactly once, right after the generator has written it into the grid.
class ChunkStreamer {
public:
    explicit ChunkStreamer(const TerrainGenerator& generator);

    ChunkStreamer(const ChunkStreamer&) = delete;
    ChunkStreamer& operator=(const ChunkStreamer&) = delete;

    /// Generate every chunk within Chebyshev distance `radius` of `center` that
    /// is not loaded yet. Returns the number of chunks generated by this call.
    /// The square is clipped to [MIN_CHUNK_COORD, MAX_CHUNK_COORD].
    size_t ensure_loaded(WorldGrid& grid, const ChunkCoord& center, int32_t radius);

    /// Same, centered on the chunk containing a continuous viewpoint.
    /// Does nothing if the viewpoint's cell has no int32 coordinates.
    size_t ensure_loaded_around(WorldGrid& grid, const WorldPos& viewpoint, int32_t radius);

    [[nodiscard]] bool is_loaded(const ChunkCoord& chunk) const { return loaded_.count(chunk) > 0; }
    [[nodiscard]] size_t loaded_count() const { return loaded_.size(); }
    [[nodiscard]] std::vector<ChunkCoord> loaded_chunks() const;

private:
    const TerrainGenerator& generator_;
    std::unordered_set<ChunkCoord> loaded_;
};

}  // namespace voxelcore::world
