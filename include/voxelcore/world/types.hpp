// VoxelCore World System
// types.hpp - Block kinds, coordinates, constants and conversion functions

#pragma once

#include <glm/glm.hpp>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>

namespace voxelcore::world {

// ============================================================================
// Block Kinds
// ============================================================================

// Empty means "no block" and is never stored, only implied by absence
enum class BlockKind : uint8_t {
    Empty = 0,
    Grass,
    Dirt,
    Stone,
    Wood,
    Sand,
    Count
};

inline constexpr size_t BLOCK_KIND_COUNT = static_cast<size_t>(BlockKind::Count);

// ============================================================================
// World Constants
// ============================================================================

// Chunk footprint along x and z
inline constexpr int32_t CHUNK_SIZE = 16;

// Generated columns never reach this height
inline constexpr int32_t WORLD_HEIGHT = 64;

// Chunks loaded around the viewpoint (Chebyshev radius)
inline constexpr int32_t DEFAULT_LOAD_RADIUS = 3;

// Largest load radius a simulation accepts: (2 * 16 + 1)^2 = 1089 chunks
inline constexpr int32_t MAX_LOAD_RADIUS = 16;

// ============================================================================
// Coordinate Types (using GLM)
// ============================================================================

// Absolute block position, the storage key of the world grid
using BlockPos = glm::ivec3;

// Chunk coordinate (chunk_x, chunk_z); y holds the z component
using ChunkCoord = glm::ivec2;

// Continuous world position (viewpoint, ray origin)
using WorldPos = glm::dvec3;

// ============================================================================
// Coordinate Conversion Functions
// ============================================================================

// Floor division, correct for negative numerators
[[nodiscard]] constexpr int32_t floor_div(int32_t value, int32_t divisor) {
    int32_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

// Chunk domain: every block of these chunks has an int32 x and z
inline constexpr int32_t MIN_CHUNK_COORD = floor_div(std::numeric_limits<int32_t>::min(), CHUNK_SIZE);
inline constexpr int32_t MAX_CHUNK_COORD = floor_div(std::numeric_limits<int32_t>::max(), CHUNK_SIZE);

[[nodiscard]] inline bool is_valid_chunk(const ChunkCoord& chunk) {
    return chunk.x >= MIN_CHUNK_COORD && chunk.x <= MAX_CHUNK_COORD && chunk.y >= MIN_CHUNK_COORD &&
           chunk.y <= MAX_CHUNK_COORD;
}

[[nodiscard]] constexpr bool fits_block_coord(int64_t value) {
    return value >= std::numeric_limits<int32_t>::min() && value <= std::numeric_limits<int32_t>::max();
}

// Always inside the chunk domain
[[nodiscard]] inline ChunkCoord block_to_chunk(const BlockPos& pos) {
    return ChunkCoord(floor_div(pos.x, CHUNK_SIZE), floor_div(pos.z, CHUNK_SIZE));
}

// World x/z of the chunk's minimum corner; nullopt outside the chunk domain
[[nodiscard]] inline std::optional<BlockPos> chunk_origin(const ChunkCoord& chunk) {
    if (!is_valid_chunk(chunk)) {
        return std::nullopt;
    }
    const int64_t x = static_cast<int64_t>(chunk.x) * CHUNK_SIZE;
    const int64_t z = static_cast<int64_t>(chunk.y) * CHUNK_SIZE;
    return BlockPos(static_cast<int32_t>(x), 0, static_cast<int32_t>(z));
}

// Block cell of an already integral point; nullopt if an axis is not finite or
// outside the int32 range
[[nodiscard]] inline std::optional<BlockPos> to_block_pos(const WorldPos& integral) {
    constexpr double lo = static_cast<double>(std::numeric_limits<int32_t>::min());
    constexpr double hi = static_cast<double>(std::numeric_limits<int32_t>::max());
    for (int axis = 0; axis < 3; ++axis) {
        const double value = integral[axis];
        if (!std::isfinite(value) || value < lo || value > hi) {
            return std::nullopt;
        }
    }
    return BlockPos(static_cast<int32_t>(integral.x), static_cast<int32_t>(integral.y),
                    static_cast<int32_t>(integral.z));
}

// Cell containing a continuous point
[[nodiscard]] inline std::optional<BlockPos> floor_to_block(const WorldPos& point) {
    return to_block_pos(WorldPos(std::floor(point.x), std::floor(point.y), std::floor(point.z)));
}

// Nearest block cell to a continuous point, each axis rounded half away from zero
[[nodiscard]] inline std::optional<BlockPos> round_to_block(const WorldPos& point) {
    return to_block_pos(WorldPos(std::round(point.x), std::round(point.y), std::round(point.z)));
}

// Chunk containing a continuous position; nullopt when its cell is not representable
[[nodiscard]] inline std::optional<ChunkCoord> world_to_chunk(const WorldPos& pos) {
    auto block = floor_to_block(pos);
    if (!block) {
        return std::nullopt;
    }
    return block_to_chunk(*block);
}

// ============================================================================
// Neighbors
// ============================================================================

// The 6 axis-aligned neighbor offsets: -x, +x, -y, +y, -z, +z
inline constexpr glm::ivec3 NEIGHBOR_OFFSETS[6] = {{-1, 0, 0}, {1, 0, 0},  {0, -1, 0},
                                                   {0, 1, 0},  {0, 0, -1}, {0, 0, 1}};

// pos + offset; nullopt past the edge of the int32 block range
[[nodiscard]] inline std::optional<BlockPos> offset_block(const BlockPos& pos, const glm::ivec3& offset) {
    const int64_t x = static_cast<int64_t>(pos.x) + offset.x;
    const int64_t y = static_cast<int64_t>(pos.y) + offset.y;
    const int64_t z = static_cast<int64_t>(pos.z) + offset.z;
    if (!fits_block_coord(x) || !fits_block_coord(y) || !fits_block_coord(z)) {
        return std::nullopt;
    }
    return BlockPos(static_cast<int32_t>(x), static_cast<int32_t>(y), static_cast<int32_t>(z));
}

}  // namespace voxelcore::world

// ============================================================================
// Hash Functions for using coordinates as map keys
// ============================================================================

namespace std {

template <>
struct hash<voxelcore::world::ChunkCoord> {
    size_t operator()(const voxelcore::world::ChunkCoord& pos) const noexcept {
        size_t h1 = std::hash<int32_t>{}(pos.x);
        size_t h2 = std::hash<int32_t>{}(pos.y);
        return h1 ^ (h2 * 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

template <>
struct hash<voxelcore::world::BlockPos> {
    size_t operator()(const voxelcore::world::BlockPos& pos) const noexcept {
        size_t h1 = std::hash<int32_t>{}(pos.x);
        size_t h2 = std::hash<int32_t>{}(pos.y);
        size_t h3 = std::hash<int32_t>{}(pos.z);
        size_t result = h1;
        result ^= h2 * 0x9e3779b97f4a7c15ULL + (result << 6) + (result >> 2);
        result ^= h3 * 0x9e3779b97f4a7c15ULL + (result << 6) + (result >> 2);
        return result;
    }
};

}  // namespace std
