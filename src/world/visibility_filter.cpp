// VoxelCore World System
// visibility_filter.cpp - Exposed block selection

#include <voxelcore/world/visibility_filter.hpp>

namespace voxelcore::world {

namespace {

bool has_empty_neighbor(const WorldGrid& grid, const BlockPos& pos) {
    for (const auto& offset : NEIGHBOR_OFFSETS) {
        // Nothing can be stored past the edge of the block range
        auto neighbor = offset_block(pos, offset);
        if (!neighbor || grid.get(*neighbor) == BlockKind::Empty) {
            return true;
        }
    }
    return false;
}

}  // namespace

bool VisibilityFilter::is_exposed(const WorldGrid& grid, const BlockPos& pos) {
    return grid.get(pos) != BlockKind::Empty && has_empty_neighbor(grid, pos);
}

void VisibilityFilter::for_each_exposed(const WorldGrid& grid, const Callback& callback) {
    for (const auto& [pos, kind] : grid) {
        if (has_empty_neighbor(grid, pos)) {
            callback(pos, kind);
        }
    }
}

std::vector<ExposedBlock> VisibilityFilter::collect_exposed(const WorldGrid& grid) {
    std::vector<ExposedBlock> result;
    for_each_exposed(grid, [&result](const BlockPos& pos, BlockKind kind) { result.push_back({pos, kind}); });
    return result;
}

std::vector<ExposedBlock> VisibilityFilter::collect_exposed_near(const WorldGrid& grid, const WorldPos& center,
                                                                 double max_distance) {
    std::vector<ExposedBlock> result;
    if (max_distance < 0.0) {
        return result;
    }

    const double max_distance_sq = max_distance * max_distance;
    for_each_exposed(grid, [&](const BlockPos& pos, BlockKind kind) {
        glm::dvec3 delta = glm::dvec3(pos) - center;
        if (glm::dot(delta, delta) <= max_distance_sq) {
            result.push_back({pos, kind});
        }
    });
    return result;
}

}  // namespace voxelcore::world
