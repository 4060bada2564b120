// VoxelCore World System
// visibility_filter.hpp - Selects blocks with at least one empty neighbor

#pragma once

#include "types.hpp"
#include "world_grid.hpp"

#include <functional>
#include <vector>

namespace voxelcore::world {

// A block the renderer has to draw
struct ExposedBlock {
    BlockPos position{0};
    BlockKind kind = BlockKind::Empty;
};

// Stateless: every call reads the grid as it is now. Callers decide when to
// recompute, typically when WorldGrid::revision() has moved.
// Iteration order follows the grid's storage and is unspecified.
class VisibilityFilter {
public:
    using Callback = std::function<void(const BlockPos&, BlockKind)>;

    /// True if pos is occupied and one of its 6 axis neighbors is Empty
    [[nodiscard]] static bool is_exposed(const WorldGrid& grid, const BlockPos& pos);

    /// Visits exposed blocks one at a time without building a list
    static void for_each_exposed(const WorldGrid& grid, const Callback& callback);

    [[nodiscard]] static std::vector<ExposedBlock> collect_exposed(const WorldGrid& grid);

    /// Exposed blocks whose cell center lies within max_distance of center
    [[nodiscard]] static std::vector<ExposedBlock> collect_exposed_near(const WorldGrid& grid, const WorldPos& center,
                                                                        double max_distance);

private:
    VisibilityFilter() = delete;
};

}  // namespace voxelcore::world
