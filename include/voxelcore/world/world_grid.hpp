// VoxelCore World System
// world_grid.hpp - Sparse block storage keyed by absolute block position

#pragma once

#include "types.hpp"

#include <cstdint>
#include <functional>
#include <unordered_map>

namespace voxelcore::world {

// ============================================================================
// World Grid
// ============================================================================

// Holds only non-Empty entries: writing Empty erases the key.
// Not thread-safe; mutation and reads alternate within one simulation step.
class WorldGrid {
public:
    using Storage = std::unordered_map<BlockPos, BlockKind>;
    using const_iterator = Storage::const_iterator;

    WorldGrid() = default;

    // Copyable so tests and tools can snapshot a world
    WorldGrid(const WorldGrid&) = default;
    WorldGrid& operator=(const WorldGrid&) = default;
    WorldGrid(WorldGrid&&) noexcept = default;
    WorldGrid& operator=(WorldGrid&&) noexcept = default;

    // ========================================================================
    // Block Access
    // ========================================================================

    // Empty when nothing is stored at pos
    [[nodiscard]] BlockKind get(const BlockPos& pos) const;

    // Empty removes the entry, Grass..Sand insert or overwrite; other values are
    // logged and ignored
    void set(const BlockPos& pos, BlockKind kind);

    [[nodiscard]] bool contains(const BlockPos& pos) const { return blocks_.find(pos) != blocks_.end(); }

    // ========================================================================
    // Iteration
    // ========================================================================

    [[nodiscard]] const_iterator begin() const { return blocks_.begin(); }
    [[nodiscard]] const_iterator end() const { return blocks_.end(); }

    void for_each(const std::function<void(const BlockPos&, BlockKind)>& callback) const;

    // ========================================================================
    // Statistics
    // ========================================================================

    [[nodiscard]] size_t size() const { return blocks_.size(); }
    [[nodiscard]] bool empty() const { return blocks_.empty(); }

    // Bumped on every write that changes the stored state
    [[nodiscard]] uint64_t revision() const { return revision_; }

private:
    Storage blocks_;
    uint64_t revision_ = 0;
};

}  // namespace voxelcore::world
