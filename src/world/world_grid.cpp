// VoxelCore World System
// world_grid.cpp - Sparse block storage implementation

#include <voxelcore/core/logger.hpp>
#include <voxelcore/world/world_grid.hpp>

namespace voxelcore::world {

BlockKind WorldGrid::get(const BlockPos& pos) const {
    auto it = blocks_.find(pos);
    if (it == blocks_.end()) {
        return BlockKind::Empty;
    }
    return it->second;
}

void WorldGrid::set(const BlockPos& pos, BlockKind kind) {
    if (static_cast<size_t>(kind) >= BLOCK_KIND_COUNT) {
        VOXELCORE_LOG_ERROR(core::log_category::WORLD, "Rejected unknown block kind {} at ({}, {}, {})",
                            static_cast<int>(kind), pos.x, pos.y, pos.z);
        return;
    }

    if (kind == BlockKind::Empty) {
        if (blocks_.erase(pos) > 0) {
            ++revision_;
        }
        return;
    }

    auto [it, inserted] = blocks_.try_emplace(pos, kind);
    if (inserted) {
        ++revision_;
    } else if (it->second != kind) {
        it->second = kind;
        ++revision_;
    }
}

void WorldGrid::for_each(const std::function<void(const BlockPos&, BlockKind)>& callback) const {
    for (const auto& [pos, kind] : blocks_) {
        callback(pos, kind);
    }
}

}  // namespace voxelcore::world
