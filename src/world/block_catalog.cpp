// VoxelCore World System
// block_catalog.cpp - Static block kind attributes

#include <algorithm>
#include <cctype>
#include <voxelcore/world/block_catalog.hpp>

namespace voxelcore::world {

namespace {

// Indexed by BlockKind
const std::array<BlockDesc, BLOCK_KIND_COUNT> BLOCK_DESCS = {{
    {BlockKind::Empty, "empty", "Empty", glm::vec4(0.0f, 0.0f, 0.0f, 0.0f)},
    {BlockKind::Grass, "grass", "Grass", glm::vec4(0.36f, 0.73f, 0.28f, 1.0f)},
    {BlockKind::Dirt, "dirt", "Dirt", glm::vec4(0.55f, 0.27f, 0.07f, 1.0f)},
    {BlockKind::Stone, "stone", "Stone", glm::vec4(0.5f, 0.5f, 0.5f, 1.0f)},
    {BlockKind::Wood, "wood", "Wood", glm::vec4(0.63f, 0.32f, 0.18f, 1.0f)},
    {BlockKind::Sand, "sand", "Sand", glm::vec4(0.96f, 0.64f, 0.38f, 1.0f)},
}};

constexpr std::array<BlockKind, HOTBAR_SLOT_COUNT> HOTBAR = {BlockKind::Grass, BlockKind::Dirt, BlockKind::Stone,
                                                             BlockKind::Wood, BlockKind::Sand};

bool equals_ignore_case(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char lhs, char rhs) {
               return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
           });
}

}  // namespace

const BlockDesc& BlockCatalog::get(BlockKind kind) {
    auto index = static_cast<size_t>(kind);
    if (index >= BLOCK_DESCS.size()) {
        return BLOCK_DESCS[0];
    }
    return BLOCK_DESCS[index];
}

std::optional<BlockKind> BlockCatalog::kind_from_name(std::string_view name) {
    for (const auto& desc : BLOCK_DESCS) {
        if (equals_ignore_case(desc.name, name)) {
            return desc.kind;
        }
    }
    return std::nullopt;
}

bool BlockCatalog::is_placeable(BlockKind kind) {
    return kind != BlockKind::Empty && static_cast<size_t>(kind) < BLOCK_KIND_COUNT;
}

std::optional<BlockKind> BlockCatalog::kind_for_hotbar_slot(int slot) {
    if (slot < 1 || slot > HOTBAR_SLOT_COUNT) {
        return std::nullopt;
    }
    return HOTBAR[static_cast<size_t>(slot - 1)];
}

const std::array<BlockDesc, BLOCK_KIND_COUNT>& BlockCatalog::all() {
    return BLOCK_DESCS;
}

}  // namespace voxelcore::world
