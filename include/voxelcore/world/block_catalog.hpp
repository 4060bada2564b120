// VoxelCore World System
// block_catalog.hpp - Static block kind attributes (names, colors, hotbar)

#pragma once

#include "types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace voxelcore::world {

// ============================================================================
// Block Descriptor
// ============================================================================

struct BlockDesc {
    BlockKind kind = BlockKind::Empty;
    std::string_view name;          // Lower-case identifier "stone"
    std::string_view display_name;  // Human-readable "Stone"
    glm::vec4 color{0.0f};          // Linear RGBA used by the renderer
};

// Hotbar slots are numbered from 1 like the number keys
inline constexpr int HOTBAR_SLOT_COUNT = 5;

// ============================================================================
// Block Catalog (static, immutable)
// ============================================================================

class BlockCatalog {
public:
    [[nodiscard]] static const BlockDesc& get(BlockKind kind);

    [[nodiscard]] static glm::vec4 color(BlockKind kind) { return get(kind).color; }
    [[nodiscard]] static std::string_view name(BlockKind kind) { return get(kind).name; }
    [[nodiscard]] static std::string_view display_name(BlockKind kind) { return get(kind).display_name; }

    // Case-insensitive lookup by name
    [[nodiscard]] static std::optional<BlockKind> kind_from_name(std::string_view name);

    // Every kind except Empty can be placed
    [[nodiscard]] static bool is_placeable(BlockKind kind);

    // Slot 1..5 -> Grass, Dirt, Stone, Wood, Sand
    [[nodiscard]] static std::optional<BlockKind> kind_for_hotbar_slot(int slot);

    [[nodiscard]] static const std::array<BlockDesc, BLOCK_KIND_COUNT>& all();

private:
    BlockCatalog() = delete;
};

}  // namespace voxelcore::world
