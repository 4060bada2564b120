// VoxelCore Gameplay System
// interaction_resolver.hpp - Ray-marched block breaking and placement

#pragma once

#include <voxelcore/world/types.hpp>
#include <voxelcore/world/world_grid.hpp>

#include <cstdint>
#include <optional>

namespace voxelcore::gameplay {

// ============================================================================
// Actions and Results
// ============================================================================

enum class InteractionAction : uint8_t {
    Break,  // Primary action
    Place   // Secondary action
};

enum class InteractionOutcome : uint8_t {
    Broken,            // Target removed
    Placed,            // Selected kind written before the surface
    NoTarget,          // No occupied cell within reach
    NoPlacementCell,   // Surface hit on the first step, nothing empty before it
    NothingSelected,   // Place requested with Empty selected
    InvalidDirection   // Direction was not unit length; grid untouched
};

[[nodiscard]] const char* interaction_outcome_to_string(InteractionOutcome outcome);

struct InteractionResult {
    InteractionAction action = InteractionAction::Break;
    InteractionOutcome outcome = InteractionOutcome::NoTarget;
    std::optional<world::BlockPos> target;             // Cell that was written
    world::BlockKind previous = world::BlockKind::Empty;  // Kind at target before the write
    world::BlockKind current = world::BlockKind::Empty;   // Kind at target after the write

    [[nodiscard]] bool changed_grid() const {
        return outcome == InteractionOutcome::Broken || outcome == InteractionOutcome::Placed;
    }
};

// Cells found by one ray march, before any write
struct RayMarch {
    std::optional<world::BlockPos> surface;       // First occupied cell
    std::optional<world::BlockPos> before_surface;  // Empty cell sampled right before it
    int32_t steps = 0;                            // Samples taken
};

// ============================================================================
// Interaction Configuration
// ============================================================================

struct InteractionConfig {
    int32_t max_distance = 10;         // Last integer step sampled along the ray
    double direction_tolerance = 1e-3;  // Allowed deviation of |direction| from 1
};

// ============================================================================
// Interaction Resolver
// ============================================================================

// Samples origin + direction * d for d = 1..max_distance, rounding each sample to
// the nearest cell. Shallow rays may sample a cell twice or skip one; there is
// no voxel traversal, so placement matches the sampled cells exactly.
class InteractionResolver {
public:
    explicit InteractionResolver(const InteractionConfig& config = {});

    /// Break the first occupied cell, or place `selected` in the empty cell
    /// sampled right before it. Stops at the first occupied cell either way.
    InteractionResult resolve(world::WorldGrid& grid, const world::WorldPos& origin, const glm::dvec3& direction,
                              InteractionAction action, world::BlockKind selected) const;

    /// Read-only march, for target highlighting
    [[nodiscard]] RayMarch march(const world::WorldGrid& grid, const world::WorldPos& origin,
                                 const glm::dvec3& direction) const;

    [[nodiscard]] bool is_valid_direction(const glm::dvec3& direction) const;

    [[nodiscard]] const InteractionConfig& get_config() const { return config_; }

private:
    InteractionConfig config_;
};

}  // namespace voxelcore::gameplay
