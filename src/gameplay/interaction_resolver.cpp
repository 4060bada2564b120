// VoxelCore Gameplay System
// interaction_resolver.cpp - Ray-marched block breaking and placement

#include <cmath>
#include <voxelcore/core/logger.hpp>
#include <voxelcore/gameplay/interaction_resolver.hpp>
#include <voxelcore/world/block_catalog.hpp>

namespace voxelcore::gameplay {

const char* interaction_outcome_to_string(InteractionOutcome outcome) {
    switch (outcome) {
        case InteractionOutcome::Broken:
            return "Broken";
        case InteractionOutcome::Placed:
            return "Placed";
        case InteractionOutcome::NoTarget:
            return "NoTarget";
        case InteractionOutcome::NoPlacementCell:
            return "NoPlacementCell";
        case InteractionOutcome::NothingSelected:
            return "NothingSelected";
        case InteractionOutcome::InvalidDirection:
            return "InvalidDirection";
        default:
            return "Unknown";
    }
}

InteractionResolver::InteractionResolver(const InteractionConfig& config) : config_(config) {
    if (config_.max_distance < 1) {
        VOXELCORE_LOG_WARN(core::log_category::GAME, "Interaction max_distance {} is invalid, using 1",
                           config_.max_distance);
        config_.max_distance = 1;
    }
}

bool InteractionResolver::is_valid_direction(const glm::dvec3& direction) const {
    const double length = glm::length(direction);
    return std::isfinite(length) && std::abs(length - 1.0) <= config_.direction_tolerance;
}

RayMarch InteractionResolver::march(const world::WorldGrid& grid, const world::WorldPos& origin,
                                    const glm::dvec3& direction) const {
    RayMarch result;
    std::optional<world::BlockPos> last_empty;

    for (int32_t distance = 1; distance <= config_.max_distance; ++distance) {
        const auto cell = world::round_to_block(origin + direction * static_cast<double>(distance));
        result.steps = distance;

        // Samples outside the block range hold nothing and cannot be placed into
        if (!cell) {
            last_empty.reset();
            continue;
        }

        if (grid.get(*cell) != world::BlockKind::Empty) {
            result.surface = *cell;
            result.before_surface = last_empty;
            break;
        }
        last_empty = *cell;
    }

    return result;
}

InteractionResult InteractionResolver::resolve(world::WorldGrid& grid, const world::WorldPos& origin,
                                               const glm::dvec3& direction, InteractionAction action,
                                               world::BlockKind selected) const {
    InteractionResult result;
    result.action = action;

    if (!is_valid_direction(direction)) {
        VOXELCORE_LOG_ERROR(core::log_category::GAME,
                            "Rejected interaction: direction ({:.4f}, {:.4f}, {:.4f}) is not unit length", direction.x,
                            direction.y, direction.z);
        result.outcome = InteractionOutcome::InvalidDirection;
        return result;
    }

    if (action == InteractionAction::Place && !world::BlockCatalog::is_placeable(selected)) {
        result.outcome = InteractionOutcome::NothingSelected;
        return result;
    }

    const RayMarch hit = march(grid, origin, direction);
    if (!hit.surface) {
        result.outcome = InteractionOutcome::NoTarget;
        return result;
    }

    if (action == InteractionAction::Break) {
        result.target = *hit.surface;
        result.previous = grid.get(*hit.surface);
        grid.set(*hit.surface, world::BlockKind::Empty);
        result.current = world::BlockKind::Empty;
        result.outcome = InteractionOutcome::Broken;

        VOXELCORE_LOG_DEBUG(core::log_category::GAME, "Broke {} at ({}, {}, {})",
                            world::BlockCatalog::name(result.previous), hit.surface->x, hit.surface->y,
                            hit.surface->z);
        return result;
    }

    if (!hit.before_surface) {
        result.outcome = InteractionOutcome::NoPlacementCell;
        return result;
    }

    result.target = *hit.before_surface;
    result.previous = grid.get(*hit.before_surface);
    grid.set(*hit.before_surface, selected);
    result.current = selected;
    result.outcome = InteractionOutcome::Placed;

    VOXELCORE_LOG_DEBUG(core::log_category::GAME, "Placed {} at ({}, {}, {})", world::BlockCatalog::name(selected),
                        hit.before_surface->x, hit.before_surface->y, hit.before_surface->z);
    return result;
}

}  // namespace voxelcore::gameplay
