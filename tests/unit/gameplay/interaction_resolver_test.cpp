// VoxelCore Gameplay Tests
// interaction_resolver_test.cpp - Tests for ray-marched break and place

#include <gtest/gtest.h>

#include <voxelcore/gameplay/interaction_resolver.hpp>

namespace voxelcore::gameplay {
namespace {

using world::BlockKind;
using world::BlockPos;
using world::WorldGrid;
using world::WorldPos;

class InteractionResolverTest : public ::testing::Test {
protected:
    InteractionResolver resolver_;
    WorldGrid grid_;
    const WorldPos origin_{0.0, 0.0, 0.0};
    const glm::dvec3 pos_x_{1.0, 0.0, 0.0};
};

TEST_F(InteractionResolverTest, BreakRemovesFirstBlockOnly) {
    grid_.set(BlockPos(3, 0, 0), BlockKind::Stone);
    grid_.set(BlockPos(5, 0, 0), BlockKind::Dirt);

    auto result = resolver_.resolve(grid_, origin_, pos_x_, InteractionAction::Break, BlockKind::Grass);

    EXPECT_EQ(result.outcome, InteractionOutcome::Broken);
    ASSERT_TRUE(result.target.has_value());
    EXPECT_EQ(*result.target, BlockPos(3, 0, 0));
    EXPECT_EQ(result.previous, BlockKind::Stone);
    EXPECT_EQ(result.current, BlockKind::Empty);
    EXPECT_TRUE(result.changed_grid());

    EXPECT_EQ(grid_.get(BlockPos(3, 0, 0)), BlockKind::Empty);
    EXPECT_EQ(grid_.get(BlockPos(5, 0, 0)), BlockKind::Dirt);
    EXPECT_EQ(grid_.size(), 1u);
}

TEST_F(InteractionResolverTest, SecondBreakReachesNextBlock) {
    grid_.set(BlockPos(3, 0, 0), BlockKind::Stone);
    grid_.set(BlockPos(5, 0, 0), BlockKind::Dirt);

    resolver_.resolve(grid_, origin_, pos_x_, InteractionAction::Break, BlockKind::Grass);
    auto result = resolver_.resolve(grid_, origin_, pos_x_, InteractionAction::Break, BlockKind::Grass);

    EXPECT_EQ(result.outcome, InteractionOutcome::Broken);
    EXPECT_EQ(*result.target, BlockPos(5, 0, 0));
    EXPECT_TRUE(grid_.empty());
}

TEST_F(InteractionResolverTest, PlaceWritesCellBeforeSurface) {
    grid_.set(BlockPos(5, 0, 0), BlockKind::Stone);

    auto result = resolver_.resolve(grid_, origin_, pos_x_, InteractionAction::Place, BlockKind::Wood);

    EXPECT_EQ(result.outcome, InteractionOutcome::Placed);
    ASSERT_TRUE(result.target.has_value());
    EXPECT_EQ(*result.target, BlockPos(4, 0, 0));
    EXPECT_EQ(result.previous, BlockKind::Empty);
    EXPECT_EQ(result.current, BlockKind::Wood);

    EXPECT_EQ(grid_.get(BlockPos(4, 0, 0)), BlockKind::Wood);
    EXPECT_EQ(grid_.get(BlockPos(5, 0, 0)), BlockKind::Stone);
    EXPECT_EQ(grid_.size(), 2u);
}

TEST_F(InteractionResolverTest, NothingInReachLeavesGridUnchanged) {
    grid_.set(BlockPos(0, 5, 0), BlockKind::Stone);
    const uint64_t revision = grid_.revision();

    auto broke = resolver_.resolve(grid_, origin_, pos_x_, InteractionAction::Break, BlockKind::Grass);
    auto placed = resolver_.resolve(grid_, origin_, pos_x_, InteractionAction::Place, BlockKind::Grass);

    EXPECT_EQ(broke.outcome, InteractionOutcome::NoTarget);
    EXPECT_EQ(placed.outcome, InteractionOutcome::NoTarget);
    EXPECT_FALSE(broke.target.has_value());
    EXPECT_FALSE(broke.changed_grid());
    EXPECT_EQ(grid_.revision(), revision);
    EXPECT_EQ(grid_.size(), 1u);
}

TEST_F(InteractionResolverTest, PlaceAgainstAdjacentBlockHasNoCell) {
    grid_.set(BlockPos(1, 0, 0), BlockKind::Stone);

    auto result = resolver_.resolve(grid_, origin_, pos_x_, InteractionAction::Place, BlockKind::Sand);

    EXPECT_EQ(result.outcome, InteractionOutcome::NoPlacementCell);
    EXPECT_FALSE(result.target.has_value());
    EXPECT_EQ(grid_.size(), 1u);
}

TEST_F(InteractionResolverTest, BreakAdjacentBlock) {
    grid_.set(BlockPos(1, 0, 0), BlockKind::Stone);

    auto result = resolver_.resolve(grid_, origin_, pos_x_, InteractionAction::Break, BlockKind::Grass);

    EXPECT_EQ(result.outcome, InteractionOutcome::Broken);
    EXPECT_TRUE(grid_.empty());
}

TEST_F(InteractionResolverTest, PlaceWithEmptySelectionIsRejected) {
    grid_.set(BlockPos(5, 0, 0), BlockKind::Stone);

    auto result = resolver_.resolve(grid_, origin_, pos_x_, InteractionAction::Place, BlockKind::Empty);

    EXPECT_EQ(result.outcome, InteractionOutcome::NothingSelected);
    EXPECT_EQ(grid_.size(), 1u);
}

TEST_F(InteractionResolverTest, NonUnitDirectionIsRejected) {
    grid_.set(BlockPos(3, 0, 0), BlockKind::Stone);
    const uint64_t revision = grid_.revision();

    auto result =
        resolver_.resolve(grid_, origin_, glm::dvec3(2.0, 0.0, 0.0), InteractionAction::Break, BlockKind::Grass);
    EXPECT_EQ(result.outcome, InteractionOutcome::InvalidDirection);

    result = resolver_.resolve(grid_, origin_, glm::dvec3(0.0), InteractionAction::Place, BlockKind::Grass);
    EXPECT_EQ(result.outcome, InteractionOutcome::InvalidDirection);

    EXPECT_EQ(grid_.revision(), revision);
    EXPECT_EQ(grid_.get(BlockPos(3, 0, 0)), BlockKind::Stone);
}

TEST_F(InteractionResolverTest, DirectionTolerance) {
    EXPECT_TRUE(resolver_.is_valid_direction(glm::dvec3(1.0, 0.0, 0.0)));
    EXPECT_TRUE(resolver_.is_valid_direction(glm::normalize(glm::dvec3(1.0, -2.0, 0.5))));
    EXPECT_TRUE(resolver_.is_valid_direction(glm::dvec3(1.0005, 0.0, 0.0)));
    EXPECT_FALSE(resolver_.is_valid_direction(glm::dvec3(1.01, 0.0, 0.0)));
    EXPECT_FALSE(resolver_.is_valid_direction(glm::dvec3(0.0)));
}

TEST_F(InteractionResolverTest, ReachEndsAtMaxDistance) {
    grid_.set(BlockPos(10, 0, 0), BlockKind::Stone);
    auto result = resolver_.resolve(grid_, origin_, pos_x_, InteractionAction::Break, BlockKind::Grass);
    EXPECT_EQ(result.outcome, InteractionOutcome::Broken);

    grid_.set(BlockPos(11, 0, 0), BlockKind::Stone);
    result = resolver_.resolve(grid_, origin_, pos_x_, InteractionAction::Break, BlockKind::Grass);
    EXPECT_EQ(result.outcome, InteractionOutcome::NoTarget);
    EXPECT_EQ(grid_.get(BlockPos(11, 0, 0)), BlockKind::Stone);
}

TEST_F(InteractionResolverTest, ConfiguredReach) {
    InteractionConfig config;
    config.max_distance = 3;
    InteractionResolver resolver(config);

    grid_.set(BlockPos(4, 0, 0), BlockKind::Stone);
    auto result = resolver.resolve(grid_, origin_, pos_x_, InteractionAction::Break, BlockKind::Grass);
    EXPECT_EQ(result.outcome, InteractionOutcome::NoTarget);
}

TEST_F(InteractionResolverTest, InvalidReachIsClamped) {
    InteractionConfig config;
    config.max_distance = 0;
    InteractionResolver resolver(config);
    EXPECT_EQ(resolver.get_config().max_distance, 1);
}

TEST_F(InteractionResolverTest, MarchDoesNotModifyGrid) {
    grid_.set(BlockPos(0, -4, 0), BlockKind::Grass);
    const uint64_t revision = grid_.revision();

    RayMarch hit = resolver_.march(grid_, origin_, glm::dvec3(0.0, -1.0, 0.0));

    ASSERT_TRUE(hit.surface.has_value());
    EXPECT_EQ(*hit.surface, BlockPos(0, -4, 0));
    ASSERT_TRUE(hit.before_surface.has_value());
    EXPECT_EQ(*hit.before_surface, BlockPos(0, -3, 0));
    EXPECT_EQ(hit.steps, 4);
    EXPECT_EQ(grid_.revision(), revision);
}

TEST_F(InteractionResolverTest, MarchWithoutHitSamplesFullReach) {
    RayMarch hit = resolver_.march(grid_, origin_, pos_x_);
    EXPECT_FALSE(hit.surface.has_value());
    EXPECT_FALSE(hit.before_surface.has_value());
    EXPECT_EQ(hit.steps, resolver_.get_config().max_distance);
}

TEST_F(InteractionResolverTest, DiagonalRayUsesRoundedSamples) {
    const glm::dvec3 diagonal = glm::normalize(glm::dvec3(1.0, 1.0, 0.0));
    // Samples at d=1..3 round to (1,1,0), (1,1,0), (2,2,0)
    grid_.set(BlockPos(2, 2, 0), BlockKind::Stone);

    auto result = resolver_.resolve(grid_, origin_, diagonal, InteractionAction::Place, BlockKind::Dirt);

    EXPECT_EQ(result.outcome, InteractionOutcome::Placed);
    EXPECT_EQ(*result.target, BlockPos(1, 1, 0));
    EXPECT_EQ(grid_.get(BlockPos(1, 1, 0)), BlockKind::Dirt);
}

TEST_F(InteractionResolverTest, RayLeavingBlockRangeFindsNothing) {
    const WorldPos origin(2147483645.0, 0.0, 0.0);

    RayMarch hit = resolver_.march(grid_, origin, pos_x_);
    EXPECT_FALSE(hit.surface.has_value());
    EXPECT_EQ(hit.steps, resolver_.get_config().max_distance);

    grid_.set(BlockPos(2147483647, 0, 0), BlockKind::Stone);
    auto result = resolver_.resolve(grid_, origin, pos_x_, InteractionAction::Break, BlockKind::Grass);
    EXPECT_EQ(result.outcome, InteractionOutcome::Broken);
    EXPECT_TRUE(grid_.empty());
}

TEST_F(InteractionResolverTest, NoPlacementAfterOutOfRangeSamples) {
    grid_.set(BlockPos(2147483647, 0, 0), BlockKind::Stone);

    // d = 1, 2 round past the int32 range; d = 3 hits the block
    auto result = resolver_.resolve(grid_, WorldPos(2147483650.0, 0.0, 0.0), glm::dvec3(-1.0, 0.0, 0.0),
                                    InteractionAction::Place, BlockKind::Wood);

    EXPECT_EQ(result.outcome, InteractionOutcome::NoPlacementCell);
    EXPECT_EQ(grid_.size(), 1u);
}

TEST(InteractionOutcomeTest, ToString) {
    EXPECT_STREQ(interaction_outcome_to_string(InteractionOutcome::Broken), "Broken");
    EXPECT_STREQ(interaction_outcome_to_string(InteractionOutcome::NoPlacementCell), "NoPlacementCell");
    EXPECT_STREQ(interaction_outcome_to_string(InteractionOutcome::InvalidDirection), "InvalidDirection");
}

}  // namespace
}  // namespace voxelcore::gameplay
