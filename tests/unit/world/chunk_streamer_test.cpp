// VoxelCore World System Tests
// chunk_streamer_test.cpp - Tests for viewpoint-driven chunk loading

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <voxelcore/world/chunk_streamer.hpp>

namespace voxelcore::world {
namespace {

class ChunkStreamerTest : public ::testing::Test {
protected:
    TerrainGenerator generator_;
    WorldGrid grid_;
};

TEST_F(ChunkStreamerTest, LoadsSquareAroundCenter) {
    ChunkStreamer streamer(generator_);

    EXPECT_EQ(streamer.ensure_loaded(grid_, ChunkCoord(0, 0), 1), 9u);
    EXPECT_EQ(streamer.loaded_count(), 9u);

    for (int32_t x = -1; x <= 1; ++x) {
        for (int32_t z = -1; z <= 1; ++z) {
            EXPECT_TRUE(streamer.is_loaded(ChunkCoord(x, z)));
        }
    }
    EXPECT_FALSE(streamer.is_loaded(ChunkCoord(2, 0)));
    EXPECT_FALSE(streamer.is_loaded(ChunkCoord(-1, -2)));

    // Every column of the loaded area carries terrain
    EXPECT_NE(grid_.get(BlockPos(-16, 0, -16)), BlockKind::Empty);
    EXPECT_NE(grid_.get(BlockPos(31, 0, 31)), BlockKind::Empty);
    EXPECT_EQ(grid_.get(BlockPos(32, 0, 0)), BlockKind::Empty);
}

TEST_F(ChunkStreamerTest, RepeatedCallIsNoOp) {
    ChunkStreamer streamer(generator_);
    streamer.ensure_loaded(grid_, ChunkCoord(0, 0), 1);

    const size_t size = grid_.size();
    const uint64_t revision = grid_.revision();

    EXPECT_EQ(streamer.ensure_loaded(grid_, ChunkCoord(0, 0), 1), 0u);
    EXPECT_EQ(streamer.loaded_count(), 9u);
    EXPECT_EQ(grid_.size(), size);
    EXPECT_EQ(grid_.revision(), revision);
}

TEST_F(ChunkStreamerTest, EditsInLoadedChunksSurvive) {
    ChunkStreamer streamer(generator_);
    streamer.ensure_loaded(grid_, ChunkCoord(0, 0), 1);

    grid_.set(BlockPos(0, 0, 0), BlockKind::Empty);
    streamer.ensure_loaded(grid_, ChunkCoord(0, 0), 1);

    EXPECT_EQ(grid_.get(BlockPos(0, 0, 0)), BlockKind::Empty);
}

TEST_F(ChunkStreamerTest, RadiusZeroLoadsOneChunk) {
    ChunkStreamer streamer(generator_);
    EXPECT_EQ(streamer.ensure_loaded(grid_, ChunkCoord(4, -7), 0), 1u);
    EXPECT_TRUE(streamer.is_loaded(ChunkCoord(4, -7)));
}

TEST_F(ChunkStreamerTest, NegativeRadiusDoesNothing) {
    ChunkStreamer streamer(generator_);
    EXPECT_EQ(streamer.ensure_loaded(grid_, ChunkCoord(0, 0), -1), 0u);
    EXPECT_EQ(streamer.loaded_count(), 0u);
    EXPECT_TRUE(grid_.empty());
}

TEST_F(ChunkStreamerTest, LoadAroundViewpointUsesContainingChunk) {
    ChunkStreamer streamer(generator_);
    EXPECT_EQ(streamer.ensure_loaded_around(grid_, WorldPos(-0.5, 10.0, 17.0), 0), 1u);
    EXPECT_TRUE(streamer.is_loaded(ChunkCoord(-1, 1)));
}

TEST_F(ChunkStreamerTest, MovingOneChunkLoadsOneNewRow) {
    ChunkStreamer streamer(generator_);
    streamer.ensure_loaded(grid_, ChunkCoord(0, 0), 1);

    EXPECT_EQ(streamer.ensure_loaded(grid_, ChunkCoord(1, 0), 1), 3u);
    EXPECT_EQ(streamer.loaded_count(), 12u);
    EXPECT_TRUE(streamer.is_loaded(ChunkCoord(2, -1)));
    EXPECT_TRUE(streamer.is_loaded(ChunkCoord(2, 1)));
}

TEST_F(ChunkStreamerTest, ChunksAreNeverUnloaded) {
    ChunkStreamer streamer(generator_);
    streamer.ensure_loaded(grid_, ChunkCoord(0, 0), 1);
    streamer.ensure_loaded(grid_, ChunkCoord(10, 10), 1);

    EXPECT_EQ(streamer.loaded_count(), 18u);
    EXPECT_TRUE(streamer.is_loaded(ChunkCoord(0, 0)));

    auto chunks = streamer.loaded_chunks();
    EXPECT_EQ(chunks.size(), 18u);
    EXPECT_NE(std::find(chunks.begin(), chunks.end(), ChunkCoord(11, 9)), chunks.end());
}

TEST_F(ChunkStreamerTest, SquareIsClippedAtDomainEdge) {
    ChunkStreamer streamer(generator_);

    // Only x = MAX - 1 and MAX exist to the right of the range
    EXPECT_EQ(streamer.ensure_loaded(grid_, ChunkCoord(MAX_CHUNK_COORD, 0), 1), 6u);
    EXPECT_TRUE(streamer.is_loaded(ChunkCoord(MAX_CHUNK_COORD, 1)));
    EXPECT_TRUE(streamer.is_loaded(ChunkCoord(MAX_CHUNK_COORD - 1, -1)));

    EXPECT_EQ(streamer.ensure_loaded(grid_, ChunkCoord(MAX_CHUNK_COORD, 0), 1), 0u);
    EXPECT_EQ(streamer.loaded_count(), 6u);

    for (const auto& [pos, kind] : grid_) {
        EXPECT_GE(pos.x, (MAX_CHUNK_COORD - 1) * CHUNK_SIZE);
    }
}

TEST_F(ChunkStreamerTest, CenterPastDomainIsRejected) {
    ChunkStreamer streamer(generator_);

    EXPECT_EQ(streamer.ensure_loaded(grid_, ChunkCoord(MAX_CHUNK_COORD + 1, 0), 0), 0u);
    EXPECT_EQ(streamer.ensure_loaded(grid_, ChunkCoord(0, std::numeric_limits<int32_t>::min()), 2), 0u);
    EXPECT_EQ(streamer.loaded_count(), 0u);
    EXPECT_TRUE(grid_.empty());
}

TEST_F(ChunkStreamerTest, FarViewpointIsRejected) {
    ChunkStreamer streamer(generator_);

    EXPECT_EQ(streamer.ensure_loaded_around(grid_, WorldPos(2.2e9, 10.0, 0.0), 1), 0u);
    EXPECT_EQ(streamer.loaded_count(), 0u);
    EXPECT_TRUE(grid_.empty());
}

}  // namespace
}  // namespace voxelcore::world
