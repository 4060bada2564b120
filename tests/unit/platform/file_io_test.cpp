// VoxelCore Platform Tests
// file_io_test.cpp - File helper unit tests

#include <gtest/gtest.h>
#include <voxelcore/platform/file_io.hpp>

using namespace voxelcore::platform;

class FileIOTest : public ::testing::Test {
protected:
    fs::path test_dir_;
    fs::path test_file_;

    void SetUp() override {
        test_dir_ = FileSystem::get_temp_directory() / "voxelcore_file_test";
        FileSystem::create_directories(test_dir_);
        test_file_ = test_dir_ / "test_file.txt";
    }

    void TearDown() override { FileSystem::remove_all(test_dir_); }
};

TEST_F(FileIOTest, UserDataDirectoryIsNamedAfterProject) {
    auto dir = FileSystem::get_user_data_directory();
    EXPECT_FALSE(dir.empty());
    EXPECT_EQ(dir.filename(), "VoxelCore");
}

TEST_F(FileIOTest, CreateDirectories) {
    auto nested = test_dir_ / "a" / "b" / "c";
    EXPECT_TRUE(FileSystem::create_directories(nested));
    EXPECT_TRUE(FileSystem::exists(nested));
    // Existing directory is not an error
    EXPECT_TRUE(FileSystem::create_directories(nested));
}

TEST_F(FileIOTest, WriteAndReadText) {
    std::string content = "{\"world\": {}}\nsecond line\n";

    EXPECT_TRUE(FileSystem::write_text(test_file_, content));
    EXPECT_TRUE(FileSystem::exists(test_file_));

    auto result = FileSystem::read_text(test_file_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, content);
}

TEST_F(FileIOTest, WriteCreatesParentDirectories) {
    auto path = test_dir_ / "deep" / "dir" / "file.txt";
    EXPECT_TRUE(FileSystem::write_text(path, "x"));
    EXPECT_TRUE(FileSystem::exists(path));
}

TEST_F(FileIOTest, ReadNonexistentFile) {
    auto result = FileSystem::read_text(test_dir_ / "nonexistent.txt");
    EXPECT_FALSE(result.has_value());
}
