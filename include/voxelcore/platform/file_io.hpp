// VoxelCore Platform Layer
// file_io.hpp - File system helpers for configuration and logs

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace voxelcore::platform {

namespace fs = std::filesystem;

// Static utility class for file system operations
class FileSystem {
public:
    // ~/.local/share/VoxelCore on Linux, Application Support on macOS, LOCALAPPDATA on Windows
    static fs::path get_user_data_directory();
    static fs::path get_temp_directory();

    static std::optional<std::string> read_text(const fs::path& path);
    static bool write_text(const fs::path& path, std::string_view content);

    static bool create_directories(const fs::path& path);
    static bool exists(const fs::path& path);
    static bool remove_all(const fs::path& path);

private:
    FileSystem() = delete;
};

}  // namespace voxelcore::platform
