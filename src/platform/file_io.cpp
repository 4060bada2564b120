// VoxelCore Platform Layer
// file_io.cpp - File system helpers implementation

#include <voxelcore/platform/file_io.hpp>

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <iterator>

#if defined(VOXELCORE_PLATFORM_LINUX) || defined(VOXELCORE_PLATFORM_MACOS)
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace voxelcore::platform {

namespace {

#if defined(VOXELCORE_PLATFORM_LINUX) || defined(VOXELCORE_PLATFORM_MACOS)
fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw == nullptr) {
            return fs::current_path();
        }
        home = pw->pw_dir;
    }
    return fs::path(home);
}
#endif

}  // namespace

fs::path FileSystem::get_user_data_directory() {
#if defined(VOXELCORE_PLATFORM_MACOS)
    return home_directory() / "Library" / "Application Support" / "VoxelCore";
#elif defined(VOXELCORE_PLATFORM_WINDOWS)
    const char* local_app_data = std::getenv("LOCALAPPDATA");
    if (local_app_data != nullptr) {
        return fs::path(local_app_data) / "VoxelCore";
    }
    return fs::current_path() / "data";
#elif defined(VOXELCORE_PLATFORM_LINUX)
    const char* xdg_data = std::getenv("XDG_DATA_HOME");
    if (xdg_data != nullptr && *xdg_data != '\0') {
        return fs::path(xdg_data) / "VoxelCore";
    }
    return home_directory() / ".local" / "share" / "VoxelCore";
#else
    return fs::current_path() / "data";
#endif
}

fs::path FileSystem::get_temp_directory() {
    return fs::temp_directory_path() / "VoxelCore";
}

std::optional<std::string> FileSystem::read_text(const fs::path& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for reading: {}", path.string());
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        if (!file && !file.eof()) {
            spdlog::warn("Error reading file: {}", path.string());
            return std::nullopt;
        }

        return content;
    } catch (const std::exception& e) {
        spdlog::error("Exception reading file '{}': {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool FileSystem::write_text(const fs::path& path, std::string_view content) {
    try {
        if (path.has_parent_path() && !create_directories(path.parent_path())) {
            return false;
        }

        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::warn("Failed to open file for writing: {}", path.string());
            return false;
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            spdlog::warn("Error writing file: {}", path.string());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Exception writing file '{}': {}", path.string(), e.what());
        return false;
    }
}

bool FileSystem::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        spdlog::warn("Failed to create directory '{}': {}", path.string(), ec.message());
        return false;
    }
    return true;
}

bool FileSystem::exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool FileSystem::remove_all(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

}  // namespace voxelcore::platform
