// VoxelCore Engine Core
// logger.hpp - Category-based logging on top of spdlog

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace voxelcore::core {

// Ordered by severity; values line up with spdlog::level::level_enum
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// Accepts the names used in the [debug] log_level setting, any case, plus "warning"
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    bool enable_file = true;
    std::filesystem::path log_directory;  // Empty = <user data dir>/logs
    std::string log_filename = "voxelcore.log";
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
    bool include_timestamps = true;
};

// Process-wide logger shared by every Simulation. Messages carry a category
// ("world", "game", ...) whose level can be tuned on its own.
class Logger {
public:
    // Without initialize() messages go to spdlog's default logger
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    // Applies to categories without their own level, and to the console sink
    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    static void flush();

    // Formats only when the category passes its level
    template<typename... Args>
    static void log(LogLevel level, std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        log_message(level, category, fmt::format(fmt, std::forward<Args>(args)...));
    }

private:
    Logger() = delete;

    [[nodiscard]] static bool should_log(LogLevel level, std::string_view category);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

namespace log_category {
    inline constexpr const char* ENGINE = "engine";  // Startup, shutdown, driver
    inline constexpr const char* WORLD = "world";    // Grid, terrain, streaming
    inline constexpr const char* GAME = "game";      // Selection and interactions
    inline constexpr const char* CONFIG = "config";  // Settings files
}  // namespace log_category

}  // namespace voxelcore::core

#define VOXELCORE_LOG_TRACE(category, ...) \
    ::voxelcore::core::Logger::log(::voxelcore::core::LogLevel::Trace, category, __VA_ARGS__)

#define VOXELCORE_LOG_DEBUG(category, ...) \
    ::voxelcore::core::Logger::log(::voxelcore::core::LogLevel::Debug, category, __VA_ARGS__)

#define VOXELCORE_LOG_INFO(category, ...) \
    ::voxelcore::core::Logger::log(::voxelcore::core::LogLevel::Info, category, __VA_ARGS__)

#define VOXELCORE_LOG_WARN(category, ...) \
    ::voxelcore::core::Logger::log(::voxelcore::core::LogLevel::Warn, category, __VA_ARGS__)

#define VOXELCORE_LOG_ERROR(category, ...) \
    ::voxelcore::core::Logger::log(::voxelcore::core::LogLevel::Error, category, __VA_ARGS__)

#define VOXELCORE_LOG_CRITICAL(category, ...) \
    ::voxelcore::core::Logger::log(::voxelcore::core::LogLevel::Critical, category, __VA_ARGS__)
