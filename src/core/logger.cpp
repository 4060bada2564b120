// VoxelCore Engine Core
// logger.cpp - Logging system implementation

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <unordered_map>
#include <voxelcore/core/logger.hpp>
#include <voxelcore/platform/file_io.hpp>

namespace voxelcore::core {

namespace {

struct LoggerState {
    bool initialized = false;
    LogLevel global_level = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> category_levels;
    std::shared_ptr<spdlog::logger> console_logger;
    std::shared_ptr<spdlog::logger> file_logger;
    std::mutex mutex;
};

LoggerState& get_state() {
    static LoggerState state;
    return state;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
        default:
            return spdlog::level::info;
    }
}

std::shared_ptr<spdlog::logger> make_file_logger(const LoggerConfig& config, std::filesystem::path& log_path) {
    std::filesystem::path log_dir = config.log_directory;
    if (log_dir.empty()) {
        log_dir = platform::FileSystem::get_user_data_directory() / "logs";
    }

    if (!platform::FileSystem::exists(log_dir) && !platform::FileSystem::create_directories(log_dir)) {
        return nullptr;
    }

    log_path = log_dir / config.log_filename;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_path.string(), config.max_file_size,
                                                                            config.max_files);
    file_sink->set_level(to_spdlog_level(config.file_level));
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    auto logger = std::make_shared<spdlog::logger>("file", file_sink);
    logger->set_level(spdlog::level::trace);  // Let sink filter
    logger->flush_on(spdlog::level::info);
    return logger;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") {
        return LogLevel::Trace;
    }
    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "error") {
        return LogLevel::Error;
    }
    if (lowered == "critical") {
        return LogLevel::Critical;
    }
    if (lowered == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

void Logger::initialize(const LoggerConfig& config) {
    auto& state = get_state();
    std::filesystem::path log_path;
    bool file_failed = false;

    {
        std::lock_guard lock(state.mutex);

        if (state.initialized) {
            return;
        }

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(config.console_level));
        if (config.include_timestamps) {
            console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        } else {
            console_sink->set_pattern("[%^%l%$] %v");
        }

        state.console_logger = std::make_shared<spdlog::logger>("console", console_sink);
        state.console_logger->set_level(spdlog::level::trace);  // Let sink filter

        if (config.enable_file) {
            try {
                state.file_logger = make_file_logger(config, log_path);
                file_failed = state.file_logger == nullptr;
            } catch (const spdlog::spdlog_ex& ex) {
                // Console logging keeps working without the file sink
                spdlog::error("Log file sink unavailable: {}", ex.what());
                state.file_logger.reset();
                file_failed = true;
            }
        }

        state.global_level = config.console_level;
        state.initialized = true;
    }

    // Logged after the lock is released
    log(LogLevel::Info, log_category::ENGINE, "Logger initialized");
    if (state.file_logger) {
        log(LogLevel::Info, log_category::ENGINE, "Log file: {}", log_path.string());
    } else if (file_failed) {
        log(LogLevel::Warn, log_category::ENGINE, "File logging disabled, console only");
    }
}

void Logger::shutdown() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return;
    }

    if (state.console_logger) {
        state.console_logger->flush();
    }
    if (state.file_logger) {
        state.file_logger->flush();
    }

    state.console_logger.reset();
    state.file_logger.reset();
    state.category_levels.clear();
    state.initialized = false;
}

bool Logger::is_initialized() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.initialized;
}

void Logger::set_category_level(std::string_view category, LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.category_levels[std::string(category)] = level;
}

LogLevel Logger::get_category_level(std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    auto it = state.category_levels.find(std::string(category));
    if (it != state.category_levels.end()) {
        return it->second;
    }
    return state.global_level;
}

void Logger::set_global_level(LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.global_level = level;

    if (state.console_logger) {
        for (auto& sink : state.console_logger->sinks()) {
            sink->set_level(to_spdlog_level(level));
        }
    }
}

LogLevel Logger::get_global_level() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.global_level;
}

void Logger::flush() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (state.console_logger) {
        state.console_logger->flush();
    }
    if (state.file_logger) {
        state.file_logger->flush();
    }
}

bool Logger::should_log(LogLevel level, std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        // spdlog's default logger applies its own level
        return true;
    }

    LogLevel category_level = state.global_level;
    auto it = state.category_levels.find(std::string(category));
    if (it != state.category_levels.end()) {
        category_level = it->second;
    }

    return static_cast<int>(level) >= static_cast<int>(category_level);
}

void Logger::log_message(LogLevel level, std::string_view category, std::string_view message) {
    auto& state = get_state();
    auto spdlog_level = to_spdlog_level(level);

    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        spdlog::log(spdlog_level, "[{}] {}", category, message);
        return;
    }

    if (state.console_logger) {
        state.console_logger->log(spdlog_level, "[{}] {}", category, message);
    }
    if (state.file_logger) {
        state.file_logger->log(spdlog_level, "[{}] {}", category, message);
    }
}

}  // namespace voxelcore::core
