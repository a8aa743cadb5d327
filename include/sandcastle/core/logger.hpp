// SandCastle Core
// logger.hpp - Category logging over spdlog with console and rotating file sinks

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace sandcastle::core {

// Same order and values as spdlog::level::level_enum
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    std::filesystem::path log_directory;  // Empty = console only
    std::string log_filename = "sandcastle.log";
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
};

// Static logging interface
class Logger {
public:
    // Initialize/shutdown (call once at startup/exit)
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    // Category-based level control
    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    // Global level (default for unconfigured categories)
    static void set_global_level(LogLevel level);

    // Format and emit one record; formatting is skipped when the level is filtered
    template<typename... Args>
    static void log(LogLevel level, std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        log_message(level, category, fmt::format(fmt, std::forward<Args>(args)...));
    }

private:
    Logger() = delete;  // Static-only class

    [[nodiscard]] static bool should_log(LogLevel level, std::string_view category);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel fallback = LogLevel::Info);

// Pre-defined log categories for consistency
namespace log_category {
    inline constexpr const char* ENGINE = "engine";
    inline constexpr const char* PHYSICS = "physics";
    inline constexpr const char* GAME = "game";
    inline constexpr const char* SCORING = "scoring";
    inline constexpr const char* PERSISTENCE = "persistence";
    inline constexpr const char* CONFIG = "config";
}  // namespace log_category

}  // namespace sandcastle::core

#define SANDCASTLE_LOG_TRACE(category, ...) \
    ::sandcastle::core::Logger::log(::sandcastle::core::LogLevel::Trace, category, __VA_ARGS__)
#define SANDCASTLE_LOG_DEBUG(category, ...) \
    ::sandcastle::core::Logger::log(::sandcastle::core::LogLevel::Debug, category, __VA_ARGS__)
#define SANDCASTLE_LOG_INFO(category, ...) \
    ::sandcastle::core::Logger::log(::sandcastle::core::LogLevel::Info, category, __VA_ARGS__)
#define SANDCASTLE_LOG_WARN(category, ...) \
    ::sandcastle::core::Logger::log(::sandcastle::core::LogLevel::Warn, category, __VA_ARGS__)
#define SANDCASTLE_LOG_ERROR(category, ...) \
    ::sandcastle::core::Logger::log(::sandcastle::core::LogLevel::Error, category, __VA_ARGS__)
#define SANDCASTLE_LOG_CRITICAL(category, ...) \
    ::sandcastle::core::Logger::log(::sandcastle::core::LogLevel::Critical, category, __VA_ARGS__)
