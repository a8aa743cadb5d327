// SandCastle Core
// logger.cpp - Category logging over one multi-sink spdlog logger

#include <sandcastle/core/logger.hpp>
#include <sandcastle/platform/file_io.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace sandcastle::core {

namespace {

struct LoggerState {
    std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger;  // Null until initialize()
    spdlog::sink_ptr console_sink;
    LogLevel global_level = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> category_levels;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

// LogLevel mirrors spdlog's level order
spdlog::level::level_enum to_spdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(static_cast<int>(level));
}

LogLevel level_for(const LoggerState& s, std::string_view category) {
    auto it = s.category_levels.find(std::string(category));
    return it != s.category_levels.end() ? it->second : s.global_level;
}

spdlog::sink_ptr make_console_sink(LogLevel level) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_level(to_spdlog(level));
    sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    return sink;
}

}  // namespace

void Logger::initialize(const LoggerConfig& config) {
    auto& s = state();
    std::filesystem::path log_path;
    std::string sink_error;

    {
        std::lock_guard lock(s.mutex);
        if (s.logger) {
            return;
        }

        s.console_sink = make_console_sink(config.console_level);
        std::vector<spdlog::sink_ptr> sinks{s.console_sink};

        if (!config.log_directory.empty() && !platform::FileSystem::create_directories(config.log_directory)) {
            sink_error = fmt::format("cannot create {}", config.log_directory.string());
        } else if (!config.log_directory.empty()) {
            try {
                log_path = config.log_directory / config.log_filename;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_path.string(), config.max_file_size, config.max_files);
                file_sink->set_level(to_spdlog(config.file_level));
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(std::move(file_sink));
            } catch (const spdlog::spdlog_ex& ex) {
                // Keep running on the console alone
                sink_error = ex.what();
                log_path.clear();
            }
        }

        s.logger = std::make_shared<spdlog::logger>("sandcastle", sinks.begin(), sinks.end());
        s.logger->set_level(spdlog::level::trace);  // Sinks filter
        s.logger->flush_on(spdlog::level::warn);
        s.global_level = config.console_level;
    }

    if (!sink_error.empty()) {
        SANDCASTLE_LOG_ERROR(log_category::ENGINE, "Log file unavailable, console only: {}", sink_error);
    } else if (!log_path.empty()) {
        SANDCASTLE_LOG_INFO(log_category::ENGINE, "Logging to {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.logger) {
        return;
    }

    s.logger->flush();
    s.logger.reset();
    s.console_sink.reset();
    s.category_levels.clear();
}

bool Logger::is_initialized() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.logger != nullptr;
}

void Logger::set_category_level(std::string_view category, LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.category_levels[std::string(category)] = level;
}

LogLevel Logger::get_category_level(std::string_view category) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return level_for(s, category);
}

void Logger::set_global_level(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.global_level = level;
    if (s.console_sink) {
        s.console_sink->set_level(to_spdlog(level));
    }
}

bool Logger::should_log(LogLevel level, std::string_view category) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.logger) {
        // spdlog's default logger applies its own level
        return true;
    }
    return static_cast<int>(level) >= static_cast<int>(level_for(s, category));
}

void Logger::log_message(LogLevel level, std::string_view category, std::string_view message) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.logger) {
        s.logger->log(to_spdlog(level), "[{}] {}", category, message);
    } else {
        spdlog::log(to_spdlog(level), "[{}] {}", category, message);
    }
}

LogLevel parse_log_level(std::string_view name, LogLevel fallback) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // from_str maps unknown names to off
    auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off && lowered != "off") {
        return fallback;
    }
    return static_cast<LogLevel>(static_cast<int>(level));
}

}  // namespace sandcastle::core
