// Creative2D Engine Core
// logger.hpp - Category-aware logging on top of spdlog

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace creative2d::core {

// Log levels matching spdlog for easy conversion
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// Accepts "trace", "debug", "info", "warn"/"warning", "error", "critical", "off" (case-insensitive)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);
[[nodiscard]] const char* to_string(LogLevel level);

struct LoggerConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    bool file_output = true;                   // Rotating file sink next to the user data
    std::filesystem::path log_directory;       // Empty = <user data dir>/logs
    std::string log_filename = "creative2d.log";
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
    bool include_timestamps = true;
};

// Static logging facade. Messages are formatted only when the category passes its level.
class Logger {
public:
    static void initialize(const LoggerConfig& config = {});
    static void shutdown();
    [[nodiscard]] static bool is_initialized();

    static void set_category_level(std::string_view category, LogLevel level);
    [[nodiscard]] static LogLevel get_category_level(std::string_view category);

    static void set_global_level(LogLevel level);
    [[nodiscard]] static LogLevel get_global_level();

    static void flush();

    template<typename... Args>
    static void trace(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Trace, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void debug(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Debug, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Info, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Warn, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Error, category, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void critical(std::string_view category, fmt::format_string<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::Critical, category, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = delete;

    template<typename... Args>
    static void log_impl(LogLevel level, std::string_view category, fmt::format_string<Args...> fmt,
                         Args&&... args) {
        if (!should_log(level, category)) {
            return;
        }
        log_message(level, category, fmt::format(fmt, std::forward<Args>(args)...));
    }

    [[nodiscard]] static bool should_log(LogLevel level, std::string_view category);
    static void log_message(LogLevel level, std::string_view category, std::string_view message);
};

namespace log_category {
    inline constexpr const char* ENGINE = "engine";
    inline constexpr const char* PHYSICS = "physics";
    inline constexpr const char* COLLISION = "collision";
    inline constexpr const char* FLUID = "fluid";
    inline constexpr const char* CONFIG = "config";
}  // namespace log_category

}  // namespace creative2d::core

#define CREATIVE2D_LOG_TRACE(category, ...) ::creative2d::core::Logger::trace(category, __VA_ARGS__)

#define CREATIVE2D_LOG_DEBUG(category, ...) ::creative2d::core::Logger::debug(category, __VA_ARGS__)

#define CREATIVE2D_LOG_INFO(category, ...) ::creative2d::core::Logger::info(category, __VA_ARGS__)

#define CREATIVE2D_LOG_WARN(category, ...) ::creative2d::core::Logger::warn(category, __VA_ARGS__)

#define CREATIVE2D_LOG_ERROR(category, ...) ::creative2d::core::Logger::error(category, __VA_ARGS__)

#define CREATIVE2D_LOG_CRITICAL(category, ...) ::creative2d::core::Logger::critical(category, __VA_ARGS__)
