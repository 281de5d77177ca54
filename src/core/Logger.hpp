/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * One thread-safe logger shared by capture threads, the coordinator worker
 * and the application shell. Console output goes to stderr because stdout
 * carries the interactive command output. A rotating file under the cache
 * directory keeps the last few sessions.
 *
 * @section Dependencies
 * - spdlog
 *
 * @section Patterns
 * - Wrapper: Simplifies spdlog usage.
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string_view>

namespace mc {

class Logger {
public:
    static void init(std::string_view appName = "meetcap", bool debug = false);
    static void setDebug(bool debug);
    static void shutdown();

    // Initializes with defaults on first use
    static std::shared_ptr<spdlog::logger>& get();

    // Empty when the file sink could not be created
    static const std::filesystem::path& logFile() {
        return logFile_;
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::filesystem::path logFile_;
};

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(mc::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(mc::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(mc::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(mc::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(mc::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(mc::Logger::get(), __VA_ARGS__)

} // namespace mc
