/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * This file defines the Logger class which initializes and manages the
 * spdlog instance shared by the UI thread, the session control thread and
 * the capture callbacks. It provides macros for convenient logging with
 * source location information.
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

namespace vb {

class Logger {
public:
    static void init(std::string_view appName = "booth-recorder",
                     bool debug = false);
    static void shutdown();
    static void setDebug(bool debug);

    static std::shared_ptr<spdlog::logger>& get();

    // Extra sinks, e.g. the UI log pane. The sink list is not guarded
    // against concurrent logging: call these before worker threads start and
    // after they stop.
    static void addSink(spdlog::sink_ptr sink);
    static void removeSink(const spdlog::sink_ptr& sink);

    // Empty until init() managed to open the rotating file sink
    static const std::filesystem::path& logFile() {
        return logFile_;
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::filesystem::path logFile_;
};

// Macros for convenient logging with source location
// Use these instead of calling Logger::get() directly

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(vb::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(vb::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(vb::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(vb::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(vb::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(vb::Logger::get(), __VA_ARGS__)

} // namespace vb
