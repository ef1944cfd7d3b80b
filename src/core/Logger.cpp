#include "Logger.hpp"
#include <algorithm>
#include <mutex>
#include "util/FileUtils.hpp"

namespace vb {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::filesystem::path Logger::logFile_;

namespace {
std::mutex initMutex;

spdlog::level::level_enum levelFor(bool debug) {
    return debug ? spdlog::level::debug : spdlog::level::info;
}
} // namespace

void Logger::init(std::string_view appName, bool debug) {
    std::lock_guard lock(initMutex);
    const std::string name(appName);
    try {
        spdlog::drop(name);

        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("%^[%H:%M:%S.%e] [%l]%$ [%t] %v");
        sinks.push_back(console);

        auto logDir = file::cacheDir() / "logs";
        file::ensureDir(logDir);

        logFile_ = logDir / (name + ".log");
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile_.string(), 1024 * 1024 * 5, 3);
        rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
        sinks.push_back(rotating);

        logger_ = std::make_shared<spdlog::logger>(
                name, sinks.begin(), sinks.end());

        logger_->set_level(levelFor(debug));
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);
        spdlog::set_default_logger(logger_);
        spdlog::flush_every(std::chrono::seconds(2));

        LOG_INFO("Logger initialized. Debug mode: {}", debug);
        LOG_DEBUG("Log file: {}", logFile_.string());

    } catch (const spdlog::spdlog_ex& ex) {
        spdlog::drop(name);
        logFile_.clear();
        logger_ = spdlog::stdout_color_mt(name);
        logger_->set_level(levelFor(debug));
        logger_->warn("Failed to create file logger: {}", ex.what());
    }
}

void Logger::addSink(spdlog::sink_ptr sink) {
    auto& logger = get();
    std::lock_guard lock(initMutex);
    logger->sinks().push_back(std::move(sink));
}

void Logger::removeSink(const spdlog::sink_ptr& sink) {
    std::lock_guard lock(initMutex);
    if (!logger_)
        return;
    auto& sinks = logger_->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
}

void Logger::setDebug(bool debug) {
    get()->set_level(levelFor(debug));
}

void Logger::shutdown() {
    std::lock_guard lock(initMutex);
    if (logger_) {
        logger_->flush();
    }
    logger_.reset();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_) {
        init();
    }
    return logger_;
}

} // namespace vb
