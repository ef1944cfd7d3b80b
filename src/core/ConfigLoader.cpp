#include "ConfigLoader.hpp"
#include <fstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace vb {

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());

        config.debug_ = ConfigParsers::parseDebug(tbl, config.debug_);
        ConfigParsers::parseEngine(tbl, config.engine_);
        ConfigParsers::parseSession(tbl, config.session_);
        ConfigParsers::parseCapture(tbl, config.capture_);
        ConfigParsers::parseUI(tbl, config.ui_);
        if (config.session_.outputDirectory.empty())
            config.session_.outputDirectory = file::videosDir();

        config.markClean();
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(ErrorCode::ConfigError,
                                 std::string("Config parse error: ") +
                                         err.what());
    }
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto configDir = file::configDir();
    auto defaultPath = configDir / "config.toml";
    config.configPath_ = defaultPath;

    if (fs::exists(defaultPath)) {
        return load(config, defaultPath);
    }

    fs::path systemDefault = "/usr/share/booth-recorder/config/default.toml";
    if (fs::exists(systemDefault)) {
        file::ensureDir(configDir);
        std::error_code ec;
        fs::copy_file(systemDefault, defaultPath, ec);
        if (!ec) {
            return load(config, defaultPath);
        }
        LOG_WARN("Could not copy {}: {}", systemDefault.string(), ec.message());
    }

    LOG_WARN("No config file found, using built-in defaults");
    config.session_.outputDirectory = file::videosDir();
    if (!file::ensureDir(configDir)) {
        LOG_WARN("Cannot create config directory {}", configDir.string());
        return Result<void>::ok();
    }
    if (auto res = save(config, defaultPath); !res) {
        LOG_WARN("{}", res.error().message);
    }
    return Result<void>::ok();
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    try {
        auto tbl = ConfigParsers::serialize(config.engine_,
                                            config.session_,
                                            config.capture_,
                                            config.ui_,
                                            config.debug_);
        fs::path tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath);
            if (!file)
                return Result<void>::err(ErrorCode::ConfigError,
                                         "Failed to open temp config file");
            file << tbl;
        }
        fs::rename(tempPath, path);
        LOG_DEBUG("Config saved to: {}", path.string());
        return Result<void>::ok();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save config: {}", e.what());
        return Result<void>::err(ErrorCode::ConfigError,
                                 std::string("Failed to save config: ") +
                                         e.what());
    }
}

} // namespace vb
