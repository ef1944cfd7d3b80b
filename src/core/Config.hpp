/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * This file defines the Config class which provides a thread-safe singleton
 * for accessing and modifying application preferences. It delegates parsing
 * to ConfigParsers and file I/O to ConfigLoader. Sessions never write it.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 *
 * @section Patterns
 * - Singleton: Global access point for configuration.
 * - Thread-Safe: Mutex-protected load/save.
 */

#pragma once
#include <memory>
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace vb {

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    // Section accessors (const)
    const EngineConfig& engine() const {
        return engine_;
    }
    const SessionSettings& session() const {
        return session_;
    }
    const CaptureConfig& capture() const {
        return capture_;
    }
    const UIConfig& ui() const {
        return ui_;
    }

    // Section accessors (mutable)
    EngineConfig& engine() {
        markDirty();
        return engine_;
    }
    SessionSettings& session() {
        markDirty();
        return session_;
    }
    CaptureConfig& capture() {
        markDirty();
        return capture_;
    }
    UIConfig& ui() {
        markDirty();
        return ui_;
    }

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config() = default;
    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    EngineConfig engine_;
    SessionSettings session_;
    CaptureConfig capture_;
    UIConfig ui_;

    mutable std::mutex mutex_;
};

#define CONFIG vb::Config::instance()

} // namespace vb
