/**
 * @file ConfigLoader.hpp
 * @brief Configuration file I/O.
 *
 * This file defines the ConfigLoader class which handles reading and writing
 * the preferences file from/to disk. Writes go through a temp file and a
 * rename so a crash never leaves a truncated config behind.
 *
 * @section Dependencies
 * - Config
 * - std::filesystem
 */

#pragma once
#include <filesystem>
#include "util/Result.hpp"

namespace vb {

class Config;

class ConfigLoader {
public:
    static Result<void> load(Config& config, const std::filesystem::path& path);
    static Result<void> save(const Config& config,
                             const std::filesystem::path& path);
    static Result<void> loadDefault(Config& config);
};

} // namespace vb
