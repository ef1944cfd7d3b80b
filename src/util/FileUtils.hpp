/**
 * @file FileUtils.hpp
 * @brief Filesystem helpers: XDG directories, path expansion, formatting.
 */

#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include "Types.hpp"

namespace vb {

namespace fs = std::filesystem;

namespace file {

fs::path configDir();
fs::path cacheDir();
fs::path videosDir();

bool ensureDir(const fs::path& dir);

// "~/x" -> "$HOME/x"; anything else is returned unchanged
fs::path expandHome(std::string_view path);

// Replaces {date} and {time} with the local wall-clock values
std::string expandFilenamePattern(std::string_view pattern);

// mm:ss, or hh:mm:ss from one hour on
std::string formatDuration(Duration d);

} // namespace file
} // namespace vb
