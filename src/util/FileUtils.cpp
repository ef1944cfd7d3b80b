#include "FileUtils.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <spdlog/fmt/fmt.h>

namespace vb::file {

namespace {

constexpr const char* kAppDirName = "booth-recorder";

fs::path homeDir() {
    if (const char* home = std::getenv("HOME"))
        return fs::path(home);
    return fs::temp_directory_path();
}

fs::path xdgDir(const char* envName, const fs::path& fallback) {
    if (const char* value = std::getenv(envName); value && *value)
        return fs::path(value);
    return homeDir() / fallback;
}

void replaceAll(std::string& text, std::string_view token, const std::string& value) {
    for (auto pos = text.find(token); pos != std::string::npos;
         pos = text.find(token, pos + value.size())) {
        text.replace(pos, token.size(), value);
    }
}

} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config") / kAppDirName;
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache") / kAppDirName;
}

fs::path videosDir() {
    return homeDir() / "Videos" / "Booth";
}

bool ensureDir(const fs::path& dir) {
    if (dir.empty())
        return true;
    std::error_code ec;
    if (fs::exists(dir, ec))
        return fs::is_directory(dir, ec);
    return fs::create_directories(dir, ec) && !ec;
}

fs::path expandHome(std::string_view path) {
    std::string p(path);
    if (p == "~")
        return homeDir();
    if (p.starts_with("~/"))
        return homeDir() / p.substr(2);
    return fs::path(p);
}

std::string expandFilenamePattern(std::string_view pattern) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    char date[16];
    char clock[16];
    std::strftime(date, sizeof(date), "%Y%m%d", &tm);
    std::strftime(clock, sizeof(clock), "%H%M%S", &tm);

    std::string out(pattern);
    replaceAll(out, "{date}", date);
    replaceAll(out, "{time}", clock);
    return out;
}

std::string formatDuration(Duration d) {
    auto total = std::chrono::duration_cast<std::chrono::seconds>(d).count();
    if (total < 0)
        total = 0;
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;
    if (hours > 0)
        return fmt::format("{:02}:{:02}:{:02}", hours, minutes, seconds);
    return fmt::format("{:02}:{:02}", minutes, seconds);
}

} // namespace vb::file
