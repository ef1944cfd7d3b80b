#include "ConfigParsers.hpp"
#include <algorithm>
#include "util/FileUtils.hpp"

namespace vb {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>()) {
                if constexpr (std::is_unsigned_v<T>) {
                    if (*val < 0)
                        return 0;
                }
                return static_cast<T>(*val);
            }
        }
    }
    return defaultVal;
}
} // namespace

bool ConfigParsers::parseDebug(const toml::table& tbl, bool fallback) {
    if (auto gen = tbl["general"].as_table())
        return get(*gen, "debug", fallback);
    return fallback;
}

void ConfigParsers::parseEngine(const toml::table& tbl, EngineConfig& cfg) {
    if (auto engine = tbl["engine"].as_table()) {
        auto path = get(*engine, "binary_path", std::string("ffmpeg"));
        cfg.binaryPath = path.empty() ? std::string("ffmpeg")
                                      : file::expandHome(path).string();
        cfg.politeStopTimeoutMs = std::clamp(
                get(*engine, "polite_stop_timeout_ms", 1500u), 100u, 10000u);
        cfg.settleDelayMs =
                std::clamp(get(*engine, "settle_delay_ms", 300u), 0u, 5000u);
        cfg.probeTimeoutMs = std::clamp(
                get(*engine, "probe_timeout_ms", 5000u), 500u, 30000u);
        cfg.preferHardware = get(*engine, "prefer_hardware", true);
        cfg.validateMode = get(*engine, "validate_mode", false);
        cfg.lowCompressionFallback =
                get(*engine, "low_compression_fallback", false);
    }
}

void ConfigParsers::parseSession(const toml::table& tbl, SessionSettings& cfg) {
    if (auto session = tbl["session"].as_table()) {
        cfg.maxDurationSeconds =
                std::min(get(*session, "max_duration_s", 60u), 24u * 3600u);
        cfg.countdownSeconds =
                std::clamp(get(*session, "countdown_s", 3u), 0u, 10u);
        auto outDir =
                get(*session, "output_directory", std::string("~/Videos/Booth"));
        cfg.outputDirectory = file::expandHome(outDir);
        cfg.filenamePattern = get(*session,
                                  "filename_pattern",
                                  std::string("recording_{date}_{time}"));
        if (cfg.filenamePattern.empty())
            cfg.filenamePattern = "recording_{date}_{time}";
        cfg.restorePreviewAfterRecording =
                get(*session, "restore_preview_after_recording", true);
    }
}

void ConfigParsers::parseCapture(const toml::table& tbl, CaptureConfig& cfg) {
    if (auto capture = tbl["capture"].as_table()) {
        cfg.defaultPreset = get(*capture, "default_preset", std::string("HD"));
        cfg.defaultFps = std::clamp(get(*capture, "default_fps", 30u), 1u, 240u);
    }
}

void ConfigParsers::parseUI(const toml::table& tbl, UIConfig& cfg) {
    if (auto uiTbl = tbl["ui"].as_table()) {
        cfg.showLog = get(*uiTbl, "show_log", true);
    }
}

toml::table ConfigParsers::serialize(const EngineConfig& engine,
                                     const SessionSettings& session,
                                     const CaptureConfig& capture,
                                     const UIConfig& ui,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});

    root.insert("engine",
                toml::table{
                        {"binary_path", engine.binaryPath},
                        {"polite_stop_timeout_ms",
                         (i64)engine.politeStopTimeoutMs},
                        {"settle_delay_ms", (i64)engine.settleDelayMs},
                        {"probe_timeout_ms", (i64)engine.probeTimeoutMs},
                        {"prefer_hardware", engine.preferHardware},
                        {"validate_mode", engine.validateMode},
                        {"low_compression_fallback",
                         engine.lowCompressionFallback}});

    root.insert("session",
                toml::table{{"max_duration_s", (i64)session.maxDurationSeconds},
                            {"countdown_s", (i64)session.countdownSeconds},
                            {"output_directory",
                             session.outputDirectory.string()},
                            {"filename_pattern", session.filenamePattern},
                            {"restore_preview_after_recording",
                             session.restorePreviewAfterRecording}});

    root.insert("capture",
                toml::table{{"default_preset", capture.defaultPreset},
                            {"default_fps", (i64)capture.defaultFps}});

    root.insert("ui", toml::table{{"show_log", ui.showLog}});

    return root;
}

} // namespace vb
