/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * This file defines the POD (Plain Old Data) structs used to hold application
 * preferences. It is separated from the logic classes to keep headers lean and
 * avoid circular dependencies. None of these values describe a session; the
 * per-attempt SessionConfig is built from them by the UI.
 */

#pragma once
#include <filesystem>
#include <string>
#include "util/Types.hpp"

namespace vb {

namespace fs = std::filesystem;

// External encoding engine
struct EngineConfig {
    std::string binaryPath{"ffmpeg"};
    u32 politeStopTimeoutMs{1500};
    u32 settleDelayMs{300};
    u32 probeTimeoutMs{5000};
    bool preferHardware{true};
    bool validateMode{false};
    bool lowCompressionFallback{false};
};

// Recording session behaviour
struct SessionSettings {
    u32 maxDurationSeconds{60}; // 0 = unlimited
    u32 countdownSeconds{3};
    fs::path outputDirectory;
    std::string filenamePattern{"recording_{date}_{time}"};
    bool restorePreviewAfterRecording{true};
};

// Capture defaults
struct CaptureConfig {
    std::string defaultPreset{"HD"};
    u32 defaultFps{30};
};

// UI configuration
struct UIConfig {
    bool showLog{true};
};

} // namespace vb
