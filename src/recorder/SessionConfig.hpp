/**
 * @file SessionConfig.hpp
 * @brief Parameters of one recording attempt.
 *
 * Built by the UI from the current selections and the [engine] settings,
 * then copied into the orchestrator; it does not change during the attempt.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "util/Types.hpp"

namespace vb {

namespace fs = std::filesystem;

struct SessionConfig {
    std::string engineBinaryPath{"ffmpeg"};
    std::string cameraId;
    std::optional<std::string> microphoneId; // nullopt = no audio
    fs::path outputPath;
    u32 width{1280};
    u32 height{720};
    std::optional<u32> frameRate; // nullopt = driver default

    bool preferHardwareEncoder{true};
    bool validateModeBeforeStart{false};
    bool useLowCompressionFallbackCodec{false};

    bool hasAudio() const {
        return microphoneId && !microphoneId->empty();
    }
};

} // namespace vb
