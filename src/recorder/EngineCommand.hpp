/**
 * @file EngineCommand.hpp
 * @brief Argument lists for the external encoding engine (ffmpeg).
 *
 * Pure functions: nothing here starts a process. Arguments are returned as a
 * QStringList and passed to QProcess unquoted, so device names and paths with
 * spaces need no escaping.
 *
 * @section Dependencies
 * - Qt6::Core (QStringList, QStandardPaths)
 */

#pragma once
#include <QString>
#include <QStringList>
#include "EncoderSettings.hpp"
#include "SessionConfig.hpp"
#include "capture/CaptureTypes.hpp"
#include "util/Result.hpp"

namespace vb {

class EngineCommand {
public:
    static constexpr u32 kDefaultFrameRate = 30;
    static constexpr u32 kMinDimension = 16;

    static QStringList recordArgs(const SessionConfig& config,
                                  EncoderCandidate encoder);
    static QStringList probeArgs(EncoderCandidate encoder);

    static QStringList encodersArgs();
    static QStringList listModesArgs(const std::string& cameraId);
    static QStringList listSourcesArgs(DeviceKind kind);

    // Same path with the extension replaced by .mp4
    static fs::path normalizedOutputPath(const fs::path& path);

    // Absolute path of the engine binary. A value containing a separator must
    // exist and be executable; a bare name is searched on PATH.
    static Result<QString> resolveBinary(const std::string& binaryPath);

private:
    static void appendEncoderArgs(QStringList& args,
                                  const EncoderProfile& profile);
};

} // namespace vb
