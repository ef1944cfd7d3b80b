#include "EngineCommand.hpp"
#include <QFileInfo>
#include <QStandardPaths>
#include <algorithm>
#include "util/FileUtils.hpp"

namespace vb {

namespace {

QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

// Shared by both capture inputs so they timestamp against the same clock
void appendInputTiming(QStringList& args) {
    args << "-thread_queue_size" << "4096"
         << "-use_wallclock_as_timestamps" << "1";
}

} // namespace

void EngineCommand::appendEncoderArgs(QStringList& args,
                                      const EncoderProfile& profile) {
    args << "-c:v" << qstr(profile.codec);
    if (!profile.preset.empty())
        args << "-preset" << qstr(profile.preset);
    args << qstr(profile.qualityFlag) << qstr(profile.qualityValue);
}

QStringList EngineCommand::recordArgs(const SessionConfig& config,
                                      EncoderCandidate encoder) {
    const auto profile = encoders::profileFor(encoder);
    const u32 width = std::max(config.width, kMinDimension);
    const u32 height = std::max(config.height, kMinDimension);
    const u32 fps = std::max<u32>(config.frameRate.value_or(kDefaultFrameRate), 1);
    const u32 gop = std::max<u32>(fps * 2, 2);
    const bool audio = config.hasAudio();

    QStringList args;
    args << "-hide_banner" << "-loglevel" << "warning" << "-fflags" << "+genpts";

    // Global option, has to come before the inputs
    if (!profile.hwDevice.empty())
        args << "-vaapi_device" << qstr(profile.hwDevice);

    args << "-f" << "v4l2";
    appendInputTiming(args);
    args << "-video_size" << QString("%1x%2").arg(width).arg(height)
         << "-framerate" << QString::number(fps)
         << "-i" << qstr(config.cameraId);

    if (audio) {
        args << "-f" << "pulse";
        appendInputTiming(args);
        args << "-i" << qstr(*config.microphoneId);
    }

    args << "-fps_mode" << "vfr"
         << "-vf" << qstr(profile.pixelFilter);
    if (audio)
        args << "-af" << "aresample=async=1:osr=48000";

    appendEncoderArgs(args, profile);
    args << "-g" << QString::number(gop);

    if (audio)
        args << "-c:a" << "aac" << "-b:a" << "160k";

    args << "-movflags" << "+faststart" << "-y"
         << QString::fromStdString(normalizedOutputPath(config.outputPath).string());
    return args;
}

QStringList EngineCommand::probeArgs(EncoderCandidate encoder) {
    const auto profile = encoders::profileFor(encoder);

    QStringList args;
    args << "-hide_banner" << "-loglevel" << "error";
    if (!profile.hwDevice.empty())
        args << "-vaapi_device" << qstr(profile.hwDevice);
    args << "-f" << "lavfi" << "-i" << "testsrc2=size=128x128:rate=10"
         << "-t" << "0.2"
         << "-vf" << qstr(profile.pixelFilter);
    appendEncoderArgs(args, profile);
    args << "-f" << "null" << "-";
    return args;
}

QStringList EngineCommand::encodersArgs() {
    return {"-hide_banner", "-encoders"};
}

QStringList EngineCommand::listModesArgs(const std::string& cameraId) {
    return {"-hide_banner", "-f", "v4l2", "-list_formats", "all",
            "-i", qstr(cameraId)};
}

QStringList EngineCommand::listSourcesArgs(DeviceKind kind) {
    return {"-hide_banner", "-sources",
            kind == DeviceKind::Video ? "v4l2" : "pulse"};
}

fs::path EngineCommand::normalizedOutputPath(const fs::path& path) {
    if (path.empty())
        return path;
    auto out = path;
    out.replace_extension(".mp4");
    return out;
}

Result<QString> EngineCommand::resolveBinary(const std::string& binaryPath) {
    if (binaryPath.empty())
        return Result<QString>::err(ErrorCode::EngineNotFound,
                                    "No engine binary configured");

    const auto expanded = file::expandHome(binaryPath);
    const auto name = QString::fromStdString(expanded.string());

    if (!name.contains('/')) {
        auto found = QStandardPaths::findExecutable(name);
        if (found.isEmpty())
            return Result<QString>::err(ErrorCode::EngineNotFound,
                                        "Engine '" + binaryPath +
                                                "' not found on PATH");
        return Result<QString>::ok(found);
    }

    QFileInfo info(name);
    if (!info.exists() || !info.isFile() || !info.isExecutable())
        return Result<QString>::err(ErrorCode::EngineNotFound,
                                    "Engine not found: " + expanded.string());
    return Result<QString>::ok(info.absoluteFilePath());
}

} // namespace vb
