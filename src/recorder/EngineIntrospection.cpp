#include "EngineIntrospection.hpp"
#include <QRegularExpression>
#include "CommandRunner.hpp"
#include "EngineCommand.hpp"
#include "core/Logger.hpp"

namespace vb {

std::vector<EncoderCandidate> EngineIntrospection::compiledAccelerators(
        const QString& encodersListing) {
    std::vector<EncoderCandidate> found;
    for (auto candidate : encoders::kHardwarePreference) {
        // " V....D h264_nvenc    NVIDIA NVENC H.264 encoder"
        const QRegularExpression line(
                QStringLiteral("^\\s*[VAS][.A-Z]{5}\\s+%1\\s")
                        .arg(QLatin1String(encoders::codecName(candidate))),
                QRegularExpression::MultilineOption);
        if (line.match(encodersListing).hasMatch())
            found.push_back(candidate);
    }
    return found;
}

bool EngineIntrospection::isModeListed(const QString& modesListing,
                                       u32 width,
                                       u32 height,
                                       std::optional<u32> frameRate) {
    const auto size = QStringLiteral("%1x%2").arg(width).arg(height);
    const QRegularExpression sizeRe(QStringLiteral("\\b%1\\b").arg(size));
    if (!sizeRe.match(modesListing).hasMatch())
        return false;

    // v4l2 lists sizes only; nothing more to check
    const QRegularExpression anyRate(QStringLiteral("\\bfps\\b"),
                                     QRegularExpression::CaseInsensitiveOption);
    if (!frameRate || !anyRate.match(modesListing).hasMatch())
        return true;

    const QRegularExpression rateRe(
            QStringLiteral("\\b%1\\b.*?\\b%2(\\.0+)?\\s*fps\\b")
                    .arg(size)
                    .arg(*frameRate),
            QRegularExpression::CaseInsensitiveOption |
                    QRegularExpression::DotMatchesEverythingOption);
    return rateRe.match(modesListing).hasMatch();
}

void EngineIntrospection::logLines(const QString& text, std::string_view prefix) {
    const auto lines = text.split('\n', Qt::SkipEmptyParts);
    for (const auto& l : lines) {
        const auto trimmed = l.trimmed();
        if (!trimmed.isEmpty())
            LOG_INFO("[{}] {}", prefix, trimmed.toStdString());
    }
}

namespace {

Result<void> runAndLog(const std::string& binaryPath,
                       const QStringList& args,
                       std::string_view prefix,
                       int timeoutMs) {
    auto binary = EngineCommand::resolveBinary(binaryPath);
    if (!binary)
        return Result<void>::err(binary.error());

    auto result = CommandRunner::run(*binary, args, timeoutMs);
    if (result.failedToStart)
        return Result<void>::err(ErrorCode::EngineNotFound,
                                 "Engine failed to start: " +
                                         result.stderrText.toStdString());
    if (result.timedOut)
        LOG_WARN("[{}] listing timed out after {} ms", prefix, timeoutMs);

    EngineIntrospection::logLines(result.combinedText(), prefix);
    return Result<void>::ok();
}

} // namespace

Result<void> EngineIntrospection::logSources(const std::string& binaryPath,
                                             DeviceKind kind,
                                             int timeoutMs) {
    return runAndLog(binaryPath,
                     EngineCommand::listSourcesArgs(kind),
                     kind == DeviceKind::Video ? "video sources" : "audio sources",
                     timeoutMs);
}

Result<void> EngineIntrospection::logModes(const std::string& binaryPath,
                                           const std::string& cameraId,
                                           int timeoutMs) {
    return runAndLog(binaryPath, EngineCommand::listModesArgs(cameraId), "modes", timeoutMs);
}

} // namespace vb
