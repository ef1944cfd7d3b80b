#include "EncoderSelector.hpp"
#include "CommandRunner.hpp"
#include "EngineCommand.hpp"
#include "EngineIntrospection.hpp"
#include "core/Logger.hpp"

namespace vb {

EncoderSelector::EncoderSelector(QString engineBinary, int probeTimeoutMs)
    : engineBinary_(std::move(engineBinary)), probeTimeoutMs_(probeTimeoutMs) {}

EncoderCandidate EncoderSelector::select(bool preferHardware,
                                         bool lowCompressionFallback) {
    if (lowCompressionFallback) {
        LOG_INFO("Encoder: low-compression fallback requested, using {}",
                 toString(EncoderCandidate::Mjpeg));
        return EncoderCandidate::Mjpeg;
    }
    if (!preferHardware) {
        LOG_INFO("Encoder: hardware disabled, using {}",
                 toString(EncoderCandidate::X264));
        return EncoderCandidate::X264;
    }

    for (auto candidate : compiledAccelerators()) {
        if (probe(candidate)) {
            LOG_INFO("Encoder: using {}", toString(candidate));
            return candidate;
        }
        LOG_WARN("Encoder: {} not usable, trying next", toString(candidate));
    }

    LOG_INFO("Encoder: no usable accelerator, using {}",
             toString(EncoderCandidate::X264));
    return EncoderCandidate::X264;
}

std::vector<EncoderCandidate> EncoderSelector::compiledAccelerators() {
    auto result = CommandRunner::run(
            engineBinary_, EngineCommand::encodersArgs(), probeTimeoutMs_);
    if (!result.success()) {
        LOG_WARN("Encoder: could not read the engine's encoder list");
        return {};
    }

    EngineIntrospection::logLines(result.combinedText(), "encoders");
    auto found = EngineIntrospection::compiledAccelerators(result.combinedText());
    LOG_DEBUG("Encoder: {} accelerator(s) compiled in", found.size());
    return found;
}

bool EncoderSelector::probe(EncoderCandidate candidate) {
    auto result = CommandRunner::run(
            engineBinary_, EngineCommand::probeArgs(candidate), probeTimeoutMs_);

    if (result.failedToStart) {
        LOG_WARN("Encoder probe {}: engine failed to start", toString(candidate));
        return false;
    }
    if (result.timedOut) {
        LOG_WARN("Encoder probe {}: timed out after {} ms",
                 toString(candidate),
                 probeTimeoutMs_);
        return false;
    }
    if (result.exitCode != 0) {
        LOG_WARN("Encoder probe {}: exit code {}", toString(candidate), result.exitCode);
        EngineIntrospection::logLines(result.stderrText, "probe");
        return false;
    }
    return true;
}

} // namespace vb
