/**
 * @file EncoderSelector.hpp
 * @brief Chooses the video encoder for a recording attempt.
 *
 * Hardware accelerators are taken from the engine's compiled-in list and each
 * one is verified with a short synthetic encode; the probe exit code is the
 * only thing trusted. Anything that goes wrong falls through to x264.
 */

#pragma once
#include <QString>
#include <vector>
#include "EncoderSettings.hpp"

namespace vb {

class EncoderSelector {
public:
    EncoderSelector(QString engineBinary, int probeTimeoutMs);

    EncoderCandidate select(bool preferHardware, bool lowCompressionFallback);

    // Empty when the listing could not be obtained or read
    std::vector<EncoderCandidate> compiledAccelerators();
    bool probe(EncoderCandidate candidate);

private:
    QString engineBinary_;
    int probeTimeoutMs_;
};

} // namespace vb
