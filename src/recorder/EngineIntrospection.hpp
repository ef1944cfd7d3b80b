/**
 * @file EngineIntrospection.hpp
 * @brief Best-effort parsing of the engine's text listings.
 *
 * The listings are diagnostics only. Anything unreadable parses as "nothing
 * found"; these functions never fail.
 */

#pragma once
#include <QString>
#include <optional>
#include <string_view>
#include <vector>
#include "EncoderSettings.hpp"
#include "capture/CaptureTypes.hpp"
#include "util/Result.hpp"

namespace vb {

class EngineIntrospection {
public:
    // Hardware candidates present in `-encoders` output, in preference order
    static std::vector<EncoderCandidate> compiledAccelerators(
            const QString& encodersListing);

    // Looks for "WxH" and, when a rate is given and the listing carries
    // rates at all, for "WxH" followed later by "F fps"
    static bool isModeListed(const QString& modesListing,
                             u32 width,
                             u32 height,
                             std::optional<u32> frameRate);

    // One info line per non-empty line of text
    static void logLines(const QString& text, std::string_view prefix);

    // Run the engine's listings and log them. Only a missing engine is an
    // error; whatever the engine prints, including failures, is logged.
    static Result<void> logSources(const std::string& binaryPath,
                                   DeviceKind kind,
                                   int timeoutMs);
    static Result<void> logModes(const std::string& binaryPath,
                                 const std::string& cameraId,
                                 int timeoutMs);
};

} // namespace vb
