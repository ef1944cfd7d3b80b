/**
 * @file CapabilityResolver.hpp
 * @brief Picks the capture mode used for preview and recording.
 *
 * Capabilities inside the preset bucket win; when none match, the whole list
 * is ranked instead so preview never refuses to start on an odd camera.
 * Ranking is area descending, then frame rate descending.
 */

#pragma once
#include <optional>
#include <vector>
#include "CaptureTypes.hpp"

namespace vb {

class CapabilityResolver {
public:
    // nullopt only when the device reported no capabilities at all
    static std::optional<CaptureCapability> resolve(
            const std::vector<CaptureCapability>& capabilities,
            const ResolutionPreset& preset);

    // Strict weak ordering used by resolve(): true if a ranks before b
    static bool ranksBefore(const CaptureCapability& a,
                            const CaptureCapability& b);
};

} // namespace vb
