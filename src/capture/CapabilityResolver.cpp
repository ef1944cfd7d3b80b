#include "CapabilityResolver.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace vb {

bool CapabilityResolver::ranksBefore(const CaptureCapability& a,
                                     const CaptureCapability& b) {
    if (a.area() != b.area())
        return a.area() > b.area();
    if (a.frameRate != b.frameRate)
        return a.frameRate > b.frameRate;
    // Same area, same rate: prefer the wider one so the result is stable
    return a.width > b.width;
}

std::optional<CaptureCapability> CapabilityResolver::resolve(
        const std::vector<CaptureCapability>& capabilities,
        const ResolutionPreset& preset) {
    if (capabilities.empty())
        return std::nullopt;

    std::vector<CaptureCapability> pool;
    std::copy_if(capabilities.begin(),
                 capabilities.end(),
                 std::back_inserter(pool),
                 [&preset](const auto& c) { return preset.contains(c); });

    if (pool.empty()) {
        LOG_DEBUG("CapabilityResolver: nothing in '{}', ranking all {} modes",
                  preset.label,
                  capabilities.size());
        pool = capabilities;
    }

    return *std::min_element(pool.begin(), pool.end(), ranksBefore);
}

} // namespace vb
