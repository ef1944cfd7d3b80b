/**
 * @file CaptureTypes.hpp
 * @brief Value types exchanged with the capture device adapter.
 */

#pragma once
#include <array>
#include <limits>
#include <string>
#include <string_view>
#include "util/Types.hpp"

namespace vb {

// A device-advertised mode. frameRate 0 means the driver did not report one.
struct CaptureCapability {
    u32 width{0};
    u32 height{0};
    u32 frameRate{0};

    u64 area() const {
        return static_cast<u64>(width) * height;
    }

    bool operator==(const CaptureCapability&) const = default;
};

// Resolution bucket used to filter capabilities. Bounds are inclusive.
struct ResolutionPreset {
    std::string_view label;
    u32 minWidth{0};
    u32 minHeight{0};
    u32 maxWidth{std::numeric_limits<u32>::max()};
    u32 maxHeight{std::numeric_limits<u32>::max()};

    bool contains(const CaptureCapability& c) const {
        return c.width >= minWidth && c.width <= maxWidth &&
               c.height >= minHeight && c.height <= maxHeight;
    }
};

namespace presets {

inline constexpr u32 kUnbounded = std::numeric_limits<u32>::max();

// The last entry is the catch-all bucket
inline constexpr std::array<ResolutionPreset, 6> kResolutions{{
        {"4K (3840x2160)", 3800, 2100, 4096, 2304},
        {"2K/QHD (2560x1440)", 2500, 1400, 2700, 1520},
        {"Full HD (1920x1080)", 1880, 1050, 2000, 1120},
        {"HD (1280x720)", 1240, 700, 1300, 760},
        {"SD (640x480)", 620, 460, 660, 520},
        {"Best available", 0, 0, kUnbounded, kUnbounded},
}};

inline constexpr std::array<u32, 4> kFrameRates{60, 30, 25, 15};

inline const ResolutionPreset& bestAvailable() {
    return kResolutions.back();
}

// Matches a label prefix ("HD", "Full HD", "4K"...), falls back to the
// catch-all bucket.
inline const ResolutionPreset& byName(std::string_view name) {
    for (const auto& p : kResolutions) {
        if (!name.empty() && p.label.starts_with(name) &&
            (p.label.size() == name.size() || p.label[name.size()] == ' ' ||
             p.label[name.size()] == '/'))
            return p;
    }
    return bestAvailable();
}

} // namespace presets

enum class DeviceKind { Video, Audio };

struct DeviceInfo {
    std::string id;
    std::string displayName;
};

} // namespace vb
