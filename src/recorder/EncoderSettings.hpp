/**
 * @file EncoderSettings.hpp
 * @brief Encoder candidates and their engine argument profiles.
 *
 * Each candidate maps to a codec / quality / preset triple plus the pixel
 * filter it needs. Hardware candidates are listed in preference order.
 */

#pragma once
#include <array>
#include <string>
#include "util/Types.hpp"

namespace vb {

enum class EncoderCandidate {
    Nvenc,  // NVIDIA
    Qsv,    // Intel Quick Sync
    Vaapi,  // generic VA-API (Intel/AMD)
    X264,   // software baseline
    Mjpeg,  // low-compression fallback
};

struct EncoderProfile {
    std::string codec;
    std::string qualityFlag;
    std::string qualityValue;
    std::string preset; // empty when the encoder has no preset option
    std::string pixelFilter{"format=yuv420p"};
    std::string hwDevice; // -vaapi_device, VAAPI only
};

namespace encoders {

inline constexpr std::array<EncoderCandidate, 3> kHardwarePreference{
        EncoderCandidate::Nvenc, EncoderCandidate::Qsv, EncoderCandidate::Vaapi};

inline const char* codecName(EncoderCandidate c) {
    switch (c) {
    case EncoderCandidate::Nvenc:
        return "h264_nvenc";
    case EncoderCandidate::Qsv:
        return "h264_qsv";
    case EncoderCandidate::Vaapi:
        return "h264_vaapi";
    case EncoderCandidate::X264:
        return "libx264";
    case EncoderCandidate::Mjpeg:
        return "mjpeg";
    }
    return "libx264";
}

inline EncoderProfile profileFor(EncoderCandidate c) {
    switch (c) {
    case EncoderCandidate::Nvenc:
        return {codecName(c), "-cq", "21", "p4"};
    case EncoderCandidate::Qsv:
        return {codecName(c), "-global_quality", "21", "veryfast"};
    case EncoderCandidate::Vaapi:
        return {codecName(c),
                "-qp",
                "21",
                "",
                "format=nv12,hwupload",
                "/dev/dri/renderD128"};
    case EncoderCandidate::Mjpeg:
        return {codecName(c), "-q:v", "3", "", "format=yuvj420p"};
    case EncoderCandidate::X264:
        break;
    }
    return {"libx264", "-crf", "20", "veryfast"};
}

} // namespace encoders

inline const char* toString(EncoderCandidate c) {
    switch (c) {
    case EncoderCandidate::Nvenc:
        return "NVENC";
    case EncoderCandidate::Qsv:
        return "QSV";
    case EncoderCandidate::Vaapi:
        return "VAAPI";
    case EncoderCandidate::X264:
        return "x264";
    case EncoderCandidate::Mjpeg:
        return "MJPEG";
    }
    return "x264";
}

} // namespace vb
