/**
 * @file CaptureAdapter.hpp
 * @brief Interface to the camera/microphone layer.
 *
 * The session core only needs device enumeration, the capability list of the
 * selected camera, mode selection, and start/stop of the live frame stream.
 * Frames arrive on the adapter's own execution context.
 *
 * @section Patterns
 * - Abstract Interface: Qt Multimedia in the app, fakes in the tests.
 */

#pragma once
#include <QImage>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "CaptureTypes.hpp"
#include "util/Result.hpp"

namespace vb {

class CaptureDevice {
public:
    // The image is only valid for the duration of the call
    using FrameCallback = std::function<void(const QImage& frame)>;

    virtual ~CaptureDevice() = default;

    virtual const std::string& id() const = 0;
    virtual std::vector<CaptureCapability> capabilities() const = 0;
    virtual Result<void> setCapability(const CaptureCapability& capability) = 0;

    virtual Result<void> start(FrameCallback onFrame) = 0;
    // Returns once no further frame callback can run
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;
};

class CaptureAdapter {
public:
    virtual ~CaptureAdapter() = default;

    virtual std::vector<DeviceInfo> listDevices(DeviceKind kind) = 0;
    virtual Result<std::unique_ptr<CaptureDevice>> openDevice(
            const std::string& id) = 0;
};

} // namespace vb
