/**
 * @file QtCaptureAdapter.hpp
 * @brief CaptureAdapter backed by Qt Multimedia.
 *
 * Cameras are identified by their V4L2 node (/dev/videoN) so the same id can
 * be handed to the engine. Microphones use the PulseAudio source name that
 * Qt reports as the device id.
 *
 * All QCamera objects live on the adapter's own capture thread. Frames are
 * converted and delivered there; start/stop from other threads block until
 * the capture thread has done the work.
 *
 * @section Dependencies
 * - Qt6::Multimedia (QMediaDevices, QCamera, QMediaCaptureSession, QVideoSink)
 */

#pragma once
#include <QCameraDevice>
#include <QObject>
#include <QThread>
#include <memory>
#include "CaptureAdapter.hpp"

namespace vb {

class QtCaptureAdapter : public CaptureAdapter {
public:
    QtCaptureAdapter();
    ~QtCaptureAdapter() override;

    std::vector<DeviceInfo> listDevices(DeviceKind kind) override;
    Result<std::unique_ptr<CaptureDevice>> openDevice(const std::string& id) override;

    // Runs fn on the capture thread and waits for it
    void runOnCaptureThread(const std::function<void()>& fn);

    static QString v4l2Path(const QCameraDevice& device);

private:
    QThread thread_;
    std::unique_ptr<QObject> context_;
};

} // namespace vb
