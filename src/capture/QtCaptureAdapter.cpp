#include "QtCaptureAdapter.hpp"
#include <QCamera>
#include <QCameraFormat>
#include <QMediaCaptureSession>
#include <QMediaDevices>
#include <QRegularExpression>
#include <QVideoFrame>
#include <QVideoSink>
#include <algorithm>
#include <cmath>
#include <mutex>
#include "core/Logger.hpp"

namespace vb {

namespace {

u32 roundedRate(float fps) {
    return fps > 0.0f ? static_cast<u32>(std::lround(fps)) : 0;
}

class QtCaptureDevice : public CaptureDevice {
public:
    QtCaptureDevice(QtCaptureAdapter& adapter, QCameraDevice device, std::string id)
        : adapter_(adapter), device_(std::move(device)), id_(std::move(id)) {
        adapter_.runOnCaptureThread([this] {
            camera_ = std::make_unique<QCamera>(device_);
            sink_ = std::make_unique<QVideoSink>();
            session_ = std::make_unique<QMediaCaptureSession>();
            session_->setCamera(camera_.get());
            session_->setVideoSink(sink_.get());

            QObject::connect(camera_.get(),
                             &QCamera::errorOccurred,
                             camera_.get(),
                             [this](QCamera::Error, const QString& message) {
                                 LOG_ERROR("Camera {}: {}", id_, message.toStdString());
                             });
            QObject::connect(sink_.get(),
                             &QVideoSink::videoFrameChanged,
                             sink_.get(),
                             [this](const QVideoFrame& frame) { deliver(frame); });
        });
    }

    ~QtCaptureDevice() override {
        stop();
        adapter_.runOnCaptureThread([this] {
            session_.reset();
            sink_.reset();
            camera_.reset();
        });
    }

    const std::string& id() const override {
        return id_;
    }

    std::vector<CaptureCapability> capabilities() const override {
        std::vector<CaptureCapability> caps;
        for (const auto& format : device_.videoFormats()) {
            CaptureCapability c{static_cast<u32>(format.resolution().width()),
                                static_cast<u32>(format.resolution().height()),
                                roundedRate(format.maxFrameRate())};
            // Same mode is listed once per pixel format
            if (std::find(caps.begin(), caps.end(), c) == caps.end())
                caps.push_back(c);
        }
        return caps;
    }

    Result<void> setCapability(const CaptureCapability& capability) override {
        const auto formats = device_.videoFormats();
        auto it = std::find_if(formats.begin(), formats.end(), [&](const QCameraFormat& f) {
            return static_cast<u32>(f.resolution().width()) == capability.width &&
                   static_cast<u32>(f.resolution().height()) == capability.height &&
                   roundedRate(f.maxFrameRate()) == capability.frameRate;
        });
        if (it == formats.end())
            return Result<void>::err(ErrorCode::DeviceError,
                                     fmt::format("{}x{} @ {} fps not offered by {}",
                                                 capability.width,
                                                 capability.height,
                                                 capability.frameRate,
                                                 id_));

        const QCameraFormat format = *it;
        adapter_.runOnCaptureThread([this, format] { camera_->setCameraFormat(format); });
        return Result<void>::ok();
    }

    Result<void> start(FrameCallback onFrame) override {
        {
            std::lock_guard lock(callbackMutex_);
            onFrame_ = std::move(onFrame);
        }

        bool active = false;
        QString error;
        adapter_.runOnCaptureThread([&] {
            camera_->start();
            active = camera_->isActive() || camera_->error() == QCamera::NoError;
            error = camera_->errorString();
        });

        if (!active) {
            std::lock_guard lock(callbackMutex_);
            onFrame_ = nullptr;
            return Result<void>::err(ErrorCode::DeviceError,
                                     "Camera failed to start: " + error.toStdString());
        }
        running_ = true;
        return Result<void>::ok();
    }

    void stop() override {
        if (!running_)
            return;
        // Frames are delivered on the capture thread, so once this returns
        // no callback is in flight
        adapter_.runOnCaptureThread([this] { camera_->stop(); });
        std::lock_guard lock(callbackMutex_);
        onFrame_ = nullptr;
        running_ = false;
    }

    bool isRunning() const override {
        return running_;
    }

private:
    void deliver(const QVideoFrame& frame) {
        std::lock_guard lock(callbackMutex_);
        if (!onFrame_)
            return;
        const QImage image = frame.toImage();
        if (!image.isNull())
            onFrame_(image);
    }

    QtCaptureAdapter& adapter_;
    QCameraDevice device_;
    std::string id_;

    std::unique_ptr<QCamera> camera_;
    std::unique_ptr<QVideoSink> sink_;
    std::unique_ptr<QMediaCaptureSession> session_;

    std::mutex callbackMutex_;
    FrameCallback onFrame_;
    bool running_{false};
};

} // namespace

QtCaptureAdapter::QtCaptureAdapter() : context_(std::make_unique<QObject>()) {
    thread_.setObjectName("capture");
    context_->moveToThread(&thread_);
    thread_.start();
}

QtCaptureAdapter::~QtCaptureAdapter() {
    thread_.quit();
    thread_.wait();
}

void QtCaptureAdapter::runOnCaptureThread(const std::function<void()>& fn) {
    if (QThread::currentThread() == &thread_) {
        fn();
        return;
    }
    QMetaObject::invokeMethod(context_.get(), fn, Qt::BlockingQueuedConnection);
}

QString QtCaptureAdapter::v4l2Path(const QCameraDevice& device) {
    const auto id = QString::fromUtf8(device.id());
    if (id.startsWith("/dev/video"))
        return id;

    const QRegularExpression number(QStringLiteral("(\\d+)"));
    if (auto match = number.match(id); match.hasMatch())
        return "/dev/video" + match.captured(1);
    return id;
}

std::vector<DeviceInfo> QtCaptureAdapter::listDevices(DeviceKind kind) {
    std::vector<DeviceInfo> devices;

    if (kind == DeviceKind::Video) {
        for (const auto& camera : QMediaDevices::videoInputs()) {
            DeviceInfo info{v4l2Path(camera).toStdString(),
                            camera.description().toStdString()};
            auto dup = std::find_if(devices.begin(), devices.end(), [&](const auto& d) {
                return d.id == info.id;
            });
            if (dup == devices.end())
                devices.push_back(std::move(info));
        }
    } else {
        for (const auto& mic : QMediaDevices::audioInputs())
            devices.push_back({mic.id().toStdString(), mic.description().toStdString()});
    }

    LOG_DEBUG("Capture: {} {} device(s)",
              devices.size(),
              kind == DeviceKind::Video ? "video" : "audio");
    return devices;
}

Result<std::unique_ptr<CaptureDevice>> QtCaptureAdapter::openDevice(const std::string& id) {
    using R = Result<std::unique_ptr<CaptureDevice>>;

    const auto cameras = QMediaDevices::videoInputs();
    auto it = std::find_if(cameras.begin(), cameras.end(), [&](const QCameraDevice& c) {
        return v4l2Path(c).toStdString() == id;
    });
    if (it == cameras.end())
        return R::err(ErrorCode::DeviceError, "Camera not found: " + id);

    LOG_INFO("Opening camera {} ({})", id, it->description().toStdString());
    return R::ok(std::make_unique<QtCaptureDevice>(*this, *it, id));
}

} // namespace vb
