#include "TestSupport.hpp"
#include <QFile>

namespace vb::test {

FakeCaptureDevice::FakeCaptureDevice(std::string id,
                                     std::vector<CaptureCapability> caps,
                                     QString lockFile,
                                     FakeDeviceLog& log)
    : id_(std::move(id)), caps_(std::move(caps)), lockFile_(std::move(lockFile)), log_(log) {}

FakeCaptureDevice::~FakeCaptureDevice() {
    stop();
}

Result<void> FakeCaptureDevice::setCapability(const CaptureCapability& capability) {
    log_.applied = capability;
    return Result<void>::ok();
}

Result<void> FakeCaptureDevice::start(FrameCallback onFrame) {
    ++log_.starts;
    log_.onFrame = std::move(onFrame);
    if (!lockFile_.isEmpty()) {
        QFile lock(lockFile_);
        if (!lock.open(QIODevice::WriteOnly))
            return Result<void>::err(ErrorCode::DeviceError, "cannot create lock");
    }
    running_ = true;
    return Result<void>::ok();
}

void FakeCaptureDevice::stop() {
    if (!running_)
        return;
    ++log_.stops;
    log_.onFrame = nullptr;
    if (!lockFile_.isEmpty())
        QFile::remove(lockFile_);
    running_ = false;
}

std::vector<DeviceInfo> FakeCaptureAdapter::listDevices(DeviceKind kind) {
    if (kind == DeviceKind::Video)
        return {{"/dev/video0", "Fake Camera"}};
    return {{"fake_mic", "Fake Microphone"}};
}

Result<std::unique_ptr<CaptureDevice>> FakeCaptureAdapter::openDevice(const std::string& id) {
    using R = Result<std::unique_ptr<CaptureDevice>>;
    ++log.opens;
    if (failOpen)
        return R::err(ErrorCode::DeviceError, "Camera not found: " + id);

    auto device = std::make_unique<FakeCaptureDevice>(id, capabilities, lockFile, log);
    current = device.get();
    return R::ok(std::move(device));
}

void FakeCaptureAdapter::pushFrame(const QImage& frame) {
    if (log.onFrame)
        log.onFrame(frame);
}

void RecordingReviewGate::review(const std::filesystem::path& recording, Decision decide) {
    reviewed.push_back(recording);
    decide(answer);
}

namespace engine {

namespace {

// Shell prologue: $last is the output path for recording invocations
const char* kPrologue = R"(#!/bin/sh
for a in "$@"; do last="$a"; done
case " $* " in
  *" -encoders "*) echo " V....D libx264   libx264 H.264"; exit 0 ;;
  *" lavfi "*) exit 1 ;;
  *" -list_formats "*) echo "[video4linux2,v4l2] Raw : yuyv422 : YUYV : 640x480 1280x720"; exit 0 ;;
esac
)";

QString lockCheck(const QString& lockFile) {
    return QStringLiteral("if [ -e \"%1\" ]; then echo \"%1: Device or resource busy\" >&2; exit 1; fi\n")
            .arg(lockFile);
}

} // namespace

QString writeScript(const QTemporaryDir& dir, const QString& name, const QString& body) {
    const auto path = dir.filePath(name);
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return {};
    f.write(body.toUtf8());
    f.close();
    f.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
    return path;
}

QString graceful(const QTemporaryDir& dir) {
    return writeScript(dir,
                       "graceful.sh",
                       QString(kPrologue) + "echo \"recording to $last\"\n"
                                            ": > \"$last\"\n"
                                            "read line\n"
                                            "echo \"got $line\"\n"
                                            "exit 0\n");
}

QString stubborn(const QTemporaryDir& dir) {
    return writeScript(dir,
                       "stubborn.sh",
                       QString(kPrologue) + ": > \"$last\"\n"
                                            "trap '' INT TERM\n"
                                            "sleep 60 &\n"
                                            "while true; do sleep 1; done\n");
}

QString crashing(const QTemporaryDir& dir) {
    return writeScript(dir,
                       "crashing.sh",
                       QString(kPrologue) + "echo \"boom\" >&2\nexit 1\n");
}

QString contended(const QTemporaryDir& dir, const QString& lockFile) {
    return writeScript(dir,
                       "contended.sh",
                       QString(kPrologue) + lockCheck(lockFile) +
                               ": > \"$last\"\n"
                               "read line\n"
                               "exit 0\n");
}

QString dying(const QTemporaryDir& dir, const QString& lockFile) {
    return writeScript(dir,
                       "dying.sh",
                       QString(kPrologue) + lockCheck(lockFile) +
                               ": > \"$last\"\n"
                               "sleep 1\n"
                               "echo \"input device lost\" >&2\n"
                               "exit 3\n");
}

} // namespace engine

} // namespace vb::test
