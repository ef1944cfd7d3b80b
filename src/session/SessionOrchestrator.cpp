#include "SessionOrchestrator.hpp"
#include <QEventLoop>
#include <QPointer>
#include <QTimer>
#include <system_error>
#include "ReviewGate.hpp"
#include "capture/CapabilityResolver.hpp"
#include "core/Logger.hpp"
#include "recorder/CommandRunner.hpp"
#include "recorder/EncoderSelector.hpp"
#include "recorder/EngineCommand.hpp"
#include "recorder/EngineIntrospection.hpp"

namespace vb {

namespace {

// Failures a second attempt without the preview can cure
bool isContention(ErrorCode code) {
    return code == ErrorCode::ProcessStartFailure ||
           code == ErrorCode::DeviceContentionFailure;
}

QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

// Runs the control thread's event loop for ms. Intents arriving meanwhile
// are rejected by the Busy guard.
void pumpFor(int ms) {
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

} // namespace

SessionOrchestrator::SessionOrchestrator(CaptureAdapter& adapter,
                                         ReviewGate& reviewGate,
                                         EngineConfig engine,
                                         SessionSettings session,
                                         QObject* parent)
    : QObject(parent),
      adapter_(adapter),
      reviewGate_(reviewGate),
      engine_(std::move(engine)),
      session_(std::move(session)),
      timer_(new SessionTimer(this)) {
    qRegisterMetaType<vb::SessionState>();

    machine_.stateChanged.connect([this](SessionState s) { emit stateChanged(s); });
    supervisor_.exited.connect([this] { onEngineExited(); });

    connect(timer_, &SessionTimer::elapsedChanged, this, &SessionOrchestrator::elapsedChanged);
    connect(timer_, &SessionTimer::stopRequested, this, [this] {
        if (auto r = stopRecording(); !r)
            LOG_WARN("Auto-stop: {}", r.error().message);
    });
}

SessionOrchestrator::~SessionOrchestrator() {
    shutdown();
}

// Preview

Result<void> SessionOrchestrator::startPreview(const std::string& cameraId,
                                               const ResolutionPreset& preset) {
    if (cameraId.empty())
        return fail({ErrorCode::InvalidSelection, "Select a camera first"});

    auto guard = machine_.tryBegin({SessionState::Idle});
    if (!guard)
        return reject("start preview");

    auto opened = openPreview(cameraId, preset);
    if (!opened)
        return fail(opened.error());

    guard->settle(SessionState::Previewing);
    emit statusMessage(tr("Preview running"));
    return Result<void>::ok();
}

Result<void> SessionOrchestrator::stopPreview() {
    auto guard = machine_.tryBegin({SessionState::Previewing});
    if (!guard)
        return reject("stop preview");

    closePreview();
    mustRestorePreview_ = false;
    guard->settle(SessionState::Idle);
    emit statusMessage(tr("Preview stopped"));
    return Result<void>::ok();
}

Result<void> SessionOrchestrator::openPreview(const std::string& cameraId,
                                              const ResolutionPreset& preset) {
    auto opened = adapter_.openDevice(cameraId);
    if (!opened)
        return Result<void>::err(opened.error());
    device_ = std::move(opened.value());

    auto capability = CapabilityResolver::resolve(device_->capabilities(), preset);
    if (!capability) {
        device_.reset();
        return Result<void>::err(ErrorCode::DeviceError,
                                 "Camera reports no capture modes");
    }

    if (auto applied = device_->setCapability(*capability); !applied) {
        device_.reset();
        return applied;
    }

    LOG_INFO("Preview: {} at {}x{} @ {} fps ({})",
             cameraId,
             capability->width,
             capability->height,
             capability->frameRate,
             preset.label);

    framePending_ = false;
    auto started = device_->start([this](const QImage& frame) {
        frames_.store(frame);
        if (!framePending_.exchange(true))
            emit previewFrameAvailable();
    });
    if (!started) {
        device_->stop();
        device_.reset();
        frames_.clear();
        return started;
    }

    previewCameraId_ = cameraId;
    previewPreset_ = preset;
    activeCapability_ = capability;
    emit captureModeChanged(static_cast<int>(capability->width),
                            static_cast<int>(capability->height),
                            static_cast<int>(capability->frameRate));
    return Result<void>::ok();
}

void SessionOrchestrator::closePreview() {
    if (device_) {
        device_->stop();
        device_.reset();
    }
    frames_.clear();
    framePending_ = false;
}

void SessionOrchestrator::restorePreviewIfSuspended() {
    if (!mustRestorePreview_)
        return;
    mustRestorePreview_ = false;

    if (!session_.restorePreviewAfterRecording) {
        LOG_INFO("Preview restore disabled, leaving camera closed");
        return;
    }
    if (auto r = openPreview(previewCameraId_, previewPreset_); !r) {
        LOG_WARN("Could not restore preview: {}", r.error().message);
        emit statusMessage(tr("Preview could not be restored: %1")
                                   .arg(qstr(r.error().message)));
    }
}

bool SessionOrchestrator::isPreviewRunning() const {
    return device_ && device_->isRunning();
}

QImage SessionOrchestrator::snapshot() const {
    return frames_.latest();
}

QImage SessionOrchestrator::takePreviewFrame() {
    framePending_ = false;
    return frames_.latest();
}

// Recording

Result<void> SessionOrchestrator::startRecording(const SessionConfig& config) {
    if (config.cameraId.empty())
        return fail({ErrorCode::InvalidSelection, "Select a camera first"});
    if (config.outputPath.empty())
        return fail({ErrorCode::InvalidSelection, "Choose an output file first"});

    auto guard = machine_.tryBegin({SessionState::Idle, SessionState::Previewing});
    if (!guard)
        return reject("start recording");

    const bool previewActive = isPreviewRunning();
    activeConfig_ = config;
    activeConfig_.outputPath = EngineCommand::normalizedOutputPath(config.outputPath);
    chosenEncoder_.reset();
    mustRestorePreview_ = false;

    runCountdown();

    auto attempt = attemptRecording(previewActive);
    if (!attempt && previewActive && isContention(attempt.error().code)) {
        LOG_WARN("Recording with preview open failed ({}: {}), suspending preview "
                 "and retrying",
                 toString(attempt.error().code),
                 attempt.error().message);
        closePreview();
        mustRestorePreview_ = true;
        attempt = attemptRecording(false);
    }

    if (!attempt) {
        // A suspended preview stays closed; one never suspended is kept
        mustRestorePreview_ = false;
        if (auto stopped = supervisor_.stop(static_cast<int>(engine_.politeStopTimeoutMs));
            !stopped)
            LOG_ERROR("{}", stopped.error().message);
        guard->setFallback(idleSide());
        return fail(attempt.error());
    }

    timer_->reset();
    timer_->start();
    if (session_.maxDurationSeconds > 0)
        timer_->armAutoStop(std::chrono::seconds(session_.maxDurationSeconds));

    guard->settle(SessionState::Recording);

    const auto path = qstr(activeConfig_.outputPath.string());
    const auto encoder = QString::fromLatin1(toString(*chosenEncoder_));
    LOG_INFO("Recording to {} with {}", activeConfig_.outputPath.string(), toString(*chosenEncoder_));
    emit statusMessage(tr("Recording (%1)").arg(encoder));
    emit recordingStarted(path, encoder);
    return Result<void>::ok();
}

Result<void> SessionOrchestrator::attemptRecording(bool previewActive) {
    auto binary = EngineCommand::resolveBinary(activeConfig_.engineBinaryPath);
    if (!binary)
        return Result<void>::err(binary.error());

    if (!chosenEncoder_) {
        EncoderSelector selector(*binary, static_cast<int>(engine_.probeTimeoutMs));
        chosenEncoder_ = selector.select(activeConfig_.preferHardwareEncoder,
                                         activeConfig_.useLowCompressionFallbackCodec);
    }

    if (activeConfig_.validateModeBeforeStart)
        validateMode();

    auto started = supervisor_.start(activeConfig_, *chosenEncoder_);
    if (!started)
        return started;

    if (!supervisor_.settle(static_cast<int>(engine_.settleDelayMs))) {
        if (previewActive)
            return Result<void>::err(ErrorCode::DeviceContentionFailure,
                                     "Engine exited at start-up; camera busy?");
        return Result<void>::err(ErrorCode::ProcessStartFailure,
                                 "Engine exited at start-up");
    }
    return Result<void>::ok();
}

void SessionOrchestrator::validateMode() {
    auto binary = EngineCommand::resolveBinary(activeConfig_.engineBinaryPath);
    if (!binary)
        return;

    auto listing = CommandRunner::run(*binary,
                                      EngineCommand::listModesArgs(activeConfig_.cameraId),
                                      static_cast<int>(engine_.probeTimeoutMs));
    const auto text = listing.combinedText();
    EngineIntrospection::logLines(text, "modes");

    if (!EngineIntrospection::isModeListed(text,
                                           activeConfig_.width,
                                           activeConfig_.height,
                                           activeConfig_.frameRate)) {
        LOG_WARN("{}x{}{} not in the camera's mode list, trying anyway",
                 activeConfig_.width,
                 activeConfig_.height,
                 activeConfig_.frameRate
                         ? fmt::format(" @ {} fps", *activeConfig_.frameRate)
                         : std::string{});
    }
}

void SessionOrchestrator::runCountdown() {
    for (u32 left = session_.countdownSeconds; left > 0; --left) {
        emit countdownChanged(static_cast<int>(left));
        pumpFor(1000);
    }
    if (session_.countdownSeconds > 0)
        emit countdownChanged(0);
}

Result<void> SessionOrchestrator::stopRecording() {
    auto guard = machine_.tryBegin({SessionState::Recording});
    if (!guard)
        return reject("stop recording");

    auto stopped = supervisor_.stop(static_cast<int>(engine_.politeStopTimeoutMs));
    timer_->stop();
    timer_->disarmAutoStop();
    timer_->reset();
    restorePreviewIfSuspended();

    guard->settle(idleSide());
    if (stopped) {
        emit statusMessage(tr("Recording stopped"));
    } else {
        LOG_ERROR("{}: {}", toString(stopped.error().code), stopped.error().message);
        emit statusMessage(tr("Engine did not stop: %1").arg(qstr(stopped.error().message)));
    }

    handOffForReview(activeConfig_.outputPath);
    return Result<void>::ok();
}

void SessionOrchestrator::handOffForReview(const fs::path& recording) {
    std::error_code ec;
    if (!fs::exists(recording, ec)) {
        LOG_WARN("Engine left no output at {}", recording.string());
        emit statusMessage(tr("No recording was written"));
        return;
    }

    QPointer<SessionOrchestrator> self(this);
    reviewGate_.review(recording, [self, recording](bool keep) {
        if (!keep) {
            std::error_code removeError;
            if (fs::remove(recording, removeError))
                LOG_INFO("Discarded {}", recording.string());
            else
                LOG_WARN("Could not delete {}: {}",
                         recording.string(),
                         removeError ? removeError.message() : "not found");
        } else {
            LOG_INFO("Kept {}", recording.string());
        }
        if (self)
            emit self->recordingReviewed(qstr(recording.string()), keep);
    });
}

void SessionOrchestrator::onEngineExited() {
    // Exits during start-up or stop are handled by the operation in progress
    auto guard = machine_.tryBegin({SessionState::Recording});
    if (!guard)
        return;

    LOG_ERROR("UnexpectedProcessExit: engine stopped while recording");
    timer_->stop();
    timer_->disarmAutoStop();
    timer_->reset();
    restorePreviewIfSuspended();

    guard->settle(idleSide());
    emit statusMessage(tr("Recording ended unexpectedly, see log"));
}

void SessionOrchestrator::shutdown() {
    mustRestorePreview_ = false;
    if (machine_.is(SessionState::Recording)) {
        if (auto r = stopRecording(); !r)
            LOG_WARN("Shutdown: {}", r.error().message);
    }
    if (machine_.is(SessionState::Previewing)) {
        if (auto r = stopPreview(); !r)
            LOG_WARN("Shutdown: {}", r.error().message);
    }
    if (auto stopped = supervisor_.stop(static_cast<int>(engine_.politeStopTimeoutMs));
        !stopped) {
        LOG_ERROR("Shutdown: {}", stopped.error().message);
        emit statusMessage(qstr(stopped.error().message));
    }
    closePreview();
}

// Recording ends on the idle side of the machine; a live preview keeps the
// camera owned, which is the Previewing state.
SessionState SessionOrchestrator::idleSide() const {
    return isPreviewRunning() ? SessionState::Previewing : SessionState::Idle;
}

Result<void> SessionOrchestrator::fail(Error error) {
    LOG_ERROR("{}: {}", toString(error.code), error.message);
    emit statusMessage(qstr(error.message));
    return Result<void>::err(std::move(error));
}

Result<void> SessionOrchestrator::reject(const char* operation) {
    LOG_DEBUG("Ignoring {} while {}", operation, toString(state()));
    return Result<void>::err(ErrorCode::InvalidState,
                             fmt::format("Cannot {} while {}", operation, toString(state())));
}

} // namespace vb
