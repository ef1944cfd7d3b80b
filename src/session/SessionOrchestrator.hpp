/**
 * @file SessionOrchestrator.hpp
 * @brief Preview / record workflows on top of capture and engine.
 *
 * The orchestrator owns the single capture-device handle, the engine
 * supervisor, the session timer and the state machine. It is moved to a
 * dedicated control thread at start-up; the UI talks to it only through
 * queued invocations and the signals below.
 *
 * Recording first tries to run the engine while the preview keeps the camera
 * open. Drivers that refuse a second open make that attempt die during the
 * settling delay; the preview is then suspended and the start retried once.
 *
 * @section Dependencies
 * - Qt6::Core, Qt6::Gui (QImage)
 *
 * @section Patterns
 * - Facade over CaptureAdapter, EncoderSelector, RecordingProcessSupervisor.
 * - State machine with scoped Busy guard.
 */

#pragma once
#include <QImage>
#include <QObject>
#include <QString>
#include <atomic>
#include <memory>
#include <optional>
#include "SessionStateMachine.hpp"
#include "SessionTimer.hpp"
#include "capture/CaptureAdapter.hpp"
#include "capture/FrameSlot.hpp"
#include "core/ConfigData.hpp"
#include "recorder/RecordingProcessSupervisor.hpp"
#include "recorder/SessionConfig.hpp"

namespace vb {

class ReviewGate;

class SessionOrchestrator : public QObject {
    Q_OBJECT

public:
    SessionOrchestrator(CaptureAdapter& adapter,
                        ReviewGate& reviewGate,
                        EngineConfig engine,
                        SessionSettings session,
                        QObject* parent = nullptr);
    ~SessionOrchestrator() override;

    Result<void> startPreview(const std::string& cameraId,
                              const ResolutionPreset& preset);
    Result<void> stopPreview();
    Result<void> startRecording(const SessionConfig& config);
    Result<void> stopRecording();

    // Stops whatever runs; used on application exit
    void shutdown();

    // Copy of the latest preview frame, null when there is none
    QImage snapshot() const;
    // Same, and re-enables the next previewFrameAvailable()
    QImage takePreviewFrame();

    SessionState state() const {
        return machine_.state();
    }
    bool isPreviewRunning() const;
    bool mustRestorePreviewAfterStop() const {
        return mustRestorePreview_;
    }
    std::optional<CaptureCapability> activeCapability() const {
        return activeCapability_;
    }
    std::optional<EncoderCandidate> chosenEncoder() const {
        return chosenEncoder_;
    }
    const SessionConfig& activeConfig() const {
        return activeConfig_;
    }

    SessionTimer& timer() {
        return *timer_;
    }
    RecordingProcessSupervisor& supervisor() {
        return supervisor_;
    }

signals:
    void stateChanged(vb::SessionState state);
    void statusMessage(const QString& message);
    void elapsedChanged(const QString& text);
    // Seconds left before the engine starts; 0 when the countdown is over
    void countdownChanged(int remaining);
    // Capture mode applied to the preview, mirrored into recording defaults
    void captureModeChanged(int width, int height, int frameRate);
    // At most one pending notification; call takePreviewFrame() to re-arm
    void previewFrameAvailable();
    void recordingStarted(const QString& path, const QString& encoder);
    void recordingReviewed(const QString& path, bool kept);

private:
    Result<void> openPreview(const std::string& cameraId,
                             const ResolutionPreset& preset);
    void closePreview();
    void restorePreviewIfSuspended();

    Result<void> attemptRecording(bool previewActive);
    void validateMode();
    void runCountdown();
    void handOffForReview(const fs::path& recording);

    void onEngineExited();
    SessionState idleSide() const;
    Result<void> fail(Error error);
    Result<void> reject(const char* operation);

    CaptureAdapter& adapter_;
    ReviewGate& reviewGate_;
    EngineConfig engine_;
    SessionSettings session_;

    SessionStateMachine machine_;
    SessionTimer* timer_;
    RecordingProcessSupervisor supervisor_;
    FrameSlot frames_;
    std::atomic<bool> framePending_{false};

    std::unique_ptr<CaptureDevice> device_;
    std::string previewCameraId_;
    ResolutionPreset previewPreset_{presets::bestAvailable()};
    std::optional<CaptureCapability> activeCapability_;

    SessionConfig activeConfig_;
    std::optional<EncoderCandidate> chosenEncoder_;
    bool mustRestorePreview_{false};
};

} // namespace vb
