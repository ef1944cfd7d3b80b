#pragma once
// MainWindow.hpp - Booth operator window
// Preview on the left, controls on the right, engine log at the bottom

#include "session/SessionStateMachine.hpp"
#include "util/Result.hpp"
#include "util/Types.hpp"

#include <QDockWidget>
#include <QImage>
#include <QLabel>
#include <QMainWindow>
#include <QPlainTextEdit>
#include <QTimer>
#include <functional>
#include <optional>
#include <spdlog/common.h>

namespace vb {

class CaptureAdapter;
class SessionControls;
class SessionOrchestrator;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    // Stops mirroring log output into the log pane
    void detachLogSink();

protected:
    void closeEvent(QCloseEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;

private slots:
    void onStartPreview();
    void onStopPreview();
    void onSnapshot();
    void onStartRecording();
    void onStopRecording();
    void onListDevices();
    void onListModes();

    void onStateChanged(vb::SessionState state);
    void onPreviewFrame();
    void onCountdown(int remaining);
    void onCaptureMode(int width, int height, int frameRate);
    void onRecordingReviewed(const QString& path, bool kept);

private:
    void setupUI();
    void setupMenuBar();
    void setupConnections();
    void refreshDevices();
    void placeCountdown();

    // Queues an operation on the control thread
    void post(const char* what, std::function<Result<void>()> operation);

    SessionOrchestrator* orchestrator_{nullptr};
    CaptureAdapter* captureAdapter_{nullptr};

    SessionControls* controls_{nullptr};
    QLabel* preview_{nullptr};
    QLabel* countdownLabel_{nullptr};
    QPlainTextEdit* logView_{nullptr};
    QDockWidget* logDock_{nullptr};
    spdlog::sink_ptr logSink_;

    QTimer frameWatch_;
    TimePoint lastFrameAt_{};
    QImage lastFrame_;
    std::optional<std::pair<u32, u32>> lastMode_;
    SessionState state_{SessionState::Idle};
};

} // namespace vb
