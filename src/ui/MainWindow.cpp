#include "MainWindow.hpp"
#include "SessionControls.hpp"
#include "capture/CaptureAdapter.hpp"
#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "recorder/EngineIntrospection.hpp"
#include "recorder/SessionConfig.hpp"
#include "session/SessionOrchestrator.hpp"
#include "util/FileUtils.hpp"

#include <QCloseEvent>
#include <QDesktopServices>
#include <QFileDialog>
#include <QFileInfo>
#include <QMenuBar>
#include <QMessageBox>
#include <QPixmap>
#include <QRegularExpression>
#include <QStatusBar>
#include <QUrl>
#include <spdlog/sinks/qt_sinks.h>
#include <tuple>

namespace vb {

namespace {

constexpr auto kFrameStaleAfter = std::chrono::milliseconds(1000);

// Nominal size from labels like "HD (1280x720)"
std::pair<u32, u32> nominalSize(const ResolutionPreset& preset) {
    static const QRegularExpression size(QStringLiteral("(\\d+)x(\\d+)"));
    const auto match = size.match(QString::fromUtf8(preset.label.data(),
                                                    static_cast<int>(preset.label.size())));
    if (!match.hasMatch())
        return {1280, 720};
    return {match.captured(1).toUInt(), match.captured(2).toUInt()};
}

} // namespace

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
    setWindowTitle("Booth Recorder");
    setMinimumSize(960, 600);
    resize(1280, 800);

    orchestrator_ = APP->orchestrator();
    captureAdapter_ = APP->captureAdapter();

    if (!orchestrator_ || !captureAdapter_) {
        LOG_ERROR("MainWindow: session is null! APP is likely not initialized.");
    }

    setupUI();
    setupMenuBar();
    setupConnections();
    refreshDevices();

    statusBar()->showMessage("Ready");
}

MainWindow::~MainWindow() {
    frameWatch_.stop();
    detachLogSink();
}

void MainWindow::setupUI() {
    preview_ = new QLabel("No preview");
    preview_->setAlignment(Qt::AlignCenter);
    preview_->setMinimumSize(640, 360);
    preview_->setSizePolicy(QSizePolicy::Ignored, QSizePolicy::Ignored);
    preview_->setStyleSheet("background-color: black; color: #888888;");
    setCentralWidget(preview_);

    countdownLabel_ = new QLabel(preview_);
    countdownLabel_->setAlignment(Qt::AlignCenter);
    countdownLabel_->setStyleSheet(
            "color: white; font-size: 120px; font-weight: bold;"
            "background-color: rgba(0, 0, 0, 120); border-radius: 24px;");
    countdownLabel_->resize(220, 220);
    countdownLabel_->hide();

    controls_ = new SessionControls();
    auto* controlsDock = new QDockWidget("Session", this);
    controlsDock->setObjectName("SessionDock");
    controlsDock->setWidget(controls_);
    controlsDock->setFeatures(QDockWidget::DockWidgetMovable |
                              QDockWidget::DockWidgetFloatable);
    controlsDock->setMinimumWidth(300);
    addDockWidget(Qt::RightDockWidgetArea, controlsDock);

    logView_ = new QPlainTextEdit();
    logView_->setReadOnly(true);
    logView_->setMaximumBlockCount(2000);
    logView_->setStyleSheet("font-family: monospace;");
    logDock_ = new QDockWidget("Log", this);
    logDock_->setObjectName("LogDock");
    logDock_->setWidget(logView_);
    addDockWidget(Qt::BottomDockWidgetArea, logDock_);
    logDock_->setVisible(CONFIG.ui().showLog);

    logSink_ = std::make_shared<spdlog::sinks::qt_sink_mt>(logView_, "appendPlainText");
    logSink_->set_pattern("[%H:%M:%S] [%l] %v");
    Logger::addSink(logSink_);
}

void MainWindow::setupMenuBar() {
    auto* fileMenu = menuBar()->addMenu("&File");
    fileMenu->addAction("Save &Snapshot...",
                        QKeySequence(Qt::CTRL | Qt::Key_S),
                        this,
                        &MainWindow::onSnapshot);
    fileMenu->addSeparator();
    fileMenu->addAction("E&xit", QKeySequence::Quit, this, &QMainWindow::close);

    auto* sessionMenu = menuBar()->addMenu("&Session");
    sessionMenu->addAction("Start &Preview",
                           QKeySequence(Qt::CTRL | Qt::Key_P),
                           this,
                           &MainWindow::onStartPreview);
    sessionMenu->addAction("Stop P&review", this, &MainWindow::onStopPreview);
    sessionMenu->addSeparator();
    sessionMenu->addAction("Start &Recording",
                           QKeySequence(Qt::CTRL | Qt::Key_R),
                           this,
                           &MainWindow::onStartRecording);
    sessionMenu->addAction("S&top Recording",
                           QKeySequence(Qt::CTRL | Qt::Key_T),
                           this,
                           &MainWindow::onStopRecording);

    auto* toolsMenu = menuBar()->addMenu("&Tools");
    toolsMenu->addAction("List &Devices", this, &MainWindow::onListDevices);
    toolsMenu->addAction("List &Modes", this, &MainWindow::onListModes);

    auto* viewMenu = menuBar()->addMenu("&View");
    auto* showLogAction = viewMenu->addAction("Show &Log");
    showLogAction->setCheckable(true);
    showLogAction->setChecked(logDock_->isVisible());
    connect(showLogAction, &QAction::toggled, logDock_, &QDockWidget::setVisible);
    connect(logDock_, &QDockWidget::visibilityChanged, showLogAction, &QAction::setChecked);
}

void MainWindow::setupConnections() {
    connect(controls_, &SessionControls::startPreviewRequested, this, &MainWindow::onStartPreview);
    connect(controls_, &SessionControls::stopPreviewRequested, this, &MainWindow::onStopPreview);
    connect(controls_, &SessionControls::snapshotRequested, this, &MainWindow::onSnapshot);
    connect(controls_, &SessionControls::startRecordingRequested, this, &MainWindow::onStartRecording);
    connect(controls_, &SessionControls::stopRecordingRequested, this, &MainWindow::onStopRecording);
    connect(controls_, &SessionControls::listDevicesRequested, this, &MainWindow::onListDevices);
    connect(controls_, &SessionControls::listModesRequested, this, &MainWindow::onListModes);

    if (orchestrator_) {
        // Sender lives on the control thread: all of these are queued
        connect(orchestrator_, &SessionOrchestrator::stateChanged, this, &MainWindow::onStateChanged);
        connect(orchestrator_, &SessionOrchestrator::statusMessage, this, [this](const QString& msg) {
            controls_->setStatus(msg);
            statusBar()->showMessage(msg, 8000);
        });
        connect(orchestrator_, &SessionOrchestrator::elapsedChanged, controls_, &SessionControls::setElapsed);
        connect(orchestrator_, &SessionOrchestrator::countdownChanged, this, &MainWindow::onCountdown);
        connect(orchestrator_, &SessionOrchestrator::captureModeChanged, this, &MainWindow::onCaptureMode);
        connect(orchestrator_, &SessionOrchestrator::previewFrameAvailable, this, &MainWindow::onPreviewFrame);
        connect(orchestrator_, &SessionOrchestrator::recordingReviewed, this, &MainWindow::onRecordingReviewed);
    }

    connect(&frameWatch_, &QTimer::timeout, this, [this] {
        const bool live = !lastFrame_.isNull() && Clock::now() - lastFrameAt_ < kFrameStaleAfter;
        controls_->setPreviewLive(live);
    });
    frameWatch_.start(500);
}

void MainWindow::post(const char* what, std::function<Result<void>()> operation) {
    if (!orchestrator_)
        return;
    QMetaObject::invokeMethod(
            orchestrator_,
            [what, operation = std::move(operation)] {
                if (auto r = operation(); !r)
                    LOG_DEBUG("{} not done: {}", what, r.error().message);
            },
            Qt::QueuedConnection);
}

void MainWindow::refreshDevices() {
    if (!captureAdapter_)
        return;
    controls_->setDevices(captureAdapter_->listDevices(DeviceKind::Video),
                          captureAdapter_->listDevices(DeviceKind::Audio));
}

void MainWindow::onStartPreview() {
    const auto cameraId = controls_->cameraId();
    const ResolutionPreset preset = controls_->preset();
    auto* orchestrator = orchestrator_;
    post("Start preview", [orchestrator, cameraId, preset] {
        return orchestrator->startPreview(cameraId, preset);
    });
}

void MainWindow::onStopPreview() {
    auto* orchestrator = orchestrator_;
    post("Stop preview", [orchestrator] { return orchestrator->stopPreview(); });
}

void MainWindow::onStartRecording() {
    const auto& session = CONFIG.session();
    const auto dir = file::expandHome(session.outputDirectory.string());
    file::ensureDir(dir);
    const auto suggested = dir / (file::expandFilenamePattern(session.filenamePattern) + ".mp4");

    const QString path = QFileDialog::getSaveFileName(this,
                                                      "Record to",
                                                      QString::fromStdString(suggested.string()),
                                                      "MP4 Video (*.mp4)",
                                                      nullptr,
                                                      QFileDialog::DontUseNativeDialog);
    if (path.isEmpty())
        return;

    const auto& engine = CONFIG.engine();
    SessionConfig config;
    config.engineBinaryPath = engine.binaryPath;
    config.cameraId = controls_->cameraId();
    config.microphoneId = controls_->microphoneId();
    config.outputPath = path.toStdString();
    std::tie(config.width, config.height) = lastMode_.value_or(nominalSize(controls_->preset()));
    config.frameRate = controls_->frameRate();
    config.preferHardwareEncoder = engine.preferHardware;
    config.validateModeBeforeStart = engine.validateMode;
    config.useLowCompressionFallbackCodec = engine.lowCompressionFallback;

    auto* orchestrator = orchestrator_;
    post("Start recording", [orchestrator, config] {
        return orchestrator->startRecording(config);
    });
}

void MainWindow::onStopRecording() {
    auto* orchestrator = orchestrator_;
    post("Stop recording", [orchestrator] { return orchestrator->stopRecording(); });
}

void MainWindow::onSnapshot() {
    if (!orchestrator_)
        return;
    const QImage frame = orchestrator_->snapshot();
    if (frame.isNull()) {
        statusBar()->showMessage("No frame to save yet", 5000);
        return;
    }

    const auto dir = file::expandHome(CONFIG.session().outputDirectory.string());
    const auto suggested = dir / (file::expandFilenamePattern("snapshot_{date}_{time}") + ".jpg");
    QString path = QFileDialog::getSaveFileName(this,
                                                "Save Snapshot",
                                                QString::fromStdString(suggested.string()),
                                                "JPEG (*.jpg *.jpeg);;PNG (*.png);;Bitmap (*.bmp)",
                                                nullptr,
                                                QFileDialog::DontUseNativeDialog);
    if (path.isEmpty())
        return;
    if (QFileInfo(path).suffix().isEmpty())
        path += ".jpg";

    if (frame.save(path)) {
        LOG_INFO("Snapshot saved to {}", path.toStdString());
        statusBar()->showMessage("Snapshot saved: " + path, 5000);
    } else {
        LOG_ERROR("Could not save snapshot to {}", path.toStdString());
        QMessageBox::warning(this, "Snapshot", "Could not save " + path);
    }
}

void MainWindow::onListDevices() {
    refreshDevices();
    const auto binary = CONFIG.engine().binaryPath;
    const auto timeout = static_cast<int>(CONFIG.engine().probeTimeoutMs);
    post("List devices", [binary, timeout]() -> Result<void> {
        if (auto r = EngineIntrospection::logSources(binary, DeviceKind::Video, timeout); !r)
            return r;
        return EngineIntrospection::logSources(binary, DeviceKind::Audio, timeout);
    });
}

void MainWindow::onListModes() {
    const auto cameraId = controls_->cameraId();
    if (cameraId.empty()) {
        statusBar()->showMessage("Select a camera first", 5000);
        return;
    }
    const auto binary = CONFIG.engine().binaryPath;
    const auto timeout = static_cast<int>(CONFIG.engine().probeTimeoutMs);
    post("List modes", [binary, cameraId, timeout] {
        return EngineIntrospection::logModes(binary, cameraId, timeout);
    });
}

void MainWindow::onStateChanged(SessionState state) {
    state_ = state;
    controls_->updateState(state);

    QString title = "Booth Recorder";
    if (state == SessionState::Recording)
        title = "⏺ " + title;
    setWindowTitle(title);

    // Drop the last frame so a closed camera leaves no ghost image
    if (state == SessionState::Idle) {
        lastFrame_ = QImage();
        preview_->clear();
        preview_->setText("No preview");
    }
}

void MainWindow::onPreviewFrame() {
    if (!orchestrator_)
        return;
    lastFrame_ = orchestrator_->takePreviewFrame();
    if (lastFrame_.isNull() || state_ == SessionState::Idle)
        return;
    lastFrameAt_ = Clock::now();
    preview_->setPixmap(QPixmap::fromImage(lastFrame_).scaled(
            preview_->size(), Qt::KeepAspectRatio, Qt::SmoothTransformation));
}

void MainWindow::onCountdown(int remaining) {
    if (remaining <= 0) {
        countdownLabel_->hide();
        return;
    }
    countdownLabel_->setText(QString::number(remaining));
    placeCountdown();
    countdownLabel_->show();
    countdownLabel_->raise();
}

void MainWindow::onCaptureMode(int width, int height, int frameRate) {
    lastMode_ = std::make_pair(static_cast<u32>(width), static_cast<u32>(height));
    if (frameRate > 0)
        controls_->selectFrameRate(frameRate);
}

void MainWindow::onRecordingReviewed(const QString& path, bool kept) {
    if (!kept) {
        statusBar()->showMessage("Recording discarded", 5000);
        return;
    }
    statusBar()->showMessage("Saved: " + path, 8000);
    const auto folder = QFileInfo(path).absolutePath();
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(folder)))
        LOG_WARN("Could not open {}", folder.toStdString());
}

void MainWindow::placeCountdown() {
    countdownLabel_->move((preview_->width() - countdownLabel_->width()) / 2,
                          (preview_->height() - countdownLabel_->height()) / 2);
}

void MainWindow::resizeEvent(QResizeEvent* event) {
    QMainWindow::resizeEvent(event);
    placeCountdown();
}

void MainWindow::detachLogSink() {
    if (!logSink_)
        return;
    Logger::removeSink(logSink_);
    logSink_.reset();
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (state_ == SessionState::Recording) {
        auto reply = QMessageBox::question(this,
                                           "Recording Active",
                                           "Recording in progress. Stop and exit?",
                                           QMessageBox::Yes | QMessageBox::No);
        if (reply == QMessageBox::No) {
            event->ignore();
            return;
        }
    }
    if (CONFIG.isDirty()) {
        if (auto r = CONFIG.save(CONFIG.configPath()); !r)
            LOG_WARN("Could not save config: {}", r.error().message);
    }
    event->accept();
}

} // namespace vb
