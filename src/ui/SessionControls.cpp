#include "SessionControls.hpp"
#include "core/Config.hpp"

#include <QFormLayout>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QVBoxLayout>

namespace vb {

namespace {
constexpr const char* kNoAudio = "(No audio)";
} // namespace

SessionControls::SessionControls(QWidget* parent) : QWidget(parent) {
    setupUI();
    updateState(SessionState::Idle);
}

void SessionControls::setupUI() {
    auto* layout = new QVBoxLayout(this);

    auto* devicesGroup = new QGroupBox("Devices");
    auto* form = new QFormLayout(devicesGroup);

    cameraCombo_ = new QComboBox();
    micCombo_ = new QComboBox();
    presetCombo_ = new QComboBox();
    fpsCombo_ = new QComboBox();

    for (const auto& p : presets::kResolutions)
        presetCombo_->addItem(QString::fromUtf8(p.label.data(),
                                                static_cast<int>(p.label.size())));
    const auto& configured = presets::byName(CONFIG.capture().defaultPreset);
    presetCombo_->setCurrentText(QString::fromUtf8(configured.label.data(),
                                                   static_cast<int>(configured.label.size())));

    for (auto fps : presets::kFrameRates)
        fpsCombo_->addItem(QString("%1 fps").arg(fps), fps);
    selectFrameRate(static_cast<int>(CONFIG.capture().defaultFps));

    form->addRow("Camera:", cameraCombo_);
    form->addRow("Microphone:", micCombo_);
    form->addRow("Resolution:", presetCombo_);
    form->addRow("Frame rate:", fpsCombo_);
    layout->addWidget(devicesGroup);

    auto* sessionGroup = new QGroupBox("Session");
    auto* grid = new QGridLayout(sessionGroup);

    startPreviewButton_ = new QPushButton("Start Preview");
    stopPreviewButton_ = new QPushButton("Stop Preview");
    snapshotButton_ = new QPushButton("Snapshot");
    startRecordButton_ = new QPushButton("⏺ Record");
    stopRecordButton_ = new QPushButton("⏹ Stop");
    startRecordButton_->setMinimumHeight(40);
    stopRecordButton_->setMinimumHeight(40);

    grid->addWidget(startPreviewButton_, 0, 0);
    grid->addWidget(stopPreviewButton_, 0, 1);
    grid->addWidget(snapshotButton_, 1, 0, 1, 2);
    grid->addWidget(startRecordButton_, 2, 0);
    grid->addWidget(stopRecordButton_, 2, 1);
    layout->addWidget(sessionGroup);

    auto* statusGroup = new QGroupBox("Status");
    auto* statusLayout = new QFormLayout(statusGroup);
    previewLamp_ = new QLabel();
    recordLamp_ = new QLabel();
    previewLamp_->setFixedSize(14, 14);
    recordLamp_->setFixedSize(14, 14);
    statusLabel_ = new QLabel("Idle");
    statusLabel_->setWordWrap(true);
    elapsedLabel_ = new QLabel("00:00");
    elapsedLabel_->setStyleSheet("font-size: 20px; font-weight: bold;");

    statusLayout->addRow("Preview:", previewLamp_);
    statusLayout->addRow("Recording:", recordLamp_);
    statusLayout->addRow("Elapsed:", elapsedLabel_);
    statusLayout->addRow("Status:", statusLabel_);
    layout->addWidget(statusGroup);

    auto* diagLayout = new QHBoxLayout();
    listDevicesButton_ = new QPushButton("List Devices");
    listModesButton_ = new QPushButton("List Modes");
    diagLayout->addWidget(listDevicesButton_);
    diagLayout->addWidget(listModesButton_);
    layout->addLayout(diagLayout);

    layout->addStretch();

    setLamp(previewLamp_, false, "#2ecc71");
    setLamp(recordLamp_, false, "#e74c3c");

    connect(startPreviewButton_, &QPushButton::clicked, this, &SessionControls::startPreviewRequested);
    connect(stopPreviewButton_, &QPushButton::clicked, this, &SessionControls::stopPreviewRequested);
    connect(snapshotButton_, &QPushButton::clicked, this, &SessionControls::snapshotRequested);
    connect(startRecordButton_, &QPushButton::clicked, this, &SessionControls::startRecordingRequested);
    connect(stopRecordButton_, &QPushButton::clicked, this, &SessionControls::stopRecordingRequested);
    connect(listDevicesButton_, &QPushButton::clicked, this, &SessionControls::listDevicesRequested);
    connect(listModesButton_, &QPushButton::clicked, this, &SessionControls::listModesRequested);
}

void SessionControls::setDevices(const std::vector<DeviceInfo>& cameras,
                                 const std::vector<DeviceInfo>& microphones) {
    const auto previousCamera = cameraCombo_->currentData().toString();
    const auto previousMic = micCombo_->currentData().toString();

    cameraCombo_->clear();
    for (const auto& c : cameras)
        cameraCombo_->addItem(QString::fromStdString(c.displayName),
                              QString::fromStdString(c.id));

    micCombo_->clear();
    micCombo_->addItem(kNoAudio, QString());
    for (const auto& m : microphones)
        micCombo_->addItem(QString::fromStdString(m.displayName),
                           QString::fromStdString(m.id));

    if (int i = cameraCombo_->findData(previousCamera); i >= 0)
        cameraCombo_->setCurrentIndex(i);
    if (int i = micCombo_->findData(previousMic); i >= 0)
        micCombo_->setCurrentIndex(i);
}

std::string SessionControls::cameraId() const {
    return cameraCombo_->currentData().toString().toStdString();
}

std::optional<std::string> SessionControls::microphoneId() const {
    auto id = micCombo_->currentData().toString();
    if (id.isEmpty())
        return std::nullopt;
    return id.toStdString();
}

const ResolutionPreset& SessionControls::preset() const {
    const auto index = presetCombo_->currentIndex();
    if (index < 0 || index >= static_cast<int>(presets::kResolutions.size()))
        return presets::bestAvailable();
    return presets::kResolutions[static_cast<usize>(index)];
}

std::optional<u32> SessionControls::frameRate() const {
    bool ok = false;
    const auto fps = fpsCombo_->currentData().toUInt(&ok);
    if (!ok || fps == 0)
        return std::nullopt;
    return fps;
}

void SessionControls::selectFrameRate(int fps) {
    if (int i = fpsCombo_->findData(static_cast<u32>(fps)); i >= 0)
        fpsCombo_->setCurrentIndex(i);
}

void SessionControls::updateState(SessionState state) {
    state_ = state;

    const bool idle = state == SessionState::Idle;
    const bool previewing = state == SessionState::Previewing;
    const bool recording = state == SessionState::Recording;
    const bool selectable = idle || previewing;

    cameraCombo_->setEnabled(selectable);
    micCombo_->setEnabled(selectable);
    presetCombo_->setEnabled(selectable);
    fpsCombo_->setEnabled(selectable);

    startPreviewButton_->setEnabled(idle);
    stopPreviewButton_->setEnabled(previewing);
    snapshotButton_->setEnabled(previewing || recording);
    startRecordButton_->setEnabled(selectable);
    stopRecordButton_->setEnabled(recording);
    listDevicesButton_->setEnabled(state != SessionState::Busy);
    listModesButton_->setEnabled(state != SessionState::Busy);

    setLamp(recordLamp_, recording, "#e74c3c");
    if (!recording)
        elapsedLabel_->setStyleSheet("font-size: 20px; font-weight: bold;");
    else
        elapsedLabel_->setStyleSheet("font-size: 20px; font-weight: bold; color: #e74c3c;");
}

void SessionControls::setElapsed(const QString& text) {
    elapsedLabel_->setText(text);
}

void SessionControls::setStatus(const QString& text) {
    statusLabel_->setText(text);
}

void SessionControls::setPreviewLive(bool live) {
    setLamp(previewLamp_, live, "#2ecc71");
}

void SessionControls::setLamp(QLabel* lamp, bool on, const char* color) {
    lamp->setStyleSheet(QString("border-radius: 7px; background-color: %1;")
                                .arg(on ? color : "#555555"));
}

} // namespace vb
