#pragma once
// SessionControls.hpp - Device selection and session buttons
// Everything the operator touches lives here; state comes from the session

#include "capture/CaptureTypes.hpp"
#include "session/SessionStateMachine.hpp"
#include "util/Types.hpp"

#include <QComboBox>
#include <QLabel>
#include <QPushButton>
#include <QWidget>
#include <optional>

namespace vb {

class SessionControls : public QWidget {
    Q_OBJECT

public:
    explicit SessionControls(QWidget* parent = nullptr);

    void setDevices(const std::vector<DeviceInfo>& cameras,
                    const std::vector<DeviceInfo>& microphones);

    std::string cameraId() const;
    std::optional<std::string> microphoneId() const;
    const ResolutionPreset& preset() const;
    std::optional<u32> frameRate() const;

signals:
    void startPreviewRequested();
    void stopPreviewRequested();
    void snapshotRequested();
    void startRecordingRequested();
    void stopRecordingRequested();
    void listDevicesRequested();
    void listModesRequested();

public slots:
    void updateState(vb::SessionState state);
    void setElapsed(const QString& text);
    void setStatus(const QString& text);
    void setPreviewLive(bool live);
    void selectFrameRate(int fps);

private:
    void setupUI();
    static void setLamp(QLabel* lamp, bool on, const char* color);

    QComboBox* cameraCombo_{nullptr};
    QComboBox* micCombo_{nullptr};
    QComboBox* presetCombo_{nullptr};
    QComboBox* fpsCombo_{nullptr};

    QPushButton* startPreviewButton_{nullptr};
    QPushButton* stopPreviewButton_{nullptr};
    QPushButton* snapshotButton_{nullptr};
    QPushButton* startRecordButton_{nullptr};
    QPushButton* stopRecordButton_{nullptr};
    QPushButton* listDevicesButton_{nullptr};
    QPushButton* listModesButton_{nullptr};

    QLabel* previewLamp_{nullptr};
    QLabel* recordLamp_{nullptr};
    QLabel* statusLabel_{nullptr};
    QLabel* elapsedLabel_{nullptr};

    SessionState state_{SessionState::Idle};
};

} // namespace vb
