#pragma once
// ReviewDialog.hpp - Play back a fresh recording, then keep or retake
// Closing the window keeps the file

#include "session/ReviewGate.hpp"

#include <QAudioOutput>
#include <QDialog>
#include <QMediaPlayer>
#include <QPointer>
#include <QVideoWidget>
#include <filesystem>

namespace vb {

class ReviewDialog : public QDialog {
    Q_OBJECT

public:
    ReviewDialog(const std::filesystem::path& recording, QWidget* parent = nullptr);
    ~ReviewDialog() override;

    bool keep() const {
        return keep_;
    }

    // Stops playback and lets go of the file
    void releaseMedia();

private slots:
    void onKeep();
    void onRetake();
    void onPlayAgain();

private:
    QAudioOutput audio_;
    QMediaPlayer player_;
    QVideoWidget* video_{nullptr};
    bool keep_{true};
};

// Shows a ReviewDialog on the UI thread for every finished recording
class DialogReviewGate : public ReviewGate {
public:
    void setParentWidget(QWidget* parent) {
        parent_ = parent;
    }

    void review(const std::filesystem::path& recording, Decision decide) override;

private:
    QPointer<QWidget> parent_;
};

} // namespace vb
