#include "ReviewDialog.hpp"
#include "core/Logger.hpp"

#include <QCoreApplication>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QUrl>
#include <QVBoxLayout>

namespace vb {

ReviewDialog::ReviewDialog(const std::filesystem::path& recording, QWidget* parent)
    : QDialog(parent) {
    const auto path = QString::fromStdString(recording.string());
    setWindowTitle("Review recording");
    resize(960, 620);

    auto* layout = new QVBoxLayout(this);
    auto* name = new QLabel(QString::fromStdString(recording.filename().string()));
    name->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layout->addWidget(name);

    video_ = new QVideoWidget();
    video_->setMinimumSize(640, 360);
    layout->addWidget(video_, 1);

    auto* buttons = new QHBoxLayout();
    auto* playAgain = new QPushButton("Play again");
    auto* retake = new QPushButton("Retake");
    auto* keep = new QPushButton("Keep");
    keep->setDefault(true);
    buttons->addWidget(playAgain);
    buttons->addStretch();
    buttons->addWidget(retake);
    buttons->addWidget(keep);
    layout->addLayout(buttons);

    connect(keep, &QPushButton::clicked, this, &ReviewDialog::onKeep);
    connect(retake, &QPushButton::clicked, this, &ReviewDialog::onRetake);
    connect(playAgain, &QPushButton::clicked, this, &ReviewDialog::onPlayAgain);

    player_.setAudioOutput(&audio_);
    player_.setVideoOutput(video_);
    connect(&player_, &QMediaPlayer::errorOccurred, this,
            [](QMediaPlayer::Error, const QString& message) {
                LOG_WARN("Review playback: {}", message.toStdString());
            });

    player_.setSource(QUrl::fromLocalFile(path));
    player_.play();
}

ReviewDialog::~ReviewDialog() {
    releaseMedia();
}

void ReviewDialog::releaseMedia() {
    player_.stop();
    player_.setSource(QUrl());
}

void ReviewDialog::onKeep() {
    keep_ = true;
    releaseMedia();
    accept();
}

void ReviewDialog::onRetake() {
    keep_ = false;
    releaseMedia();
    accept();
}

void ReviewDialog::onPlayAgain() {
    player_.setPosition(0);
    player_.play();
}

void DialogReviewGate::review(const std::filesystem::path& recording, Decision decide) {
    QObject* context = parent_ ? static_cast<QObject*>(parent_.data())
                               : QCoreApplication::instance();
    QPointer<QWidget> parent = parent_;

    QMetaObject::invokeMethod(
            context,
            [recording, decide = std::move(decide), parent] {
                ReviewDialog dialog(recording, parent.data());
                dialog.exec();
                dialog.releaseMedia();
                decide(dialog.keep());
            },
            Qt::QueuedConnection);
}

} // namespace vb
