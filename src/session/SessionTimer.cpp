#include "SessionTimer.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace vb {

SessionTimer::SessionTimer(QObject* parent)
    : QObject(parent), ticker_(this), clock_([] { return Clock::now(); }) {
    ticker_.setInterval(kTickIntervalMs);
    ticker_.setTimerType(Qt::CoarseTimer);
    connect(&ticker_, &QTimer::timeout, this, &SessionTimer::tick);
}

void SessionTimer::start() {
    startedAt_ = clock_();
    elapsed_ = Duration{0};
    running_ = true;
    ticker_.start();
    emit elapsedChanged(elapsedText());
}

void SessionTimer::stop() {
    ticker_.stop();
    running_ = false;
}

void SessionTimer::reset() {
    elapsed_ = Duration{0};
    startedAt_ = clock_();
    emit elapsedChanged(elapsedText());
}

void SessionTimer::armAutoStop(Duration maxDuration) {
    maxDuration_ = maxDuration;
    autoStopArmed_ = maxDuration.count() > 0;
}

void SessionTimer::disarmAutoStop() {
    autoStopArmed_ = false;
}

QString SessionTimer::elapsedText() const {
    return QString::fromStdString(file::formatDuration(elapsed_));
}

void SessionTimer::tick() {
    if (!running_)
        return;

    elapsed_ = std::chrono::duration_cast<Duration>(clock_() - startedAt_);
    emit elapsedChanged(elapsedText());

    if (autoStopArmed_ && elapsed_ >= maxDuration_) {
        // Disarm first so a slow stop cannot be requested twice
        autoStopArmed_ = false;
        LOG_INFO("Max duration {} reached, stopping",
                 file::formatDuration(maxDuration_));
        emit stopRequested();
    }
}

} // namespace vb
