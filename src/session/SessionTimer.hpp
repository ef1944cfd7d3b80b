/**
 * @file SessionTimer.hpp
 * @brief Elapsed recording time and the max-duration auto-stop.
 *
 * Ticks once per second on the thread it lives on (the control thread).
 * The clock can be replaced so tests can drive tick() by hand.
 */

#pragma once
#include <QObject>
#include <QString>
#include <QTimer>
#include <functional>
#include "util/Types.hpp"

namespace vb {

class SessionTimer : public QObject {
    Q_OBJECT

public:
    using ClockFn = std::function<TimePoint()>;

    static constexpr int kTickIntervalMs = 1000;

    explicit SessionTimer(QObject* parent = nullptr);

    void setClock(ClockFn clock) {
        clock_ = std::move(clock);
    }

    void start();
    void stop();
    // Elapsed back to zero, publishes "00:00"
    void reset();

    void armAutoStop(Duration maxDuration);
    void disarmAutoStop();
    bool isAutoStopArmed() const {
        return autoStopArmed_;
    }

    bool isRunning() const {
        return running_;
    }
    Duration elapsed() const {
        return elapsed_;
    }
    QString elapsedText() const;

    void tick();

signals:
    void elapsedChanged(const QString& text);
    void stopRequested();

private:
    QTimer ticker_;
    ClockFn clock_;
    TimePoint startedAt_{};
    Duration elapsed_{0};
    Duration maxDuration_{0};
    bool running_{false};
    bool autoStopArmed_{false};
};

} // namespace vb
