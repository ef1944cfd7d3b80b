#include <QSignalSpy>
#include <QtTest>
#include "session/SessionTimer.hpp"

using namespace vb;
using namespace std::chrono_literals;

class TestSessionTimer : public QObject {
    Q_OBJECT

private:
    TimePoint now_{};

    void useFakeClock(SessionTimer& timer) {
        now_ = TimePoint{} + 1h;
        timer.setClock([this] { return now_; });
    }

private slots:
    void testStartPublishesZero() {
        SessionTimer timer;
        useFakeClock(timer);
        QSignalSpy spy(&timer, &SessionTimer::elapsedChanged);

        timer.start();
        QVERIFY(timer.isRunning());
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).toString(), QString("00:00"));
    }

    void testElapsedText() {
        SessionTimer timer;
        useFakeClock(timer);
        timer.start();

        now_ += 65s;
        timer.tick();
        QCOMPARE(timer.elapsedText(), QString("01:05"));

        now_ += 1h - 3s;
        timer.tick();
        QCOMPARE(timer.elapsedText(), QString("01:01:02"));
    }

    void testTickWhileStoppedDoesNothing() {
        SessionTimer timer;
        useFakeClock(timer);
        QSignalSpy spy(&timer, &SessionTimer::elapsedChanged);

        now_ += 10s;
        timer.tick();
        QCOMPARE(spy.count(), 0);
        QCOMPARE(timer.elapsed(), Duration{0});

        timer.start();
        timer.stop();
        now_ += 10s;
        timer.tick();
        QCOMPARE(spy.count(), 1);
        QVERIFY(!timer.isRunning());
    }

    void testAutoStopFiresOnce() {
        SessionTimer timer;
        useFakeClock(timer);
        QSignalSpy stops(&timer, &SessionTimer::stopRequested);

        timer.start();
        timer.armAutoStop(3s);
        QVERIFY(timer.isAutoStopArmed());

        now_ += 2s;
        timer.tick();
        QCOMPARE(stops.count(), 0);

        now_ += 1s;
        timer.tick();
        QCOMPARE(stops.count(), 1);
        QVERIFY(!timer.isAutoStopArmed());

        now_ += 5s;
        timer.tick();
        QCOMPARE(stops.count(), 1);
    }

    void testZeroDurationNeverArms() {
        SessionTimer timer;
        useFakeClock(timer);
        QSignalSpy stops(&timer, &SessionTimer::stopRequested);

        timer.start();
        timer.armAutoStop(Duration{0});
        QVERIFY(!timer.isAutoStopArmed());

        now_ += 10min;
        timer.tick();
        QCOMPARE(stops.count(), 0);
    }

    void testDisarm() {
        SessionTimer timer;
        useFakeClock(timer);
        QSignalSpy stops(&timer, &SessionTimer::stopRequested);

        timer.start();
        timer.armAutoStop(1s);
        timer.disarmAutoStop();
        now_ += 5s;
        timer.tick();
        QCOMPARE(stops.count(), 0);
    }

    void testReset() {
        SessionTimer timer;
        useFakeClock(timer);
        timer.start();
        now_ += 42s;
        timer.tick();
        QCOMPARE(timer.elapsedText(), QString("00:42"));

        QSignalSpy spy(&timer, &SessionTimer::elapsedChanged);
        timer.reset();
        QCOMPARE(timer.elapsed(), Duration{0});
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).toString(), QString("00:00"));
    }

    void testTickerDrivesTick() {
        SessionTimer timer;
        QSignalSpy spy(&timer, &SessionTimer::elapsedChanged);
        timer.start();
        QTRY_VERIFY_WITH_TIMEOUT(spy.count() >= 2, SessionTimer::kTickIntervalMs * 3);
        timer.stop();
    }
};

int runTestSessionTimer(int argc, char** argv) {
    TestSessionTimer tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_SessionTimer.moc"
