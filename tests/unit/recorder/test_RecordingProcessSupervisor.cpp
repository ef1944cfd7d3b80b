#include <QtTest>
#include <QElapsedTimer>
#include <QTemporaryDir>
#include <algorithm>
#include <signal.h>
#include <filesystem>
#include "recorder/RecordingProcessSupervisor.hpp"
#include "support/TestSupport.hpp"

using namespace vb;
namespace fs = std::filesystem;

class TestRecordingProcessSupervisor : public QObject {
    Q_OBJECT

private:
    SessionConfig configFor(const QString& script, const QTemporaryDir& dir) {
        SessionConfig config;
        config.engineBinaryPath = script.toStdString();
        config.cameraId = "/dev/video0";
        config.outputPath = fs::path(dir.path().toStdString()) / "out" / "take.mp4";
        return config;
    }

private slots:
    void testGracefulStop() {
        QTemporaryDir dir;
        auto config = configFor(test::engine::graceful(dir), dir);

        RecordingProcessSupervisor supervisor;
        int exits = 0;
        supervisor.exited.connect([&] { ++exits; });

        auto r = supervisor.start(config, EncoderCandidate::X264);
        QVERIFY(r.isOk());
        QVERIFY(supervisor.isRunning());
        QVERIFY(supervisor.settle(300));

        QVERIFY(supervisor.stop(3000).isOk());
        QVERIFY(!supervisor.isRunning());
        QCOMPARE(exits, 1);
        QVERIFY(fs::exists(config.outputPath));

        // Nothing left to stop
        QVERIFY(supervisor.stop(3000).isOk());
        QCOMPARE(exits, 1);
    }

    void testStubbornEngineIsKilled() {
        QTemporaryDir dir;
        auto config = configFor(test::engine::stubborn(dir), dir);

        RecordingProcessSupervisor supervisor;
        int exits = 0;
        supervisor.exited.connect([&] { ++exits; });

        QVERIFY(supervisor.start(config, EncoderCandidate::X264).isOk());
        QVERIFY(supervisor.settle(200));

        QElapsedTimer clock;
        clock.start();
        QVERIFY(supervisor.stop(300).isOk());
        QVERIFY(clock.elapsed() <
                300 + RecordingProcessSupervisor::kKillConfirmMs + 1000);
        QVERIFY(!supervisor.isRunning());
        QCOMPARE(exits, 1);
    }

    void testKillFollowsPoliteTimeout() {
        QTemporaryDir dir;
        auto config = configFor(test::engine::stubborn(dir), dir);

        RecordingProcessSupervisor supervisor;
        QElapsedTimer clock;
        qint64 killedAfterMs = -1;
        supervisor.setKillHook([&](qint64 pid) {
            killedAfterMs = clock.elapsed();
            ::kill(static_cast<pid_t>(-pid), SIGKILL);
        });

        QVERIFY(supervisor.start(config, EncoderCandidate::X264).isOk());
        QVERIFY(supervisor.settle(200));

        clock.start();
        QVERIFY(supervisor.stop(400).isOk());
        QVERIFY(killedAfterMs >= 0);
        QVERIFY(killedAfterMs < 400 + 300);
        QVERIFY(!supervisor.isRunning());
    }

    void testUnconfirmedKillIsReported() {
        QTemporaryDir dir;
        auto config = configFor(test::engine::stubborn(dir), dir);

        RecordingProcessSupervisor supervisor;
        int exits = 0;
        qint64 survivor = 0;
        supervisor.exited.connect([&] { ++exits; });
        // The group outlives the kill
        supervisor.setKillHook([&](qint64 pid) { survivor = pid; });

        QVERIFY(supervisor.start(config, EncoderCandidate::X264).isOk());
        QVERIFY(supervisor.settle(200));

        auto r = supervisor.stop(200);
        QVERIFY(r.isErr());
        QCOMPARE(r.error().code, ErrorCode::StopTimeout);
        QVERIFY(!supervisor.isRunning());
        QCOMPARE(exits, 1);

        QVERIFY(survivor > 0);
        ::kill(static_cast<pid_t>(-survivor), SIGKILL);
    }

    void testCrashIsReportedOnce() {
        QTemporaryDir dir;
        auto config = configFor(test::engine::crashing(dir), dir);

        RecordingProcessSupervisor supervisor;
        int exits = 0;
        std::vector<std::string> lines;
        supervisor.exited.connect([&] { ++exits; });
        supervisor.outputLine.connect([&](const std::string& l) { lines.push_back(l); });

        QVERIFY(supervisor.start(config, EncoderCandidate::X264).isOk());
        QVERIFY(!supervisor.settle(2000));
        QVERIFY(!supervisor.isRunning());
        QCOMPARE(exits, 1);
        QVERIFY(std::find(lines.begin(), lines.end(), "boom") != lines.end());
    }

    void testSecondStartIsRejected() {
        QTemporaryDir dir;
        auto config = configFor(test::engine::graceful(dir), dir);

        RecordingProcessSupervisor supervisor;
        QVERIFY(supervisor.start(config, EncoderCandidate::X264).isOk());

        auto again = supervisor.start(config, EncoderCandidate::X264);
        QVERIFY(again.isErr());
        QCOMPARE(again.error().code, ErrorCode::AlreadyRunning);

        QVERIFY(supervisor.stop(3000).isOk());
        QVERIFY(!supervisor.isRunning());
    }

    void testMissingEngine() {
        QTemporaryDir dir;
        auto config = configFor(dir.filePath("no-such-engine"), dir);

        RecordingProcessSupervisor supervisor;
        int exits = 0;
        supervisor.exited.connect([&] { ++exits; });

        auto r = supervisor.start(config, EncoderCandidate::X264);
        QVERIFY(r.isErr());
        QCOMPARE(r.error().code, ErrorCode::EngineNotFound);
        QVERIFY(!supervisor.isRunning());
        QCOMPARE(exits, 0);
    }

    void testStopWithoutStart() {
        RecordingProcessSupervisor supervisor;
        int exits = 0;
        supervisor.exited.connect([&] { ++exits; });
        QVERIFY(supervisor.stop(100).isOk());
        QVERIFY(!supervisor.settle(10));
        QCOMPARE(exits, 0);
    }

    void testDestructorKillsLiveEngine() {
        QTemporaryDir dir;
        auto config = configFor(test::engine::stubborn(dir), dir);
        {
            RecordingProcessSupervisor supervisor;
            QVERIFY(supervisor.start(config, EncoderCandidate::X264).isOk());
            QVERIFY(supervisor.isRunning());
        }
        // Reaching here without hanging is the check
        QVERIFY(true);
    }
};

int runTestRecordingProcessSupervisor(int argc, char** argv) {
    TestRecordingProcessSupervisor tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_RecordingProcessSupervisor.moc"
