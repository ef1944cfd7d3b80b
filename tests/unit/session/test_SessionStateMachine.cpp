#include <QtTest>
#include <stdexcept>
#include <vector>
#include "session/SessionStateMachine.hpp"

using namespace vb;

class TestSessionStateMachine : public QObject {
    Q_OBJECT

private slots:
    void testStartsIdle() {
        SessionStateMachine machine;
        QVERIFY(machine.is(SessionState::Idle));
    }

    void testSettleLeavesBusy() {
        SessionStateMachine machine;
        std::vector<SessionState> seen;
        machine.stateChanged.connect([&](SessionState s) { seen.push_back(s); });

        {
            auto guard = machine.tryBegin({SessionState::Idle});
            QVERIFY(guard.has_value());
            QVERIFY(machine.is(SessionState::Busy));
            guard->settle(SessionState::Previewing);
            QVERIFY(machine.is(SessionState::Previewing));
            // Later settles are ignored
            guard->settle(SessionState::Recording);
        }

        QVERIFY(machine.is(SessionState::Previewing));
        QCOMPARE(seen.size(), std::size_t{2});
        QVERIFY(seen[0] == SessionState::Busy);
        QVERIFY(seen[1] == SessionState::Previewing);
    }

    void testUnsettledGuardFallsBack() {
        SessionStateMachine machine;
        {
            auto guard = machine.tryBegin({SessionState::Idle}, SessionState::Previewing);
            QVERIFY(guard.has_value());
        }
        QVERIFY(machine.is(SessionState::Previewing));

        {
            auto guard = machine.tryBegin({SessionState::Previewing});
            QVERIFY(guard.has_value());
            guard->setFallback(SessionState::Idle);
        }
        QVERIFY(machine.is(SessionState::Idle));
    }

    void testRejectedFromWrongState() {
        SessionStateMachine machine;
        int changes = 0;
        machine.stateChanged.connect([&](SessionState) { ++changes; });

        QVERIFY(!machine.tryBegin({SessionState::Recording}).has_value());
        QVERIFY(machine.is(SessionState::Idle));
        QCOMPARE(changes, 0);
    }

    void testBusyRejectsEverything() {
        SessionStateMachine machine;
        auto guard = machine.tryBegin({SessionState::Idle});
        QVERIFY(guard.has_value());
        QVERIFY(!machine.tryBegin({SessionState::Idle, SessionState::Previewing,
                                   SessionState::Recording})
                         .has_value());
        QVERIFY(machine.is(SessionState::Busy));
    }

    void testExceptionLeavesBusy() {
        SessionStateMachine machine;
        try {
            auto guard = machine.tryBegin({SessionState::Idle});
            QVERIFY(guard.has_value());
            throw std::runtime_error("device vanished");
        } catch (const std::runtime_error&) {
        }
        QVERIFY(machine.is(SessionState::Idle));
    }

    void testMovedGuardSettlesOnce() {
        SessionStateMachine machine;
        int changes = 0;
        machine.stateChanged.connect([&](SessionState) { ++changes; });
        {
            auto guard = machine.tryBegin({SessionState::Idle}, SessionState::Previewing);
            QVERIFY(guard.has_value());
            SessionStateMachine::BusyGuard moved(std::move(*guard));
        }
        QVERIFY(machine.is(SessionState::Previewing));
        QCOMPARE(changes, 2);
    }

    void testStateNames() {
        QCOMPARE(QString(toString(SessionState::Idle)), QString("Idle"));
        QCOMPARE(QString(toString(SessionState::Busy)), QString("Busy"));
    }
};

int runTestSessionStateMachine(int argc, char** argv) {
    TestSessionStateMachine tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_SessionStateMachine.moc"
