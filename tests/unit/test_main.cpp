/**
 * @file test_main.cpp
 * @brief Test suite entry point using Qt Test.
 *
 * Each suite lives in its own translation unit and exposes a runTestX()
 * function; they share one QCoreApplication and event loop.
 */
#include <QCoreApplication>
#include <QtTest>
#include "core/Logger.hpp"

int runTestLogger(int argc, char** argv);
int runTestConfigParsers(int argc, char** argv);
int runTestCapabilityResolver(int argc, char** argv);
int runTestFrameSlot(int argc, char** argv);
int runTestEngineCommand(int argc, char** argv);
int runTestEngineIntrospection(int argc, char** argv);
int runTestEncoderSelector(int argc, char** argv);
int runTestRecordingProcessSupervisor(int argc, char** argv);
int runTestSessionStateMachine(int argc, char** argv);
int runTestSessionTimer(int argc, char** argv);
int runTestSessionOrchestrator(int argc, char** argv);

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    int status = 0;

    status |= runTestLogger(argc, argv);

    // Later suites log through a fresh logger
    vb::Logger::init("booth-recorder-tests", true);

    status |= runTestConfigParsers(argc, argv);
    status |= runTestCapabilityResolver(argc, argv);
    status |= runTestFrameSlot(argc, argv);
    status |= runTestEngineCommand(argc, argv);
    status |= runTestEngineIntrospection(argc, argv);
    status |= runTestEncoderSelector(argc, argv);
    status |= runTestRecordingProcessSupervisor(argc, argv);
    status |= runTestSessionStateMachine(argc, argv);
    status |= runTestSessionTimer(argc, argv);
    status |= runTestSessionOrchestrator(argc, argv);

    vb::Logger::shutdown();
    return status;
}
