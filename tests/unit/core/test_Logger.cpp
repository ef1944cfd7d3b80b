#include <QtTest>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include "core/Logger.hpp"

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        // Ensure clean state
        vb::Logger::shutdown();
    }

    void testInitialization() {
        vb::Logger::init("test_app", true);
        QVERIFY(vb::Logger::get() != nullptr);

        // Should not crash
        LOG_INFO("Test info message");
        LOG_WARN("Test warn message");
        LOG_ERROR("Test error message");

        vb::Logger::shutdown();
    }

    void testDoubleInit() {
        vb::Logger::init("test_app", true);
        // Second init should be safe (idempotent or handled)
        vb::Logger::init("test_app", true);
        QVERIFY(vb::Logger::get() != nullptr);
        vb::Logger::shutdown();
    }

    void testLazyGetInitializes() {
        vb::Logger::shutdown();
        QVERIFY(vb::Logger::get() != nullptr);
        vb::Logger::shutdown();
    }

    void testDebugLevelToggle() {
        vb::Logger::init("test_app", false);
        QVERIFY(!vb::Logger::get()->should_log(spdlog::level::debug));
        vb::Logger::setDebug(true);
        QVERIFY(vb::Logger::get()->should_log(spdlog::level::debug));
        vb::Logger::shutdown();
    }

    void testExtraSinkReceivesAndDetaches() {
        vb::Logger::init("test_app", false);

        std::ostringstream out;
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
        sink->set_pattern("%v");
        vb::Logger::addSink(sink);

        LOG_INFO("[engine] frame=42");
        QVERIFY(out.str().find("[engine] frame=42") != std::string::npos);

        vb::Logger::removeSink(sink);
        LOG_INFO("after removal");
        QVERIFY(out.str().find("after removal") == std::string::npos);

        vb::Logger::shutdown();
    }
};

int runTestLogger(int argc, char** argv) {
    TestLogger tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Logger.moc"
