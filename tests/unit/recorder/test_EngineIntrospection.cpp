#include <QtTest>
#include <QTemporaryDir>
#include "recorder/EngineIntrospection.hpp"
#include "support/TestSupport.hpp"

using namespace vb;

namespace {

const char* kEncoders = R"(Encoders:
 V..... = Video
 A..... = Audio
 ------
 V....D libx264              libx264 H.264 / AVC / MPEG-4 AVC (codec h264)
 V....D h264_nvenc           NVIDIA NVENC H.264 encoder (codec h264)
 V....D h264_vaapi           H.264/AVC (VAAPI) (codec h264)
 V..... h264_v4l2m2m         V4L2 mem2mem H.264 encoder wrapper (codec h264)
 A....D aac                  AAC (Advanced Audio Coding)
)";

const char* kV4l2Modes =
        "[video4linux2,v4l2 @ 0x55] Compressed:       mjpeg :          Motion-JPEG : "
        "1920x1080 1280x720 640x480\n"
        "[video4linux2,v4l2 @ 0x55] Raw       :     yuyv422 :           YUYV 4:2:2 : "
        "640x480 320x240\n";

const char* kModesWithRates =
        "  yuyv422   640x480   30.000 fps\n"
        "  mjpeg    1280x720   60 fps\n"
        "  mjpeg   1920x1080   30 fps\n";

} // namespace

class TestEngineIntrospection : public QObject {
    Q_OBJECT

private slots:
    void testCompiledAcceleratorsInPreferenceOrder() {
        auto found = EngineIntrospection::compiledAccelerators(kEncoders);
        QCOMPARE(found.size(), usize{2});
        QVERIFY(found[0] == EncoderCandidate::Nvenc);
        QVERIFY(found[1] == EncoderCandidate::Vaapi);
    }

    void testDescriptionsDoNotCount() {
        // Only the name column matters, not a mention in a description
        auto found = EngineIntrospection::compiledAccelerators(
                " V....D libx264   wraps h264_qsv and h264_nvenc, honest\n");
        QVERIFY(found.empty());
    }

    void testUnreadableListing() {
        QVERIFY(EngineIntrospection::compiledAccelerators("").empty());
        QVERIFY(EngineIntrospection::compiledAccelerators("garbage\n\x01\x02").empty());
    }

    void testModeListedBySize() {
        QVERIFY(EngineIntrospection::isModeListed(kV4l2Modes, 1280, 720, std::nullopt));
        QVERIFY(!EngineIntrospection::isModeListed(kV4l2Modes, 3840, 2160, std::nullopt));
        // No rates in a v4l2 listing: the size alone decides
        QVERIFY(EngineIntrospection::isModeListed(kV4l2Modes, 1280, 720, 60u));
    }

    void testSizeMustBeAWholeToken() {
        QVERIFY(!EngineIntrospection::isModeListed(kV4l2Modes, 280, 720, std::nullopt));
    }

    void testModeListedWithRate() {
        QVERIFY(EngineIntrospection::isModeListed(kModesWithRates, 1280, 720, 60u));
        QVERIFY(EngineIntrospection::isModeListed(kModesWithRates, 640, 480, 30u));
        QVERIFY(!EngineIntrospection::isModeListed(kModesWithRates, 2560, 1440, 30u));
    }

    void testLogListingsWithMissingEngine() {
        auto r = EngineIntrospection::logSources("/nonexistent/ffmpeg", DeviceKind::Video, 1000);
        QVERIFY(r.isErr());
        QCOMPARE(r.error().code, ErrorCode::EngineNotFound);
    }

    void testLogModesRunsTheEngine() {
        QTemporaryDir dir;
        auto script = test::engine::graceful(dir);
        auto r = EngineIntrospection::logModes(script.toStdString(), "/dev/video0", 2000);
        QVERIFY(r.isOk());
    }
};

int runTestEngineIntrospection(int argc, char** argv) {
    TestEngineIntrospection tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_EngineIntrospection.moc"
