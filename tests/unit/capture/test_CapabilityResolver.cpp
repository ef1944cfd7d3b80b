#include <QtTest>
#include "capture/CapabilityResolver.hpp"

using namespace vb;

class TestCapabilityResolver : public QObject {
    Q_OBJECT

private slots:
    void testEmptyListResolvesToNothing() {
        QVERIFY(!CapabilityResolver::resolve({}, presets::byName("HD")));
    }

    void testHdBucketPicksHd() {
        std::vector<CaptureCapability> caps{{1920, 1080, 30}, {1280, 720, 30}, {640, 480, 30}};
        auto chosen = CapabilityResolver::resolve(caps, presets::byName("HD"));
        QVERIFY(chosen.has_value());
        QCOMPARE(*chosen, (CaptureCapability{1280, 720, 30}));
    }

    void testEmptyBucketFallsBackToFullList() {
        std::vector<CaptureCapability> caps{{3840, 2160, 30}};
        auto chosen = CapabilityResolver::resolve(caps, presets::byName("SD"));
        QVERIFY(chosen.has_value());
        QCOMPARE(*chosen, (CaptureCapability{3840, 2160, 30}));
    }

    void testBucketBoundsAreInclusive() {
        const auto& hd = presets::byName("HD");
        QVERIFY(hd.contains({1240, 700, 30}));
        QVERIFY(hd.contains({1300, 760, 30}));
        QVERIFY(!hd.contains({1239, 720, 30}));
        QVERIFY(!hd.contains({1280, 761, 30}));
    }

    void testHigherFrameRateWinsAtSameSize() {
        std::vector<CaptureCapability> caps{{1280, 720, 15}, {1280, 720, 60}, {1280, 720, 30}};
        auto chosen = CapabilityResolver::resolve(caps, presets::byName("HD"));
        QCOMPARE(chosen->frameRate, 60u);
    }

    void testLargerAreaWinsInsideBucket() {
        // Both fit the HD bucket; the larger area wins even at a lower rate
        std::vector<CaptureCapability> caps{{1248, 702, 60}, {1296, 756, 15}};
        auto chosen = CapabilityResolver::resolve(caps, presets::byName("HD"));
        QCOMPARE(*chosen, (CaptureCapability{1296, 756, 15}));
    }

    void testBestAvailableTakesLargest() {
        std::vector<CaptureCapability> caps{{640, 480, 60}, {1920, 1080, 30}, {1280, 720, 60}};
        auto chosen = CapabilityResolver::resolve(caps, presets::bestAvailable());
        QCOMPARE(*chosen, (CaptureCapability{1920, 1080, 30}));
    }

    void testResultIsDeterministic() {
        std::vector<CaptureCapability> a{{1280, 720, 30}, {720, 1280, 30}};
        std::vector<CaptureCapability> b{{720, 1280, 30}, {1280, 720, 30}};
        auto first = CapabilityResolver::resolve(a, presets::bestAvailable());
        auto second = CapabilityResolver::resolve(b, presets::bestAvailable());
        QCOMPARE(*first, *second);
    }

    void testPresetLookupByName() {
        QCOMPARE(presets::byName("HD").minWidth, 1240u);
        QCOMPARE(presets::byName("Full HD").minWidth, 1880u);
        QCOMPARE(presets::byName("2K").minWidth, 2500u);
        QCOMPARE(presets::byName("nonsense").label, presets::bestAvailable().label);
        QCOMPARE(presets::byName("").label, presets::bestAvailable().label);
    }
};

int runTestCapabilityResolver(int argc, char** argv) {
    TestCapabilityResolver tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_CapabilityResolver.moc"
