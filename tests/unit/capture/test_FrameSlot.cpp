#include <QtTest>
#include <atomic>
#include <thread>
#include "capture/FrameSlot.hpp"

using namespace vb;

namespace {
QImage solid(int w, int h, Qt::GlobalColor color) {
    QImage img(w, h, QImage::Format_RGB32);
    img.fill(color);
    return img;
}
} // namespace

class TestFrameSlot : public QObject {
    Q_OBJECT

private slots:
    void testStartsEmpty() {
        FrameSlot slot;
        QVERIFY(slot.empty());
        QVERIFY(slot.latest().isNull());
        QCOMPARE(slot.framesStored(), u64{0});
    }

    void testLastWriteWins() {
        FrameSlot slot;
        slot.store(solid(4, 4, Qt::red));
        slot.store(solid(8, 8, Qt::blue));

        auto frame = slot.latest();
        QCOMPARE(frame.size(), QSize(8, 8));
        QCOMPARE(frame.pixelColor(0, 0), QColor(Qt::blue));
        QCOMPARE(slot.framesStored(), u64{2});
    }

    void testStoreCopiesTheCallerBuffer() {
        FrameSlot slot;
        QImage source = solid(4, 4, Qt::green);
        slot.store(source);

        // The producer reuses its buffer for the next frame
        source.fill(Qt::black);
        QCOMPARE(slot.latest().pixelColor(1, 1), QColor(Qt::green));
    }

    void testClearDropsTheFrame() {
        FrameSlot slot;
        slot.store(solid(4, 4, Qt::red));
        slot.clear();
        QVERIFY(slot.empty());
        QVERIFY(slot.latest().isNull());
    }

    void testConcurrentWriterAndReader() {
        FrameSlot slot;
        std::atomic<bool> done{false};

        std::thread writer([&] {
            for (int i = 0; i < 500; ++i)
                slot.store(solid(16, 16, i % 2 ? Qt::red : Qt::blue));
            done = true;
        });

        int reads = 0;
        while (!done) {
            auto frame = slot.latest();
            if (!frame.isNull()) {
                QCOMPARE(frame.size(), QSize(16, 16));
                ++reads;
            }
        }
        writer.join();

        QCOMPARE(slot.framesStored(), 50u64{0});
        QVERIFY(!slot.empty());
        Q_UNUSED(reads);
    }
};

int runTestFrameSlot(int argc, char** argv) {
    TestFrameSlot tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_FrameSlot.moc"
