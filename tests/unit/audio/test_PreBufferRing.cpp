#include <QtTest>
#include "TestAudio.hpp"
#include "audio/PreBufferRing.hpp"

using namespace mc;

namespace {

SampleBuffer makeBuffer(f64 seconds, f64 pts, i16 value = 0) {
    auto frames = test::kTestFormat.secondsToFrames(seconds);
    return SampleBuffer(test::kTestFormat,
                        std::vector<i16>(frames * test::kTestFormat.channels, value),
                        Seconds(pts));
}

} // namespace

class TestPreBufferRing : public QObject {
    Q_OBJECT

private slots:
    void testSampleBufferDropsPartialFrame() {
        AudioFormat stereo{48000, 2};
        SampleBuffer buffer(stereo, std::vector<i16>(5, 7), Seconds(0.0));
        QCOMPARE(buffer.frameCount(), usize(2));
        QCOMPARE(buffer.samples().size(), usize(4));
    }

    void testSampleBufferDuration() {
        auto buffer = makeBuffer(0.5, 2.0);
        QCOMPARE(buffer.frameCount(), usize(4000));
        QCOMPARE(buffer.duration().count(), 0.5);
        QCOMPARE(buffer.presentationTime().count(), 2.0);
    }

    void testKeepsNewestWithinCapacity() {
        PreBufferRing ring(Seconds(30.0));
        for (int i = 0; i < 40; ++i)
            ring.push(makeBuffer(1.0, i));

        QCOMPARE(ring.size(), usize(30));
        QCOMPARE(ring.duration().count(), 30.0);
        QCOMPARE(ring.evictedCount(), u64(10));
        // Seconds 11..40 survive
        QCOMPARE(ring.front().presentationTime().count(), 10.0);
        QCOMPARE(ring.back().presentationTime().count(), 39.0);
    }

    void testShortBuffersFillCapacityExactly() {
        // Default capture chunking: 4800 frames at 48 kHz
        AudioFormat stereo{48000, 2};
        PreBufferRing ring(Seconds(30.0));
        for (int i = 0; i < 600; ++i) {
            ring.push(SampleBuffer(stereo,
                                   std::vector<i16>(4800 * stereo.channels),
                                   Seconds(i * 0.1)));
        }

        QCOMPARE(ring.size(), usize(300));
        QCOMPARE(ring.frames(), u64(1440000));
        QCOMPARE(ring.duration().count(), 30.0);
        QCOMPARE(ring.evictedCount(), u64(300));
    }

    void testNeverExceedsCapacity() {
        PreBufferRing ring(Seconds(2.0));
        for (int i = 0; i < 25; ++i) {
            ring.push(makeBuffer(0.3, i * 0.3));
            QVERIFY(ring.duration().count() <= 2.0 + 1e-9);
        }
    }

    void testOversizedSingleBufferIsKept() {
        PreBufferRing ring(Seconds(5.0));
        ring.push(makeBuffer(8.0, 0.0));
        QCOMPARE(ring.size(), usize(1));
        QCOMPARE(ring.duration().count(), 8.0);

        // The next buffer evicts it
        ring.push(makeBuffer(1.0, 8.0));
        QCOMPARE(ring.size(), usize(1));
        QCOMPARE(ring.duration().count(), 1.0);
        QCOMPARE(ring.front().presentationTime().count(), 8.0);
    }

    void testDrainReturnsInsertionOrder() {
        PreBufferRing ring(Seconds(10.0));
        for (int i = 0; i < 5; ++i)
            ring.push(makeBuffer(1.0, i, static_cast<i16>(i)));

        auto drained = ring.drainAll();
        QCOMPARE(drained.size(), usize(5));
        for (usize i = 0; i < drained.size(); ++i) {
            QCOMPARE(drained[i].presentationTime().count(), static_cast<f64>(i));
            QCOMPARE(static_cast<int>(drained[i].samples()[0]), static_cast<int>(i));
        }

        QVERIFY(ring.empty());
        QCOMPARE(ring.duration().count(), 0.0);
        QVERIFY(ring.drainAll().empty());
    }

    void testDiscard() {
        PreBufferRing ring(Seconds(10.0));
        for (int i = 0; i < 3; ++i)
            ring.push(makeBuffer(1.0, i));
        ring.discard();
        QVERIFY(ring.empty());
        QCOMPARE(ring.duration().count(), 0.0);

        ring.push(makeBuffer(1.0, 3.0));
        QCOMPARE(ring.size(), usize(1));
    }
};

int runTestPreBufferRing(int argc, char** argv) {
    TestPreBufferRing tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_PreBufferRing.moc"
