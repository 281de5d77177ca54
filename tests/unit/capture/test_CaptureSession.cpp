#include <QTemporaryDir>
#include <QtTest>
#include <atomic>
#include "FakeCaptureSource.hpp"
#include "TestAudio.hpp"
#include "capture/CaptureSession.hpp"
#include "library/RecordingNaming.hpp"
#include "recorder/Coordinator.hpp"

using namespace mc;

// Owns a coordinator whose deliveries are routed into one session
struct SessionHarness {
    explicit SessionHarness(const fs::path& tempDir)
        : rig(test::kTestFormat),
          coordinator(64, [this](Delivery&& d) {
              if (session && session->id() == d.sessionId)
                  session->route(d.source, std::move(d.buffer));
          }) {
        settings.format = test::kTestFormat;
        settings.preBufferCapacity = Seconds(10.0);
        settings.tempDirectory = tempDir;
    }

    ~SessionHarness() {
        coordinator.invoke([this] { session.reset(); });
    }

    CaptureSession& create(CaptureSourceFactory factory = {}) {
        coordinator.invoke([&] {
            session = std::make_unique<CaptureSession>(
                    1,
                    settings,
                    "meeting",
                    factory ? factory : rig.factory(),
                    coordinator,
                    [this](u64, SourceKind kind, const std::string&) {
                        ++failures[static_cast<int>(kind)];
                    });
        });
        return *session;
    }

    test::FakeRig rig;
    SessionSettings settings;
    std::unique_ptr<CaptureSession> session;
    std::atomic<int> failures[2]{};
    Coordinator coordinator;
};

class TestCaptureSession : public QObject {
    Q_OBJECT

private slots:
    void init() {
        QVERIFY(tmp_.isValid());
        dir_ = fs::path(tmp_.path().toStdString());
    }

    void testPreBufferRoutesIntoRings() {
        SessionHarness h(dir_);
        auto& session = h.create();
        auto report = h.coordinator.invoke([&] { return session.start(Routing::PreBuffer); });
        QVERIFY(report.isOk());
        QVERIFY(report->microphoneAvailable);

        QCOMPARE(h.rig.system->produce(12), 12);
        QCOMPARE(h.rig.microphone->produce(3), 3);

        auto durations = h.coordinator.invoke([&] {
            return std::make_pair(session.bufferedDuration(SourceKind::System),
                                  session.bufferedDuration(SourceKind::Microphone));
        });
        QCOMPARE(durations.first.count(), 10.0);
        QCOMPARE(durations.second.count(), 3.0);

        // Nothing touches the disk while pre-buffering
        QVERIFY(!fs::exists(naming::systemTempPath(dir_, "meeting")));
        h.coordinator.invoke([&] { session.cancel(); });
    }

    void testBeginRecordingFlushesRingsOldestFirst() {
        SessionHarness h(dir_);
        auto& session = h.create();
        QVERIFY(h.coordinator.invoke([&] { return session.start(Routing::PreBuffer); }));

        h.rig.system->produce(4, 1.0, 100);
        QVERIFY(h.coordinator.invoke([&] { return session.beginRecording(); }));
        h.rig.system->produce(2, 1.0, 200);

        auto out = h.coordinator.invoke([&] { return session.stop(); });
        QCOMPARE(out.systemDuration.count(), 6.0);
        QCOMPARE(out.rejectedBuffers, u64(0));
        QVERIFY(!h.rig.system->isRunning());

        auto pcm = readPcmFile(out.systemFile);
        QVERIFY(pcm.isOk());
        QCOMPARE(pcm->frames(), usize(6 * 8000));
        QVERIFY(qAbs(pcm->channels[0][0] - test::toFloat(100)) < 1e-4f);
        QVERIFY(qAbs(pcm->channels[0][5 * 8000] - test::toFloat(200)) < 1e-4f);
    }

    void testRecordModeWritesDirectly() {
        SessionHarness h(dir_);
        auto& session = h.create();
        QVERIFY(h.coordinator.invoke([&] { return session.start(Routing::Record); }));
        QVERIFY(fs::exists(naming::systemTempPath(dir_, "meeting")));
        QVERIFY(fs::exists(naming::microphoneTempPath(dir_, "meeting")));

        h.rig.system->produce(3);
        h.rig.microphone->produce(2);
        auto out = h.coordinator.invoke([&] { return session.stop(); });
        QCOMPARE(out.systemDuration.count(), 3.0);
        QCOMPARE(out.microphoneDuration.count(), 2.0);
        QVERIFY(out.finishError.empty());
    }

    void testBuffersAfterStopAreDiscarded() {
        SessionHarness h(dir_);
        auto& session = h.create();
        QVERIFY(h.coordinator.invoke([&] { return session.start(Routing::Record); }));
        h.rig.system->produce(2);
        auto out = h.coordinator.invoke([&] { return session.stop(); });

        // The source is stopped: the device has no one to deliver to
        QCOMPARE(h.rig.system->produce(3), 0);
        h.coordinator.invoke([&] {
            session.route(SourceKind::System,
                          SampleBuffer(test::kTestFormat,
                                       std::vector<i16>(8000, 0),
                                       Seconds(9.0)));
        });
        QCOMPARE(out.systemDuration.count(), 2.0);
        auto info = probePcmFile(out.systemFile);
        QVERIFY(info.isOk());
        QCOMPARE(info->frames, u64(16000));
    }

    void testCancelLeavesNoFiles() {
        SessionHarness h(dir_);
        auto& session = h.create();
        QVERIFY(h.coordinator.invoke([&] { return session.start(Routing::PreBuffer); }));
        h.rig.system->produce(5);
        QVERIFY(h.coordinator.invoke([&] { return session.beginRecording(); }));
        h.rig.system->produce(1);

        h.coordinator.invoke([&] { session.cancel(); });
        QVERIFY(!fs::exists(naming::systemTempPath(dir_, "meeting")));
        QVERIFY(!fs::exists(naming::microphoneTempPath(dir_, "meeting")));
        QVERIFY(!h.rig.system->isRunning());
        QVERIFY(!h.rig.microphone->isRunning());
    }

    void testSystemAcquisitionFailure() {
        SessionHarness h(dir_);
        h.rig.system->failStart = true;
        auto& session = h.create();

        auto report = h.coordinator.invoke([&] { return session.start(Routing::Record); });
        QVERIFY(report.isErr());
        QVERIFY(!fs::exists(naming::systemTempPath(dir_, "meeting")));
        QVERIFY(!fs::exists(naming::microphoneTempPath(dir_, "meeting")));
        QCOMPARE(h.rig.microphone->starts, 0);
    }

    void testMissingMicrophoneIsDegraded() {
        SessionHarness h(dir_);
        h.rig.microphone->failStart = true;
        auto& session = h.create();

        auto report = h.coordinator.invoke([&] { return session.start(Routing::Record); });
        QVERIFY(report.isOk());
        QVERIFY(!report->microphoneAvailable);
        QVERIFY(!report->microphoneError.empty());
        QVERIFY(!h.coordinator.invoke([&] { return session.microphoneActive(); }));

        h.rig.system->produce(2);
        auto out = h.coordinator.invoke([&] { return session.stop(); });
        QCOMPARE(out.systemDuration.count(), 2.0);
        QCOMPARE(out.microphoneDuration.count(), 0.0);
        QVERIFY(fs::exists(out.microphoneFile));
    }

    void testNullFactoryResultIsAcquisitionFailure() {
        SessionHarness h(dir_);
        auto& session = h.create([](SourceKind) { return std::unique_ptr<CaptureSource>(); });
        auto report = h.coordinator.invoke([&] { return session.start(Routing::PreBuffer); });
        QVERIFY(report.isErr());
    }

    void testSourceFailureIsForwarded() {
        SessionHarness h(dir_);
        auto& session = h.create();
        QVERIFY(h.coordinator.invoke([&] { return session.start(Routing::PreBuffer); }));

        h.rig.microphone->fail();
        QCOMPARE(h.failures[static_cast<int>(SourceKind::Microphone)].load(), 1);
        QCOMPARE(h.failures[static_cast<int>(SourceKind::System)].load(), 0);

        h.coordinator.invoke([&] { session.stopSource(SourceKind::Microphone); });
        QVERIFY(!h.coordinator.invoke([&] { return session.microphoneActive(); }));
        h.coordinator.invoke([&] { session.cancel(); });
    }

private:
    QTemporaryDir tmp_;
    fs::path dir_;
};

int runTestCaptureSession(int argc, char** argv) {
    TestCaptureSession tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_CaptureSession.moc"
