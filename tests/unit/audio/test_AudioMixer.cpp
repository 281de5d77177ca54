#include <QTemporaryDir>
#include <QtTest>
#include "TestAudio.hpp"
#include "audio/AudioMixer.hpp"

using namespace mc;

namespace {

PcmData constant(const AudioFormat& format, usize frames, f32 value) {
    auto pcm = PcmData::silence(format, frames);
    for (auto& ch : pcm.channels)
        std::fill(ch.begin(), ch.end(), value);
    return pcm;
}

} // namespace

class TestAudioMixer : public QObject {
    Q_OBJECT

private slots:
    void init() {
        QVERIFY(tmp_.isValid());
        dir_ = fs::path(tmp_.path().toStdString());
    }

    void testSumsAndClamps() {
        AudioFormat stereo{48000, 2};
        auto sys = constant(stereo, 100, 0.75f);
        auto mic = constant(stereo, 100, 0.5f);
        mic.channels[1].assign(100, -0.25f);

        auto mixed = AudioMixer::mixBuffers(sys, mic);
        QVERIFY(mixed.isOk());
        QCOMPARE(mixed->frames(), usize(100));
        QCOMPARE(mixed->channels[0][0], 1.0f);  // 1.25 clamped
        QCOMPARE(mixed->channels[1][0], 0.5f);

        auto negative = AudioMixer::mixBuffers(constant(stereo, 10, -0.9f),
                                               constant(stereo, 10, -0.9f));
        QVERIFY(negative.isOk());
        QCOMPARE(negative->channels[0][5], -1.0f);
    }

    void testShorterStreamPaddedWithSilence() {
        auto sys = constant(test::kTestFormat, 300, 0.25f);
        auto mic = constant(test::kTestFormat, 100, 0.5f);

        auto mixed = AudioMixer::mixBuffers(sys, mic);
        QVERIFY(mixed.isOk());
        QCOMPARE(mixed->frames(), usize(300));
        QCOMPARE(mixed->channels[0][50], 0.75f);
        QCOMPARE(mixed->channels[0][200], 0.25f);

        // Either side may be the longer one
        auto swapped = AudioMixer::mixBuffers(mic, sys);
        QVERIFY(swapped.isOk());
        QCOMPARE(swapped->frames(), usize(300));
    }

    void testFormatMismatch() {
        auto mixed = AudioMixer::mixBuffers(constant({48000, 2}, 10, 0.1f),
                                            constant({44100, 2}, 10, 0.1f));
        QVERIFY(mixed.isErr());
        QVERIFY(mixed.error().kind == MixError::Kind::FormatMismatch);
    }

    void testMixFiles() {
        auto sys = dir_ / "a_sys.wav";
        auto mic = dir_ / "a_mic.wav";
        auto out = dir_ / "a.wav";
        QVERIFY(test::writeConstantWav(sys, test::kTestFormat, 8000, 1000));
        QVERIFY(test::writeConstantWav(mic, test::kTestFormat, 4000, 2000));

        auto res = AudioMixer::mix(sys, mic, out);
        QVERIFY2(res.isOk(), res.isOk() ? "" : res.error().message.c_str());
        QVERIFY(!fs::exists(dir_ / "a.wav.part"));

        auto pcm = readPcmFile(out);
        QVERIFY(pcm.isOk());
        QVERIFY(pcm->format == test::kTestFormat);
        QCOMPARE(pcm->frames(), usize(8000));
        QCOMPARE(pcm->channels[0][100], test::toFloat(3000));
        QCOMPARE(pcm->channels[0][6000], test::toFloat(1000));
    }

    void testSilentMicrophoneKeepsSamplesExact() {
        const i16 values[] = {32767, 30000, 20000, 1, -1, -20000, -32768};
        for (i16 value : values) {
            auto sys = dir_ / "x_sys.wav";
            auto mic = dir_ / "x_mic.wav";
            auto out = dir_ / "x.wav";
            QVERIFY(test::writeConstantWav(sys, test::kTestFormat, 500, value));
            QVERIFY(test::writeConstantWav(mic, test::kTestFormat, 500, 0));
            QVERIFY(AudioMixer::mix(sys, mic, out).isOk());

            auto samples = test::readS16(out);
            QCOMPARE(samples.size(), usize(500));
            for (i16 s : samples)
                QCOMPARE(static_cast<int>(s), static_cast<int>(value));
        }
    }

    void testZeroLengthInputsGiveEmptyOutput() {
        auto sys = dir_ / "g_sys.wav";
        auto mic = dir_ / "g_mic.wav";
        auto out = dir_ / "g.wav";
        QVERIFY(test::writeConstantWav(sys, test::kTestFormat, 0, 0));
        QVERIFY(test::writeConstantWav(mic, test::kTestFormat, 0, 0));

        auto res = AudioMixer::mix(sys, mic, out);
        QVERIFY2(res.isOk(), res.isOk() ? "" : res.error().message.c_str());
        QVERIFY(fs::exists(out));

        auto info = probePcmFile(out);
        QVERIFY(info.isOk());
        QCOMPARE(info->frames, u64(0));
        auto pcm = readPcmFile(out);
        QVERIFY(pcm.isOk());
        QCOMPARE(pcm->frames(), usize(0));
    }

    void testZeroLengthMicrophoneIsSilence() {
        auto sys = dir_ / "b_sys.wav";
        auto mic = dir_ / "b_mic.wav";
        auto out = dir_ / "b.wav";
        QVERIFY(test::writeConstantWav(sys, test::kTestFormat, 16000, 500));
        QVERIFY(test::writeConstantWav(mic, test::kTestFormat, 0, 0));

        auto res = AudioMixer::mix(sys, mic, out);
        QVERIFY(res.isOk());

        auto info = probePcmFile(out);
        QVERIFY(info.isOk());
        QCOMPARE(info->frames, u64(16000));
    }

    void testReplacesExistingDestination() {
        auto sys = dir_ / "c_sys.wav";
        auto mic = dir_ / "c_mic.wav";
        auto out = dir_ / "c.wav";
        QVERIFY(test::writeConstantWav(out, test::kTestFormat, 100, 1));
        QVERIFY(test::writeConstantWav(sys, test::kTestFormat, 2000, 1));
        QVERIFY(test::writeConstantWav(mic, test::kTestFormat, 2000, 1));

        QVERIFY(AudioMixer::mix(sys, mic, out).isOk());
        auto info = probePcmFile(out);
        QVERIFY(info.isOk());
        QCOMPARE(info->frames, u64(2000));
    }

    void testUnreadableSource() {
        auto mic = dir_ / "d_mic.wav";
        QVERIFY(test::writeConstantWav(mic, test::kTestFormat, 100, 1));

        auto res = AudioMixer::mix(dir_ / "missing_sys.wav", mic, dir_ / "d.wav");
        QVERIFY(res.isErr());
        QVERIFY(res.error().kind == MixError::Kind::SourceReadFailed);
        QVERIFY(!fs::exists(dir_ / "d.wav"));
    }

    void testUnwritableDestination() {
        auto sys = dir_ / "e_sys.wav";
        auto mic = dir_ / "e_mic.wav";
        QVERIFY(test::writeConstantWav(sys, test::kTestFormat, 100, 1));
        QVERIFY(test::writeConstantWav(mic, test::kTestFormat, 100, 1));

        auto out = dir_ / "no" / "such" / "dir" / "e.wav";
        auto res = AudioMixer::mix(sys, mic, out);
        QVERIFY(res.isErr());
        QVERIFY(res.error().kind == MixError::Kind::DestinationWriteFailed);
        QVERIFY(!fs::exists(out));
        // Inputs untouched
        QVERIFY(fs::exists(sys));
        QVERIFY(fs::exists(mic));
    }

    void testMismatchedFiles() {
        auto sys = dir_ / "f_sys.wav";
        auto mic = dir_ / "f_mic.wav";
        QVERIFY(test::writeConstantWav(sys, AudioFormat{8000, 1}, 100, 1));
        QVERIFY(test::writeConstantWav(mic, AudioFormat{16000, 1}, 100, 1));

        auto res = AudioMixer::mix(sys, mic, dir_ / "f.wav");
        QVERIFY(res.isErr());
        QVERIFY(res.error().kind == MixError::Kind::FormatMismatch);
    }

private:
    QTemporaryDir tmp_;
    fs::path dir_;
};

int runTestAudioMixer(int argc, char** argv) {
    TestAudioMixer tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_AudioMixer.moc"
