#include <catch2/catch.hpp>

#include <cstring>
#include <thread>

#include "AudioBuffer.h"
#include "AudioCaptureDevice.h"
#include "AudioController.h"
#include "QtAudioCapture.h"

using namespace std;
using namespace std::chrono_literals;

TEST_CASE("Duration and peak of a buffer", "[audio]")
{
    AudioBuffer buffer{vector<qint16>(32000, 0), 16000, 1};
    CHECK(buffer.duration() == 2000ms);
    CHECK(buffer.frames() == 32000);
    CHECK(buffer.peakAmplitude() == 0);

    AudioBuffer stereo{{100, -200, 3000, -32768, 5}, 48000, 2};
    // The odd sample is not a full frame
    CHECK(stereo.frames() == 2);
    CHECK(stereo.samples().size() == 4);
    CHECK(stereo.peakAmplitude() == 32768);

    CHECK(AudioBuffer{}.empty());
    CHECK_THROWS_AS((AudioBuffer{{1, 2}, 0, 1}), invalid_argument);
}

TEST_CASE("Convert to mono float", "[audio]")
{
    SECTION("downmix") {
        AudioBuffer stereo{{16384, 0, -16384, -16384}, 16000, 2};
        const auto mono = stereo.toMonoFloat(16000);
        REQUIRE(mono.size() == 2);
        CHECK(mono[0] == Approx(0.25f));
        CHECK(mono[1] == Approx(-0.5f));
    }

    SECTION("resample 48 kHz to 16 kHz") {
        vector<qint16> samples(48000);
        for (size_t i = 0; i < samples.size(); ++i) {
            samples[i] = static_cast<qint16>(i % 3 * 1000);
        }
        AudioBuffer buffer{std::move(samples), 48000, 1};
        const auto out = buffer.toMonoFloat(16000);
        CHECK(out.size() == 16000);
        // Every third sample lands on the first sample of each group
        CHECK(out[10] == Approx(0.0f));
    }

    SECTION("upsample 8 kHz to 16 kHz interpolates") {
        AudioBuffer buffer{{0, 16384}, 8000, 1};
        const auto out = buffer.toMonoFloat(16000);
        REQUIRE(out.size() == 4);
        CHECK(out[0] == Approx(0.0f));
        CHECK(out[1] == Approx(0.25f));
        CHECK(out[2] == Approx(0.5f));
        CHECK(out[3] == Approx(0.5f));
    }
}

TEST_CASE("Device samples are converted to int16", "[audio]")
{
    QAudioFormat format;
    format.setSampleRate(16000);
    format.setChannelCount(1);

    SECTION("float") {
        format.setSampleFormat(QAudioFormat::Float);
        const float in[] = {0.0f, 1.0f, -1.0f, 2.0f};
        vector<qint16> out;
        AudioCaptureDevice::appendConverted(format, reinterpret_cast<const char *>(in), sizeof(in), out);
        CHECK(out == vector<qint16>{0, 32767, -32767, 32767});
    }

    SECTION("unsigned 8 bit") {
        format.setSampleFormat(QAudioFormat::UInt8);
        const unsigned char in[] = {128, 255, 0};
        vector<qint16> out;
        AudioCaptureDevice::appendConverted(format, reinterpret_cast<const char *>(in), sizeof(in), out);
        CHECK(out == vector<qint16>{0, 127 << 8, -32768});
    }

    SECTION("32 bit") {
        format.setSampleFormat(QAudioFormat::Int32);
        const qint32 in[] = {0x40000000, -0x40000000};
        vector<qint16> out;
        AudioCaptureDevice::appendConverted(format, reinterpret_cast<const char *>(in), sizeof(in), out);
        CHECK(out == vector<qint16>{0x4000, -0x4000});
    }
}

TEST_CASE("A sample split across two writes is kept", "[audio]")
{
    QAudioFormat format;
    format.setSampleRate(16000);
    format.setChannelCount(1);
    format.setSampleFormat(QAudioFormat::Int16);

    AudioCaptureDevice device{format, 100ms};
    REQUIRE(device.open(QIODevice::WriteOnly));

    const qint16 in[] = {1000, -2000, 3000};
    const auto *bytes = reinterpret_cast<const char *>(in);
    CHECK(device.write(bytes, 3) == 3);
    CHECK(device.write(bytes + 3, 3) == 3);
    CHECK(device.sampleCount() == 3);

    const auto samples = device.takeSamples();
    CHECK(samples == vector<qint16>{1000, -2000, 3000});
    CHECK(device.sampleCount() == 0);
    device.close();
}

TEST_CASE("The recording level follows the incoming audio", "[audio]")
{
    QAudioFormat format;
    format.setSampleRate(16000);
    format.setChannelCount(1);
    format.setSampleFormat(QAudioFormat::Int16);

    AudioCaptureDevice device{format, 20ms};
    vector<qreal> levels;
    QObject::connect(&device, &AudioCaptureDevice::recordingLevelUpdated, [&](qreal level) {
        levels.push_back(level);
    });
    REQUIRE(device.open(QIODevice::WriteOnly));

    const vector<qint16> loud(1600, 30000);
    const auto *bytes = reinterpret_cast<const char *>(loud.data());
    const auto len = static_cast<qint64>(loud.size() * sizeof(qint16));

    for (auto i = 0; i < 3; ++i) {
        this_thread::sleep_for(30ms);
        CHECK(device.write(bytes, len) == len);
    }

    REQUIRE(levels.size() >= 2);
    CHECK(levels.front() > 0.0);
    CHECK(levels.back() > levels.front());
    CHECK(levels.back() <= 1.0);
    device.close();
}

TEST_CASE("Stopping a capture that never started is an error", "[audio]")
{
    AudioController devices;
    QtAudioCapture capture{devices, 16000, 100ms};

    CHECK_FALSE(capture.isCapturing());
    CHECK_THROWS_AS((void)capture.stop(), CaptureError);
    CHECK_FALSE(capture.isCapturing());

    // Nothing to abort either
    capture.abort();
    CHECK_FALSE(capture.isCapturing());
}
