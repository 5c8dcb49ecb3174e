#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "AudioBuffer.h"

using namespace std;

AudioBuffer::AudioBuffer(std::vector<qint16> samples, int sampleRate, int channels)
    : samples_{std::move(samples)}, sample_rate_{sampleRate}, channels_{channels}
{
    if (sample_rate_ <= 0 || channels_ <= 0) {
        throw invalid_argument{"AudioBuffer: sample rate and channel count must be positive"};
    }

    // Drop a trailing partial frame
    samples_.resize(samples_.size() - samples_.size() % static_cast<size_t>(channels_));
}

size_t AudioBuffer::frames() const noexcept
{
    return samples_.size() / static_cast<size_t>(channels_);
}

chrono::milliseconds AudioBuffer::duration() const noexcept
{
    return chrono::milliseconds{static_cast<int64_t>(frames()) * 1000 / sample_rate_};
}

int AudioBuffer::peakAmplitude() const noexcept
{
    int peak = 0;
    for (const auto s : samples_) {
        peak = max(peak, abs(static_cast<int>(s)));
    }
    return peak;
}

vector<float> AudioBuffer::toMonoFloat(int targetRate) const
{
    if (targetRate <= 0) {
        throw invalid_argument{"AudioBuffer::toMonoFloat: target rate must be positive"};
    }

    const auto nframes = frames();
    vector<float> mono;
    mono.reserve(nframes);

    for (size_t f = 0; f < nframes; ++f) {
        int sum = 0;
        for (int c = 0; c < channels_; ++c) {
            sum += samples_[f * channels_ + c];
        }
        mono.push_back(static_cast<float>(sum) / static_cast<float>(channels_) / 32768.0f);
    }

    if (targetRate == sample_rate_ || mono.empty()) {
        return mono;
    }

    const double ratio = static_cast<double>(sample_rate_) / static_cast<double>(targetRate);
    const auto out_frames = static_cast<size_t>(static_cast<double>(mono.size()) / ratio);

    vector<float> out;
    out.reserve(out_frames);
    for (size_t i = 0; i < out_frames; ++i) {
        const double pos = static_cast<double>(i) * ratio;
        const auto ix = static_cast<size_t>(pos);
        const auto frac = static_cast<float>(pos - static_cast<double>(ix));
        const float a = mono[ix];
        const float b = ix + 1 < mono.size() ? mono[ix + 1] : a;
        out.push_back(a + (b - a) * frac);
    }

    return out;
}
