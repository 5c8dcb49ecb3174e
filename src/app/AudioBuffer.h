#pragma once

#include <chrono>
#include <memory>
#include <span>
#include <vector>

#include <QtGlobal>

/*! A finished recording.
 *
 * Interleaved signed 16 bit samples. The buffer is immutable once it is
 * handed over from the capture device to a processing job, and is shared
 * as a pointer to const from that point on.
 */
class AudioBuffer
{
public:
    AudioBuffer() = default;
    AudioBuffer(std::vector<qint16> samples, int sampleRate, int channels);

    std::span<const qint16> samples() const noexcept {
        return samples_;
    }

    int sampleRate() const noexcept { return sample_rate_; }
    int channels() const noexcept { return channels_; }
    bool empty() const noexcept { return samples_.empty(); }

    // Number of sample frames (one sample per channel)
    size_t frames() const noexcept;

    std::chrono::milliseconds duration() const noexcept;

    // Largest absolute sample value, 0..32768
    int peakAmplitude() const noexcept;

    /*! Mono float PCM in the range -1..1 at the requested rate.
     *
     * Channels are averaged and the signal is linearly resampled.
     * This is the input format whisper.cpp expects (16 kHz).
     */
    std::vector<float> toMonoFloat(int targetRate = 16000) const;

private:
    std::vector<qint16> samples_;
    int sample_rate_{16000};
    int channels_{1};
};

using audio_buffer_t = std::shared_ptr<const AudioBuffer>;
