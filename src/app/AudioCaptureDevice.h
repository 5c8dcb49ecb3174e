#pragma once

#include <chrono>
#include <span>
#include <vector>

#include <QAudioFormat>
#include <QIODevice>

/*! Write-only sink for QAudioSource in push mode.
 *
 * Converts whatever the device delivers into interleaved int16 samples and
 * accumulates them until the recording stops. Emits the recording level at
 * a fixed cadence.
 */
class AudioCaptureDevice : public QIODevice
{
    Q_OBJECT
public:
    AudioCaptureDevice(const QAudioFormat& format,
                       std::chrono::milliseconds levelInterval,
                       QObject *parent = nullptr);

    bool open(OpenMode mode) override;
    void close() override;

    // Moves the accumulated samples out of the device.
    std::vector<qint16> takeSamples();

    size_t sampleCount() const noexcept { return samples_.size(); }

    // Converts raw device bytes to int16 and appends them to `out`.
    static void appendConverted(const QAudioFormat& format, const char *data, qint64 len,
                                std::vector<qint16>& out);

protected:
    qint64 readData(char *, qint64) override
    {
        return -1;
    }

    qint64 writeData(const char *data, qint64 len) override;

signals:
    void recordingLevelUpdated(qreal level);

private:
    void recalculateRecordingLevel(std::span<const qint16> samples);

    const QAudioFormat format_;
    const std::chrono::milliseconds level_interval_;
    std::vector<qint16> samples_;
    QByteArray partial_; // bytes of an incomplete sample from the previous write
    size_t level_from_{}; // first sample not yet included in a level update
    std::chrono::steady_clock::time_point level_time_;
    qreal recording_level_{};
};
