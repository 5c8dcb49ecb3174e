#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include <QAudioDevice>
#include <QAudioFormat>
#include <QAudioSource>
#include <QThread>

#include "AudioCapture.h"

class AudioController;
class AudioCaptureDevice;

/*! AudioCapture on top of QAudioSource.
 *
 * The audio source and its sink live on a dedicated capture thread, so
 * capture keeps running while the coordinator's thread is busy. Calls from
 * the coordinator block until the capture thread has acted on them.
 */
class QtAudioCapture : public AudioCapture
{
    Q_OBJECT
public:
    QtAudioCapture(AudioController& devices,
                   int sampleRate,
                   std::chrono::milliseconds levelInterval,
                   QObject *parent = nullptr);
    ~QtAudioCapture() override;

    void start() override;
    [[nodiscard]] audio_buffer_t stop() override;
    void abort() noexcept override;

    bool isCapturing() const noexcept override {
        return capturing_;
    }

    // The format we ask the device for, or the nearest it supports
    static QAudioFormat createCaptureFormat(const QAudioDevice &device, int sampleRate);

private:
    // These run on the capture thread
    QString startOnCaptureThread(const QAudioDevice& device);
    audio_buffer_t stopOnCaptureThread(bool keepAudio);
    void onSourceStateChanged(QAudio::State state);

    void onInputDevicesChanged();
    void fail(const QString& why);

    AudioController& devices_;
    const int sample_rate_;
    const std::chrono::milliseconds level_interval_;
    QThread thread_;
    QObject *thread_ctx_{}; // lives on thread_
    std::unique_ptr<QAudioSource> source_;
    std::unique_ptr<AudioCaptureDevice> sink_;
    QAudioFormat format_;
    QByteArray device_id_;
    QString device_name_;
    std::atomic_bool capturing_{false};
};
