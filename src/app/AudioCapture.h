#pragma once

#include <stdexcept>

#include <QObject>

#include "AudioBuffer.h"

class CaptureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/*! Owns the microphone while recording.
 *
 * start() and stop() are called from the coordinator's thread. Level updates
 * and mid-capture failures are delivered through signals, separate from the
 * audio itself.
 */
class AudioCapture : public QObject
{
    Q_OBJECT
public:
    explicit AudioCapture(QObject *parent = nullptr) : QObject(parent) {}
    ~AudioCapture() override = default;

    /*! Acquire the input device and start capturing.
     *
     * Throws CaptureError if the device cannot be opened, or if a capture is
     * already running.
     */
    virtual void start() = 0;

    /*! Stop capturing and hand over the recorded audio.
     *
     * Throws CaptureError if no capture is running. The returned buffer is
     * owned by the caller from here on.
     */
    [[nodiscard]] virtual audio_buffer_t stop() = 0;

    // Release the device and discard any recorded audio. No-op if idle.
    virtual void abort() noexcept = 0;

    virtual bool isCapturing() const noexcept = 0;

signals:
    void levelUpdated(qreal level);

    // The device failed while recording. The capture is already aborted.
    void captureFailed(const QString& error);
};
