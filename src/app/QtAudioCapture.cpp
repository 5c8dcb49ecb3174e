#include <QMediaDevices>

#include "QtAudioCapture.h"
#include "AudioCaptureDevice.h"
#include "AudioController.h"

#include "logging.h"

using namespace std;

namespace {

QString toString(QAudio::Error error) {
    switch (error) {
    case QAudio::NoError:
        return QStringLiteral("no error");
    case QAudio::OpenError:
        return QStringLiteral("the audio device could not be opened (busy, or no permission)");
    case QAudio::IOError:
        return QStringLiteral("read error on the audio device");
    case QAudio::UnderrunError:
        return QStringLiteral("audio underrun");
    case QAudio::FatalError:
        return QStringLiteral("the audio device is no longer usable");
    }
    return QStringLiteral("unknown audio error");
}

} // anon ns

QtAudioCapture::QtAudioCapture(AudioController& devices,
                               int sampleRate,
                               std::chrono::milliseconds levelInterval,
                               QObject *parent)
    : AudioCapture(parent)
    , devices_{devices}
    , sample_rate_{sampleRate}
    , level_interval_{levelInterval}
{
    thread_.setObjectName("audio-capture");
    thread_ctx_ = new QObject;
    thread_ctx_->moveToThread(&thread_);
    connect(&thread_, &QThread::finished, thread_ctx_, &QObject::deleteLater);
    thread_.start();

    connect(&devices_, &AudioController::inputDevicesChanged,
            this, &QtAudioCapture::onInputDevicesChanged);
}

QtAudioCapture::~QtAudioCapture()
{
    abort();
    thread_.quit();
    thread_.wait();
}

void QtAudioCapture::start()
{
    if (capturing_) {
        throw CaptureError{"A recording is already in progress"};
    }

    const auto device = devices_.currentInputDevice();
    if (device.isNull()) {
        throw CaptureError{"No audio input device is available"};
    }

    QString error;
    QMetaObject::invokeMethod(thread_ctx_, [&] {
        error = startOnCaptureThread(device);
    }, Qt::BlockingQueuedConnection);

    if (!error.isEmpty()) {
        throw CaptureError{error.toStdString()};
    }

    LOG_INFO_N << "Capturing from " << device_name_ << " at " << format_.sampleRate()
               << " Hz, " << format_.channelCount() << " channel(s)";
}

audio_buffer_t QtAudioCapture::stop()
{
    if (!capturing_.exchange(false)) {
        throw CaptureError{"No recording is in progress"};
    }

    audio_buffer_t buffer;
    QMetaObject::invokeMethod(thread_ctx_, [&] {
        buffer = stopOnCaptureThread(true);
    }, Qt::BlockingQueuedConnection);

    if (!buffer) {
        throw CaptureError{"The recording was lost"};
    }

    LOG_DEBUG_N << "Captured " << buffer->frames() << " frames (" << buffer->duration().count() << " ms)";
    return buffer;
}

void QtAudioCapture::abort() noexcept
{
    if (!capturing_.exchange(false)) {
        return;
    }

    LOG_DEBUG_N << "Aborting audio capture";
    QMetaObject::invokeMethod(thread_ctx_, [this] {
        stopOnCaptureThread(false);
    }, Qt::BlockingQueuedConnection);
}

QString QtAudioCapture::startOnCaptureThread(const QAudioDevice &device)
{
    format_ = createCaptureFormat(device, sample_rate_);
    if (!format_.isValid()) {
        return QStringLiteral("The audio device %1 reports no usable format").arg(device.description());
    }

    sink_ = make_unique<AudioCaptureDevice>(format_, level_interval_);
    connect(sink_.get(), &AudioCaptureDevice::recordingLevelUpdated,
            this, &AudioCapture::levelUpdated);

    source_ = make_unique<QAudioSource>(device, format_);
    connect(source_.get(), &QAudioSource::stateChanged,
            thread_ctx_, [this](QAudio::State state) {
                onSourceStateChanged(state);
            });

    if (!sink_->open(QIODevice::WriteOnly)) {
        source_.reset();
        sink_.reset();
        return QStringLiteral("Failed to open the capture buffer");
    }

    device_id_ = device.id();
    device_name_ = device.description();

    // Before start(), so a failure reported by the source is not lost
    capturing_ = true;
    source_->start(sink_.get()); // push mode

    if (const auto err = source_->error(); err != QAudio::NoError) {
        capturing_ = false;
        source_.reset();
        sink_.reset();
        return QStringLiteral("Failed to start recording from %1: %2")
            .arg(device.description(), toString(err));
    }

    return {};
}

audio_buffer_t QtAudioCapture::stopOnCaptureThread(bool keepAudio)
{
    if (!source_ || !sink_) {
        return {};
    }

    source_->stop();
    sink_->close();

    audio_buffer_t buffer;
    if (keepAudio) {
        buffer = make_shared<const AudioBuffer>(sink_->takeSamples(),
                                                format_.sampleRate(),
                                                format_.channelCount());
    }

    source_.reset();
    sink_.reset();
    return buffer;
}

void QtAudioCapture::onSourceStateChanged(QAudio::State state)
{
    if (state != QAudio::StoppedState || !source_) {
        return;
    }

    if (const auto err = source_->error(); err != QAudio::NoError) {
        if (!capturing_.exchange(false)) {
            return;
        }

        // We are on the capture thread already
        stopOnCaptureThread(false);
        fail(QStringLiteral("Recording from %1 stopped: %2").arg(device_name_, toString(err)));
    }
}

void QtAudioCapture::onInputDevicesChanged()
{
    if (!capturing_ || devices_.isAvailable(device_id_)) {
        return;
    }

    if (!capturing_.exchange(false)) {
        return;
    }

    QMetaObject::invokeMethod(thread_ctx_, [this] {
        stopOnCaptureThread(false);
    }, Qt::BlockingQueuedConnection);

    fail(QStringLiteral("The audio device %1 was disconnected").arg(device_name_));
}

void QtAudioCapture::fail(const QString &why)
{
    LOG_WARN_N << why;
    emit captureFailed(why);
}

QAudioFormat QtAudioCapture::createCaptureFormat(const QAudioDevice &device, int sampleRate)
{
    QAudioFormat format;
    format.setSampleRate(sampleRate);
    format.setChannelCount(1);                   // mono
    format.setSampleFormat(QAudioFormat::Int16); // 16-bit signed PCM

    if (!device.isFormatSupported(format)) {
        LOG_WARN_N << "Requested format not supported by " << device.description() << ", using nearest";
        format = device.preferredFormat();
    }
    return format;
}
