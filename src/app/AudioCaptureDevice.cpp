#include <algorithm>
#include <cmath>
#include <cstring>

#include "AudioCaptureDevice.h"

#include "logging.h"
using namespace std;

AudioCaptureDevice::AudioCaptureDevice(const QAudioFormat& format,
                                       std::chrono::milliseconds levelInterval,
                                       QObject *parent)
    : QIODevice(parent), format_{format}, level_interval_{levelInterval}
{
}

bool AudioCaptureDevice::open(OpenMode mode)
{
    LOG_DEBUG_N << "Opening AudioCaptureDevice in mode " << mode.toInt();
    if (!(mode & WriteOnly)) {
        LOG_ERROR_N << "AudioCaptureDevice can only be opened in WriteOnly mode";
        return false;
    }

    samples_.clear();
    partial_.clear();
    level_from_ = 0;
    recording_level_ = 0;
    level_time_ = chrono::steady_clock::now();

    // Reserve room for about a minute of audio
    samples_.reserve(static_cast<size_t>(format_.sampleRate()) * max(1, format_.channelCount()) * 60);

    const auto res = QIODevice::open(mode);
    if (!res) {
        LOG_ERROR_N << "Failed to open AudioCaptureDevice";
    }
    return res;
}

void AudioCaptureDevice::close()
{
    LOG_DEBUG_N << "Closing AudioCaptureDevice with " << samples_.size() << " samples";
    QIODevice::close();
}

vector<qint16> AudioCaptureDevice::takeSamples()
{
    auto samples = std::move(samples_);
    samples_ = {};
    level_from_ = 0;
    return samples;
}

void AudioCaptureDevice::appendConverted(const QAudioFormat &format, const char *data, qint64 len,
                                         std::vector<qint16> &out)
{
    const auto count = static_cast<size_t>(len / max(1, format.bytesPerSample()));

    switch (format.sampleFormat()) {
    case QAudioFormat::Int16: {
        const auto offset = out.size();
        out.resize(offset + count);
        memcpy(out.data() + offset, data, count * sizeof(qint16));
    } break;
    case QAudioFormat::UInt8:
        for (size_t i = 0; i < count; ++i) {
            const auto v = static_cast<int>(static_cast<quint8>(data[i])) - 128;
            out.push_back(static_cast<qint16>(v << 8));
        }
        break;
    case QAudioFormat::Int32:
        for (size_t i = 0; i < count; ++i) {
            qint32 v{};
            memcpy(&v, data + i * sizeof(qint32), sizeof(qint32));
            out.push_back(static_cast<qint16>(v >> 16));
        }
        break;
    case QAudioFormat::Float:
        for (size_t i = 0; i < count; ++i) {
            float v{};
            memcpy(&v, data + i * sizeof(float), sizeof(float));
            v = clamp(v, -1.0f, 1.0f);
            out.push_back(static_cast<qint16>(lrintf(v * 32767.0f)));
        }
        break;
    default:
        LOG_WARN_N << "Unsupported audio sample format " << static_cast<int>(format.sampleFormat());
        break;
    }
}

qint64 AudioCaptureDevice::writeData(const char *data, qint64 len)
{
    const qint64 bps = max(1, format_.bytesPerSample());

    // QAudioSource may split a sample across two writes
    const char *src = data;
    qint64 avail = len;
    if (!partial_.isEmpty()) {
        const auto need = min<qint64>(bps - partial_.size(), avail);
        partial_.append(data, need);
        src += need;
        avail -= need;
        if (partial_.size() == bps) {
            appendConverted(format_, partial_.constData(), bps, samples_);
            partial_.clear();
        }
    }

    const auto whole = avail - avail % bps;
    appendConverted(format_, src, whole, samples_);
    if (whole < avail) {
        partial_.append(src + whole, avail - whole);
    }

    const auto now = chrono::steady_clock::now();
    if (now - level_time_ >= level_interval_ && level_from_ < samples_.size()) {
        recalculateRecordingLevel(span<const qint16>{samples_}.subspan(level_from_));
        level_from_ = samples_.size();
        level_time_ = now;
    }

    return len;
}

void AudioCaptureDevice::recalculateRecordingLevel(std::span<const qint16> samples)
{
    if (samples.empty())
        return;

    // Peak amplitude in this chunk, normalized to 0..1
    double peak = 0.0;
    for (qint16 s : samples) {
        peak = max(peak, abs(static_cast<double>(s) / 32768.0));
    }

    // Smooth with a simple low-pass filter so the level doesn't flicker
    constexpr double alpha = 0.3;
    const double new_level = clamp(alpha * peak + (1.0 - alpha) * static_cast<double>(recording_level_), 0.0, 1.0);

    if (std::abs(new_level - static_cast<double>(recording_level_)) < 0.001)
        return;

    recording_level_ = static_cast<qreal>(new_level);
    emit recordingLevelUpdated(recording_level_);
}
