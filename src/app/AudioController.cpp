#include "AudioController.h"
#include "logging.h"

AudioController::AudioController(QObject *parent)
    : QObject(parent), input_device_{QMediaDevices::defaultAudioInput()}
{
    LOG_INFO_N << "Available audio input devices:";
    printDevices();

    connect(&media_devices_, &QMediaDevices::audioInputsChanged,
            this, [this]{
        LOG_INFO_N << "Audio input devices changed " << media_devices_.audioInputs().size();
        printDevices();
        emit inputDevicesChanged();
    });
}

void AudioController::setInputDevice(const QAudioDevice &dev) {
    input_device_ = dev;
    LOG_INFO_N << "Current audio input device changed to " << dev.description();
    emit currentInputDeviceChanged();
}

bool AudioController::setInputDevice(int index)
{
    if (index < 0) {
        setInputDevice(QMediaDevices::defaultAudioInput());
        return true;
    }

    const auto devices = inputDevices();
    if (index >= devices.size()) {
        LOG_WARN_N << "Audio input device #" << index << " does not exist. There are "
                   << devices.size() << " input devices.";
        return false;
    }

    setInputDevice(devices.at(index));
    return true;
}

bool AudioController::isAvailable(const QByteArray &deviceId) const
{
    for (const auto& dev : media_devices_.audioInputs()) {
        if (dev.id() == deviceId) {
            return true;
        }
    }
    return false;
}

QStringList AudioController::describeDevices() const
{
    QStringList list;
    int ix = 0;
    for (const auto& dev : media_devices_.audioInputs()) {
        const bool is_current = (dev.id() == input_device_.id());
        list << QStringLiteral("#%1%2%3").arg(ix++).arg(is_current ? QStringLiteral(" * ") : QStringLiteral(" : "), dev.description());
    }
    return list;
}

void AudioController::printDevices()
{
    for (const auto& line : describeDevices()) {
        LOG_INFO_N << "  " << line;
    }
}
