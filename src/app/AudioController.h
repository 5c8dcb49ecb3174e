#pragma once

#include <optional>

#include <QMediaDevices>
#include <QAudioDevice>
#include <QStringList>

/*! Knows the audio input devices and which one to record from.
 */
class AudioController : public QObject
{
    Q_OBJECT

public:
    explicit AudioController(QObject *parent = nullptr);

    const QList<QAudioDevice> inputDevices() const { return media_devices_.audioInputs(); }
    const QAudioDevice &currentInputDevice() const { return input_device_; }

    void setInputDevice(const QAudioDevice &dev);

    // -1 selects the system default. Returns false if the index is out of range.
    bool setInputDevice(int index);

    bool isAvailable(const QByteArray& deviceId) const;
    QStringList describeDevices() const;

signals:
    void inputDevicesChanged();
    void currentInputDeviceChanged();

private:
    void printDevices();

    QMediaDevices media_devices_;
    QAudioDevice  input_device_;
};
