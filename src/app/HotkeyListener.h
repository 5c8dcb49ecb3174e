#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

#include <QObject>

#include "KeyChordTracker.h"

/*! Global hotkey from Linux evdev devices.
 *
 * Reads every keyboard under /dev/input on its own thread and emits
 * toggled() when the chord is pressed. The thread does nothing else, so
 * connect to toggled() with a queued connection.
 *
 * The user needs read access to the devices (usually the "input" group).
 */
class HotkeyListener : public QObject
{
    Q_OBJECT
public:
    HotkeyListener(KeyChord chord, std::chrono::milliseconds debounce, QObject *parent = nullptr);
    ~HotkeyListener() override;

    // Opens the keyboards and starts the thread. False if no keyboard could be opened.
    bool start();
    void stop();


    const KeyChord& chord() const noexcept { return tracker_.chord(); }

signals:
    void toggled();

private:
    void run(std::stop_token stop) noexcept;
    bool openKeyboards();
    void closeKeyboards();

    KeyChordTracker tracker_;
    std::vector<int> fds_;
    std::optional<std::jthread> worker_;
    std::atomic_bool running_{false};
};
