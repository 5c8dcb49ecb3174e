#pragma once

#include <chrono>
#include <optional>

#include <QString>

/*! A key combination, like "f9" or "ctrl+shift+d".
 *
 * Key codes are Linux input event codes (KEY_*).
 */
struct KeyChord {
    enum Modifier : unsigned {
        Ctrl  = 1 << 0,
        Shift = 1 << 1,
        Alt   = 1 << 2,
        Super = 1 << 3
    };

    int key{};
    unsigned modifiers{};

    static std::optional<KeyChord> parse(const QString& text);

    // F9
    static KeyChord defaultChord();

    QString toString() const;

    bool operator==(const KeyChord&) const = default;
};

// Returns -1 for unknown names
int keyCodeFromName(const QString& name);

// Inverse of keyCodeFromName(). Unknown codes are returned as "key<code>".
QString keyNameFromCode(int code);

/*! Turns raw key events into toggle events.
 *
 * Fires on the press that completes the chord. Auto-repeat is ignored and
 * the chord must be released before it can fire again. A second completion
 * inside the debounce window is dropped.
 */
class KeyChordTracker
{
public:
    using clock_t = std::chrono::steady_clock;

    KeyChordTracker(KeyChord chord, std::chrono::milliseconds debounce);

    /*! Feed one EV_KEY event.
     *
     * @param code Linux key code
     * @param value 0 = release, 1 = press, 2 = auto-repeat
     * @param when Timestamp of the event
     * @return true if this event toggles
     */
    bool onKey(int code, int value, clock_t::time_point when);

    // Forget all held keys, for example after the devices were rescanned
    void reset();

    const KeyChord& chord() const noexcept { return chord_; }

private:
    unsigned heldModifiers() const noexcept;
    void updateModifier(int code, bool pressed);

    const KeyChord chord_;
    const std::chrono::milliseconds debounce_;
    unsigned held_{}; // one bit per left/right modifier key
    bool armed_{true};
    std::optional<clock_t::time_point> last_fired_;
};
