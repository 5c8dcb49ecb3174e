#include <array>

#include <linux/input-event-codes.h>

#include <QStringList>

#include "KeyChordTracker.h"

using namespace std;

namespace {

struct NamedKey {
    const char *name;
    int code;
};

constexpr auto named_keys = to_array<NamedKey>({
    {"space", KEY_SPACE},
    {"enter", KEY_ENTER},
    {"return", KEY_ENTER},
    {"tab", KEY_TAB},
    {"escape", KEY_ESC},
    {"esc", KEY_ESC},
    {"backspace", KEY_BACKSPACE},
    {"insert", KEY_INSERT},
    {"delete", KEY_DELETE},
    {"home", KEY_HOME},
    {"end", KEY_END},
    {"pageup", KEY_PAGEUP},
    {"pagedown", KEY_PAGEDOWN},
    {"up", KEY_UP},
    {"down", KEY_DOWN},
    {"left", KEY_LEFT},
    {"right", KEY_RIGHT},
    {"capslock", KEY_CAPSLOCK},
    {"pause", KEY_PAUSE},
    {"print", KEY_SYSRQ},
    {"scrolllock", KEY_SCROLLLOCK},
    {"period", KEY_DOT},
    {"comma", KEY_COMMA},
    {"slash", KEY_SLASH},
    {"semicolon", KEY_SEMICOLON},
    {"minus", KEY_MINUS},
    {"equal", KEY_EQUAL},
    {"grave", KEY_GRAVE}
});

// Bits in KeyChordTracker::held_, left key in the low nibble, right in the high
constexpr auto modifier_keys = to_array<int>({
    KEY_LEFTCTRL, KEY_LEFTSHIFT, KEY_LEFTALT, KEY_LEFTMETA,
    KEY_RIGHTCTRL, KEY_RIGHTSHIFT, KEY_RIGHTALT, KEY_RIGHTMETA
});

int modifierIndex(int code) {
    for (size_t i = 0; i < modifier_keys.size(); ++i) {
        if (modifier_keys[i] == code) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // anon ns

int keyCodeFromName(const QString &name)
{
    const auto n = name.trimmed().toLower();

    if (n.size() == 1) {
        const auto ch = n.at(0).toLatin1();
        if (ch >= 'a' && ch <= 'z') {
            constexpr auto letters = to_array<int>({
                KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I,
                KEY_J, KEY_K, KEY_L, KEY_M, KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R,
                KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z
            });
            return letters[ch - 'a'];
        }
        if (ch == '0') {
            return KEY_0;
        }
        if (ch >= '1' && ch <= '9') {
            return KEY_1 + (ch - '1');
        }
    }

    if (n.size() >= 2 && n.startsWith(u'f')) {
        bool ok = false;
        const auto num = n.mid(1).toInt(&ok);
        if (ok) {
            // F11 and F12 are not next to F10
            constexpr auto fkeys = to_array<int>({
                KEY_F1, KEY_F2, KEY_F3, KEY_F4, KEY_F5, KEY_F6,
                KEY_F7, KEY_F8, KEY_F9, KEY_F10, KEY_F11, KEY_F12
            });
            if (num >= 1 && num <= static_cast<int>(fkeys.size())) {
                return fkeys[num - 1];
            }
            return -1;
        }
    }

    for (const auto& k : named_keys) {
        if (n == QLatin1String{k.name}) {
            return k.code;
        }
    }

    return -1;
}

QString keyNameFromCode(int code)
{
    for (int n = 1; n <= 12; ++n) {
        if (keyCodeFromName(QStringLiteral("f%1").arg(n)) == code) {
            return QStringLiteral("f%1").arg(n);
        }
    }

    for (char ch = 'a'; ch <= 'z'; ++ch) {
        if (keyCodeFromName(QString{QLatin1Char{ch}}) == code) {
            return QString{QLatin1Char{ch}};
        }
    }

    for (char ch = '0'; ch <= '9'; ++ch) {
        if (keyCodeFromName(QString{QLatin1Char{ch}}) == code) {
            return QString{QLatin1Char{ch}};
        }
    }

    for (const auto& k : named_keys) {
        if (k.code == code) {
            return QString::fromLatin1(k.name);
        }
    }

    return QStringLiteral("key%1").arg(code);
}

optional<KeyChord> KeyChord::parse(const QString &text)
{
    const auto parts = text.split(u'+', Qt::SkipEmptyParts);
    if (parts.isEmpty()) {
        return {};
    }

    KeyChord chord;
    for (qsizetype i = 0; i + 1 < parts.size(); ++i) {
        const auto mod = parts.at(i).trimmed().toLower();
        if (mod == "ctrl" || mod == "control") {
            chord.modifiers |= Ctrl;
        } else if (mod == "shift") {
            chord.modifiers |= Shift;
        } else if (mod == "alt") {
            chord.modifiers |= Alt;
        } else if (mod == "super" || mod == "meta" || mod == "cmd") {
            chord.modifiers |= Super;
        } else {
            return {};
        }
    }

    chord.key = keyCodeFromName(parts.back());
    if (chord.key < 0) {
        return {};
    }

    return chord;
}

KeyChord KeyChord::defaultChord()
{
    return {KEY_F9, 0};
}

QString KeyChord::toString() const
{
    QStringList parts;
    if (modifiers & Ctrl) parts << QStringLiteral("ctrl");
    if (modifiers & Shift) parts << QStringLiteral("shift");
    if (modifiers & Alt) parts << QStringLiteral("alt");
    if (modifiers & Super) parts << QStringLiteral("super");
    parts << keyNameFromCode(key);
    return parts.join(u'+');
}

KeyChordTracker::KeyChordTracker(KeyChord chord, std::chrono::milliseconds debounce)
    : chord_{chord}, debounce_{debounce}
{
}

void KeyChordTracker::reset()
{
    held_ = 0;
    armed_ = true;
}

unsigned KeyChordTracker::heldModifiers() const noexcept
{
    // Left or right, in the bit layout of KeyChord::Modifier
    return (held_ | (held_ >> 4)) & 0x0f;
}

void KeyChordTracker::updateModifier(int code, bool pressed)
{
    const auto ix = modifierIndex(code);
    if (ix < 0) {
        return;
    }

    if (pressed) {
        held_ |= 1u << ix;
    } else {
        held_ &= ~(1u << ix);
    }
}

bool KeyChordTracker::onKey(int code, int value, clock_t::time_point when)
{
    if (value == 2) {
        return false; // auto-repeat
    }

    const bool pressed = value == 1;
    updateModifier(code, pressed);

    if (!pressed) {
        // Releasing any key of the chord re-arms it
        if (code == chord_.key || modifierIndex(code) >= 0) {
            armed_ = true;
        }
        return false;
    }

    if (code != chord_.key || !armed_ || heldModifiers() != chord_.modifiers) {
        return false;
    }

    armed_ = false;

    if (last_fired_ && when - *last_fired_ < debounce_) {
        return false;
    }

    last_fired_ = when;
    return true;
}
