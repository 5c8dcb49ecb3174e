#pragma once

#include <stdexcept>

#include <QString>

class InjectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/*! OS level keyboard simulation.
 *
 * All methods block and are called from the injection worker thread.
 * Failures throw InjectionError.
 */
class InputBackend
{
public:
    InputBackend() = default;
    virtual ~InputBackend() = default;

    InputBackend(const InputBackend&) = delete;
    InputBackend& operator=(const InputBackend&) = delete;

    // Throws if keystrokes cannot be simulated at all.
    virtual void checkAccess() = 0;

    // Name of the application owning the focused window. Empty if unknown.
    virtual QString foregroundApplication() = 0;

    // Types literal text (usually one character).
    virtual void typeText(const QString& text) = 0;

    // Presses and releases a named key, like "Return" or "Tab".
    virtual void pressKey(const QString& key) = 0;
};
