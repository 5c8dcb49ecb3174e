#pragma once

#include <chrono>

#include <QStringList>

#include "InputBackend.h"

/*! InputBackend that runs the xdotool command (X11 and XWayland).
 */
class XdotoolBackend : public InputBackend
{
public:
    explicit XdotoolBackend(QString program = QStringLiteral("xdotool"),
                            std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    void checkAccess() override;
    QString foregroundApplication() override;
    void typeText(const QString& text) override;
    void pressKey(const QString& key) override;

private:
    QString run(const QStringList& args);

    const QString program_;
    const std::chrono::milliseconds timeout_;
};
