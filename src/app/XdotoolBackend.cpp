#include <QProcess>

#include "XdotoolBackend.h"
#include "logging.h"

XdotoolBackend::XdotoolBackend(QString program, std::chrono::milliseconds timeout)
    : program_{std::move(program)}, timeout_{timeout}
{
}

void XdotoolBackend::checkAccess()
{
    const auto version = run({QStringLiteral("version")});
    LOG_TRACE_N << "Using " << version.trimmed();
}

QString XdotoolBackend::foregroundApplication()
{
    try {
        return run({QStringLiteral("getactivewindow"), QStringLiteral("getwindowclassname")}).trimmed();
    } catch (const InjectionError& ex) {
        // No focused window, for example on an empty desktop
        LOG_DEBUG_N << "Could not get the active window: " << ex.what();
        return {};
    }
}

void XdotoolBackend::typeText(const QString &text)
{
    run({QStringLiteral("type"), QStringLiteral("--clearmodifiers"),
         QStringLiteral("--delay"), QStringLiteral("0"),
         QStringLiteral("--"), text});
}

void XdotoolBackend::pressKey(const QString &key)
{
    run({QStringLiteral("key"), QStringLiteral("--clearmodifiers"), key});
}

QString XdotoolBackend::run(const QStringList &args)
{
    QProcess proc;
    proc.start(program_, args);
    if (!proc.waitForStarted(static_cast<int>(timeout_.count()))) {
        throw InjectionError{QStringLiteral("Failed to run %1: %2. Is xdotool installed?")
                                 .arg(program_, proc.errorString()).toStdString()};
    }

    if (!proc.waitForFinished(static_cast<int>(timeout_.count()))) {
        proc.kill();
        proc.waitForFinished();
        throw InjectionError{QStringLiteral("%1 %2 timed out").arg(program_, args.value(0)).toStdString()};
    }

    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        const auto err = QString::fromLocal8Bit(proc.readAllStandardError()).trimmed();
        throw InjectionError{QStringLiteral("%1 %2 failed with exit code %3: %4")
                                 .arg(program_, args.value(0)).arg(proc.exitCode()).arg(err).toStdString()};
    }

    return QString::fromLocal8Bit(proc.readAllStandardOutput());
}
