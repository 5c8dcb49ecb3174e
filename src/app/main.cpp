#include <memory>
#include <iostream>

#include <QCommandLineParser>
#include <QDir>
#include <QGuiApplication>
#include <QLockFile>
#include <QSettings>
#include <QStandardPaths>

#include "AppEngine.h"
#include "logging.h"

using namespace std;

namespace {
optional<logfault::LogLevel> toLogLevel(string_view name) {
    if (name.empty()) {
        return {};
    }

    if (name == "off" || name == "false") {
        return logfault::LogLevel::DISABLED;
    }

    if (name == "error") {
        return logfault::LogLevel::ERROR;
    }

    if (name == "warn" || name == "warning") {
        return logfault::LogLevel::WARN;
    }

    if (name == "debug") {
        return logfault::LogLevel::DEBUGGING;
    }

    if (name == "trace") {
        return logfault::LogLevel::TRACE;
    }

    return logfault::LogLevel::INFO;
}
} // namespace

int main(int argc, char *argv[])
{
    // The clipboard needs a gui application, even if we never show a window
    QGuiApplication app(argc, argv);

    QCoreApplication::setOrganizationName("QVoiceTyper");
    QCoreApplication::setApplicationName("QVoiceTyper");
    QCoreApplication::setApplicationVersion(APP_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Hotkey driven speech to text. Press the hotkey, speak, press it again.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption config_option{{"c", "config"}, "Read the configuration from <file>.", "file"};
    QCommandLineOption log_level_option{{"l", "log-level"},
                                        "Console log level: off, error, warn, info, debug or trace.", "level"};
    QCommandLineOption list_devices_option{"list-devices", "List the audio input devices and exit."};
    parser.addOption(config_option);
    parser.addOption(log_level_option);
    parser.addOption(list_devices_option);
    parser.process(app);

    unique_ptr<QSettings> settings = parser.isSet(config_option)
        ? make_unique<QSettings>(parser.value(config_option), QSettings::IniFormat)
        : make_unique<QSettings>();

    AppEngine::initLogging(*settings, toLogLevel(parser.value(log_level_option).toStdString()));

    LOG_INFO << "Starting QVoiceTyper " << APP_VERSION;
    LOG_INFO << "Configuration from '" << settings->fileName() << "'";

    if (parser.isSet(list_devices_option)) {
        AudioController devices;
        for (const auto& line : devices.describeDevices()) {
            cout << line.toStdString() << '\n';
        }
        return 0;
    }

    auto runtime_dir = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    if (runtime_dir.isEmpty()) {
        runtime_dir = QDir::tempPath();
    }
    QLockFile lock{runtime_dir + "/qvoicetyper.lock"};
    lock.setStaleLockTime(0);
    if (!lock.tryLock()) {
        LOG_ERROR << "QVoiceTyper is already running (lock file " << lock.fileName() << ")";
        return 1;
    }

    AppEngine app_engine{AppConfig::load(*settings)};
    app_engine.installSignalHandlers();

    if (!app_engine.start()) {
        return 2;
    }

    const auto rval = app.exec();
    app_engine.shutdown();
    LOG_INFO << "QVoiceTyper exits with code " << rval;
    return rval;
}
