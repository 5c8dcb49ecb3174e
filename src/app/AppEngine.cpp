#include <atomic>
#include <csignal>
#include <iostream>

#include <QClipboard>
#include <QGuiApplication>
#include <QSettings>

#include "AppEngine.h"
#include "ExclusionPolicy.h"
#include "HotkeyListener.h"
#include "KeyChordTracker.h"
#include "OllamaCorrector.h"
#include "QtAudioCapture.h"
#include "TextInjector.h"
#include "WhisperTranscriber.h"
#include "XdotoolBackend.h"

#include "logging.h"

using namespace std;

namespace {

static_assert(std::atomic<bool>::is_always_lock_free,
              "std::atomic<bool> must be lock-free for signal handler safety");

std::atomic_bool signal_received{false};

void onTerminationSignal(int) {
    signal_received = true;
}

} // anon ns

AppEngine::AppEngine(AppConfig config, QObject *parent)
    : QObject(parent)
    , config_{std::move(config)}
{
    if (config_.device_index >= 0 && !audio_controller_.setInputDevice(config_.device_index)) {
        LOG_WARN_N << "Audio device #" << config_.device_index
                   << " does not exist. Using the default input device.";
        audio_controller_.setInputDevice(-1);
    }

    capture_ = make_unique<QtAudioCapture>(audio_controller_, config_.sample_rate, config_.level_interval);
    transcriber_ = make_shared<WhisperTranscriber>(config_.whisper);

    if (config_.pipeline.correction_enabled) {
        corrector_ = make_shared<OllamaCorrector>(config_.ollama);
    }

    if (config_.pipeline.autotype_enabled) {
        injector_ = make_shared<TextInjector>(make_shared<XdotoolBackend>(),
                                              make_shared<const ExclusionPolicy>(config_.excluded_apps),
                                              config_.pacing);
    }

    coordinator_ = make_unique<PipelineCoordinator>(config_.pipeline, state_, *capture_,
                                                     transcriber_, corrector_, injector_);

    connect(coordinator_.get(), &PipelineCoordinator::pipelineEvent, this, &AppEngine::onPipelineEvent);
    connect(coordinator_.get(), &PipelineCoordinator::toggleAcknowledged, this, &AppEngine::onToggleAcknowledged);
    connect(coordinator_.get(), &PipelineCoordinator::levelUpdated, this, [](qreal level) {
        LOG_TRACE << "Recording level " << level;
    });

    if (!config_.transcript_log.isEmpty()) {
        journal_.emplace(config_.transcript_log);
        LOG_INFO_N << "Transcripts are appended to " << config_.transcript_log;
    }

    setupHotkey();

    if (corrector_) {
        probeCorrectionServer();
    }
}

AppEngine::~AppEngine()
{
    shutdown();
}

bool AppEngine::start()
{
    if (!hotkey_->start()) {
        return false;
    }

    LOG_INFO_N << "Press " << hotkey_->chord().toString() << " to start and stop a recording.";
    return true;
}

void AppEngine::shutdown()
{
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    LOG_INFO_N << "Shutting down";
    signal_poll_timer_.stop();
    if (hotkey_) {
        hotkey_->stop();
    }
    if (coordinator_) {
        coordinator_->shutdown();
    }
}

void AppEngine::copyTextToClipboard(const QString &text)
{
    if (auto *clipb = QGuiApplication::clipboard()) {
        clipb->setText(text);
    } else {
        LOG_WARN_N << "Clipboard not available";
    }
}

void AppEngine::initLogging(QSettings& settings, std::optional<logfault::LogLevel> consoleLevel)
{
    if (!settings.contains("logging/applevel")) {
        settings.setValue("logging/applevel", 4); // INFO
    }

    const auto applevel = consoleLevel
        ? static_cast<int>(*consoleLevel)
        : settings.value("logging/applevel", 4).toInt();

    if (applevel > 0) {
        logfault::LogManager::Instance().AddHandler(
            make_unique<logfault::StreamHandler>(clog, static_cast<logfault::LogLevel>(applevel)));
        LOG_INFO << "Logging to console";
    }

    auto level = settings.value("logging/level", 0).toInt();
    if (level > 0) {
        if (auto path = settings.value("logging/path", "").toString().toStdString(); !path.empty()) {
            const bool prune = settings.value("logging/prune", "").toString() == "true";
            logfault::LogManager::Instance().AddHandler(
                make_unique<logfault::StreamHandler>(path, static_cast<logfault::LogLevel>(level), prune));

            LOG_INFO << "Logging to: " << path;
        }
    }
}

void AppEngine::installSignalHandlers()
{
    std::signal(SIGINT, onTerminationSignal);
    std::signal(SIGTERM, onTerminationSignal);

    // Qt is not async-signal-safe, so the handler only sets a flag
    connect(&signal_poll_timer_, &QTimer::timeout, this, [this] {
        if (signal_received) {
            LOG_INFO_N << "Termination signal received";
            shutdown();
            QCoreApplication::quit();
        }
    });
    signal_poll_timer_.start(200);
}

void AppEngine::onPipelineEvent(const PipelineEvent &event)
{
    const auto status = describe(event);

    std::visit([this, &status](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;

        if constexpr (std::is_same_v<T, TranscriptReady>) {
            LOG_INFO_N << "Transcript #" << ev.session << ": " << ev.best();
            if (ev.low_confidence) {
                LOG_WARN_N << "Transcript #" << ev.session << " has low confidence (" << ev.confidence << ")";
            }
            if (config_.copy_to_clipboard) {
                copyTextToClipboard(ev.best());
            }
            if (journal_) {
                journal_->append(ev.session, ev.best());
            }
        } else if constexpr (std::is_same_v<T, RecordingFailed>
                             || std::is_same_v<T, TranscriptionFailed>
                             || std::is_same_v<T, InjectionFailed>) {
            LOG_WARN_N << status;
        } else {
            LOG_INFO_N << status;
        }
    }, event);
}

void AppEngine::onToggleAcknowledged(ToggleAck ack)
{
    switch(ack) {
    case ToggleAck::Started:
    case ToggleAck::Stopped:
        break;
    case ToggleAck::Busy:
        LOG_INFO_N << "Busy. Still processing the previous recording.";
        break;
    case ToggleAck::DeviceUnavailable:
        LOG_WARN_N << "No usable audio input device";
        break;
    case ToggleAck::CaptureFailed:
        LOG_WARN_N << "Recording failed";
        break;
    }
}

void AppEngine::setupHotkey()
{
    auto chord = KeyChord::parse(config_.hotkey);
    if (!chord) {
        LOG_WARN_N << "Cannot parse the hotkey \"" << config_.hotkey << "\". Using "
                   << KeyChord::defaultChord().toString();
        chord = KeyChord::defaultChord();
    }

    hotkey_ = make_unique<HotkeyListener>(*chord, config_.hotkey_debounce);

    // The listener emits from its own thread
    connect(hotkey_.get(), &HotkeyListener::toggled, this, [this] {
        coordinator_->toggle();
    }, Qt::QueuedConnection);
}

QCoro::Task<void> AppEngine::probeCorrectionServer()
{
    auto corrector = corrector_;
    const auto model = config_.pipeline.correction_model;

    const auto models = co_await corrector->listAvailableModels();
    if (!models) {
        LOG_WARN_N << "The correction server at " << corrector->baseUrl().toString()
                   << " is not reachable. Transcripts will be delivered uncorrected until it is.";
        co_return;
    }

    if (!models->contains(model)) {
        LOG_WARN_N << "The correction model \"" << model << "\" is not installed on "
                   << corrector->baseUrl().toString() << ". Install it with: ollama pull " << model;
        co_return;
    }

    LOG_INFO_N << "Correction server " << corrector->baseUrl().toString() << " is ready with model " << model;
}
