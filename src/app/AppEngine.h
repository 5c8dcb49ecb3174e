#pragma once

#include <memory>
#include <optional>

#include <QObject>
#include <QTimer>

#include <qcorotask.h>

#include "AppConfig.h"
#include "AudioController.h"
#include "PipelineCoordinator.h"
#include "PipelineStateHolder.h"
#include "TranscriptJournal.h"

class QtAudioCapture;
class WhisperTranscriber;
class OllamaCorrector;
class TextInjector;
class HotkeyListener;

namespace logfault {
enum class LogLevel;
}

/*! Owns the components and wires them together.
 *
 * The engine is the presenter for pipeline events: it logs them, copies
 * finished text to the clipboard and appends it to the transcript journal.
 */
class AppEngine : public QObject
{
    Q_OBJECT

public:
    explicit AppEngine(AppConfig config, QObject *parent = nullptr);
    ~AppEngine() override;

    // Start listening for the hotkey. Returns false if no keyboard could be opened.
    bool start();

    // Stop the hotkey listener and abort any recording in progress.
    void shutdown();

    PipelineCoordinator& coordinator() { return *coordinator_; }
    AudioController &audioController() { return audio_controller_; }
    const AppConfig& config() const noexcept { return config_; }

    static void copyTextToClipboard(const QString& text);

    static void initLogging(QSettings& settings, std::optional<logfault::LogLevel> consoleLevel);

    // Route SIGINT and SIGTERM to a clean shutdown of the application.
    void installSignalHandlers();

private:
    void onPipelineEvent(const PipelineEvent& event);
    void onToggleAcknowledged(ToggleAck ack);
    void setupHotkey();
    QCoro::Task<void> probeCorrectionServer();

    AppConfig config_;
    AudioController audio_controller_;
    PipelineStateHolder state_;
    std::unique_ptr<QtAudioCapture> capture_;
    std::shared_ptr<WhisperTranscriber> transcriber_;
    std::shared_ptr<OllamaCorrector> corrector_;
    std::shared_ptr<TextInjector> injector_;
    std::unique_ptr<PipelineCoordinator> coordinator_;
    std::unique_ptr<HotkeyListener> hotkey_;
    std::optional<TranscriptJournal> journal_;
    QTimer signal_poll_timer_;
    bool shut_down_{false};
};
