#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include <QObject>
#include <QThreadPool>

#include <qcorotask.h>

#include "AudioCapture.h"
#include "PipelineEvent.h"
#include "PipelineStateHolder.h"
#include "PipelineTypes.h"

class SpeechTranscriber;
class TextCorrector;
class TextInjector;

/*! Runs the record -> transcribe -> correct -> type pipeline.
 *
 * Lives on the thread that owns the event loop. toggle() is the only input.
 * It starts or stops the capture and returns at once; the processing job
 * runs as a coroutine on the same thread while the blocking stages run on
 * their own single thread pools.
 *
 * At most one job runs at any time. A toggle while a job runs is answered
 * with ToggleAck::Busy. Every job ends with the state back at Idle, no
 * matter which stage failed.
 */
class PipelineCoordinator : public QObject
{
    Q_OBJECT
public:
    struct Config {
        std::chrono::milliseconds min_duration{500};
        int silence_threshold{50}; // 0 disables the check
        std::chrono::milliseconds transcription_timeout{60000};
        bool correction_enabled{true};
        QString correction_model{"llama3:latest"};
        int max_retries{3};
        std::chrono::milliseconds backoff{500};
        bool autotype_enabled{false};
        InjectionMode injection_mode{InjectionMode::Raw};
    };

    /*! The corrector and injector may be null, which disables those stages.
     */
    PipelineCoordinator(Config config,
                        PipelineStateHolder& state,
                        AudioCapture& capture,
                        std::shared_ptr<SpeechTranscriber> transcriber,
                        std::shared_ptr<TextCorrector> corrector,
                        std::shared_ptr<TextInjector> injector,
                        QObject *parent = nullptr);
    ~PipelineCoordinator() override;

    ToggleAck toggle();

    PipelineState state() const { return state_.state(); }

    // Replaces the configuration. A running job keeps the one it started with.
    void setConfig(Config config);
    const Config& config() const noexcept { return config_; }

    // Abort any recording and tell a running transcription to give up.
    void shutdown();


    // Delay before correction retry `retry` (1-based): base * 2^(retry-1)
    static std::chrono::milliseconds backoffDelay(std::chrono::milliseconds base, int retry);

signals:
    void pipelineEvent(const PipelineEvent& event);
    void toggleAcknowledged(ToggleAck ack);
    void stateChanged(PipelineState state);
    void jobFinished(const JobRecord& job);
    void levelUpdated(qreal level);

private:
    ToggleAck startRecording();
    ToggleAck stopRecording();
    void onCaptureFailed(const QString& error);

    QCoro::Task<void> runJob(RecordingSession session, audio_buffer_t buffer);
    QCoro::Task<void> runStages(JobRecord& job, const Config& cfg, audio_buffer_t buffer);
    QCoro::Task<std::optional<QString>> correctWithRetries(JobRecord& job, const Config& cfg, QString raw);
    QCoro::Task<void> injectStage(JobRecord& job, const Config& cfg, QString raw, std::optional<QString> corrected);

    bool transition(PipelineState from, PipelineState to);
    void publish(PipelineEvent event);

    Config config_;
    PipelineStateHolder& state_;
    AudioCapture& capture_;
    std::shared_ptr<SpeechTranscriber> transcriber_;
    std::shared_ptr<TextCorrector> corrector_;
    std::shared_ptr<TextInjector> injector_;
    QThreadPool transcribe_pool_;
    QThreadPool inject_pool_;
    std::optional<RecordingSession> session_;
    uint64_t next_session_id_{1};
    std::shared_ptr<std::atomic_bool> cancel_transcription_;
};
