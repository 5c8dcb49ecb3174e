#include <format>
#include <sstream>

#include <QScopeGuard>
#include <QTimer>
#include <QtConcurrent/QtConcurrent>

#include <qcorofuture.h>
#include <qcorotimer.h>

#include "PipelineCoordinator.h"
#include "SpeechTranscriber.h"
#include "StageAwait.h"
#include "TextCorrector.h"
#include "TextInjector.h"
#include "ScopedTimer.h"
#include "logging.h"

using namespace std;

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const PipelineCoordinator& m, bool json) {
    ostringstream state;
    state << m.state();
    if (json) {
        return make_pair(true, format(R"("coordinator":{{"state":"{}"}})", state.str()));
    }

    return make_pair(false, format("Coordinator{{state={}}}", state.str()));
}
} // logfault ns

namespace {

struct TranscribeOutcome {
    TranscriptResult result;
    optional<QString> error;
};

} // anon ns

PipelineCoordinator::PipelineCoordinator(Config config,
                                         PipelineStateHolder &state,
                                         AudioCapture &capture,
                                         std::shared_ptr<SpeechTranscriber> transcriber,
                                         std::shared_ptr<TextCorrector> corrector,
                                         std::shared_ptr<TextInjector> injector,
                                         QObject *parent)
    : QObject(parent)
    , config_{std::move(config)}
    , state_{state}
    , capture_{capture}
    , transcriber_{std::move(transcriber)}
    , corrector_{std::move(corrector)}
    , injector_{std::move(injector)}
{
    if (!transcriber_) {
        throw invalid_argument{"PipelineCoordinator requires a transcriber"};
    }

    // One inference and one typing session at the time.
    transcribe_pool_.setMaxThreadCount(1);
    inject_pool_.setMaxThreadCount(1);

    connect(&capture_, &AudioCapture::levelUpdated, this, &PipelineCoordinator::levelUpdated);
    connect(&capture_, &AudioCapture::captureFailed, this, &PipelineCoordinator::onCaptureFailed);

    LOG_DEBUG_EX(*this) << "Created with transcriber " << transcriber_->name()
                        << ", correction " << (corrector_ && config_.correction_enabled ? "enabled" : "disabled")
                        << ", autotype " << (injector_ && config_.autotype_enabled ? "enabled" : "disabled");
}

PipelineCoordinator::~PipelineCoordinator()
{
    shutdown();
    transcribe_pool_.waitForDone();
    inject_pool_.waitForDone();
}

ToggleAck PipelineCoordinator::toggle()
{
    ToggleAck ack = ToggleAck::Busy;

    switch(state_.state()) {
    case PipelineState::Idle:
        ack = startRecording();
        break;
    case PipelineState::Recording:
        ack = stopRecording();
        break;
    case PipelineState::Processing:
        LOG_INFO_EX(*this) << "Toggle ignored. The previous recording is still being processed.";
        ack = ToggleAck::Busy;
        break;
    }

    emit toggleAcknowledged(ack);
    return ack;
}

void PipelineCoordinator::setConfig(Config config)
{
    config_ = std::move(config);
}

void PipelineCoordinator::shutdown()
{
    if (cancel_transcription_) {
        cancel_transcription_->store(true);
    }

    if (transition(PipelineState::Recording, PipelineState::Idle)) {
        LOG_INFO_EX(*this) << "Shutting down. Discarding the recording in progress.";
        capture_.abort();
        session_.reset();
    }
}

std::chrono::milliseconds PipelineCoordinator::backoffDelay(std::chrono::milliseconds base, int retry)
{
    if (retry <= 1) {
        return base;
    }

    // Cap the exponent so a silly config can not overflow
    const auto exponent = min(retry - 1, 16);
    return base * (1LL << exponent);
}

ToggleAck PipelineCoordinator::startRecording()
{
    if (state_.state() != PipelineState::Idle) {
        return ToggleAck::Busy;
    }

    // The state stays Idle unless the device actually started
    try {
        capture_.start();
    } catch (const CaptureError& ex) {
        LOG_WARN_EX(*this) << "Cannot start recording: " << ex.what();
        return ToggleAck::DeviceUnavailable;
    }

    if (!transition(PipelineState::Idle, PipelineState::Recording)) {
        capture_.abort();
        return ToggleAck::Busy;
    }

    session_ = RecordingSession{next_session_id_++, QDateTime::currentDateTime(), {}};
    LOG_INFO_EX(*this) << "Recording session #" << session_->id << " started.";
    publish(RecordingStarted{session_->id});
    return ToggleAck::Started;
}

ToggleAck PipelineCoordinator::stopRecording()
{
    if (!transition(PipelineState::Recording, PipelineState::Processing)) {
        return ToggleAck::Busy;
    }

    const auto id = session_ ? session_->id : 0;

    audio_buffer_t buffer;
    try {
        buffer = capture_.stop();
    } catch (const CaptureError& ex) {
        LOG_WARN_EX(*this) << "Recording session #" << id << " failed: " << ex.what();
        session_.reset();
        transition(PipelineState::Processing, PipelineState::Idle);
        publish(RecordingFailed{id, QString::fromUtf8(ex.what())});
        return ToggleAck::CaptureFailed;
    }

    auto session = session_.value_or(RecordingSession{id, QDateTime::currentDateTime(), {}});
    session.ended = QDateTime::currentDateTime();
    session_.reset();

    LOG_INFO_EX(*this) << "Recording session #" << id << " stopped after "
                       << buffer->duration().count() << " ms of audio.";
    publish(RecordingStopped{id, buffer->duration()});

    // Start the job from the event loop, so the toggle is acknowledged
    // before any of the job's events are emitted.
    QTimer::singleShot(0, this, [this, session, buffer] {
        runJob(session, buffer);
    });

    return ToggleAck::Stopped;
}

void PipelineCoordinator::onCaptureFailed(const QString &error)
{
    if (capture_.isCapturing()) {
        // Stale notification from an earlier capture
        return;
    }

    if (!transition(PipelineState::Recording, PipelineState::Idle)) {
        return;
    }

    const auto id = session_ ? session_->id : 0;
    session_.reset();
    LOG_WARN_EX(*this) << "Recording session #" << id << " aborted: " << error;
    publish(RecordingFailed{id, error});
}

QCoro::Task<void> PipelineCoordinator::runJob(RecordingSession session, audio_buffer_t buffer)
{
    // The job works on a copy. Changes to the config apply to the next job.
    const auto cfg = config_;

    JobRecord job;
    job.session = session.id;
    job.audio_duration = buffer->duration();

    const ScopedTimer timer;

    auto idle_guard = qScopeGuard([this] {
        if (state_.state() == PipelineState::Processing) {
            transition(PipelineState::Processing, PipelineState::Idle);
        }
    });

    try {
        co_await runStages(job, cfg, buffer);
    } catch (const std::exception& ex) {
        LOG_ERROR_EX(job) << "Processing failed in stage " << job.stage << ": " << ex.what();
        if (job.stage <= JobRecord::Stage::Transcribing) {
            job.outcome = JobRecord::Outcome::TranscriptionFailed;
            publish(TranscriptionFailed{job.session, QString::fromUtf8(ex.what())});
        } else if (job.stage == JobRecord::Stage::Injecting) {
            job.outcome = JobRecord::Outcome::InjectionFailed;
            publish(InjectionFailed{job.session, QString::fromUtf8(ex.what())});
        }
    }

    job.stage = JobRecord::Stage::Done;
    job.elapsed = timer.elapsedMs();
    LOG_INFO_EX(job) << "Processing of session #" << job.session << " done in "
                     << job.elapsed.count() << " ms. Outcome: " << job.outcome
                     << ", correction attempts: " << job.correction_attempts;

    // Idle before the job is reported, so a listener can start a new recording
    idle_guard.dismiss();
    transition(PipelineState::Processing, PipelineState::Idle);
    emit jobFinished(job);
}

QCoro::Task<void> PipelineCoordinator::runStages(JobRecord &job, const Config &cfg, audio_buffer_t buffer)
{
    job.stage = JobRecord::Stage::Checking;
    const auto duration = buffer->duration();
    if (duration < cfg.min_duration) {
        LOG_INFO_EX(job) << "Recording is too short (" << duration.count() << " ms).";
        job.outcome = JobRecord::Outcome::TooShort;
        publish(TooShort{job.session, duration, cfg.min_duration});
        co_return;
    }

    if (cfg.silence_threshold > 0 && buffer->peakAmplitude() <= cfg.silence_threshold) {
        LOG_INFO_EX(job) << "Recording is silent. Peak amplitude is " << buffer->peakAmplitude();
        job.outcome = JobRecord::Outcome::NoSpeech;
        publish(NoSpeechDetected{job.session, true});
        co_return;
    }

    job.stage = JobRecord::Stage::Transcribing;
    auto cancelled = make_shared<atomic_bool>(false);
    cancel_transcription_ = cancelled;
    auto transcriber = transcriber_;

    auto future = QtConcurrent::run(&transcribe_pool_, [transcriber, buffer, cancelled]() -> TranscribeOutcome {
        try {
            return {transcriber->transcribe(*buffer, *cancelled), {}};
        } catch (const std::exception& ex) {
            return {{}, QString::fromUtf8(ex.what())};
        }
    });

    const auto outcome = co_await awaitWithDeadline(future, cfg.transcription_timeout);
    cancel_transcription_.reset();

    if (!outcome) {
        cancelled->store(true);
        LOG_WARN_EX(job) << "Transcription timed out after " << cfg.transcription_timeout.count() << " ms";
        job.outcome = JobRecord::Outcome::TranscriptionFailed;
        publish(TranscriptionFailed{job.session,
                                    tr("Transcription timed out after %1 seconds")
                                        .arg(cfg.transcription_timeout.count() / 1000.0)});
        co_return;
    }

    if (outcome->error) {
        LOG_WARN_EX(job) << "Transcription failed: " << *outcome->error;
        job.outcome = JobRecord::Outcome::TranscriptionFailed;
        publish(TranscriptionFailed{job.session, *outcome->error});
        co_return;
    }

    const auto& transcript = outcome->result;
    if (transcript.empty || transcript.text.trimmed().isEmpty()) {
        LOG_INFO_EX(job) << "No speech in the recording.";
        job.outcome = JobRecord::Outcome::NoSpeech;
        publish(NoSpeechDetected{job.session, false});
        co_return;
    }

    optional<QString> corrected;
    if (cfg.correction_enabled && corrector_) {
        job.stage = JobRecord::Stage::Correcting;
        corrected = co_await correctWithRetries(job, cfg, transcript.text);
    }

    job.stage = JobRecord::Stage::Delivering;
    job.outcome = JobRecord::Outcome::Delivered;
    publish(TranscriptReady{job.session, transcript.text, corrected,
                            transcript.confidence, transcript.low_confidence});

    if (cfg.autotype_enabled && injector_) {
        job.stage = JobRecord::Stage::Injecting;
        co_await injectStage(job, cfg, transcript.text, corrected);
    }
}

QCoro::Task<std::optional<QString>> PipelineCoordinator::correctWithRetries(JobRecord &job, const Config &cfg, QString raw)
{
    auto corrector = corrector_;
    CorrectionResult result;

    for(int attempt = 0; attempt <= cfg.max_retries; ++attempt) {
        if (attempt > 0) {
            const auto delay = backoffDelay(cfg.backoff, attempt);
            LOG_DEBUG_EX(job) << "Retrying correction in " << delay.count() << " ms";
            co_await QCoro::sleepFor(delay);
        }

        ++job.correction_attempts;
        result = co_await corrector->correct(raw, cfg.correction_model);

        if (result.ok()) {
            job.corrected = true;
            co_return result.text;
        }

        LOG_WARN_EX(job) << "Correction attempt " << job.correction_attempts << " failed ("
                         << result.status << "): " << result.error;

        if (!result.retryable()) {
            break;
        }
    }

    const auto model_missing = result.status == CorrectionResult::Status::ModelMissing;
    auto reason = model_missing
        ? tr("The correction model \"%1\" is not available. Pull it with: ollama pull %1")
              .arg(cfg.correction_model)
        : result.error;

    publish(CorrectionSkipped{job.session, reason, model_missing, job.correction_attempts});
    co_return std::nullopt;
}

QCoro::Task<void> PipelineCoordinator::injectStage(JobRecord &job, const Config &cfg, QString raw, std::optional<QString> corrected)
{
    auto injector = injector_;
    const auto mode = cfg.injection_mode;

    auto future = QtConcurrent::run(&inject_pool_, [injector, raw, corrected, mode]() -> InjectionResult {
        try {
            return injector->inject(raw, corrected, mode);
        } catch (const std::exception& ex) {
            InjectionResult r;
            r.error = QString::fromUtf8(ex.what());
            return r;
        }
    });

    const auto result = co_await future;

    switch(result.status) {
    case InjectionResult::Status::Typed:
        job.outcome = JobRecord::Outcome::Typed;
        publish(InjectionCompleted{job.session, result.keystrokes});
        break;
    case InjectionResult::Status::Skipped:
        job.outcome = JobRecord::Outcome::InjectionSkipped;
        publish(InjectionSkipped{job.session, result.app});
        break;
    case InjectionResult::Status::Failed:
        job.outcome = JobRecord::Outcome::InjectionFailed;
        publish(InjectionFailed{job.session, result.error});
        break;
    }
}

bool PipelineCoordinator::transition(PipelineState from, PipelineState to)
{
    if (!state_.transition(from, to)) {
        return false;
    }

    emit stateChanged(to);
    return true;
}

void PipelineCoordinator::publish(PipelineEvent event)
{
    LOG_DEBUG_EX(*this) << "Event " << eventName(event) << ": " << describe(event);
    emit pipelineEvent(event);
}
