#include <format>

#include <QString>

// Must come before the engine headers to enable the logfault forwarder
#include "logging.h"

#include "WhisperTranscriber.h"
#include "ScopedTimer.h"

namespace logfault {

std::pair<bool /* json */, std::string /* content or json */> toLog(const WhisperTranscriber& m, bool json) {
    if (json) {
        return make_pair(true, std::format(R"("transcriber":"whisper", "model":"{}")", m.config().model_id));
    }
    return make_pair(false, std::format("WhisperTranscriber{{model={}}}", m.config().model_id));
}
} // logfault ns

using namespace std;

WhisperTranscriber::WhisperTranscriber(Config config)
    : config_{std::move(config)}
{
    LOG_TRACE_EX(*this) << "WhisperTranscriber: model file is " << modelPath()
                        << ", language '" << config_.language << "'";
}

WhisperTranscriber::~WhisperTranscriber()
{
    LOG_DEBUG_EX(*this) << "WhisperTranscriber: destructor called";
}

string WhisperTranscriber::name() const
{
    return format("whisper/{}", config_.model_id);
}

filesystem::path WhisperTranscriber::modelPath() const
{
    return config_.model_dir / format("ggml-{}.bin", config_.model_id);
}

qvt::WhisperSessionCtx &WhisperTranscriber::session()
{
    if (session_) {
        return *session_;
    }

    if (load_error_) {
        throw TranscriptionError{*load_error_};
    }

    auto remember = [this](string why) -> TranscriptionError {
        LOG_ERROR_EX(*this) << why;
        load_error_ = why;
        return TranscriptionError{why};
    };

    if (!engine_) {
        engine_ = qvt::WhisperEngine::create({});
        if (!engine_) {
            throw remember("Failed to create the Whisper engine instance.");
        }

        engine_->setLogger(logfault_fwd::forward_to_logfault,
                           static_cast<logfault_fwd::Level>(
                               ::logfault::LogManager::Instance().GetLoglevel()));

        if (!engine_->init()) {
            throw remember(format("Failed to initialize the Whisper engine: {}", engine_->lastError()));
        }
    }

    const ScopedTimer timer;
    qvt::WhisperEngineLoadParams params;
    params.use_gpu = config_.use_gpu;
    model_ = engine_->loadWhisper(config_.model_id, modelPath(), params);
    if (!model_) {
        throw remember(engine_->lastError().empty()
                           ? format("Failed to load Whisper model {}", config_.model_id)
                           : engine_->lastError());
    }

    session_ = model_->createWhisperSession();
    if (!session_) {
        model_.reset();
        throw remember(format("Failed to create a Whisper session for model {}", config_.model_id));
    }

    LOG_INFO_EX(*this) << "Loaded " << model_->info() << " in " << timer.elapsed() << " seconds";
    return *session_;
}

TranscriptResult WhisperTranscriber::transcribe(const AudioBuffer &buffer, const std::atomic_bool &cancelled)
{
    // The whisper state is not thread safe
    lock_guard lock{mutex_};

    auto& ctx = session();

    const auto pcm = buffer.toMonoFloat(16000);
    if (pcm.empty()) {
        return {};
    }

    qvt::WhisperSessionCtx::WhisperFullParams params;
    params.language = config_.language;
    params.threads = config_.threads;
    params.no_context = true;
    params.suppress_non_speech = true;
    params.abort_flag = &cancelled;

    const ScopedTimer timer;
    qvt::WhisperSessionCtx::Transcript transcript;
    if (!ctx.whisperFull(pcm, params, transcript)) {
        if (cancelled) {
            throw TranscriptionError{"Transcription was cancelled"};
        }
        throw TranscriptionError{"Whisper failed to process the audio"};
    }

    TranscriptResult result;
    result.text = QString::fromStdString(transcript.full_text).trimmed();
    result.confidence = transcript.confidence;
    result.language = QString::fromStdString(transcript.language);
    result.empty = result.text.isEmpty() || isNonSpeechOnly(transcript.full_text);
    if (result.empty) {
        result.text.clear();
    }
    result.low_confidence = !result.empty && result.confidence < config_.confidence_floor;

    LOG_DEBUG_EX(*this) << "Transcribed " << buffer.duration().count() << " ms of audio in "
                        << timer.elapsed() << " seconds. confidence=" << result.confidence
                        << (result.low_confidence ? " (low)" : "")
                        << (result.empty ? " [no speech]" : "");
    return result;
}

bool WhisperTranscriber::isNonSpeechOnly(std::string_view text)
{
    const auto str = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));

    QChar closing;
    for (const auto ch : str) {
        if (!closing.isNull()) {
            if (ch == closing) {
                closing = {};
            }
            continue;
        }

        if (ch == u'[') {
            closing = u']';
        } else if (ch == u'(') {
            closing = u')';
        } else if (ch == u'*') {
            closing = u'*';
        } else if (ch.isLetterOrNumber()) {
            return false;
        }
    }

    return true;
}
