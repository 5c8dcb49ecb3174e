#pragma once

#include <atomic>
#include <optional>
#include <span>
#include <vector>

#include "EngineBase.h"

struct whisper_context;

#if defined(_WIN32)
#if defined(QVT_WHISPER_WRAP_BUILD)
#define QVT_WHISPER_WRAP_API __declspec(dllexport)
#else
#define QVT_WHISPER_WRAP_API __declspec(dllimport)
#endif
#else
#define QVT_WHISPER_WRAP_API __attribute__((visibility("default")))
#endif

namespace qvt {

class WhisperEngine;

struct WhisperEngineLoadParams : public EngineLoadParams {
    bool use_gpu{};
    bool flash_attn{};
    int gpu_device{};
};

/*! Session context for Whisper model sessions.
 *
 *  A session owns the whisper state. It is not thread safe, so only one
 *  inference may run in a session at any time.
 */
class QVT_WHISPER_WRAP_API WhisperSessionCtx : public SessionCtx {
public:
    struct WhisperFullParams {
        std::string language; // empty for auto
        int threads{-1}; // -1 for using default
        std::optional<bool> no_context;
        std::optional<bool> single_segment;
        std::optional<bool> suppress_non_speech;

        // When set and true, the inference is aborted at the next checkpoint.
        const std::atomic_bool *abort_flag{};
    };

    struct Segment {
        int64_t t0_ms = 0;
        int64_t t1_ms = 0;
        std::string text;
        float no_speech_prob = 0.0f;
        float mean_token_p = 0.0f;
        int tokens = 0;
    };

    struct Transcript {
        std::vector<Segment> segments;
        std::string full_text;
        std::string language;

        // Mean token probability across all text tokens, in [0, 1].
        float confidence = 0.0f;
    };

    WhisperSessionCtx();
    virtual ~WhisperSessionCtx();

    /*! Processes the full audio data using the Whisper model.
     *
     * @param data Audio data, 16 kHz mono float samples.
     * @param params Parameters for the Whisper processing.
     * @param out Output transcript structure to hold the results.
     * @return True if processing was successful, false otherwise.
     */
    virtual bool whisperFull(std::span<const float> data,
                             const WhisperFullParams& params,
                             Transcript& out) = 0;
};

/*! Context for a loaded Whisper model.
 */
class QVT_WHISPER_WRAP_API WhisperCtx : public ModelCtx {
public:
    WhisperCtx();
    virtual ~WhisperCtx();

    virtual whisper_context *ctx() noexcept = 0;
    virtual const whisper_context *ctx() const noexcept = 0;
};

class QVT_WHISPER_WRAP_API WhisperEngine : public EngineBase {
public:
    WhisperEngine();
    virtual ~WhisperEngine();

    struct WhisperCreateParams{};

    static std::shared_ptr<WhisperEngine> create(const WhisperCreateParams& params);

    virtual std::shared_ptr<WhisperCtx> loadWhisper(const std::string& modelId,
                                                    const std::filesystem::path& modelPath,
                                                    const WhisperEngineLoadParams& params) = 0;
};

} // ns
