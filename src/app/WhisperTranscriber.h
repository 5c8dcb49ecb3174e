#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include "SpeechTranscriber.h"
#include "qvt/WhisperEngine.h"

/*! SpeechTranscriber backed by whisper.cpp.
 *
 * The model is loaded on first use and kept for the lifetime of the object.
 * If loading fails, the failure is remembered and every later call fails
 * at once with the same message.
 */
class WhisperTranscriber : public SpeechTranscriber
{
public:
    struct Config {
        std::string model_id{"base.en"};
        std::filesystem::path model_dir;
        std::string language;   // empty for auto
        int threads{-1};
        float confidence_floor{0.40f};
        bool use_gpu{};
    };

    explicit WhisperTranscriber(Config config);
    ~WhisperTranscriber() override;

    TranscriptResult transcribe(const AudioBuffer& buffer, const std::atomic_bool& cancelled) override;

    std::string name() const override;

    std::filesystem::path modelPath() const;

    const Config& config() const noexcept { return config_; }

    /*! True if the text contains nothing but whitespace and non-speech
     *  annotations like "[BLANK_AUDIO]" or "(silence)".
     */
    static bool isNonSpeechOnly(std::string_view text);

private:
    qvt::WhisperSessionCtx& session();

    const Config config_;
    std::mutex mutex_;
    std::shared_ptr<qvt::WhisperEngine> engine_;
    std::shared_ptr<qvt::WhisperCtx> model_;
    std::shared_ptr<qvt::WhisperSessionCtx> session_;
    std::optional<std::string> load_error_;
};
