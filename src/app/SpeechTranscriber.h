#pragma once

#include <atomic>
#include <stdexcept>
#include <string>

#include "AudioBuffer.h"
#include "PipelineTypes.h"

class TranscriptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/*! Speech to text.
 *
 * transcribe() blocks for the duration of the inference, so it must be
 * called from a worker thread. It throws TranscriptionError on failure.
 * If `cancelled` becomes true, the implementation may give up early.
 */
class SpeechTranscriber
{
public:
    SpeechTranscriber() = default;
    virtual ~SpeechTranscriber() = default;

    SpeechTranscriber(const SpeechTranscriber&) = delete;
    SpeechTranscriber& operator=(const SpeechTranscriber&) = delete;

    virtual TranscriptResult transcribe(const AudioBuffer& buffer, const std::atomic_bool& cancelled) = 0;

    virtual std::string name() const = 0;
};
