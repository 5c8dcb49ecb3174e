#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include <QMetaType>
#include <QString>

/* Status and result events from the pipeline.
 *
 * Each event carries everything a presenter needs to render or persist it
 * without asking the pipeline for more.
 */

struct RecordingStarted {
    uint64_t session{};
};

struct RecordingStopped {
    uint64_t session{};
    std::chrono::milliseconds duration{};
};

struct RecordingFailed {
    uint64_t session{};
    QString error;
};

struct TooShort {
    uint64_t session{};
    std::chrono::milliseconds duration{};
    std::chrono::milliseconds minimum{};
};

struct NoSpeechDetected {
    uint64_t session{};
    bool silent_audio{}; // true if the audio was rejected before transcription
};

struct TranscriptionFailed {
    uint64_t session{};
    QString error;
};

struct CorrectionSkipped {
    uint64_t session{};
    QString reason;
    bool model_missing{};
    int attempts{};
};

struct TranscriptReady {
    uint64_t session{};
    QString raw;
    std::optional<QString> corrected;
    float confidence{};
    bool low_confidence{};

    // The text the user most likely wants
    const QString& best() const noexcept {
        return corrected ? *corrected : raw;
    }
};

struct InjectionSkipped {
    uint64_t session{};
    QString app;
};

struct InjectionFailed {
    uint64_t session{};
    QString error;
};

struct InjectionCompleted {
    uint64_t session{};
    int keystrokes{};
};

using PipelineEvent = std::variant<
    RecordingStarted,
    RecordingStopped,
    RecordingFailed,
    TooShort,
    NoSpeechDetected,
    TranscriptionFailed,
    CorrectionSkipped,
    TranscriptReady,
    InjectionSkipped,
    InjectionFailed,
    InjectionCompleted>;

// Human readable status line for the event.
QString describe(const PipelineEvent& event);

// Name of the event type, for logs
std::string_view eventName(const PipelineEvent& event) noexcept;

uint64_t sessionOf(const PipelineEvent& event) noexcept;

Q_DECLARE_METATYPE(PipelineEvent)
