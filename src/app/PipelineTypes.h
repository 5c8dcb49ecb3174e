#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>

#include <QDateTime>
#include <QMetaType>
#include <QString>

enum class PipelineState {
    Idle,
    Recording,
    Processing
};

/*! Acknowledgment for one toggle event.
 *
 * Busy means that a processing job is still running, so no new
 * recording was started.
 */
enum class ToggleAck {
    Started,
    Stopped,
    Busy,
    DeviceUnavailable,
    CaptureFailed
};

enum class InjectionMode {
    Raw,
    Corrected,
    Both
};

std::optional<InjectionMode> toInjectionMode(const QString& name);
QString toString(InjectionMode mode);

struct RecordingSession {
    uint64_t id{};
    QDateTime started;
    QDateTime ended;

    std::chrono::milliseconds duration() const noexcept {
        if (!started.isValid() || !ended.isValid()) {
            return {};
        }
        return std::chrono::milliseconds{started.msecsTo(ended)};
    }
};

struct TranscriptResult {
    QString text;
    float confidence{};
    bool empty{true};
    bool low_confidence{};
    QString language;
};

struct CorrectionResult {
    enum class Status {
        Ok,
        Transient,      // connection level, may be retried
        ModelMissing,   // the server does not have the requested model
        BadResponse     // the server answered something we could not use
    };

    Status status{Status::BadResponse};
    QString text;
    QString error;
    int http_status{};

    bool ok() const noexcept { return status == Status::Ok; }
    bool retryable() const noexcept { return status == Status::Transient; }
};

struct InjectionResult {
    enum class Status {
        Typed,
        Skipped,    // the foreground application is excluded
        Failed
    };

    Status status{Status::Failed};
    QString app;
    QString error;
    int keystrokes{};

    bool ok() const noexcept { return status != Status::Failed; }
};

/*! Progress and outcome of one processing job.
 *
 * Lives only while the job runs. It is logged and emitted when the
 * job has finished.
 */
struct JobRecord {
    enum class Stage {
        Checking,
        Transcribing,
        Correcting,
        Delivering,
        Injecting,
        Done
    };

    enum class Outcome {
        Pending,
        TooShort,
        NoSpeech,
        TranscriptionFailed,
        Delivered,
        Typed,
        InjectionSkipped,
        InjectionFailed
    };

    uint64_t session{};
    Stage stage{Stage::Checking};
    Outcome outcome{Outcome::Pending};
    std::chrono::milliseconds audio_duration{};
    std::chrono::milliseconds elapsed{};
    int correction_attempts{};
    bool corrected{};
};

std::ostream& operator << (std::ostream& os, PipelineState state);
std::ostream& operator << (std::ostream& os, ToggleAck ack);
std::ostream& operator << (std::ostream& os, InjectionMode mode);
std::ostream& operator << (std::ostream& os, CorrectionResult::Status status);
std::ostream& operator << (std::ostream& os, InjectionResult::Status status);
std::ostream& operator << (std::ostream& os, JobRecord::Stage stage);
std::ostream& operator << (std::ostream& os, JobRecord::Outcome outcome);

Q_DECLARE_METATYPE(PipelineState)
Q_DECLARE_METATYPE(ToggleAck)
Q_DECLARE_METATYPE(JobRecord)
