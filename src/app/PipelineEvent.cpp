#include <array>
#include <string_view>

#include <QCoreApplication>

#include "PipelineEvent.h"

using namespace std;

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

QString tr(const char *text) {
    return QCoreApplication::translate("PipelineEvent", text);
}

QString seconds(chrono::milliseconds ms) {
    return QString::number(static_cast<double>(ms.count()) / 1000.0, 'f', 1);
}

} // anon ns

QString describe(const PipelineEvent &event)
{
    return visit(overloaded {
        [](const RecordingStarted&) {
            return tr("Recording...");
        },
        [](const RecordingStopped& e) {
            return tr("Recording stopped after %1 seconds. Processing...").arg(seconds(e.duration));
        },
        [](const RecordingFailed& e) {
            return tr("Recording failed: %1").arg(e.error);
        },
        [](const TooShort& e) {
            return tr("Recording too short (%1 s, minimum is %2 s)")
                .arg(seconds(e.duration), seconds(e.minimum));
        },
        [](const NoSpeechDetected& e) {
            return e.silent_audio ? tr("No speech detected (the recording was silent)")
                                  : tr("No speech detected");
        },
        [](const TranscriptionFailed& e) {
            return tr("Transcription failed: %1").arg(e.error);
        },
        [](const CorrectionSkipped& e) {
            if (e.model_missing) {
                return tr("Correction skipped, the language model is not installed: %1").arg(e.reason);
            }
            return tr("Correction skipped after %1 attempt(s): %2").arg(e.attempts).arg(e.reason);
        },
        [](const TranscriptReady& e) {
            auto text = e.corrected ? tr("Transcript ready (corrected): %1").arg(*e.corrected)
                                    : tr("Transcript ready: %1").arg(e.raw);
            if (e.low_confidence) {
                text += tr(" [low confidence]");
            }
            return text;
        },
        [](const InjectionSkipped& e) {
            return tr("Auto-typing skipped in excluded application \"%1\"").arg(e.app);
        },
        [](const InjectionFailed& e) {
            return tr("Auto-typing failed, check that input simulation is permitted: %1").arg(e.error);
        },
        [](const InjectionCompleted& e) {
            return tr("Typed %1 characters").arg(e.keystrokes);
        }
    }, event);
}

string_view eventName(const PipelineEvent &event) noexcept
{
    constexpr auto names = to_array<string_view>({
        "RecordingStarted",
        "RecordingStopped",
        "RecordingFailed",
        "TooShort",
        "NoSpeechDetected",
        "TranscriptionFailed",
        "CorrectionSkipped",
        "TranscriptReady",
        "InjectionSkipped",
        "InjectionFailed",
        "InjectionCompleted"
    });
    static_assert(names.size() == variant_size_v<PipelineEvent>);

    return names[event.index()];
}

uint64_t sessionOf(const PipelineEvent &event) noexcept
{
    return visit([](const auto& e) { return e.session; }, event);
}
