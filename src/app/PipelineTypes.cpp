#include <array>
#include <format>
#include <ostream>
#include <sstream>
#include <string_view>

#include "PipelineTypes.h"
#include "logging.h"

using namespace std;

namespace {

template <typename T>
string toText(const T& value) {
    ostringstream out;
    out << value;
    return out.str();
}

constexpr auto injection_mode_names = to_array<string_view>({
    "raw",
    "corrected",
    "both"
});

} // anon ns

optional<InjectionMode> toInjectionMode(const QString &name)
{
    const auto n = name.trimmed().toLower().toStdString();
    for (size_t i = 0; i < injection_mode_names.size(); ++i) {
        if (injection_mode_names[i] == n) {
            return static_cast<InjectionMode>(i);
        }
    }
    return {};
}

QString toString(InjectionMode mode)
{
    const auto name = injection_mode_names.at(static_cast<size_t>(mode));
    return QString::fromUtf8(name.data(), static_cast<qsizetype>(name.size()));
}

ostream& operator << (ostream& os, PipelineState state) {
    constexpr auto states = to_array<string_view>({
        "Idle",
        "Recording",
        "Processing"
    });

    return os << states.at(static_cast<size_t>(state));
}

ostream& operator << (ostream& os, ToggleAck ack) {
    constexpr auto acks = to_array<string_view>({
        "Started",
        "Stopped",
        "Busy",
        "DeviceUnavailable",
        "CaptureFailed"
    });

    return os << acks.at(static_cast<size_t>(ack));
}

ostream& operator << (ostream& os, InjectionMode mode) {
    return os << injection_mode_names.at(static_cast<size_t>(mode));
}

ostream& operator << (ostream& os, CorrectionResult::Status status) {
    constexpr auto names = to_array<string_view>({
        "Ok",
        "Transient",
        "ModelMissing",
        "BadResponse"
    });

    return os << names.at(static_cast<size_t>(status));
}

ostream& operator << (ostream& os, InjectionResult::Status status) {
    constexpr auto names = to_array<string_view>({
        "Typed",
        "Skipped",
        "Failed"
    });

    return os << names.at(static_cast<size_t>(status));
}

ostream& operator << (ostream& os, JobRecord::Stage stage) {
    constexpr auto names = to_array<string_view>({
        "Checking",
        "Transcribing",
        "Correcting",
        "Delivering",
        "Injecting",
        "Done"
    });

    return os << names.at(static_cast<size_t>(stage));
}

ostream& operator << (ostream& os, JobRecord::Outcome outcome) {
    constexpr auto names = to_array<string_view>({
        "Pending",
        "TooShort",
        "NoSpeech",
        "TranscriptionFailed",
        "Delivered",
        "Typed",
        "InjectionSkipped",
        "InjectionFailed"
    });

    return os << names.at(static_cast<size_t>(outcome));
}

namespace logfault {
std::pair<bool /* json */, std::string /* content or json */> toLog(const JobRecord& j, bool json) {
    if (json) {
        return make_pair(true, format(R"("job":{{"session":{}, "stage":"{}", "outcome":"{}"}})",
                                      j.session,
                                      toText(j.stage),
                                      toText(j.outcome)));
    }

    return make_pair(false, format("Job{{session={}}}", j.session));
}
} // logfault ns
