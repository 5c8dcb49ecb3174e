#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include <QCoreApplication>
#include <QStringList>

#include "AudioCapture.h"
#include "InputBackend.h"
#include "PipelineCoordinator.h"
#include "SpeechTranscriber.h"
#include "TextCorrector.h"
#include "TextInjector.h"

namespace qvt_test {

using namespace std::chrono_literals;

// Pump the event loop until `pred` holds or the time runs out
template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout = 5s)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

// Audio of a fixed length with a square wave of the given amplitude
inline audio_buffer_t makeBuffer(std::chrono::milliseconds duration, qint16 amplitude, int rate = 16000)
{
    std::vector<qint16> samples(static_cast<size_t>(rate * duration.count() / 1000));
    for(size_t i = 0; i < samples.size(); ++i) {
        samples[i] = (i / 20) % 2 ? amplitude : static_cast<qint16>(-amplitude);
    }
    return std::make_shared<const AudioBuffer>(std::move(samples), rate, 1);
}

class FakeCapture : public AudioCapture
{
public:
    std::chrono::milliseconds duration{2000};
    qint16 amplitude{4000};
    bool fail_start{false};
    int starts{0};
    int stops{0};
    int aborts{0};

    void start() override {
        if (fail_start) {
            throw CaptureError{"No audio input device"};
        }
        if (capturing_) {
            throw CaptureError{"Already capturing"};
        }
        ++starts;
        capturing_ = true;
    }

    audio_buffer_t stop() override {
        if (!capturing_) {
            throw CaptureError{"Not capturing"};
        }
        capturing_ = false;
        ++stops;
        return makeBuffer(duration, amplitude);
    }

    void abort() noexcept override {
        if (capturing_) {
            ++aborts;
        }
        capturing_ = false;
    }

    bool isCapturing() const noexcept override {
        return capturing_;
    }

    // What the real capture does when the device disappears
    void loseDevice() {
        capturing_ = false;
        emit captureFailed(QStringLiteral("The audio input device was removed"));
    }

private:
    bool capturing_{false};
};

class FakeTranscriber : public SpeechTranscriber
{
public:
    explicit FakeTranscriber(QString text = QStringLiteral("hello world"))
        : text_{std::move(text)} {}

    // Keep transcribe() busy until release() is called or it is cancelled
    std::atomic_bool hold{false};
    std::atomic_bool fail{false};
    std::atomic_int calls{0};
    std::atomic_bool saw_cancel{false};

    void setText(QString text) {
        std::lock_guard lock{mutex_};
        text_ = std::move(text);
    }

    TranscriptResult transcribe(const AudioBuffer&, const std::atomic_bool& cancelled) override {
        ++calls;
        while(hold) {
            if (cancelled) {
                saw_cancel = true;
                throw TranscriptionError{"cancelled"};
            }
            std::this_thread::sleep_for(2ms);
        }

        if (fail) {
            throw TranscriptionError{"Failed to load model file ggml-base.en.bin"};
        }

        std::lock_guard lock{mutex_};
        TranscriptResult r;
        r.text = text_;
        r.empty = text_.trimmed().isEmpty();
        r.confidence = 0.9f;
        return r;
    }

    std::string name() const override {
        return "fake";
    }

private:
    std::mutex mutex_;
    QString text_;
};

class FakeCorrector : public TextCorrector
{
public:
    using clock_t = std::chrono::steady_clock;

    std::deque<CorrectionResult> script;  // one entry per attempt
    CorrectionResult fallback = ok(QStringLiteral("Hello, world."));
    std::vector<clock_t::time_point> attempts;
    QString last_model;

    QCoro::Task<CorrectionResult> correct(QString, QString model) override {
        attempts.push_back(clock_t::now());
        last_model = model;
        if (!script.empty()) {
            auto r = script.front();
            script.pop_front();
            co_return r;
        }
        co_return fallback;
    }

    QCoro::Task<std::optional<QStringList>> listAvailableModels() override {
        co_return QStringList{QStringLiteral("llama3:latest")};
    }

    static CorrectionResult ok(QString text) {
        return {CorrectionResult::Status::Ok, std::move(text), {}, 200};
    }

    static CorrectionResult unreachable() {
        return {CorrectionResult::Status::Transient, {}, QStringLiteral("Connection refused"), 0};
    }

    static CorrectionResult modelMissing() {
        return {CorrectionResult::Status::ModelMissing, {}, QStringLiteral("model 'llama3:latest' not found"), 404};
    }
};

class FakeInputBackend : public InputBackend
{
public:
    explicit FakeInputBackend(QString app = QStringLiteral("gedit"))
        : app_{std::move(app)} {}

    std::atomic_bool deny_access{false};
    std::atomic_int fail_after{-1}; // throw on this keystroke, -1 for never

    void checkAccess() override {
        if (deny_access) {
            throw InjectionError{"Cannot connect to the X server"};
        }
    }

    QString foregroundApplication() override {
        std::lock_guard lock{mutex_};
        return app_;
    }

    void typeText(const QString& text) override {
        record(text);
    }

    void pressKey(const QString& key) override {
        record(QStringLiteral("<%1>").arg(key));
    }

    void setApp(QString app) {
        std::lock_guard lock{mutex_};
        app_ = std::move(app);
    }

    QStringList keys() const {
        std::lock_guard lock{mutex_};
        return keys_;
    }

    QString typed() const {
        return keys().join(QString{});
    }

private:
    void record(const QString& key) {
        std::lock_guard lock{mutex_};
        if (fail_after >= 0 && keys_.size() >= fail_after) {
            throw InjectionError{"xdotool exited with code 1"};
        }
        keys_ << key;
    }

    mutable std::mutex mutex_;
    QString app_;
    QStringList keys_;
};

// A coordinator with fakes for all the components
struct Harness {
    PipelineStateHolder state;
    FakeCapture capture;
    std::shared_ptr<FakeTranscriber> transcriber = std::make_shared<FakeTranscriber>();
    std::shared_ptr<FakeCorrector> corrector = std::make_shared<FakeCorrector>();
    std::shared_ptr<FakeInputBackend> backend = std::make_shared<FakeInputBackend>();
    std::shared_ptr<TextInjector> injector;
    std::unique_ptr<PipelineCoordinator> coordinator;

    std::vector<PipelineEvent> events;
    std::vector<JobRecord> jobs;
    std::vector<ToggleAck> acks;
    std::vector<PipelineState> states;

    static PipelineCoordinator::Config defaultConfig() {
        PipelineCoordinator::Config cfg;
        cfg.backoff = 10ms;
        cfg.transcription_timeout = 5s;
        return cfg;
    }

    explicit Harness(PipelineCoordinator::Config cfg = defaultConfig(),
                     bool withCorrector = true,
                     bool withInjector = true) {
        if (withInjector) {
            injector = std::make_shared<TextInjector>(backend,
                                                      std::make_shared<const ExclusionPolicy>(ExclusionPolicy::defaultEntries()),
                                                      TextInjector::Pacing{0ms, 0ms});
        }

        coordinator = std::make_unique<PipelineCoordinator>(cfg, state, capture, transcriber,
                                                            withCorrector ? corrector : nullptr,
                                                            injector);

        QObject::connect(coordinator.get(), &PipelineCoordinator::pipelineEvent,
                         [this](const PipelineEvent& ev) { events.push_back(ev); });
        QObject::connect(coordinator.get(), &PipelineCoordinator::jobFinished,
                         [this](const JobRecord& job) { jobs.push_back(job); });
        QObject::connect(coordinator.get(), &PipelineCoordinator::toggleAcknowledged,
                         [this](ToggleAck ack) { acks.push_back(ack); });
        QObject::connect(coordinator.get(), &PipelineCoordinator::stateChanged,
                         [this](PipelineState s) { states.push_back(s); });
    }

    ~Harness() {
        transcriber->hold = false;
        coordinator.reset();
    }

    // Record, stop, and wait for the job to finish
    bool runOnce() {
        const auto before = jobs.size();
        if (coordinator->toggle() != ToggleAck::Started) {
            return false;
        }
        if (coordinator->toggle() != ToggleAck::Stopped) {
            return false;
        }
        return waitUntil([&] { return jobs.size() > before; });
    }

    std::vector<std::string_view> eventNames() const {
        std::vector<std::string_view> names;
        for(const auto& ev : events) {
            names.push_back(eventName(ev));
        }
        return names;
    }

    template <typename T>
    const T* find() const {
        for(const auto& ev : events) {
            if (const auto *e = std::get_if<T>(&ev)) {
                return e;
            }
        }
        return nullptr;
    }

    template <typename T>
    size_t count() const {
        size_t n = 0;
        for(const auto& ev : events) {
            if (std::holds_alternative<T>(ev)) {
                ++n;
            }
        }
        return n;
    }
};

} // ns
