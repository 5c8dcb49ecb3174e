#include <catch2/catch.hpp>

#include "Fakes.h"

using namespace std;
using namespace qvt_test;

TEST_CASE("Record, transcribe and correct", "[coordinator]")
{
    Harness h;

    REQUIRE(h.coordinator->toggle() == ToggleAck::Started);
    CHECK(h.coordinator->state() == PipelineState::Recording);
    REQUIRE(h.coordinator->toggle() == ToggleAck::Stopped);
    CHECK(h.coordinator->state() == PipelineState::Processing);

    REQUIRE(waitUntil([&] { return !h.jobs.empty(); }));

    const auto *ready = h.find<TranscriptReady>();
    REQUIRE(ready);
    CHECK(ready->raw == "hello world");
    REQUIRE(ready->corrected);
    CHECK(*ready->corrected == "Hello, world.");
    CHECK(ready->session == 1);

    CHECK(h.eventNames().front() == "RecordingStarted");
    CHECK(h.coordinator->state() == PipelineState::Idle);
    CHECK(h.jobs.front().outcome == JobRecord::Outcome::Delivered);
    CHECK(h.jobs.front().corrected);
    CHECK(h.jobs.front().correction_attempts == 1);
    CHECK(h.corrector->last_model == "llama3:latest");
    CHECK(h.acks == vector<ToggleAck>{ToggleAck::Started, ToggleAck::Stopped});
}

TEST_CASE("A recording below the minimum duration is never transcribed", "[coordinator]")
{
    Harness h;
    h.capture.duration = 200ms;

    REQUIRE(h.runOnce());

    const auto *too_short = h.find<TooShort>();
    REQUIRE(too_short);
    CHECK(too_short->duration == 200ms);
    CHECK(too_short->minimum == 500ms);
    CHECK(h.transcriber->calls == 0);
    CHECK(h.count<TranscriptReady>() == 0);
    CHECK(h.jobs.front().outcome == JobRecord::Outcome::TooShort);
    CHECK(h.coordinator->state() == PipelineState::Idle);
}

TEST_CASE("Correction retries with increasing backoff and falls back to the raw text", "[coordinator]")
{
    auto cfg = Harness::defaultConfig();
    cfg.backoff = 40ms;
    cfg.max_retries = 3;
    Harness h{cfg};
    h.corrector->fallback = FakeCorrector::unreachable();

    REQUIRE(h.runOnce());

    // One attempt and three retries
    REQUIRE(h.corrector->attempts.size() == 4);
    const auto& t = h.corrector->attempts;
    const auto gap1 = t[1] - t[0];
    const auto gap2 = t[2] - t[1];
    const auto gap3 = t[3] - t[2];
    // Coarse timers may fire a few percent early
    CHECK(gap1 >= 35ms);
    CHECK(gap2 >= 70ms);
    CHECK(gap3 >= 140ms);
    CHECK(gap3 > gap1);

    const auto *ready = h.find<TranscriptReady>();
    REQUIRE(ready);
    CHECK(ready->raw == "hello world");
    CHECK_FALSE(ready->corrected);

    const auto *skipped = h.find<CorrectionSkipped>();
    REQUIRE(skipped);
    CHECK_FALSE(skipped->model_missing);
    CHECK(skipped->attempts == 4);
    CHECK(h.coordinator->state() == PipelineState::Idle);
}

TEST_CASE("A transient correction failure can recover on retry", "[coordinator]")
{
    Harness h;
    h.corrector->script = {FakeCorrector::unreachable(), FakeCorrector::ok("Hello, world.")};

    REQUIRE(h.runOnce());

    CHECK(h.corrector->attempts.size() == 2);
    const auto *ready = h.find<TranscriptReady>();
    REQUIRE(ready);
    REQUIRE(ready->corrected);
    CHECK(*ready->corrected == "Hello, world.");
    CHECK(h.count<CorrectionSkipped>() == 0);
}

TEST_CASE("A missing correction model is not retried", "[coordinator]")
{
    Harness h;
    h.corrector->fallback = FakeCorrector::modelMissing();

    REQUIRE(h.runOnce());

    CHECK(h.corrector->attempts.size() == 1);
    const auto *skipped = h.find<CorrectionSkipped>();
    REQUIRE(skipped);
    CHECK(skipped->model_missing);
    CHECK(skipped->reason.contains("ollama pull llama3:latest"));

    const auto *ready = h.find<TranscriptReady>();
    REQUIRE(ready);
    CHECK(ready->raw == "hello world");
    CHECK_FALSE(ready->corrected);
}

TEST_CASE("A toggle while processing is answered with busy", "[coordinator]")
{
    Harness h;
    h.transcriber->hold = true;

    REQUIRE(h.coordinator->toggle() == ToggleAck::Started);
    REQUIRE(h.coordinator->toggle() == ToggleAck::Stopped);
    REQUIRE(waitUntil([&] { return h.transcriber->calls > 0; }));

    CHECK(h.coordinator->toggle() == ToggleAck::Busy);
    CHECK(h.coordinator->toggle() == ToggleAck::Busy);
    CHECK(h.coordinator->state() == PipelineState::Processing);
    CHECK(h.capture.starts == 1);
    CHECK(h.count<RecordingStarted>() == 1);

    h.transcriber->hold = false;
    REQUIRE(waitUntil([&] { return !h.jobs.empty(); }));
    CHECK(h.coordinator->state() == PipelineState::Idle);

    // Ready for the next recording
    CHECK(h.coordinator->toggle() == ToggleAck::Started);
    CHECK(h.capture.starts == 2);
    h.coordinator->shutdown();
}

TEST_CASE("Auto-type does not type into excluded applications", "[coordinator][injector]")
{
    auto cfg = Harness::defaultConfig();
    cfg.autotype_enabled = true;
    Harness h{cfg};
    h.backend->setApp("Keychain Access");

    REQUIRE(h.runOnce());

    const auto *skipped = h.find<InjectionSkipped>();
    REQUIRE(skipped);
    CHECK(skipped->app == "Keychain Access");
    CHECK(h.backend->keys().isEmpty());
    CHECK(h.jobs.front().outcome == JobRecord::Outcome::InjectionSkipped);

    // The transcript is still delivered
    CHECK(h.count<TranscriptReady>() == 1);
}

TEST_CASE("Auto-type types the selected text", "[coordinator][injector]")
{
    auto cfg = Harness::defaultConfig();
    cfg.autotype_enabled = true;

    SECTION("corrected") {
        cfg.injection_mode = InjectionMode::Corrected;
        Harness h{cfg};
        REQUIRE(h.runOnce());
        CHECK(h.backend->typed() == "Hello, world.");
        const auto *done = h.find<InjectionCompleted>();
        REQUIRE(done);
        CHECK(done->keystrokes == 13);
        CHECK(h.jobs.front().outcome == JobRecord::Outcome::Typed);
    }

    SECTION("both") {
        cfg.injection_mode = InjectionMode::Both;
        Harness h{cfg};
        REQUIRE(h.runOnce());
        CHECK(h.backend->typed() == "hello world Hello, world.");
    }

    SECTION("backend failure") {
        Harness h{cfg};
        h.backend->deny_access = true;
        REQUIRE(h.runOnce());
        const auto *failed = h.find<InjectionFailed>();
        REQUIRE(failed);
        CHECK(failed->error.contains("X server"));
        CHECK(h.coordinator->state() == PipelineState::Idle);
    }
}

TEST_CASE("Auto-type is off unless enabled", "[coordinator]")
{
    Harness h;
    REQUIRE(h.runOnce());
    CHECK(h.backend->keys().isEmpty());
    CHECK(h.count<InjectionCompleted>() == 0);
    CHECK(h.count<InjectionSkipped>() == 0);
}

TEST_CASE("Silent audio is not transcribed", "[coordinator]")
{
    Harness h;
    h.capture.amplitude = 30;

    REQUIRE(h.runOnce());

    const auto *none = h.find<NoSpeechDetected>();
    REQUIRE(none);
    CHECK(none->silent_audio);
    CHECK(h.transcriber->calls == 0);
    CHECK(h.jobs.front().outcome == JobRecord::Outcome::NoSpeech);
}

TEST_CASE("An empty transcript is reported as no speech", "[coordinator]")
{
    Harness h;
    h.transcriber->setText("   ");

    REQUIRE(h.runOnce());

    const auto *none = h.find<NoSpeechDetected>();
    REQUIRE(none);
    CHECK_FALSE(none->silent_audio);
    CHECK(h.transcriber->calls == 1);
    CHECK(h.corrector->attempts.empty());
    CHECK(h.count<TranscriptReady>() == 0);
}

TEST_CASE("Transcription failures end the job", "[coordinator]")
{
    SECTION("error") {
        Harness h;
        h.transcriber->fail = true;
        REQUIRE(h.runOnce());

        const auto *failed = h.find<TranscriptionFailed>();
        REQUIRE(failed);
        CHECK(failed->error.contains("ggml-base.en.bin"));
        CHECK(h.corrector->attempts.empty());
        CHECK(h.jobs.front().outcome == JobRecord::Outcome::TranscriptionFailed);
        CHECK(h.coordinator->state() == PipelineState::Idle);
    }

    SECTION("timeout") {
        auto cfg = Harness::defaultConfig();
        cfg.transcription_timeout = 100ms;
        Harness h{cfg};
        h.transcriber->hold = true;
        REQUIRE(h.runOnce());

        const auto *failed = h.find<TranscriptionFailed>();
        REQUIRE(failed);
        CHECK(failed->error.contains("timed out"));
        CHECK(h.coordinator->state() == PipelineState::Idle);

        // The abandoned inference is told to stop
        CHECK(waitUntil([&] { return h.transcriber->saw_cancel.load(); }));
    }
}

TEST_CASE("Correction can be disabled", "[coordinator]")
{
    SECTION("by config") {
        auto cfg = Harness::defaultConfig();
        cfg.correction_enabled = false;
        Harness h{cfg};
        REQUIRE(h.runOnce());
        CHECK(h.corrector->attempts.empty());
        const auto *ready = h.find<TranscriptReady>();
        REQUIRE(ready);
        CHECK_FALSE(ready->corrected);
        CHECK(h.count<CorrectionSkipped>() == 0);
    }

    SECTION("without a corrector") {
        Harness h{Harness::defaultConfig(), false};
        REQUIRE(h.runOnce());
        const auto *ready = h.find<TranscriptReady>();
        REQUIRE(ready);
        CHECK_FALSE(ready->corrected);
    }
}

TEST_CASE("Capture errors return to idle", "[coordinator]")
{
    SECTION("device unavailable at start") {
        Harness h;
        h.capture.fail_start = true;
        CHECK(h.coordinator->toggle() == ToggleAck::DeviceUnavailable);
        CHECK(h.coordinator->state() == PipelineState::Idle);
        CHECK(h.events.empty());
        // Never observed as recording
        CHECK(h.states.empty());
    }

    SECTION("device lost while recording") {
        Harness h;
        REQUIRE(h.coordinator->toggle() == ToggleAck::Started);
        h.capture.loseDevice();

        CHECK(h.coordinator->state() == PipelineState::Idle);
        const auto *failed = h.find<RecordingFailed>();
        REQUIRE(failed);
        CHECK(failed->session == 1);
        CHECK(failed->error.contains("removed"));

        // Nothing to process, and the next toggle starts a new session
        CHECK(h.coordinator->toggle() == ToggleAck::Started);
        CHECK(h.find<RecordingStarted>()->session == 1);
        CHECK(std::get<RecordingStarted>(h.events.back()).session == 2);
        h.coordinator->shutdown();
    }
}

TEST_CASE("Every job ends in idle whatever the outcome", "[coordinator]")
{
    auto cfg = Harness::defaultConfig();
    cfg.autotype_enabled = true;
    Harness h{cfg};

    h.capture.duration = 100ms;
    REQUIRE(h.runOnce());
    CHECK(h.state.state() == PipelineState::Idle);

    h.capture.duration = 1s;
    h.transcriber->fail = true;
    REQUIRE(h.runOnce());
    CHECK(h.state.state() == PipelineState::Idle);

    h.transcriber->fail = false;
    h.corrector->fallback = CorrectionResult{CorrectionResult::Status::BadResponse, {}, "garbage", 200};
    h.backend->fail_after = 3;
    REQUIRE(h.runOnce());
    CHECK(h.state.state() == PipelineState::Idle);
    CHECK(h.count<InjectionFailed>() == 1);

    REQUIRE(h.jobs.size() == 3);
    for(const auto& job : h.jobs) {
        CHECK(job.stage == JobRecord::Stage::Done);
    }

    // Sessions are numbered in order
    CHECK(h.jobs[0].session == 1);
    CHECK(h.jobs[2].session == 3);

    // Only the three states are ever reported
    for(auto s : h.states) {
        CHECK((s == PipelineState::Idle || s == PipelineState::Recording || s == PipelineState::Processing));
    }
}

TEST_CASE("Backoff doubles per retry", "[coordinator]")
{
    CHECK(PipelineCoordinator::backoffDelay(500ms, 1) == 500ms);
    CHECK(PipelineCoordinator::backoffDelay(500ms, 2) == 1000ms);
    CHECK(PipelineCoordinator::backoffDelay(500ms, 3) == 2000ms);
    CHECK(PipelineCoordinator::backoffDelay(0ms, 3) == 0ms);
}
