#include <catch2/catch.hpp>

#include <QFile>
#include <QTemporaryDir>

#include "AppConfig.h"

using namespace std;
using namespace std::chrono_literals;

namespace {

// An INI file in a fresh directory
struct IniFile {
    QTemporaryDir dir;
    QString path;

    explicit IniFile(const QByteArray& content) {
        REQUIRE(dir.isValid());
        path = dir.filePath("qvoicetyper.ini");
        QFile file{path};
        REQUIRE(file.open(QIODevice::WriteOnly));
        file.write(content);
    }

    AppConfig load() const {
        QSettings settings{path, QSettings::IniFormat};
        return AppConfig::load(settings);
    }
};

} // anon ns

TEST_CASE("An empty configuration gives the defaults", "[config]")
{
    const IniFile ini{""};
    const auto cfg = ini.load();

    CHECK(cfg.hotkey == "f9");
    CHECK(cfg.hotkey_debounce == 50ms);
    CHECK(cfg.device_index == -1);
    CHECK(cfg.sample_rate == 16000);
    CHECK(cfg.level_interval == 100ms);

    CHECK(cfg.pipeline.min_duration == 500ms);
    CHECK(cfg.pipeline.silence_threshold == 50);
    CHECK(cfg.pipeline.transcription_timeout == 60s);
    CHECK(cfg.pipeline.correction_enabled);
    CHECK(cfg.pipeline.correction_model == "llama3:latest");
    CHECK(cfg.pipeline.max_retries == 3);
    CHECK(cfg.pipeline.backoff == 500ms);
    CHECK_FALSE(cfg.pipeline.autotype_enabled);
    CHECK(cfg.pipeline.injection_mode == InjectionMode::Raw);

    CHECK(cfg.whisper.model_id == "base.en");
    CHECK(cfg.whisper.language.empty());
    CHECK(cfg.whisper.threads == -1);
    CHECK(cfg.whisper.confidence_floor == Approx(0.40f));
    CHECK(QString::fromStdString(cfg.whisper.model_dir.string()).endsWith("/whisper_models"));

    CHECK(cfg.ollama.host == "localhost");
    CHECK(cfg.ollama.port == 11434);
    CHECK(cfg.ollama.style == CorrectionPrompts::Style::Transcription);
    CHECK(cfg.ollama.timeout == 30s);

    CHECK(cfg.pacing.pre_delay == 1000ms);
    CHECK(cfg.pacing.char_delay == 20ms);
    CHECK(cfg.excluded_apps == QStringList{"Keychain Access", "Login Window", "1Password"});

    CHECK(cfg.copy_to_clipboard);
    CHECK(cfg.transcript_log.endsWith("/transcriptions.log"));
}

TEST_CASE("Configured values are used", "[config]")
{
    const IniFile ini{R"([hotkey]
combination=ctrl+shift+d

[correction]
enabled=false
model=mistral:7b
style=formal
host=10.0.0.5
port=8080

[autotype]
enabled=true
mode=both
excluded_apps=KeePassXC, Bitwarden

[transcription]
model=small
language=nb

[output]
transcript_log=
)"};
    const auto cfg = ini.load();

    CHECK(cfg.hotkey == "ctrl+shift+d");
    CHECK_FALSE(cfg.pipeline.correction_enabled);
    CHECK(cfg.pipeline.correction_model == "mistral:7b");
    CHECK(cfg.ollama.style == CorrectionPrompts::Style::Formal);
    CHECK(cfg.ollama.host == "10.0.0.5");
    CHECK(cfg.ollama.port == 8080);
    CHECK(cfg.pipeline.autotype_enabled);
    CHECK(cfg.pipeline.injection_mode == InjectionMode::Both);
    CHECK(cfg.excluded_apps.size() == 2);
    CHECK(cfg.whisper.model_id == "small");
    CHECK(cfg.whisper.language == "nb");
    CHECK(cfg.transcript_log.isEmpty());
}

TEST_CASE("Out of range values are clamped", "[config]")
{
    const IniFile ini{R"([audio]
level_interval_ms=10

[autotype]
char_delay_ms=0
mode=sideways

[correction]
max_retries=99
port=70000
style=pirate

[recording]
silence_threshold=-5

[transcription]
confidence_floor=1.5
timeout_ms=abc
)"};
    const auto cfg = ini.load();

    CHECK(cfg.level_interval == 50ms);
    CHECK(cfg.pacing.char_delay == 1ms);
    CHECK(cfg.pipeline.injection_mode == InjectionMode::Raw);
    CHECK(cfg.pipeline.max_retries == 10);
    CHECK(cfg.ollama.port == 65535);
    CHECK(cfg.ollama.style == CorrectionPrompts::Style::Transcription);
    CHECK(cfg.pipeline.silence_threshold == 0);
    CHECK(cfg.whisper.confidence_floor == Approx(1.0f));
    CHECK(cfg.pipeline.transcription_timeout == 60s);
}
