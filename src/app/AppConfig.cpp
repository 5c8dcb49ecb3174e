#include <algorithm>

#include <QDir>
#include <QStandardPaths>

#include "AppConfig.h"
#include "logging.h"

using namespace std;

namespace {

int readInt(const QSettings& settings, const QString& key, int def, int lo, int hi)
{
    if (!settings.contains(key)) {
        return def;
    }

    bool ok = false;
    const auto value = settings.value(key).toInt(&ok);
    if (!ok) {
        LOG_WARN << "Setting " << key << " is not a number. Using " << def;
        return def;
    }

    const auto clamped = clamp(value, lo, hi);
    if (clamped != value) {
        LOG_WARN << "Setting " << key << '=' << value << " is out of range. Using " << clamped;
    }
    return clamped;
}

chrono::milliseconds readMs(const QSettings& settings, const QString& key,
                            chrono::milliseconds def, int lo, int hi)
{
    return chrono::milliseconds{readInt(settings, key, static_cast<int>(def.count()), lo, hi)};
}

bool readBool(const QSettings& settings, const QString& key, bool def)
{
    return settings.value(key, def).toBool();
}

QString readString(const QSettings& settings, const QString& key, const QString& def)
{
    return settings.value(key, def).toString().trimmed();
}

} // anon ns

AppConfig AppConfig::load(const QSettings &settings)
{
    AppConfig cfg;

    cfg.hotkey = readString(settings, "hotkey/combination", cfg.hotkey);
    cfg.hotkey_debounce = readMs(settings, "hotkey/debounce_ms", cfg.hotkey_debounce, 0, 2000);

    cfg.device_index = readInt(settings, "audio/device_index", cfg.device_index, -1, 1024);
    cfg.sample_rate = readInt(settings, "audio/sample_rate", cfg.sample_rate, 8000, 192000);
    cfg.level_interval = readMs(settings, "audio/level_interval_ms", cfg.level_interval, 50, 250);

    auto& p = cfg.pipeline;
    p.min_duration = readMs(settings, "recording/min_duration_ms", p.min_duration, 0, 60000);
    p.silence_threshold = readInt(settings, "recording/silence_threshold", p.silence_threshold, 0, 32767);
    p.transcription_timeout = readMs(settings, "transcription/timeout_ms", p.transcription_timeout, 1000, 3600000);
    p.correction_enabled = readBool(settings, "correction/enabled", p.correction_enabled);
    p.correction_model = readString(settings, "correction/model", p.correction_model);
    p.max_retries = readInt(settings, "correction/max_retries", p.max_retries, 0, 10);
    p.backoff = readMs(settings, "correction/backoff_ms", p.backoff, 0, 60000);
    p.autotype_enabled = readBool(settings, "autotype/enabled", p.autotype_enabled);

    if (const auto name = readString(settings, "autotype/mode", toString(p.injection_mode)); !name.isEmpty()) {
        if (const auto mode = toInjectionMode(name)) {
            p.injection_mode = *mode;
        } else {
            LOG_WARN << "Unknown autotype/mode \"" << name << "\". Using " << p.injection_mode;
        }
    }

    auto& w = cfg.whisper;
    w.model_id = readString(settings, "transcription/model", QString::fromStdString(w.model_id)).toStdString();
    w.model_dir = readString(settings, "transcription/model_dir", defaultModelDir()).toStdString();
    w.language = readString(settings, "transcription/language", {}).toStdString();
    w.threads = readInt(settings, "transcription/threads", w.threads, -1, 256);
    w.use_gpu = readBool(settings, "transcription/use_gpu", w.use_gpu);
    {
        bool ok = false;
        const auto floor = settings.value("transcription/confidence_floor", w.confidence_floor).toFloat(&ok);
        if (ok) {
            w.confidence_floor = clamp(floor, 0.0f, 1.0f);
            if (w.confidence_floor != floor) {
                LOG_WARN << "Setting transcription/confidence_floor=" << floor
                         << " is out of range. Using " << w.confidence_floor;
            }
        } else {
            LOG_WARN << "Setting transcription/confidence_floor is not a number. Using " << w.confidence_floor;
        }
    }

    auto& o = cfg.ollama;
    o.host = readString(settings, "correction/host", o.host);
    o.port = readInt(settings, "correction/port", o.port, 1, 65535);
    o.timeout = readMs(settings, "correction/timeout_ms", o.timeout, 1000, 600000);
    if (const auto name = readString(settings, "correction/style", CorrectionPrompts::name(o.style)); !name.isEmpty()) {
        if (const auto style = CorrectionPrompts::fromName(name)) {
            o.style = *style;
        } else {
            LOG_WARN << "Unknown correction/style \"" << name << "\". Valid styles are "
                     << CorrectionPrompts::names().join(", ");
        }
    }

    cfg.pacing.pre_delay = readMs(settings, "autotype/delay_ms", cfg.pacing.pre_delay, 0, 10000);
    cfg.pacing.char_delay = readMs(settings, "autotype/char_delay_ms", cfg.pacing.char_delay, 1, 1000);

    if (settings.contains("autotype/excluded_apps")) {
        // An INI list, or one string with comma separated names
        auto value = settings.value("autotype/excluded_apps");
        cfg.excluded_apps = value.typeId() == QMetaType::QStringList
            ? value.toStringList()
            : value.toString().split(',', Qt::SkipEmptyParts);
    }

    cfg.copy_to_clipboard = readBool(settings, "output/copy_to_clipboard", cfg.copy_to_clipboard);
    cfg.transcript_log = readString(settings, "output/transcript_log", defaultTranscriptLog());

    return cfg;
}

QString AppConfig::defaultModelDir()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + "/whisper_models";
}

QString AppConfig::defaultTranscriptLog()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + "/transcriptions.log";
}
