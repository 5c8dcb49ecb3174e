#pragma once

#include <chrono>

#include <QSettings>
#include <QString>
#include <QStringList>

#include "OllamaCorrector.h"
#include "PipelineCoordinator.h"
#include "TextInjector.h"
#include "WhisperTranscriber.h"

/*! Everything the application reads from its settings.
 *
 * Missing keys get the defaults below. Values out of range are clamped
 * and a warning is logged.
 */
struct AppConfig {
    QString hotkey{"f9"};
    std::chrono::milliseconds hotkey_debounce{50};

    int device_index{-1}; // -1 for the system default
    int sample_rate{16000};
    std::chrono::milliseconds level_interval{100};

    PipelineCoordinator::Config pipeline;
    WhisperTranscriber::Config whisper;
    OllamaCorrector::Config ollama;
    TextInjector::Pacing pacing;
    QStringList excluded_apps{ExclusionPolicy::defaultEntries()};

    bool copy_to_clipboard{true};
    QString transcript_log; // empty disables the journal

    static AppConfig load(const QSettings& settings);

    static QString defaultModelDir();
    static QString defaultTranscriptLog();
};
