#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

#include <QStringList>

#include "ExclusionPolicy.h"
#include "InputBackend.h"
#include "PipelineTypes.h"

/*! Types text at the cursor of the focused application.
 *
 * inject() blocks until all text is typed and cannot be cancelled once
 * typing has started. It holds no lock while typing; the policy is
 * snapshotted when the call starts.
 */
class TextInjector
{
public:
    struct Pacing {
        std::chrono::milliseconds pre_delay{1000};  // lets focus settle after the hotkey
        std::chrono::milliseconds char_delay{20};
    };

    TextInjector(std::shared_ptr<InputBackend> backend, exclusion_policy_t policy, Pacing pacing);

    /*! Type the text selected by `mode`.
     *
     * Raw types `raw`, Corrected types `corrected` (or `raw` if there is no
     * corrected text) and Both types raw followed by corrected.
     */
    InjectionResult inject(const QString& raw, const std::optional<QString>& corrected, InjectionMode mode);

    InjectionResult inject(const QString& text) {
        return inject(text, std::nullopt, InjectionMode::Raw);
    }

    void setExclusionPolicy(exclusion_policy_t policy);
    exclusion_policy_t exclusionPolicy() const;


    // Trims, and ends a sentence of more than two words with a period.
    static QString prepareText(const QString& text);

    static QStringList selectTexts(const QString& raw, const std::optional<QString>& corrected, InjectionMode mode);

private:
    void typeText(const QString& text, int& keystrokes);

    std::shared_ptr<InputBackend> backend_;
    const Pacing pacing_;
    mutable std::mutex policy_mutex_;
    exclusion_policy_t policy_;
};
