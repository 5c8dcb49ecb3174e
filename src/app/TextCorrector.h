#pragma once

#include <optional>

#include <QString>
#include <QStringList>

#include <qcorotask.h>

#include "PipelineTypes.h"

/*! Rewrites a raw transcript with a language model.
 *
 * Never throws. Failures are reported in CorrectionResult::status, so the
 * caller can decide whether to retry.
 */
class TextCorrector
{
public:
    TextCorrector() = default;
    virtual ~TextCorrector() = default;

    TextCorrector(const TextCorrector&) = delete;
    TextCorrector& operator=(const TextCorrector&) = delete;

    // One attempt. No retries.
    virtual QCoro::Task<CorrectionResult> correct(QString text, QString model) = 0;

    // Installed models, or nullopt if the server could not be asked.
    virtual QCoro::Task<std::optional<QStringList>> listAvailableModels() = 0;
};
