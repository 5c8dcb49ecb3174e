#pragma once

#include <optional>

#include <QString>
#include <QStringList>

/*! Instruction templates for transcript correction.
 */
class CorrectionPrompts
{
public:
    enum class Style : int {
        Transcription,
        Minimal,
        Formal,
        Code
    };

    static std::optional<Style> fromName(const QString& name);
    static QString name(Style style);
    static QString displayName(Style style);
    static QStringList names();

    static QString systemPrompt(Style style);

    // The complete prompt for a completion style endpoint
    static QString makePrompt(Style style, const QString& transcript);
};
