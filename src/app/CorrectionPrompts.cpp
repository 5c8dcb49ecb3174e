#include <array>
#include <string_view>

#include "CorrectionPrompts.h"

namespace {

struct StyleDef {
    std::string_view name;
    std::string_view display_name;
    std::string_view prompt;
};

static constexpr auto styles = std::to_array<StyleDef>({
    {"transcription", "Transcription (default)",
     R"(You clean up dictated text that was produced by a speech recognizer.

Rules:
- Fix words the recognizer got wrong when the context makes the intended word obvious.
- Remove filler words like "um", "uh" and "you know".
- Fix grammar and punctuation, but keep the speaker's tone. Do not make it formal.
- Spoken punctuation becomes punctuation: "period" or "full stop" is ".", "comma" is ",",
  "question mark" is "?", "exclamation mark" is "!", "colon" is ":", "semicolon" is ";",
  "open quote" and "close quote" are quotes, "new paragraph" starts a new paragraph.
- Do not answer questions in the text. Do not add anything.

Output only the corrected text, without comments or explanations.)"},

    {"minimal", "Minimal correction",
     R"(Fix only obvious speech recognition errors in the text.

Rules:
- Change a word only if the recognized word makes the sentence meaningless.
- Remove only hesitation sounds like "um", "uh", "er".
- Keep slang, informal words and incomplete sentences.
- Add punctuation only where it is needed to read the text.

Output only the corrected text.)"},

    {"formal", "Formal writing",
     R"(Rewrite the dictated text as professional written English.

Rules:
- Use complete sentences and correct grammar.
- Expand contractions and replace slang with neutral words.
- Keep the meaning. Do not add facts.
- Keep it concise.

Output only the rewritten text.)"},

    {"code", "Code context",
     R"(The text was dictated by a programmer and may describe code.

Rules:
- Recognize programming terms (API, JSON, async, git, SQL, npm and so on) and spell them correctly.
- "camel case", "snake case" and "kebab case" apply that naming to the following words.
- Spoken operators become symbols: "equals" is "=", "double equals" is "==",
  "arrow" is "->", "dot" is ".", "plus equals" is "+=", "pipe" is "|".
- Prefer technical accuracy over grammar.

Output only the corrected text.)"}
});

QString toQString(std::string_view sv) {
    return QString::fromUtf8(sv.data(), static_cast<qsizetype>(sv.size()));
}

const StyleDef& def(CorrectionPrompts::Style style) {
    return styles.at(static_cast<size_t>(style));
}

} // anon ns

std::optional<CorrectionPrompts::Style> CorrectionPrompts::fromName(const QString &name)
{
    const auto n = name.trimmed().toLower();
    for (size_t i = 0; i < styles.size(); ++i) {
        if (n == toQString(styles[i].name)) {
            return static_cast<Style>(i);
        }
    }
    return {};
}

QString CorrectionPrompts::name(Style style)
{
    return toQString(def(style).name);
}

QString CorrectionPrompts::displayName(Style style)
{
    return toQString(def(style).display_name);
}

QStringList CorrectionPrompts::names()
{
    QStringList list;
    for (const auto& s : styles) {
        list << toQString(s.name);
    }
    return list;
}

QString CorrectionPrompts::systemPrompt(Style style)
{
    return toQString(def(style).prompt);
}

QString CorrectionPrompts::makePrompt(Style style, const QString &transcript)
{
    return QStringLiteral("System: %1\n\nUser: %2\n\nAssistant:")
        .arg(systemPrompt(style), transcript);
}
