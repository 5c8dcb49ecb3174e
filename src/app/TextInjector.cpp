#include <thread>

#include "TextInjector.h"
#include "ScopedTimer.h"
#include "logging.h"

using namespace std;

TextInjector::TextInjector(std::shared_ptr<InputBackend> backend, exclusion_policy_t policy, Pacing pacing)
    : backend_{std::move(backend)}, pacing_{pacing}, policy_{std::move(policy)}
{
    if (!backend_) {
        throw invalid_argument{"TextInjector requires an input backend"};
    }
    if (!policy_) {
        policy_ = make_shared<const ExclusionPolicy>();
    }
}

void TextInjector::setExclusionPolicy(exclusion_policy_t policy)
{
    if (!policy) {
        policy = make_shared<const ExclusionPolicy>();
    }

    lock_guard lock{policy_mutex_};
    policy_ = std::move(policy);
}

exclusion_policy_t TextInjector::exclusionPolicy() const
{
    lock_guard lock{policy_mutex_};
    return policy_;
}

QString TextInjector::prepareText(const QString &text)
{
    auto clean = text.trimmed();
    if (clean.isEmpty()) {
        return clean;
    }

    const auto last = clean.back();
    if (last != u'.' && last != u'!' && last != u'?') {
        if (clean.split(u' ', Qt::SkipEmptyParts).size() > 2) {
            clean += u'.';
        }
    }
    return clean;
}

QStringList TextInjector::selectTexts(const QString &raw, const std::optional<QString> &corrected, InjectionMode mode)
{
    QStringList texts;
    switch (mode) {
    case InjectionMode::Raw:
        texts << raw;
        break;
    case InjectionMode::Corrected:
        texts << (corrected ? *corrected : raw);
        break;
    case InjectionMode::Both:
        texts << raw;
        if (corrected) {
            texts << *corrected;
        }
        break;
    }

    QStringList prepared;
    for (const auto& t : texts) {
        if (auto p = prepareText(t); !p.isEmpty()) {
            prepared << p;
        }
    }
    return prepared;
}

InjectionResult TextInjector::inject(const QString &raw, const std::optional<QString> &corrected, InjectionMode mode)
{
    const auto policy = exclusionPolicy();
    const auto texts = selectTexts(raw, corrected, mode);

    InjectionResult result;
    if (texts.isEmpty()) {
        LOG_DEBUG_N << "Nothing to type";
        result.status = InjectionResult::Status::Typed;
        return result;
    }

    try {
        if (pacing_.pre_delay.count() > 0) {
            LOG_TRACE_N << "Waiting " << pacing_.pre_delay.count() << " ms before typing";
            this_thread::sleep_for(pacing_.pre_delay);
        }

        result.app = backend_->foregroundApplication();
        if (const auto entry = policy->match(result.app)) {
            LOG_INFO_N << "Not typing into excluded application '" << result.app
                       << "' (matches '" << *entry << "')";
            result.status = InjectionResult::Status::Skipped;
            return result;
        }

        backend_->checkAccess();

        const ScopedTimer timer;
        for (qsizetype i = 0; i < texts.size(); ++i) {
            if (i > 0) {
                typeText(QStringLiteral(" "), result.keystrokes);
            }
            typeText(texts.at(i), result.keystrokes);
        }

        LOG_DEBUG_N << "Typed " << result.keystrokes << " keystrokes into '" << result.app
                    << "' in " << timer.elapsed() << " seconds";
        result.status = InjectionResult::Status::Typed;
    } catch (const std::exception& ex) {
        LOG_WARN_N << "Typing failed after " << result.keystrokes << " keystrokes: " << ex.what();
        result.status = InjectionResult::Status::Failed;
        result.error = QString::fromUtf8(ex.what());
    }

    return result;
}

void TextInjector::typeText(const QString &text, int &keystrokes)
{
    for (qsizetype i = 0; i < text.size(); ++i) {
        const auto ch = text.at(i);
        if (ch == u'\n') {
            backend_->pressKey(QStringLiteral("Return"));
        } else if (ch == u'\t') {
            backend_->pressKey(QStringLiteral("Tab"));
        } else if (ch == u'\r') {
            continue;
        } else if (ch.isHighSurrogate() && i + 1 < text.size()) {
            backend_->typeText(text.mid(i, 2));
            ++i;
        } else {
            backend_->typeText(QString{ch});
        }

        ++keystrokes;
        if (pacing_.char_delay.count() > 0) {
            this_thread::sleep_for(pacing_.char_delay);
        }
    }
}
