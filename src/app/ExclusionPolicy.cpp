#include "ExclusionPolicy.h"

ExclusionPolicy::ExclusionPolicy(const QStringList &entries)
{
    for (const auto& e : entries) {
        if (auto t = e.trimmed(); !t.isEmpty() && !entries_.contains(t, Qt::CaseInsensitive)) {
            entries_ << t;
        }
    }
}

std::optional<QString> ExclusionPolicy::match(const QString &app) const
{
    if (app.isEmpty()) {
        return {};
    }

    for (const auto& e : entries_) {
        if (app.contains(e, Qt::CaseInsensitive)) {
            return e;
        }
    }
    return {};
}

QStringList ExclusionPolicy::defaultEntries()
{
    return {QStringLiteral("Keychain Access"),
            QStringLiteral("Login Window"),
            QStringLiteral("1Password")};
}
