#pragma once

#include <memory>
#include <optional>

#include <QString>
#include <QStringList>

/*! Applications that must never receive simulated keystrokes.
 *
 * Immutable. A configuration change replaces the whole policy.
 * Entries match case-insensitively anywhere in the application name.
 */
class ExclusionPolicy
{
public:
    ExclusionPolicy() = default;
    explicit ExclusionPolicy(const QStringList& entries);

    // The first entry that matches `app`, if any.
    std::optional<QString> match(const QString& app) const;

    bool excludes(const QString& app) const {
        return match(app).has_value();
    }

    const QStringList& entries() const noexcept { return entries_; }

    static QStringList defaultEntries();

private:
    QStringList entries_;
};

using exclusion_policy_t = std::shared_ptr<const ExclusionPolicy>;
