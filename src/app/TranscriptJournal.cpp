#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "TranscriptJournal.h"
#include "logging.h"

using namespace std;

TranscriptJournal::TranscriptJournal(QString path)
    : path_{std::move(path)}
{
}

bool TranscriptJournal::append(uint64_t session, const QString &text, const QDateTime &when)
{
    if (path_.isEmpty()) {
        return false;
    }

    if (const auto dir = QFileInfo{path_}.absoluteDir(); !dir.exists()) {
        if (!QDir{}.mkpath(dir.absolutePath())) {
            LOG_WARN_N << "Cannot create directory " << dir.absolutePath();
            return false;
        }
    }

    QFile file{path_};
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        LOG_WARN_N << "Cannot open transcript journal " << path_ << ": " << file.errorString();
        return false;
    }

    const auto line = formatEntry(session, text, when).toUtf8();
    if (file.write(line) != line.size()) {
        LOG_WARN_N << "Failed to write to transcript journal " << path_ << ": " << file.errorString();
        return false;
    }

    return true;
}

QString TranscriptJournal::formatEntry(uint64_t session, const QString &text, const QDateTime &when)
{
    auto flat = text;
    flat.replace(QChar{'\r'}, QChar{' '});
    flat.replace(QChar{'\n'}, QChar{' '});

    return QStringLiteral("[%1] #%2 %3\n")
        .arg(when.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")))
        .arg(session)
        .arg(flat.trimmed());
}
