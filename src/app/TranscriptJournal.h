#pragma once

#include <QDateTime>
#include <QString>

/*! Append-only log of delivered transcripts.
 *
 * One line per transcript: "[yyyy-MM-dd HH:mm:ss] #<session> <text>".
 * Newlines in the text are folded into spaces so each entry stays on one line.
 */
class TranscriptJournal
{
public:
    explicit TranscriptJournal(QString path);

    // Returns false if the entry could not be written. The failure is logged.
    bool append(uint64_t session, const QString& text, const QDateTime& when = QDateTime::currentDateTime());

    const QString& path() const noexcept { return path_; }

    static QString formatEntry(uint64_t session, const QString& text, const QDateTime& when);

private:
    QString path_;
};
