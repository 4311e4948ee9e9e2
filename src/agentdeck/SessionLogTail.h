/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONLOGTAIL_H
#define SESSIONLOGTAIL_H

#include "agentdeck_export.h"

#include "TranscriptLocator.h"

#include <QByteArray>
#include <QHash>
#include <QJsonArray>
#include <QObject>
#include <QString>

class QFileSystemWatcher;
class QTimer;

namespace Agentdeck
{

/**
 * Polling parameters of SessionLogTail
 */
struct AGENTDECK_EXPORT LogTailTimings {
    int pollIntervalMs = 1500; // directory scan and backup content poll
    int appearAttempts = 60; // polls for a known log before giving up
    int appearIntervalMs = 1000;
};

/**
 * SessionLogTail mirrors transcript logs written by agent sessions this
 * process does not own (for example a CLI running in a terminal pane).
 *
 * Each consumer attaches to one log at a time. New complete lines arrive
 * through entriesAppended(); a log that was rewritten in place or replaced by
 * a newer one is re-read and delivered whole through logReset(). Native file
 * change notification and interval polling run side by side; either one
 * noticing new content is enough.
 */
class AGENTDECK_EXPORT SessionLogTail : public QObject
{
    Q_OBJECT

public:
    explicit SessionLogTail(const TranscriptLocator &locator = TranscriptLocator(), QObject *parent = nullptr);
    ~SessionLogTail() override;

    void setTimings(const LogTailTimings &timings) { m_timings = timings; }
    LogTailTimings timings() const { return m_timings; }

    const TranscriptLocator &locator() const { return m_locator; }

    /**
     * Start mirroring for a consumer and return the entries already on disk.
     *
     * With a known log id the consumer stays pinned to that log, waiting for
     * it to appear if needed. Without one the newest log of the project is
     * followed, switching whenever a newer log shows up.
     */
    QJsonArray watch(const QString &consumerId, const QString &knownLogId, const QString &projectPath);

    /**
     * Stop mirroring and release the consumer's watcher and timers
     */
    void unwatch(const QString &consumerId);
    void unwatchAll();

    bool isWatching(const QString &consumerId) const { return m_watches.contains(consumerId); }
    QString activeLogId(const QString &consumerId) const;
    QStringList consumers() const { return m_watches.keys(); }

    /**
     * One-shot read of a whole log
     */
    QJsonArray readAll(const QString &logId, const QString &projectPath) const;

    QString findLatestLogId(const QString &projectPath) const;

    /**
     * Decode JSON lines, keeping objects that carry a "type".
     * Malformed lines are logged and skipped.
     */
    static QJsonArray parseLines(const QByteArray &data);

Q_SIGNALS:
    void entriesAppended(const QString &consumerId, const QJsonArray &entries);
    void logReset(const QString &consumerId, const QJsonArray &entries);
    void logAttached(const QString &consumerId, const QString &logId);
    void logNotFound(const QString &consumerId, const QString &message);

private:
    struct Watch {
        QString projectPath;
        QString activeFile;
        QString activeLogId;
        bool pinned = false;
        qint64 offset = 0;
        quint64 inode = 0;
        QByteArray tail; // last bytes consumed, detects rewrites that grew past the offset
        int appearAttempts = 0;
        QObject *context = nullptr; // parent of watcher and timers
        QFileSystemWatcher *fileWatcher = nullptr;
        QTimer *pollTimer = nullptr;
        QTimer *appearTimer = nullptr;
    };

    QJsonArray attach(Watch &watch, const QString &filePath, const QString &logId);
    void startFileWatch(const QString &consumerId, Watch &watch);
    void onAppearPoll(const QString &consumerId);
    void onPoll(const QString &consumerId);
    void readNewContent(const QString &consumerId);
    static QByteArray readCompleteLines(const QString &filePath, qint64 from, qint64 *consumed);
    static bool tailMatches(const QString &filePath, qint64 offset, const QByteArray &tail);
    static void rememberTail(Watch &watch, const QByteArray &consumed);

    static quint64 fileInode(const QString &filePath);

    TranscriptLocator m_locator;
    LogTailTimings m_timings;
    QHash<QString, Watch> m_watches;
};

} // namespace Agentdeck

#endif // SESSIONLOGTAIL_H
