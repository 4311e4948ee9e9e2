/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionLogTail.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimer>

#include <sys/stat.h>

namespace Agentdeck
{

static constexpr int TailSignatureBytes = 64;

SessionLogTail::SessionLogTail(const TranscriptLocator &locator, QObject *parent)
    : QObject(parent)
    , m_locator(locator)
{
}

SessionLogTail::~SessionLogTail()
{
    unwatchAll();
}

QJsonArray SessionLogTail::watch(const QString &consumerId, const QString &knownLogId, const QString &projectPath)
{
    unwatch(consumerId);

    Watch w;
    w.projectPath = projectPath;
    w.context = new QObject(this);
    w.fileWatcher = new QFileSystemWatcher(w.context);
    w.pollTimer = new QTimer(w.context);
    w.pollTimer->setInterval(m_timings.pollIntervalMs);

    connect(w.fileWatcher, &QFileSystemWatcher::fileChanged, w.context, [this, consumerId]() {
        readNewContent(consumerId);
    });
    connect(w.pollTimer, &QTimer::timeout, w.context, [this, consumerId]() {
        onPoll(consumerId);
    });

    Watch &watch = m_watches.insert(consumerId, w).value();

    qDebug() << "SessionLogTail: watch" << consumerId << "logId:" << knownLogId << "dir:" << m_locator.projectDirectory(projectPath);

    QJsonArray initial;
    QString attachedId;

    if (!knownLogId.isEmpty()) {
        // Pinned: never follow newer logs of the same project
        watch.pinned = true;
        const QString filePath = m_locator.logPath(knownLogId, projectPath);
        watch.activeFile = filePath;
        watch.activeLogId = knownLogId;

        if (QFileInfo::exists(filePath)) {
            initial = attach(watch, filePath, knownLogId);
            attachedId = knownLogId;
        } else {
            qDebug() << "SessionLogTail: File not found yet, polling:" << filePath;
            watch.appearTimer = new QTimer(watch.context);
            watch.appearTimer->setInterval(m_timings.appearIntervalMs);
            connect(watch.appearTimer, &QTimer::timeout, watch.context, [this, consumerId]() {
                onAppearPoll(consumerId);
            });
            watch.appearTimer->start();
        }
    } else {
        const QString latest = m_locator.findLatestLogId(projectPath);
        if (!latest.isEmpty()) {
            initial = attach(watch, m_locator.logPath(latest, projectPath), latest);
            attachedId = latest;
        }
    }

    watch.pollTimer->start();

    if (!attachedId.isEmpty()) {
        Q_EMIT logAttached(consumerId, attachedId);
    }
    return initial;
}

void SessionLogTail::unwatch(const QString &consumerId)
{
    auto it = m_watches.find(consumerId);
    if (it == m_watches.end()) {
        return;
    }

    const Watch watch = it.value();
    m_watches.erase(it);

    watch.pollTimer->stop();
    watch.pollTimer->disconnect();
    if (watch.appearTimer) {
        watch.appearTimer->stop();
        watch.appearTimer->disconnect();
    }
    if (!watch.fileWatcher->files().isEmpty()) {
        watch.fileWatcher->removePaths(watch.fileWatcher->files());
    }
    watch.fileWatcher->disconnect();

    // May run from inside one of the timers' own timeout
    watch.context->deleteLater();
}

void SessionLogTail::unwatchAll()
{
    const QStringList ids = m_watches.keys();
    for (const QString &id : ids) {
        unwatch(id);
    }
}

QString SessionLogTail::activeLogId(const QString &consumerId) const
{
    return m_watches.value(consumerId).activeLogId;
}

QJsonArray SessionLogTail::readAll(const QString &logId, const QString &projectPath) const
{
    QFile file(m_locator.logPath(logId, projectPath));
    if (!file.exists()) {
        return QJsonArray();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "SessionLogTail: Cannot read" << file.fileName() << file.errorString();
        return QJsonArray();
    }
    return parseLines(file.readAll());
}

QString SessionLogTail::findLatestLogId(const QString &projectPath) const
{
    return m_locator.findLatestLogId(projectPath);
}

QJsonArray SessionLogTail::parseLines(const QByteArray &data)
{
    QJsonArray entries;
    const QList<QByteArray> lines = data.split('\n');
    for (const QByteArray &rawLine : lines) {
        const QByteArray line = rawLine.trimmed();
        if (line.isEmpty()) {
            continue;
        }

        QJsonParseError error;
        const QJsonDocument doc = QJsonDocument::fromJson(line, &error);
        if (error.error != QJsonParseError::NoError || !doc.isObject()) {
            qWarning() << "SessionLogTail: Malformed JSONL line:" << line.left(100);
            continue;
        }

        const QJsonObject entry = doc.object();
        if (entry.contains(QStringLiteral("type"))) {
            entries.append(entry);
        }
    }
    return entries;
}

QJsonArray SessionLogTail::attach(Watch &watch, const QString &filePath, const QString &logId)
{
    watch.activeFile = filePath;
    watch.activeLogId = logId;
    watch.inode = fileInode(filePath);

    qint64 consumed = 0;
    const QByteArray data = readCompleteLines(filePath, 0, &consumed);
    watch.offset = consumed;
    watch.tail.clear();
    rememberTail(watch, data);

    if (!watch.fileWatcher->files().isEmpty()) {
        watch.fileWatcher->removePaths(watch.fileWatcher->files());
    }
    if (!watch.fileWatcher->addPath(filePath)) {
        // Polling still covers this file
        qDebug() << "SessionLogTail: No native change notification for" << filePath;
    }

    return parseLines(data);
}

void SessionLogTail::onAppearPoll(const QString &consumerId)
{
    auto it = m_watches.find(consumerId);
    if (it == m_watches.end()) {
        return;
    }

    Watch &watch = it.value();
    ++watch.appearAttempts;

    if (QFileInfo::exists(watch.activeFile)) {
        qDebug() << "SessionLogTail: File appeared after" << watch.appearAttempts << "polls:" << watch.activeFile;
        watch.appearTimer->stop();
        // Empty attach, the content goes out as ordinary appended entries
        watch.offset = 0;
        watch.tail.clear();
        watch.inode = fileInode(watch.activeFile);
        if (!watch.fileWatcher->addPath(watch.activeFile)) {
            qDebug() << "SessionLogTail: No native change notification for" << watch.activeFile;
        }
        const QString logId = watch.activeLogId;
        Q_EMIT logAttached(consumerId, logId);
        readNewContent(consumerId);
        return;
    }

    if (watch.appearAttempts >= m_timings.appearAttempts) {
        watch.appearTimer->stop();
        const QString message = QStringLiteral("Session file not found after %1 attempts, the session keeps running but will not be mirrored")
                                    .arg(m_timings.appearAttempts);
        qWarning() << "SessionLogTail: Gave up waiting for" << watch.activeFile;
        Q_EMIT logNotFound(consumerId, message);
    }
}

void SessionLogTail::onPoll(const QString &consumerId)
{
    auto it = m_watches.find(consumerId);
    if (it == m_watches.end()) {
        return;
    }

    Watch &watch = it.value();
    if (watch.pinned) {
        if (!watch.appearTimer || !watch.appearTimer->isActive()) {
            readNewContent(consumerId);
        }
        return;
    }

    const QString latest = m_locator.findLatestLogId(watch.projectPath);
    if (latest.isEmpty()) {
        return;
    }

    const QString latestPath = m_locator.logPath(latest, watch.projectPath);
    if (latestPath == watch.activeFile) {
        readNewContent(consumerId);
        return;
    }

    qDebug() << "SessionLogTail:" << consumerId << "switching to newer log" << latest;
    const QJsonArray entries = attach(watch, latestPath, latest);
    Q_EMIT logAttached(consumerId, latest);
    Q_EMIT logReset(consumerId, entries);
}

void SessionLogTail::readNewContent(const QString &consumerId)
{
    auto it = m_watches.find(consumerId);
    if (it == m_watches.end() || it->activeFile.isEmpty()) {
        return;
    }

    Watch &watch = it.value();
    const QString path = watch.activeFile;
    const QFileInfo info(path);
    if (!info.exists()) {
        return;
    }

    // Files replaced by rename drop out of the native watcher
    if (!watch.fileWatcher->files().contains(path)) {
        watch.fileWatcher->addPath(path);
    }

    const qint64 size = info.size();
    const quint64 inode = fileInode(path);
    const bool replaced = watch.inode != 0 && inode != 0 && inode != watch.inode;

    if (size < watch.offset || replaced || !tailMatches(path, watch.offset, watch.tail)) {
        qDebug() << "SessionLogTail: Log rewritten for" << consumerId << ", re-reading";
        qint64 consumed = 0;
        const QByteArray data = readCompleteLines(path, 0, &consumed);
        watch.offset = consumed;
        watch.inode = inode;
        watch.tail.clear();
        rememberTail(watch, data);
        Q_EMIT logReset(consumerId, parseLines(data));
        return;
    }

    if (size == watch.offset) {
        return;
    }

    qint64 consumed = 0;
    const QByteArray data = readCompleteLines(path, watch.offset, &consumed);
    if (consumed == 0) {
        return;
    }
    watch.offset += consumed;
    rememberTail(watch, data);

    const QJsonArray entries = parseLines(data);
    if (!entries.isEmpty()) {
        Q_EMIT entriesAppended(consumerId, entries);
    }
}

QByteArray SessionLogTail::readCompleteLines(const QString &filePath, qint64 from, qint64 *consumed)
{
    *consumed = 0;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "SessionLogTail: Cannot read" << filePath << file.errorString();
        return QByteArray();
    }
    if (from > 0 && !file.seek(from)) {
        return QByteArray();
    }

    QByteArray data = file.readAll();
    const int lastNewline = data.lastIndexOf('\n');
    if (lastNewline < 0) {
        return QByteArray();
    }
    data.truncate(lastNewline + 1);
    *consumed = data.size();
    return data;
}

bool SessionLogTail::tailMatches(const QString &filePath, qint64 offset, const QByteArray &tail)
{
    if (tail.isEmpty() || offset < tail.size()) {
        return true;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly) || !file.seek(offset - tail.size())) {
        return true;
    }
    return file.read(tail.size()) == tail;
}

void SessionLogTail::rememberTail(Watch &watch, const QByteArray &consumed)
{
    if (consumed.isEmpty()) {
        return;
    }
    if (consumed.size() >= TailSignatureBytes) {
        watch.tail = consumed.right(TailSignatureBytes);
    } else {
        watch.tail = (watch.tail + consumed).right(TailSignatureBytes);
    }
}

quint64 SessionLogTail::fileInode(const QString &filePath)
{
    struct stat st;
    if (::stat(QFile::encodeName(filePath).constData(), &st) != 0) {
        return 0;
    }
    return static_cast<quint64>(st.st_ino);
}

} // namespace Agentdeck

#include "moc_SessionLogTail.cpp"
