/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TranscriptLocator.h"

#include <QDir>
#include <QFileInfo>

namespace Agentdeck
{

TranscriptLocator::TranscriptLocator(const QString &root)
{
    setRoot(root);
}

QString TranscriptLocator::defaultRoot()
{
    return QDir::homePath() + QStringLiteral("/.claude/projects");
}

void TranscriptLocator::setRoot(const QString &root)
{
    m_root = root.isEmpty() ? defaultRoot() : QDir::cleanPath(root);
}

QString TranscriptLocator::hashProjectPath(const QString &projectPath)
{
    QString hashed = projectPath;
    for (QChar &c : hashed) {
        const ushort u = c.unicode();
        const bool keep = (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || (u >= '0' && u <= '9') || u == '-';
        if (!keep) {
            c = QLatin1Char('-');
        }
    }
    return hashed;
}

QString TranscriptLocator::projectDirectory(const QString &projectPath) const
{
    return m_root + QLatin1Char('/') + hashProjectPath(projectPath);
}

QString TranscriptLocator::logPath(const QString &logId, const QString &projectPath) const
{
    return projectDirectory(projectPath) + QLatin1Char('/') + logId + QLatin1String(LogSuffix);
}

QString TranscriptLocator::sessionSideDirectory(const QString &logId, const QString &projectPath) const
{
    return projectDirectory(projectPath) + QLatin1Char('/') + logId;
}

QString TranscriptLocator::findLatestLogId(const QString &projectPath) const
{
    const QDir dir(projectDirectory(projectPath));
    if (!dir.exists()) {
        return QString();
    }

    const QFileInfoList logs = dir.entryInfoList({QStringLiteral("*.jsonl")}, QDir::Files, QDir::Time);
    if (logs.isEmpty()) {
        return QString();
    }

    QString name = logs.first().fileName();
    name.chop(int(qstrlen(LogSuffix)));
    return name;
}

} // namespace Agentdeck
