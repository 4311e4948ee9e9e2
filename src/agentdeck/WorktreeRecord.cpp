/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorktreeRecord.h"

#include <QJsonValue>

namespace Agentdeck
{

static QJsonValue nullableString(const QString &value)
{
    return value.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(value);
}

QJsonObject WorktreeRecord::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("sessionId")] = sessionId;
    obj[QStringLiteral("projectPath")] = projectPath;
    obj[QStringLiteral("worktreePath")] = worktreePath;
    obj[QStringLiteral("baseBranch")] = nullableString(baseBranch);
    obj[QStringLiteral("baseCommit")] = baseCommit;
    obj[QStringLiteral("createdAt")] = createdAt.toString(Qt::ISODate);
    obj[QStringLiteral("branchName")] = nullableString(branchName);
    return obj;
}

WorktreeRecord WorktreeRecord::fromJson(const QJsonObject &obj)
{
    WorktreeRecord record;
    record.sessionId = obj.value(QStringLiteral("sessionId")).toString();
    record.projectPath = obj.value(QStringLiteral("projectPath")).toString();
    record.worktreePath = obj.value(QStringLiteral("worktreePath")).toString();
    record.baseBranch = obj.value(QStringLiteral("baseBranch")).toString();
    record.baseCommit = obj.value(QStringLiteral("baseCommit")).toString();
    record.createdAt = QDateTime::fromString(obj.value(QStringLiteral("createdAt")).toString(), Qt::ISODate);
    record.branchName = obj.value(QStringLiteral("branchName")).toString();
    return record;
}

} // namespace Agentdeck
