/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKTREERECORD_H
#define WORKTREERECORD_H

#include "agentdeck_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

namespace Agentdeck
{

/**
 * WorktreeRecord describes one isolated working copy owned by a session.
 *
 * Records are persisted in the worktree registry so worktrees survive
 * restarts and crash leftovers can be told apart from live ones.
 */
class AGENTDECK_EXPORT WorktreeRecord
{
public:
    WorktreeRecord() = default;
    ~WorktreeRecord() = default;

    QString sessionId;
    QString projectPath; // Repository the worktree was created from
    QString worktreePath; // <base>/<project hash>/<sessionId>
    QString baseBranch; // empty when created from a detached HEAD
    QString baseCommit; // Commit the worktree was checked out at
    QDateTime createdAt;
    QString branchName; // empty until promoted with createBranch()

    bool isValid() const {
        return !sessionId.isEmpty() && !worktreePath.isEmpty();
    }

    /**
     * Serialize to JSON
     */
    QJsonObject toJson() const;

    /**
     * Deserialize from JSON
     */
    static WorktreeRecord fromJson(const QJsonObject &obj);

    /**
     * Compare by session ID
     */
    bool operator==(const WorktreeRecord &other) const {
        return sessionId == other.sessionId;
    }
};

} // namespace Agentdeck

#endif // WORKTREERECORD_H
