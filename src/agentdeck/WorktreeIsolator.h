/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKTREEISOLATOR_H
#define WORKTREEISOLATOR_H

#include "agentdeck_export.h"

#include "OperationResult.h"
#include "WorktreeRecord.h"

#include <QList>
#include <QObject>
#include <QSet>
#include <QString>

#include <functional>

namespace Agentdeck
{

class GitRunner;

struct AGENTDECK_EXPORT WorktreeCreateOptions {
    QString projectPath;
    QString sessionId;
    QString baseBranch; // empty = current HEAD
    bool includeChanges = false; // carry uncommitted changes into the worktree
};

/**
 * WorktreeIsolator gives each session its own git working copy.
 *
 * Worktrees are detached checkouts sharing the project's object store, laid
 * out as <base>/<sha256(projectPath)[:12]>/<sessionId>. Every worktree is
 * recorded in a JSON registry that is rewritten after each mutation.
 *
 * All git work is asynchronous; results arrive through the callbacks.
 */
class AGENTDECK_EXPORT WorktreeIsolator : public QObject
{
    Q_OBJECT

public:
    enum class SyncMode {
        Overwrite, // destination becomes source tip plus its uncommitted diff
        Apply // source changes since the merge base are patched onto the destination
    };
    Q_ENUM(SyncMode)

    using CreateCallback = std::function<void(const OperationResult &, const WorktreeRecord &)>;
    using ResultCallback = std::function<void(const OperationResult &)>;
    using DiffCallback = std::function<void(const OperationResult &, const QString &)>;

    /**
     * Empty arguments select the defaults under the application data directory
     */
    explicit WorktreeIsolator(const QString &baseDirectory = QString(), const QString &registryFile = QString(), QObject *parent = nullptr);
    ~WorktreeIsolator() override;

    static QString defaultBaseDirectory();
    static QString defaultRegistryFile();

    QString baseDirectory() const { return m_baseDirectory; }
    QString registryFile() const { return m_registryFile; }

    /**
     * First 12 hex digits of sha256(projectPath)
     */
    static QString projectHash(const QString &projectPath);
    QString worktreePathFor(const QString &projectPath, const QString &sessionId) const;

    void create(const WorktreeCreateOptions &options, const CreateCallback &callback);

    /**
     * Remove the worktree of a session. Unknown ids succeed without effect.
     */
    void remove(const QString &sessionId, const ResultCallback &callback);

    QList<WorktreeRecord> list(const QString &projectPath) const;
    QList<WorktreeRecord> all() const { return m_records; }

    /**
     * Registered worktree of a session, invalid record if none
     */
    WorktreeRecord get(const QString &sessionId) const;
    WorktreeRecord findByWorktreePath(const QString &worktreePath) const;

    /**
     * Check out a new branch in the worktree and record it
     */
    void createBranch(const QString &sessionId, const QString &branchName, const ResultCallback &callback);

    /**
     * Committed changes since the base commit followed by uncommitted ones
     */
    void diff(const QString &sessionId, const DiffCallback &callback);

    void syncToLocal(const QString &sessionId, SyncMode mode, const ResultCallback &callback);
    void syncFromLocal(const QString &sessionId, SyncMode mode, const ResultCallback &callback);

    /**
     * Prune stale git worktree references and delete unregistered directories
     */
    void cleanupAll(const ResultCallback &callback = ResultCallback());

    GitRunner *gitRunner() const { return m_git; }

Q_SIGNALS:
    void worktreeCreated(const Agentdeck::WorktreeRecord &record);
    void worktreeRemoved(const QString &sessionId);

private:
    void captureChanges(const QString &projectPath, const QString &worktreePath, const std::function<void()> &done);
    void applyPatch(const QString &directory, const QByteArray &patch, bool threeWay, const ResultCallback &callback);
    void sync(const QString &sessionId, SyncMode mode, bool toLocal, const ResultCallback &callback);
    void syncOverwrite(const QString &source, const QString &destination, const ResultCallback &callback);
    void syncApply(const WorktreeRecord &record, const QString &source, const QString &destination, const ResultCallback &callback);
    void applyUncommitted(const QString &source, const QString &destination, bool threeWay, const ResultCallback &callback);
    void removeOrphanDirectories();
    void forgetRecord(const QString &sessionId);

    void loadRegistry();
    void saveRegistry();

    QString m_baseDirectory;
    QString m_registryFile;
    QList<WorktreeRecord> m_records;
    QSet<QString> m_pendingPaths; // worktree paths whose create() is in flight
    GitRunner *m_git = nullptr;
};

} // namespace Agentdeck

#endif // WORKTREEISOLATOR_H
