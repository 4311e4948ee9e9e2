/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKTREEISOLATORTEST_H
#define WORKTREEISOLATORTEST_H

#include <QObject>
#include <QTemporaryDir>

#include <memory>

namespace Agentdeck
{

class WorktreeIsolator;
class WorktreeRecord;

class WorktreeIsolatorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();

    // Records
    void testProjectHash();
    void testRecordJson();

    // Lifecycle
    void testCreateAndRemove();
    void testCreateDuplicateFails();
    void testCreateFromUnknownBranchFails();
    void testIncludeChanges();
    void testRemoveUnknownSucceeds();

    // Working with a worktree
    void testDiffIncludesCommittedAndUncommitted();
    void testCreateBranch();
    void testOverwriteSyncRoundTrip();
    void testApplySyncToLocal();
    void testApplySyncToLocalKeepsLocalCommits();
    void testApplySyncFromLocal();
    void testRemoveFallsBackToDeletion();

    // Registry
    void testRegistryReloadDropsMissing();
    void testCleanupAllRemovesOrphans();
    void testCleanupAllSparesWorktreeBeingCreated();

private:
    WorktreeRecord createWorktree(WorktreeIsolator &isolator, const QString &sessionId, bool includeChanges = false);
    std::unique_ptr<WorktreeIsolator> newIsolator() const;

    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_repo;
    QString m_base;
    QString m_registry;
};

}

#endif // WORKTREEISOLATORTEST_H
