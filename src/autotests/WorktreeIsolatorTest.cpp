/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "WorktreeIsolatorTest.h"

// Qt
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// Agentdeck
#include "../agentdeck/GitRunner.h"
#include "../agentdeck/WorktreeIsolator.h"
#include "../agentdeck/WorktreeRecord.h"
#include "GitTestRepo.h"

#include <functional>

using namespace Agentdeck;

static constexpr int GitTimeoutMs = 30000;

// Not valid UTF-8 in either file
static const QByteArray BinaryContent("\x00\x01\x02\xff\xfe", 5);
static const QByteArray BinaryEdited("\x00\x01\x03\xff\xfe\x00\x80", 7);
static const QByteArray Latin1Content("caf\xe9\n");
static const QByteArray Latin1Edited("caf\xe9 cr\xe8me\n");

static bool commitNonUtf8Files(const QString &repo)
{
    return GitTestRepo::writeFile(repo + QStringLiteral("/blob.bin"), BinaryContent) && GitTestRepo::writeFile(repo + QStringLiteral("/latin1.txt"), Latin1Content)
        && GitTestRepo::commitAll(repo, QStringLiteral("Add non UTF-8 files"));
}

void WorktreeIsolatorTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    if (!GitRunner::isAvailable()) {
        QSKIP("git is not installed");
    }
}

void WorktreeIsolatorTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());

    m_repo = m_dir->filePath(QStringLiteral("repo"));
    m_base = m_dir->filePath(QStringLiteral("worktrees"));
    m_registry = m_dir->filePath(QStringLiteral("state/worktree-registry.json"));
    QVERIFY(GitTestRepo::init(m_repo));
}

void WorktreeIsolatorTest::cleanup()
{
    m_dir.reset();
}

std::unique_ptr<WorktreeIsolator> WorktreeIsolatorTest::newIsolator() const
{
    return std::make_unique<WorktreeIsolator>(m_base, m_registry);
}

WorktreeRecord WorktreeIsolatorTest::createWorktree(WorktreeIsolator &isolator, const QString &sessionId, bool includeChanges)
{
    WorktreeCreateOptions options;
    options.projectPath = m_repo;
    options.sessionId = sessionId;
    options.includeChanges = includeChanges;

    bool done = false;
    OperationResult outcome;
    WorktreeRecord created;
    isolator.create(options, [&](const OperationResult &result, const WorktreeRecord &record) {
        outcome = result;
        created = record;
        done = true;
    });
    if (!QTest::qWaitFor([&done]() { return done; }, GitTimeoutMs) || !outcome.ok()) {
        qWarning() << "WorktreeIsolatorTest: create failed:" << outcome.message();
        return WorktreeRecord();
    }
    return created;
}

static OperationResult waitFor(const std::function<void(const WorktreeIsolator::ResultCallback &)> &operation)
{
    bool done = false;
    OperationResult outcome(ErrorCode::InvalidState, QStringLiteral("did not finish"));
    operation([&](const OperationResult &result) {
        outcome = result;
        done = true;
    });
    QTest::qWaitFor([&done]() { return done; }, GitTimeoutMs);
    return outcome;
}

void WorktreeIsolatorTest::testProjectHash()
{
    const QString hash = WorktreeIsolator::projectHash(QStringLiteral("/home/dev/project"));
    QCOMPARE(hash.length(), 12);
    QCOMPARE(hash, WorktreeIsolator::projectHash(QStringLiteral("/home/dev/project")));
    QVERIFY(hash != WorktreeIsolator::projectHash(QStringLiteral("/home/dev/other")));

    const auto isolator = newIsolator();
    QCOMPARE(isolator->worktreePathFor(QStringLiteral("/home/dev/project"), QStringLiteral("s1")), m_base + QLatin1Char('/') + hash + QStringLiteral("/s1"));
}

void WorktreeIsolatorTest::testRecordJson()
{
    WorktreeRecord record;
    record.sessionId = QStringLiteral("s1");
    record.projectPath = QStringLiteral("/p");
    record.worktreePath = QStringLiteral("/w/s1");
    record.baseCommit = QStringLiteral("abc123");
    record.createdAt = QDateTime(QDate(2025, 6, 1), QTime(10, 0, 0));

    const QJsonObject json = record.toJson();
    QVERIFY(json.value(QStringLiteral("baseBranch")).isNull());
    QVERIFY(json.value(QStringLiteral("branchName")).isNull());

    const WorktreeRecord restored = WorktreeRecord::fromJson(json);
    QCOMPARE(restored.sessionId, record.sessionId);
    QCOMPARE(restored.worktreePath, record.worktreePath);
    QCOMPARE(restored.baseCommit, record.baseCommit);
    QCOMPARE(restored.createdAt, record.createdAt);
    QVERIFY(restored.baseBranch.isEmpty());
    QVERIFY(!WorktreeRecord().isValid());
}

void WorktreeIsolatorTest::testCreateAndRemove()
{
    const auto isolator = newIsolator();
    QSignalSpy created(isolator.get(), &WorktreeIsolator::worktreeCreated);
    QSignalSpy removed(isolator.get(), &WorktreeIsolator::worktreeRemoved);

    const WorktreeRecord record = createWorktree(*isolator, QStringLiteral("s1"));
    QVERIFY(record.isValid());
    QCOMPARE(created.count(), 1);
    QVERIFY(QFileInfo::exists(record.worktreePath + QStringLiteral("/a.txt")));
    QCOMPARE(record.baseCommit, GitTestRepo::git(m_repo, {QStringLiteral("rev-parse"), QStringLiteral("HEAD")}));
    QCOMPARE(record.baseBranch, GitTestRepo::git(m_repo, {QStringLiteral("rev-parse"), QStringLiteral("--abbrev-ref"), QStringLiteral("HEAD")}));
    QCOMPARE(isolator->list(m_repo).size(), 1);
    QCOMPARE(isolator->findByWorktreePath(record.worktreePath + QLatin1Char('/')).sessionId, QStringLiteral("s1"));
    QVERIFY(GitTestRepo::readFile(m_registry).contains("\"s1\""));

    QVERIFY(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                isolator->remove(QStringLiteral("s1"), cb);
            }).ok());

    QCOMPARE(removed.count(), 1);
    QVERIFY(!QFileInfo::exists(record.worktreePath));
    QVERIFY(!isolator->get(QStringLiteral("s1")).isValid());
    QVERIFY(isolator->list(m_repo).isEmpty());
    QVERIFY(newIsolator()->all().isEmpty());
    QVERIFY(!GitTestRepo::git(m_repo, {QStringLiteral("worktree"), QStringLiteral("list")}).contains(record.worktreePath));
}

void WorktreeIsolatorTest::testCreateDuplicateFails()
{
    const auto isolator = newIsolator();
    QVERIFY(createWorktree(*isolator, QStringLiteral("s1")).isValid());

    WorktreeCreateOptions options;
    options.projectPath = m_repo;
    options.sessionId = QStringLiteral("s1");

    bool called = false;
    isolator->create(options, [&called](const OperationResult &result, const WorktreeRecord &) {
        QCOMPARE(result.code(), ErrorCode::InvalidState);
        called = true;
    });
    QVERIFY(called);
    QCOMPARE(isolator->all().size(), 1);
}

void WorktreeIsolatorTest::testCreateFromUnknownBranchFails()
{
    const auto isolator = newIsolator();

    WorktreeCreateOptions options;
    options.projectPath = m_repo;
    options.sessionId = QStringLiteral("s1");
    options.baseBranch = QStringLiteral("no-such-branch");

    bool done = false;
    OperationResult outcome;
    isolator->create(options, [&](const OperationResult &result, const WorktreeRecord &) {
        outcome = result;
        done = true;
    });
    QTRY_VERIFY_WITH_TIMEOUT(done, GitTimeoutMs);
    QCOMPARE(outcome.code(), ErrorCode::Git);
    QVERIFY(isolator->all().isEmpty());
    QVERIFY(!QFileInfo::exists(isolator->worktreePathFor(m_repo, QStringLiteral("s1"))));
}

void WorktreeIsolatorTest::testIncludeChanges()
{
    QVERIFY(commitNonUtf8Files(m_repo));
    QVERIFY(GitTestRepo::writeFile(m_repo + QStringLiteral("/a.txt"), "line one\nchanged locally\n"));
    QVERIFY(GitTestRepo::writeFile(m_repo + QStringLiteral("/blob.bin"), BinaryEdited));
    QVERIFY(GitTestRepo::writeFile(m_repo + QStringLiteral("/latin1.txt"), Latin1Edited));

    const auto isolator = newIsolator();
    const WorktreeRecord record = createWorktree(*isolator, QStringLiteral("s1"), true);
    QVERIFY(record.isValid());

    QCOMPARE(GitTestRepo::readFile(record.worktreePath + QStringLiteral("/a.txt")), QByteArray("line one\nchanged locally\n"));
    QCOMPARE(GitTestRepo::readFile(record.worktreePath + QStringLiteral("/blob.bin")), BinaryEdited);
    QCOMPARE(GitTestRepo::readFile(record.worktreePath + QStringLiteral("/latin1.txt")), Latin1Edited);

    // The source checkout keeps its changes and its stash list
    QCOMPARE(GitTestRepo::readFile(m_repo + QStringLiteral("/a.txt")), QByteArray("line one\nchanged locally\n"));
    QVERIFY(GitTestRepo::git(m_repo, {QStringLiteral("stash"), QStringLiteral("list")}).isEmpty());

    const WorktreeRecord clean = createWorktree(*isolator, QStringLiteral("s2"), false);
    QCOMPARE(GitTestRepo::readFile(clean.worktreePath + QStringLiteral("/a.txt")), QByteArray("line one\nline two\n"));
    QCOMPARE(GitTestRepo::readFile(clean.worktreePath + QStringLiteral("/blob.bin")), BinaryContent);
}

void WorktreeIsolatorTest::testRemoveUnknownSucceeds()
{
    const auto isolator = newIsolator();
    QVERIFY(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                isolator->remove(QStringLiteral("nothing"), cb);
            }).ok());
}

void WorktreeIsolatorTest::testDiffIncludesCommittedAndUncommitted()
{
    const auto isolator = newIsolator();
    const WorktreeRecord record = createWorktree(*isolator, QStringLiteral("s1"));
    QVERIFY(record.isValid());

    QVERIFY(GitTestRepo::writeFile(record.worktreePath + QStringLiteral("/b.txt"), "committed file\n"));
    QVERIFY(GitTestRepo::commitAll(record.worktreePath, QStringLiteral("Add b")));
    QVERIFY(GitTestRepo::writeFile(record.worktreePath + QStringLiteral("/a.txt"), "line one\nwork in progress\n"));

    bool done = false;
    QString diff;
    isolator->diff(QStringLiteral("s1"), [&](const OperationResult &result, const QString &text) {
        QVERIFY(result.ok());
        diff = text;
        done = true;
    });
    QTRY_VERIFY_WITH_TIMEOUT(done, GitTimeoutMs);
    QVERIFY(diff.contains(QStringLiteral("+committed file")));
    QVERIFY(diff.contains(QStringLiteral("+work in progress")));

    bool missingDone = false;
    isolator->diff(QStringLiteral("missing"), [&](const OperationResult &result, const QString &) {
        QCOMPARE(result.code(), ErrorCode::NotFound);
        missingDone = true;
    });
    QVERIFY(missingDone);
}

void WorktreeIsolatorTest::testCreateBranch()
{
    const auto isolator = newIsolator();
    const WorktreeRecord record = createWorktree(*isolator, QStringLiteral("s1"));
    QVERIFY(record.isValid());

    QVERIFY(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                isolator->createBranch(QStringLiteral("s1"), QStringLiteral("agent/feature"), cb);
            }).ok());

    QCOMPARE(isolator->get(QStringLiteral("s1")).branchName, QStringLiteral("agent/feature"));
    QCOMPARE(GitTestRepo::git(record.worktreePath, {QStringLiteral("rev-parse"), QStringLiteral("--abbrev-ref"), QStringLiteral("HEAD")}), QStringLiteral("agent/feature"));
    QCOMPARE(newIsolator()->get(QStringLiteral("s1")).branchName, QStringLiteral("agent/feature"));
}

void WorktreeIsolatorTest::testOverwriteSyncRoundTrip()
{
    QVERIFY(commitNonUtf8Files(m_repo));
    const auto isolator = newIsolator();
    const WorktreeRecord record = createWorktree(*isolator, QStringLiteral("s1"));
    QVERIFY(record.isValid());

    QVERIFY(GitTestRepo::writeFile(record.worktreePath + QStringLiteral("/c.txt"), "from the agent\n"));
    QVERIFY(GitTestRepo::commitAll(record.worktreePath, QStringLiteral("Agent work")));
    QVERIFY(GitTestRepo::writeFile(record.worktreePath + QStringLiteral("/a.txt"), "line one\nuncommitted agent edit\n"));
    QVERIFY(GitTestRepo::writeFile(record.worktreePath + QStringLiteral("/blob.bin"), BinaryEdited));
    QVERIFY(GitTestRepo::writeFile(record.worktreePath + QStringLiteral("/latin1.txt"), Latin1Edited));

    QVERIFY(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                isolator->syncToLocal(QStringLiteral("s1"), WorktreeIsolator::SyncMode::Overwrite, cb);
            }).ok());

    const QStringList head = {QStringLiteral("rev-parse"), QStringLiteral("HEAD")};
    QCOMPARE(GitTestRepo::git(m_repo, head), GitTestRepo::git(record.worktreePath, head));
    QCOMPARE(GitTestRepo::readFile(m_repo + QStringLiteral("/c.txt")), QByteArray("from the agent\n"));
    QCOMPARE(GitTestRepo::readFile(m_repo + QStringLiteral("/a.txt")), QByteArray("line one\nuncommitted agent edit\n"));
    QCOMPARE(GitTestRepo::readFile(m_repo + QStringLiteral("/blob.bin")), BinaryEdited);
    QCOMPARE(GitTestRepo::readFile(m_repo + QStringLiteral("/latin1.txt")), Latin1Edited);

    QVERIFY(GitTestRepo::writeFile(m_repo + QStringLiteral("/a.txt"), "line one\nedited by hand\n"));
    QVERIFY(GitTestRepo::writeFile(m_repo + QStringLiteral("/blob.bin"), BinaryContent));

    QVERIFY(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                isolator->syncFromLocal(QStringLiteral("s1"), WorktreeIsolator::SyncMode::Overwrite, cb);
            }).ok());

    QCOMPARE(GitTestRepo::git(m_repo, head), GitTestRepo::git(record.worktreePath, head));
    QCOMPARE(GitTestRepo::readFile(record.worktreePath + QStringLiteral("/a.txt")), GitTestRepo::readFile(m_repo + QStringLiteral("/a.txt")));
    QCOMPARE(GitTestRepo::readFile(record.worktreePath + QStringLiteral("/blob.bin")), BinaryContent);
    QCOMPARE(GitTestRepo::readFile(record.worktreePath + QStringLiteral("/latin1.txt")), Latin1Edited);
    QCOMPARE(GitTestRepo::git(m_repo, {QStringLiteral("diff"), QStringLiteral("HEAD")}),
             GitTestRepo::git(record.worktreePath, {QStringLiteral("diff"), QStringLiteral("HEAD")}));
}

void WorktreeIsolatorTest::testApplySyncToLocal()
{
    const auto isolator = newIsolator();
    const WorktreeRecord record = createWorktree(*isolator, QStringLiteral("s1"));
    QVERIFY(record.isValid());

    const QStringList head = {QStringLiteral("rev-parse"), QStringLiteral("HEAD")};
    const QString localHead = GitTestRepo::git(m_repo, head);

    QVERIFY(GitTestRepo::writeFile(record.worktreePath + QStringLiteral("/c.txt"), "from the agent\n"));
    QVERIFY(GitTestRepo::commitAll(record.worktreePath, QStringLiteral("Agent work")));

    QVERIFY(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                isolator->syncToLocal(QStringLiteral("s1"), WorktreeIsolator::SyncMode::Apply, cb);
            }).ok());

    // Changes land in the working tree, history stays put
    QCOMPARE(GitTestRepo::git(m_repo, head), localHead);
    QCOMPARE(GitTestRepo::readFile(m_repo + QStringLiteral("/c.txt")), QByteArray("from the agent\n"));

    QCOMPARE(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                 isolator->syncToLocal(QStringLiteral("missing"), WorktreeIsolator::SyncMode::Apply, cb);
             }).code(),
             ErrorCode::NotFound);
}

void WorktreeIsolatorTest::testApplySyncToLocalKeepsLocalCommits()
{
    const auto isolator = newIsolator();
    const WorktreeRecord record = createWorktree(*isolator, QStringLiteral("s1"));
    QVERIFY(record.isValid());

    // Both sides move on from the base commit
    QVERIFY(GitTestRepo::writeFile(record.worktreePath + QStringLiteral("/c.txt"), "from the agent\n"));
    QVERIFY(GitTestRepo::commitAll(record.worktreePath, QStringLiteral("Agent work")));
    QVERIFY(GitTestRepo::writeFile(record.worktreePath + QStringLiteral("/a.txt"), "line one\nagent in progress\n"));
    QVERIFY(GitTestRepo::writeFile(m_repo + QStringLiteral("/l.txt"), "local commit\n"));
    QVERIFY(GitTestRepo::commitAll(m_repo, QStringLiteral("Local work")));

    const QStringList head = {QStringLiteral("rev-parse"), QStringLiteral("HEAD")};
    const QString localHead = GitTestRepo::git(m_repo, head);

    QVERIFY(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                isolator->syncToLocal(QStringLiteral("s1"), WorktreeIsolator::SyncMode::Apply, cb);
            }).ok());

    QCOMPARE(GitTestRepo::git(m_repo, head), localHead);
    QCOMPARE(GitTestRepo::readFile(m_repo + QStringLiteral("/l.txt")), QByteArray("local commit\n"));
    QCOMPARE(GitTestRepo::readFile(m_repo + QStringLiteral("/c.txt")), QByteArray("from the agent\n"));
    QCOMPARE(GitTestRepo::readFile(m_repo + QStringLiteral("/a.txt")), QByteArray("line one\nagent in progress\n"));
}

void WorktreeIsolatorTest::testApplySyncFromLocal()
{
    const auto isolator = newIsolator();
    const WorktreeRecord record = createWorktree(*isolator, QStringLiteral("s1"));
    QVERIFY(record.isValid());

    QVERIFY(GitTestRepo::writeFile(record.worktreePath + QStringLiteral("/w.txt"), "agent commit\n"));
    QVERIFY(GitTestRepo::commitAll(record.worktreePath, QStringLiteral("Agent work")));
    QVERIFY(GitTestRepo::writeFile(m_repo + QStringLiteral("/d.txt"), "pulled in\n"));
    QVERIFY(GitTestRepo::commitAll(m_repo, QStringLiteral("Local work")));
    QVERIFY(GitTestRepo::writeFile(m_repo + QStringLiteral("/a.txt"), "line one\nlocal edit\n"));

    const QStringList head = {QStringLiteral("rev-parse"), QStringLiteral("HEAD")};
    const QString worktreeHead = GitTestRepo::git(record.worktreePath, head);

    QVERIFY(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                isolator->syncFromLocal(QStringLiteral("s1"), WorktreeIsolator::SyncMode::Apply, cb);
            }).ok());

    QCOMPARE(GitTestRepo::git(record.worktreePath, head), worktreeHead);
    QCOMPARE(GitTestRepo::readFile(record.worktreePath + QStringLiteral("/w.txt")), QByteArray("agent commit\n"));
    QCOMPARE(GitTestRepo::readFile(record.worktreePath + QStringLiteral("/d.txt")), QByteArray("pulled in\n"));
    QCOMPARE(GitTestRepo::readFile(record.worktreePath + QStringLiteral("/a.txt")), QByteArray("line one\nlocal edit\n"));

    // The local checkout is only read
    QCOMPARE(GitTestRepo::readFile(m_repo + QStringLiteral("/a.txt")), QByteArray("line one\nlocal edit\n"));
    QVERIFY(!QFileInfo::exists(m_repo + QStringLiteral("/w.txt")));
}

void WorktreeIsolatorTest::testRemoveFallsBackToDeletion()
{
    const auto isolator = newIsolator();
    QSignalSpy removed(isolator.get(), &WorktreeIsolator::worktreeRemoved);
    const WorktreeRecord record = createWorktree(*isolator, QStringLiteral("s1"));
    QVERIFY(record.isValid());

    // git refuses to remove a checkout whose .git file points elsewhere
    QVERIFY(GitTestRepo::writeFile(record.worktreePath + QStringLiteral("/.git"), "gitdir: /nonexistent/worktrees/s1\n"));

    QVERIFY(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                isolator->remove(QStringLiteral("s1"), cb);
            }).ok());

    QCOMPARE(removed.count(), 1);
    QVERIFY(!QFileInfo::exists(record.worktreePath));
    QVERIFY(!isolator->get(QStringLiteral("s1")).isValid());
    QVERIFY(newIsolator()->all().isEmpty());
    QTRY_VERIFY_WITH_TIMEOUT(!GitTestRepo::git(m_repo, {QStringLiteral("worktree"), QStringLiteral("list")}).contains(record.worktreePath), GitTimeoutMs);
}

void WorktreeIsolatorTest::testRegistryReloadDropsMissing()
{
    WorktreeRecord kept;
    WorktreeRecord lost;
    {
        const auto isolator = newIsolator();
        kept = createWorktree(*isolator, QStringLiteral("kept"));
        lost = createWorktree(*isolator, QStringLiteral("lost"));
        QVERIFY(kept.isValid());
        QVERIFY(lost.isValid());
    }

    QVERIFY(QDir(lost.worktreePath).removeRecursively());

    const auto reloaded = newIsolator();
    QCOMPARE(reloaded->all().size(), 1);
    QCOMPARE(reloaded->all().first().sessionId, QStringLiteral("kept"));
    QCOMPARE(reloaded->get(QStringLiteral("kept")).baseCommit, kept.baseCommit);

    const QJsonObject root = QJsonDocument::fromJson(GitTestRepo::readFile(m_registry)).object();
    QCOMPARE(root.value(QStringLiteral("version")).toInt(), 1);
    QCOMPARE(root.value(QStringLiteral("worktrees")).toArray().size(), 1);
}

void WorktreeIsolatorTest::testCleanupAllRemovesOrphans()
{
    const auto isolator = newIsolator();
    const WorktreeRecord record = createWorktree(*isolator, QStringLiteral("s1"));
    QVERIFY(record.isValid());

    const QString orphan = isolator->worktreePathFor(m_repo, QStringLiteral("crashed"));
    const QString strayProject = m_base + QStringLiteral("/0123456789ab/old");
    QVERIFY(GitTestRepo::writeFile(orphan + QStringLiteral("/leftover.txt"), "x"));
    QVERIFY(GitTestRepo::writeFile(strayProject + QStringLiteral("/leftover.txt"), "x"));

    QVERIFY(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                isolator->cleanupAll(cb);
            }).ok());

    QVERIFY(!QFileInfo::exists(orphan));
    QVERIFY(!QFileInfo::exists(m_base + QStringLiteral("/0123456789ab")));
    QVERIFY(QFileInfo::exists(record.worktreePath + QStringLiteral("/a.txt")));
    QCOMPARE(isolator->all().size(), 1);
}

void WorktreeIsolatorTest::testCleanupAllSparesWorktreeBeingCreated()
{
    QVERIFY(GitTestRepo::writeFile(m_repo + QStringLiteral("/a.txt"), "line one\nchanged locally\n"));

    const auto isolator = newIsolator();
    const QString path = isolator->worktreePathFor(m_repo, QStringLiteral("s1"));

    // Sweep once the checkout is on disk but before create() has registered it
    bool swept = false;
    connect(isolator->gitRunner(), &GitRunner::commandFinished, this, [&](const QStringList &args, bool ok) {
        if (swept || !ok || args.value(0) != QLatin1String("worktree") || args.value(1) != QLatin1String("add")) {
            return;
        }
        swept = true;
        QVERIFY(QFileInfo::exists(path));
        QVERIFY(!isolator->get(QStringLiteral("s1")).isValid());
        isolator->cleanupAll();
    });

    const WorktreeRecord record = createWorktree(*isolator, QStringLiteral("s1"), true);
    QVERIFY(swept);
    QVERIFY(record.isValid());
    QCOMPARE(record.worktreePath, path);
    QCOMPARE(GitTestRepo::readFile(path + QStringLiteral("/a.txt")), QByteArray("line one\nchanged locally\n"));

    // Once registered, later sweeps keep it as well
    QVERIFY(waitFor([&](const WorktreeIsolator::ResultCallback &cb) {
                isolator->cleanupAll(cb);
            }).ok());
    QVERIFY(QFileInfo::exists(path + QStringLiteral("/a.txt")));
}

QTEST_GUILESS_MAIN(WorktreeIsolatorTest)

#include "moc_WorktreeIsolatorTest.cpp"
