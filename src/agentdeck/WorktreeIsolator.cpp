/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "WorktreeIsolator.h"
#include "GitRunner.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>
#include <QStandardPaths>

#include <algorithm>
#include <memory>

namespace Agentdeck
{

static OperationResult gitFailure(const QString &what, const GitResult &result)
{
    return OperationResult(ErrorCode::Git, QStringLiteral("%1: %2").arg(what, result.errorOutput.trimmed()));
}

static OperationResult worktreeNotFound(const QString &sessionId)
{
    return OperationResult(ErrorCode::NotFound, QStringLiteral("Worktree not found: %1").arg(sessionId));
}

WorktreeIsolator::WorktreeIsolator(const QString &baseDirectory, const QString &registryFile, QObject *parent)
    : QObject(parent)
    , m_baseDirectory(baseDirectory.isEmpty() ? defaultBaseDirectory() : QDir::cleanPath(baseDirectory))
    , m_registryFile(registryFile.isEmpty() ? defaultRegistryFile() : registryFile)
    , m_git(new GitRunner(this))
{
    QDir().mkpath(m_baseDirectory);
    loadRegistry();
}

WorktreeIsolator::~WorktreeIsolator() = default;

QString WorktreeIsolator::defaultBaseDirectory()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + QStringLiteral("/worktrees");
}

QString WorktreeIsolator::defaultRegistryFile()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + QStringLiteral("/worktree-registry.json");
}

QString WorktreeIsolator::projectHash(const QString &projectPath)
{
    const QByteArray digest = QCryptographicHash::hash(projectPath.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(digest.toHex().left(12));
}

QString WorktreeIsolator::worktreePathFor(const QString &projectPath, const QString &sessionId) const
{
    return m_baseDirectory + QLatin1Char('/') + projectHash(projectPath) + QLatin1Char('/') + sessionId;
}

void WorktreeIsolator::create(const WorktreeCreateOptions &options, const CreateCallback &callback)
{
    if (options.projectPath.isEmpty() || options.sessionId.isEmpty()) {
        callback(OperationResult(ErrorCode::InvalidState, QStringLiteral("Worktree needs a project path and a session id")), WorktreeRecord());
        return;
    }
    if (get(options.sessionId).isValid()) {
        callback(OperationResult(ErrorCode::InvalidState, QStringLiteral("Worktree already exists for %1").arg(options.sessionId)), WorktreeRecord());
        return;
    }

    const QString worktreePath = worktreePathFor(options.projectPath, options.sessionId);
    if (m_pendingPaths.contains(QDir::cleanPath(worktreePath))) {
        callback(OperationResult(ErrorCode::AlreadyRunning, QStringLiteral("Worktree for %1 is being created").arg(options.sessionId)), WorktreeRecord());
        return;
    }
    QDir().mkpath(QFileInfo(worktreePath).absolutePath());

    // Not registered until create() finishes; the orphan sweep must leave it alone
    m_pendingPaths.insert(QDir::cleanPath(worktreePath));

    const QString revision = options.baseBranch.isEmpty() ? QStringLiteral("HEAD") : options.baseBranch;

    m_git->run(options.projectPath, {QStringLiteral("rev-parse"), revision}, [this, options, worktreePath, callback](const GitResult &revParse) {
        if (!revParse.ok) {
            m_pendingPaths.remove(QDir::cleanPath(worktreePath));
            callback(gitFailure(QStringLiteral("Cannot resolve base commit"), revParse), WorktreeRecord());
            return;
        }
        const QString baseCommit = revParse.trimmedOutput();

        const QStringList addArgs = {QStringLiteral("worktree"), QStringLiteral("add"), QStringLiteral("--detach"), worktreePath, baseCommit};
        m_git->run(options.projectPath, addArgs, [this, options, worktreePath, baseCommit, callback](const GitResult &add) {
            if (!add.ok) {
                m_pendingPaths.remove(QDir::cleanPath(worktreePath));
                callback(gitFailure(QStringLiteral("git worktree add failed"), add), WorktreeRecord());
                return;
            }

            auto finish = [this, options, worktreePath, baseCommit, callback]() {
                auto registerRecord = [this, options, worktreePath, baseCommit, callback](const QString &branch) {
                    WorktreeRecord record;
                    record.sessionId = options.sessionId;
                    record.projectPath = options.projectPath;
                    record.worktreePath = worktreePath;
                    record.baseBranch = branch;
                    record.baseCommit = baseCommit;
                    record.createdAt = QDateTime::currentDateTime();

                    m_pendingPaths.remove(QDir::cleanPath(worktreePath));
                    m_records.append(record);
                    saveRegistry();

                    qDebug() << "WorktreeIsolator: Created worktree" << worktreePath << "at" << baseCommit.left(12);
                    Q_EMIT worktreeCreated(record);
                    callback(OperationResult::success(), record);
                };

                if (!options.baseBranch.isEmpty()) {
                    registerRecord(options.baseBranch);
                    return;
                }

                m_git->run(options.projectPath,
                           {QStringLiteral("rev-parse"), QStringLiteral("--abbrev-ref"), QStringLiteral("HEAD")},
                           [registerRecord](const GitResult &branch) {
                               const QString name = branch.trimmedOutput();
                               registerRecord(branch.ok && name != QLatin1String("HEAD") ? name : QString());
                           });
            };

            if (options.includeChanges) {
                captureChanges(options.projectPath, worktreePath, finish);
            } else {
                finish();
            }
        });
    });
}

void WorktreeIsolator::captureChanges(const QString &projectPath, const QString &worktreePath, const std::function<void()> &done)
{
    // stash create builds the commit without touching the stash list
    m_git->run(projectPath, {QStringLiteral("stash"), QStringLiteral("create")}, [this, projectPath, worktreePath, done](const GitResult &stash) {
        const QString stashCommit = stash.trimmedOutput();
        if (!stash.ok || stashCommit.isEmpty()) {
            if (!stash.ok) {
                qWarning() << "WorktreeIsolator: Failed to capture uncommitted changes:" << stash.errorOutput.trimmed();
            }
            done();
            return;
        }

        const QStringList diffArgs = {QStringLiteral("diff"), QStringLiteral("--binary"), stashCommit + QStringLiteral("^1"), stashCommit};
        m_git->run(projectPath, diffArgs, [this, worktreePath, done](const GitResult &diff) {
            if (!diff.ok || diff.output.trimmed().isEmpty()) {
                done();
                return;
            }

            const QByteArray patch = diff.output;
            applyPatch(worktreePath, patch, true, [this, worktreePath, patch, done](const OperationResult &threeWay) {
                if (threeWay.ok()) {
                    done();
                    return;
                }
                applyPatch(worktreePath, patch, false, [done](const OperationResult &plain) {
                    if (!plain.ok()) {
                        qWarning() << "WorktreeIsolator: Could not apply uncommitted changes:" << plain.message();
                    }
                    done();
                });
            });
        });
    });
}

void WorktreeIsolator::applyPatch(const QString &directory, const QByteArray &patch, bool threeWay, const ResultCallback &callback)
{
    QStringList args = {QStringLiteral("apply")};
    if (threeWay) {
        args << QStringLiteral("--3way");
    }
    args << QStringLiteral("-");

    m_git->run(
        directory,
        args,
        [callback](const GitResult &result) {
            if (result.ok) {
                callback(OperationResult::success());
            } else {
                callback(OperationResult(ErrorCode::Apply, QStringLiteral("git apply failed: %1").arg(result.errorOutput.trimmed())));
            }
        },
        patch);
}

void WorktreeIsolator::remove(const QString &sessionId, const ResultCallback &callback)
{
    const WorktreeRecord record = get(sessionId);
    if (!record.isValid()) {
        callback(OperationResult::success());
        return;
    }

    const QStringList args = {QStringLiteral("worktree"), QStringLiteral("remove"), QStringLiteral("--force"), record.worktreePath};
    m_git->run(record.projectPath, args, [this, record, callback](const GitResult &result) {
        OperationResult outcome;
        if (!result.ok) {
            qWarning() << "WorktreeIsolator: git worktree remove failed, deleting" << record.worktreePath;
            QDir dir(record.worktreePath);
            if (dir.exists() && !dir.removeRecursively()) {
                qWarning() << "WorktreeIsolator: Failed to remove worktree directory" << record.worktreePath;
                outcome = OperationResult(ErrorCode::Io, QStringLiteral("Could not delete %1").arg(record.worktreePath));
            }
            // Drop git's reference to the deleted checkout
            m_git->run(record.projectPath, {QStringLiteral("worktree"), QStringLiteral("prune")}, GitRunner::Callback());
        }

        forgetRecord(record.sessionId);
        qDebug() << "WorktreeIsolator: Removed worktree" << record.worktreePath;
        Q_EMIT worktreeRemoved(record.sessionId);
        callback(outcome);
    });
}

void WorktreeIsolator::forgetRecord(const QString &sessionId)
{
    for (int i = m_records.size() - 1; i >= 0; --i) {
        if (m_records.at(i).sessionId == sessionId) {
            m_records.removeAt(i);
        }
    }
    saveRegistry();
}

QList<WorktreeRecord> WorktreeIsolator::list(const QString &projectPath) const
{
    QList<WorktreeRecord> records;
    for (const WorktreeRecord &record : m_records) {
        if (record.projectPath == projectPath) {
            records.append(record);
        }
    }
    return records;
}

WorktreeRecord WorktreeIsolator::get(const QString &sessionId) const
{
    for (const WorktreeRecord &record : m_records) {
        if (record.sessionId == sessionId) {
            return record;
        }
    }
    return WorktreeRecord();
}

WorktreeRecord WorktreeIsolator::findByWorktreePath(const QString &worktreePath) const
{
    const QString cleaned = QDir::cleanPath(worktreePath);
    for (const WorktreeRecord &record : m_records) {
        if (QDir::cleanPath(record.worktreePath) == cleaned) {
            return record;
        }
    }
    return WorktreeRecord();
}

void WorktreeIsolator::createBranch(const QString &sessionId, const QString &branchName, const ResultCallback &callback)
{
    const WorktreeRecord record = get(sessionId);
    if (!record.isValid()) {
        callback(worktreeNotFound(sessionId));
        return;
    }

    m_git->run(record.worktreePath, {QStringLiteral("checkout"), QStringLiteral("-b"), branchName}, [this, sessionId, branchName, callback](const GitResult &result) {
        if (!result.ok) {
            callback(gitFailure(QStringLiteral("Cannot create branch %1").arg(branchName), result));
            return;
        }
        for (WorktreeRecord &record : m_records) {
            if (record.sessionId == sessionId) {
                record.branchName = branchName;
            }
        }
        saveRegistry();
        callback(OperationResult::success());
    });
}

void WorktreeIsolator::diff(const QString &sessionId, const DiffCallback &callback)
{
    const WorktreeRecord record = get(sessionId);
    if (!record.isValid()) {
        callback(worktreeNotFound(sessionId), QString());
        return;
    }

    m_git->run(record.worktreePath, {QStringLiteral("diff"), record.baseCommit, QStringLiteral("HEAD")}, [this, record, callback](const GitResult &committed) {
        if (!committed.ok) {
            callback(gitFailure(QStringLiteral("git diff failed"), committed), QString());
            return;
        }
        m_git->run(record.worktreePath, {QStringLiteral("diff"), QStringLiteral("HEAD")}, [committed, callback](const GitResult &uncommitted) {
            if (!uncommitted.ok) {
                callback(gitFailure(QStringLiteral("git diff failed"), uncommitted), QString());
                return;
            }
            QString combined = committed.text();
            if (!uncommitted.output.isEmpty()) {
                combined += QLatin1Char('\n') + uncommitted.text();
            }
            callback(OperationResult::success(), combined);
        });
    });
}

void WorktreeIsolator::syncToLocal(const QString &sessionId, SyncMode mode, const ResultCallback &callback)
{
    sync(sessionId, mode, true, callback);
}

void WorktreeIsolator::syncFromLocal(const QString &sessionId, SyncMode mode, const ResultCallback &callback)
{
    sync(sessionId, mode, false, callback);
}

void WorktreeIsolator::sync(const QString &sessionId, SyncMode mode, bool toLocal, const ResultCallback &callback)
{
    const WorktreeRecord record = get(sessionId);
    if (!record.isValid()) {
        callback(worktreeNotFound(sessionId));
        return;
    }

    const QString source = toLocal ? record.worktreePath : record.projectPath;
    const QString destination = toLocal ? record.projectPath : record.worktreePath;

    qDebug() << "WorktreeIsolator: Sync" << (toLocal ? "to local" : "from local") << "for" << sessionId
             << (mode == SyncMode::Overwrite ? "(overwrite)" : "(apply)");

    if (mode == SyncMode::Overwrite) {
        syncOverwrite(source, destination, callback);
    } else {
        syncApply(record, source, destination, callback);
    }
}

void WorktreeIsolator::syncOverwrite(const QString &source, const QString &destination, const ResultCallback &callback)
{
    m_git->run(source, {QStringLiteral("rev-parse"), QStringLiteral("HEAD")}, [this, source, destination, callback](const GitResult &head) {
        if (!head.ok) {
            callback(gitFailure(QStringLiteral("Cannot resolve source HEAD"), head));
            return;
        }
        const QStringList resetArgs = {QStringLiteral("reset"), QStringLiteral("--hard"), head.trimmedOutput()};
        m_git->run(destination, resetArgs, [this, source, destination, callback](const GitResult &reset) {
            if (!reset.ok) {
                callback(gitFailure(QStringLiteral("git reset failed"), reset));
                return;
            }
            applyUncommitted(source, destination, false, callback);
        });
    });
}

void WorktreeIsolator::syncApply(const WorktreeRecord &record, const QString &source, const QString &destination, const ResultCallback &callback)
{
    m_git->run(source, {QStringLiteral("rev-parse"), QStringLiteral("HEAD")}, [this, record, source, destination, callback](const GitResult &sourceHead) {
        if (!sourceHead.ok) {
            callback(gitFailure(QStringLiteral("Cannot resolve source HEAD"), sourceHead));
            return;
        }
        const QString sourceTip = sourceHead.trimmedOutput();

        m_git->run(destination, {QStringLiteral("rev-parse"), QStringLiteral("HEAD")}, [this, record, source, destination, sourceTip, callback](const GitResult &destHead) {
            if (!destHead.ok) {
                callback(gitFailure(QStringLiteral("Cannot resolve destination HEAD"), destHead));
                return;
            }

            const QStringList mergeBaseArgs = {QStringLiteral("merge-base"), destHead.trimmedOutput(), sourceTip};
            m_git->run(record.projectPath, mergeBaseArgs, [this, record, source, destination, sourceTip, callback](const GitResult &mergeBase) {
                const QString base = mergeBase.ok && !mergeBase.trimmedOutput().isEmpty() ? mergeBase.trimmedOutput() : record.baseCommit;

                m_git->run(source, {QStringLiteral("diff"), QStringLiteral("--binary"), base, sourceTip}, [this, source, destination, callback](const GitResult &committed) {
                    if (!committed.ok) {
                        callback(gitFailure(QStringLiteral("git diff failed"), committed));
                        return;
                    }

                    auto thenUncommitted = [this, source, destination, callback](const OperationResult &applied) {
                        if (!applied.ok()) {
                            callback(applied);
                            return;
                        }
                        applyUncommitted(source, destination, true, callback);
                    };

                    if (committed.output.trimmed().isEmpty()) {
                        thenUncommitted(OperationResult::success());
                    } else {
                        applyPatch(destination, committed.output, true, thenUncommitted);
                    }
                });
            });
        });
    });
}

void WorktreeIsolator::applyUncommitted(const QString &source, const QString &destination, bool threeWay, const ResultCallback &callback)
{
    m_git->run(source, {QStringLiteral("diff"), QStringLiteral("--binary"), QStringLiteral("HEAD")}, [this, destination, threeWay, callback](const GitResult &uncommitted) {
        if (!uncommitted.ok) {
            callback(gitFailure(QStringLiteral("git diff failed"), uncommitted));
            return;
        }
        if (uncommitted.output.trimmed().isEmpty()) {
            callback(OperationResult::success());
            return;
        }
        applyPatch(destination, uncommitted.output, threeWay, callback);
    });
}

void WorktreeIsolator::cleanupAll(const ResultCallback &callback)
{
    QSet<QString> projects;
    for (const WorktreeRecord &record : std::as_const(m_records)) {
        projects.insert(record.projectPath);
    }

    auto remaining = std::make_shared<int>(projects.size());
    auto finish = [this, callback]() {
        removeOrphanDirectories();
        if (callback) {
            callback(OperationResult::success());
        }
    };

    if (projects.isEmpty()) {
        finish();
        return;
    }

    for (const QString &projectPath : std::as_const(projects)) {
        m_git->run(projectPath, {QStringLiteral("worktree"), QStringLiteral("prune")}, [projectPath, remaining, finish](const GitResult &result) {
            if (!result.ok) {
                qWarning() << "WorktreeIsolator: Failed to prune worktrees for" << projectPath << result.errorOutput.trimmed();
            }
            if (--(*remaining) == 0) {
                finish();
            }
        });
    }
}

void WorktreeIsolator::removeOrphanDirectories()
{
    QSet<QString> registered;
    for (const WorktreeRecord &record : std::as_const(m_records)) {
        registered.insert(QDir::cleanPath(record.worktreePath));
    }

    const QDir base(m_baseDirectory);
    const QFileInfoList hashDirs = base.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QFileInfo &hashDir : hashDirs) {
        QDir projectDir(hashDir.absoluteFilePath());
        const QFileInfoList worktrees = projectDir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden);
        for (const QFileInfo &worktree : worktrees) {
            const QString path = QDir::cleanPath(worktree.absoluteFilePath());
            if (registered.contains(path) || m_pendingPaths.contains(path)) {
                continue;
            }
            qDebug() << "WorktreeIsolator: Removing orphaned worktree directory" << path;
            if (!QDir(path).removeRecursively()) {
                qWarning() << "WorktreeIsolator: Failed to remove" << path;
            }
        }

        const bool awaitingWorktree = std::any_of(m_pendingPaths.cbegin(), m_pendingPaths.cend(), [&projectDir](const QString &pending) {
            return QFileInfo(pending).absolutePath() == QDir::cleanPath(projectDir.absolutePath());
        });
        if (!awaitingWorktree && projectDir.isEmpty(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden)) {
            projectDir.removeRecursively();
        }
    }
}

void WorktreeIsolator::loadRegistry()
{
    QFile file(m_registryFile);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        return;
    }

    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "WorktreeIsolator: Failed to load registry" << m_registryFile << error.errorString();
        return;
    }

    const QJsonArray worktrees = doc.object().value(QStringLiteral("worktrees")).toArray();
    bool dropped = false;
    for (const QJsonValue &value : worktrees) {
        const WorktreeRecord record = WorktreeRecord::fromJson(value.toObject());
        if (!record.isValid()) {
            continue;
        }
        // Worktrees deleted behind our back are forgotten
        if (!QFileInfo::exists(record.worktreePath)) {
            dropped = true;
            continue;
        }
        m_records.append(record);
    }

    if (dropped) {
        saveRegistry();
    }
}

void WorktreeIsolator::saveRegistry()
{
    QDir().mkpath(QFileInfo(m_registryFile).absolutePath());

    QFile file(m_registryFile);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "WorktreeIsolator: Failed to save registry" << m_registryFile << file.errorString();
        return;
    }

    QJsonArray worktrees;
    for (const WorktreeRecord &record : std::as_const(m_records)) {
        worktrees.append(record.toJson());
    }

    QJsonObject root;
    root[QStringLiteral("version")] = 1;
    root[QStringLiteral("worktrees")] = worktrees;

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    file.close();
}

} // namespace Agentdeck

#include "moc_WorktreeIsolator.cpp"
