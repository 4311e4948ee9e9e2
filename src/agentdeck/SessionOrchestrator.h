/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONORCHESTRATOR_H
#define SESSIONORCHESTRATOR_H

#include "agentdeck_export.h"

#include "AgentProcess.h"
#include "OperationResult.h"
#include "OrchestratorConfig.h"
#include "TurnRunner.h"
#include "WorktreeRecord.h"

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

#include <functional>

namespace Agentdeck
{

class EventBroadcaster;
class SessionLogTail;
class TitleGenerator;
class WorktreeIsolator;

/**
 * Snapshot returned by SessionOrchestrator::getStatus()
 */
struct AGENTDECK_EXPORT SessionStatus {
    QString sessionId; // empty for unknown sessions
    QString projectPath;
    bool isRunning = false;
    bool hasCompletedFirstTurn = false;
    AgentProcess::State state = AgentProcess::State::Idle;

    // Agent store holds a conversation for this identity
    bool hasSession() const { return hasCompletedFirstTurn; }

    QJsonObject toJson() const;
};

struct AGENTDECK_EXPORT WorktreeStartOptions {
    QString baseBranch;
    bool includeChanges = false;
};

/**
 * One side of a fork
 */
struct AGENTDECK_EXPORT ForkBranch {
    QString sessionId; // identity of the copied transcript
    QString worktreePath;
    QString worktreeSessionId; // key of the worktree record

    QJsonObject toJson() const;
};

struct AGENTDECK_EXPORT ForkResult {
    ForkBranch forkA;
    ForkBranch forkB;
};

/**
 * SessionOrchestrator multiplexes all agent sessions of the application.
 *
 * It owns one AgentProcess per session id and fans their events out to every
 * registered EventChannel. Text deltas are coalesced per session: they are
 * buffered and delivered as one "agent:events" batch on the next event loop
 * iteration, or as soon as the batch cap is reached. Any other event first
 * flushes the pending deltas, so observers always see production order.
 *
 * After a turn closes the orchestrator broadcasts a notification and, once
 * per session, asks the TitleGenerator for a title.
 *
 * Lifecycle: construct, init(), use, destroy(). Operations before init()
 * fail with InvalidState.
 */
class AGENTDECK_EXPORT SessionOrchestrator : public QObject
{
    Q_OBJECT

public:
    using StartCallback = std::function<void(const OperationResult &, const QString &sessionId, const WorktreeRecord &)>;
    using ForkCallback = std::function<void(const OperationResult &, const ForkResult &)>;

    explicit SessionOrchestrator(const OrchestratorConfig &config = OrchestratorConfig(), QObject *parent = nullptr);
    ~SessionOrchestrator() override;

    /**
     * Replace the execution unit used for agent and title turns.
     * The default runs the Claude CLI.
     */
    void setRunnerFactory(const TurnRunnerFactory &factory);

    void init();
    void destroy();
    bool isInitialized() const { return m_initialized; }

    const OrchestratorConfig &config() const { return m_config; }

    EventBroadcaster *broadcaster() const { return m_broadcaster; }
    TitleGenerator *titleGenerator() const { return m_titleGenerator; }
    WorktreeIsolator *worktrees() const { return m_worktrees; }
    SessionLogTail *logTail() const { return m_logTail; }

    /**
     * Create a session and run its first turn. The new id is written to
     * sessionId on success.
     */
    OperationResult startAgent(const AgentProcessOptions &options, const QString &prompt, QString *sessionId = nullptr);

    /**
     * Create an isolated worktree, then start the session inside it. A
     * worktree failure aborts the start.
     */
    void startAgentInWorktree(const AgentProcessOptions &options, const QString &prompt, const WorktreeStartOptions &worktreeOptions, const StartCallback &callback);

    /**
     * Continue a session that exists in the agent's store, for example one
     * restored after a restart
     */
    OperationResult resumeAgent(const QString &sessionId, const QString &projectPath, const QString &model, const QString &message);

    OperationResult sendMessage(const QString &sessionId, const QString &content);
    OperationResult setModel(const QString &sessionId, const QString &model);

    /**
     * Stop one session, or every session when sessionId is empty
     */
    OperationResult stopAgent(const QString &sessionId = QString());

    SessionStatus getStatus(const QString &sessionId) const;
    QStringList sessionIds() const { return m_agents.keys(); }
    AgentProcess *agent(const QString &sessionId) const { return m_agents.value(sessionId); }

    /**
     * Split a session into two new ones, each in its own worktree and each
     * seeded with a copy of the parent's transcript. knownLogId names the
     * transcript when it differs from the session id.
     */
    void fork(const QString &sessionId, const QString &projectPath, const QString &knownLogId, const ForkCallback &callback);

    /**
     * Tool bridge server map for a turn in projectPath, empty when the bridge
     * is not configured
     */
    QJsonObject buildMcpServers(const QString &projectPath) const;

    int pendingDeltaCount(const QString &sessionId) const { return m_deltaBuffers.value(sessionId).size(); }

    static const QString BridgeServerName;
    static const QString BridgeSystemPrompt;

Q_SIGNALS:
    void sessionStarted(const QString &sessionId);
    void sessionRemoved(const QString &sessionId);
    void filesChanged(const QString &projectPath);

private:
    AgentProcess *createAgent(const AgentProcessOptions &options);
    void wireEvents(AgentProcess *agent);
    void removeAgent(const QString &sessionId);

    void onAgentEvent(const QString &sessionId, const TurnEvent &event);
    void onAgentClosed(const QString &sessionId, int exitCode);
    void onAgentError(const QString &sessionId, const QString &message);
    void flushDeltas(const QString &sessionId);

    void createForkWorktrees(const QString &projectPath, const QByteArray &transcript, const QString &sideDirectory, const QString &model, const ForkCallback &callback);
    OperationResult seedForkTranscript(const ForkBranch &branch, const QByteArray &transcript, const QString &sideDirectory) const;

    void wireLogTail();

    OrchestratorConfig m_config;
    TurnRunnerFactory m_runnerFactory;
    bool m_initialized = false;

    EventBroadcaster *m_broadcaster = nullptr;
    TitleGenerator *m_titleGenerator = nullptr;
    WorktreeIsolator *m_worktrees = nullptr;
    SessionLogTail *m_logTail = nullptr;

    QHash<QString, AgentProcess *> m_agents;
    QHash<QString, QJsonArray> m_deltaBuffers;
    QSet<QString> m_flushScheduled;
    QHash<QString, QString> m_initialPrompts;
    QSet<QString> m_titleRequested;
};

} // namespace Agentdeck

#endif // SESSIONORCHESTRATOR_H
