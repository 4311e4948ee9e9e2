/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionOrchestrator.h"
#include "CliTurnRunner.h"
#include "EventBroadcaster.h"
#include "SessionLogTail.h"
#include "TitleGenerator.h"
#include "WorktreeIsolator.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QTimer>
#include <QUuid>

namespace Agentdeck
{

const QString SessionOrchestrator::BridgeServerName = QStringLiteral("agentdeck-bridge");

const QString SessionOrchestrator::BridgeSystemPrompt = QStringLiteral(
    "You are running inside Agentdeck, a desktop IDE. You have MCP tools for the IDE's terminal and browser panels. "
    "Terminal commands and browser navigation are visible to the user in real-time. "
    "Use terminal_execute to run commands and terminal_read to check output. "
    "Use browser_navigate, browser_content, and browser_screenshot to interact with web pages.");

static QString newIdentity()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

static bool copyDirectory(const QString &source, const QString &destination)
{
    const QDir sourceDir(source);
    if (!QDir().mkpath(destination)) {
        return false;
    }

    bool ok = true;
    QDirIterator it(source, QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        const QFileInfo info = it.fileInfo();
        const QString target = destination + QLatin1Char('/') + sourceDir.relativeFilePath(path);
        if (info.isDir()) {
            ok = QDir().mkpath(target) && ok;
        } else {
            QDir().mkpath(QFileInfo(target).absolutePath());
            QFile::remove(target);
            ok = QFile::copy(path, target) && ok;
        }
    }
    return ok;
}

QJsonObject SessionStatus::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("sessionId")] = sessionId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(sessionId);
    obj[QStringLiteral("projectPath")] = projectPath.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(projectPath);
    obj[QStringLiteral("isRunning")] = isRunning;
    obj[QStringLiteral("hasCompletedFirstTurn")] = hasCompletedFirstTurn;
    obj[QStringLiteral("hasSession")] = hasSession();
    return obj;
}

QJsonObject ForkBranch::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("sessionId")] = sessionId;
    obj[QStringLiteral("worktreePath")] = worktreePath;
    obj[QStringLiteral("worktreeSessionId")] = worktreeSessionId;
    return obj;
}

SessionOrchestrator::SessionOrchestrator(const OrchestratorConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
{
    const QString executable = m_config.executable;
    const int gracePeriod = m_config.stopGracePeriodMs;
    m_runnerFactory = [executable, gracePeriod](QObject *runnerParent) -> TurnRunner * {
        auto *runner = new CliTurnRunner(executable, runnerParent);
        runner->setGracePeriod(gracePeriod);
        return runner;
    };

    m_broadcaster = new EventBroadcaster(this);

    m_titleGenerator = new TitleGenerator(
        [this](QObject *runnerParent) {
            return m_runnerFactory(runnerParent);
        },
        this);
    if (!m_config.titleModel.isEmpty()) {
        m_titleGenerator->setModel(m_config.titleModel);
    }

    m_worktrees = new WorktreeIsolator(m_config.worktreeBaseDirectory, m_config.worktreeRegistryFile, this);

    m_logTail = new SessionLogTail(TranscriptLocator(m_config.transcriptRoot), this);
    m_logTail->setTimings(m_config.logTail);

    connect(m_titleGenerator, &TitleGenerator::titleReady, this, [this](const QString &sessionId, const QString &title) {
        QJsonObject payload;
        payload[QStringLiteral("sessionId")] = sessionId;
        payload[QStringLiteral("title")] = title;
        m_broadcaster->send(QStringLiteral("agent:title"), payload);
    });

    wireLogTail();
}

SessionOrchestrator::~SessionOrchestrator()
{
    destroy();
}

void SessionOrchestrator::setRunnerFactory(const TurnRunnerFactory &factory)
{
    m_runnerFactory = factory;
}

void SessionOrchestrator::init()
{
    if (m_initialized) {
        return;
    }
    m_initialized = true;

    qDebug() << "SessionOrchestrator: Initialized, bridge" << (buildMcpServers(QDir::homePath()).isEmpty() ? "disabled" : "enabled");

    // Worktrees left behind by an unclean shutdown
    m_worktrees->cleanupAll([](const OperationResult &result) {
        if (!result.ok()) {
            qWarning() << "SessionOrchestrator: Worktree cleanup failed:" << result.message();
        }
    });
}

void SessionOrchestrator::destroy()
{
    if (!m_initialized && m_agents.isEmpty()) {
        return;
    }
    m_initialized = false;

    const QStringList ids = m_agents.keys();
    for (const QString &sessionId : ids) {
        flushDeltas(sessionId);
    }

    for (AgentProcess *agent : std::as_const(m_agents)) {
        agent->disconnect(this);
        agent->stop();
        delete agent;
    }
    m_agents.clear();
    m_deltaBuffers.clear();
    m_flushScheduled.clear();
    m_initialPrompts.clear();
    m_titleRequested.clear();

    m_logTail->unwatchAll();
    qDebug() << "SessionOrchestrator: Destroyed";
}

QJsonObject SessionOrchestrator::buildMcpServers(const QString &projectPath) const
{
    if (m_config.bridgePort <= 0 || m_config.bridgeToken.isEmpty()) {
        return QJsonObject();
    }

    if (m_config.bridgeServerScript.isEmpty() || !QFileInfo::exists(m_config.bridgeServerScript)) {
        qWarning() << "SessionOrchestrator: MCP server script not found:" << m_config.bridgeServerScript;
        return QJsonObject();
    }

    QJsonObject env;
    env[QStringLiteral("AGENTDECK_BRIDGE_PORT")] = QString::number(m_config.bridgePort);
    env[QStringLiteral("AGENTDECK_BRIDGE_TOKEN")] = m_config.bridgeToken;
    env[QStringLiteral("AGENTDECK_PROJECT_PATH")] = projectPath;

    QJsonObject server;
    server[QStringLiteral("command")] = QStringLiteral("node");
    server[QStringLiteral("args")] = QJsonArray{m_config.bridgeServerScript};
    server[QStringLiteral("env")] = env;

    QJsonObject servers;
    servers[BridgeServerName] = server;
    return servers;
}

AgentProcess *SessionOrchestrator::createAgent(const AgentProcessOptions &options)
{
    AgentProcessOptions effective = options;
    if (effective.model.isEmpty()) {
        effective.model = m_config.defaultModel;
    }

    const QJsonObject servers = buildMcpServers(effective.projectPath);
    if (!servers.isEmpty()) {
        effective.mcpServers = servers;
        effective.systemPromptAppend = BridgeSystemPrompt;
    }

    auto *agent = new AgentProcess(effective, m_runnerFactory, this);
    m_agents.insert(agent->sessionId(), agent);
    wireEvents(agent);
    return agent;
}

void SessionOrchestrator::wireEvents(AgentProcess *agent)
{
    const QString sessionId = agent->sessionId();

    connect(agent, &AgentProcess::eventReceived, this, [this, sessionId](const TurnEvent &event) {
        onAgentEvent(sessionId, event);
    });
    connect(agent, &AgentProcess::closed, this, [this, sessionId](int exitCode) {
        onAgentClosed(sessionId, exitCode);
    });
    connect(agent, &AgentProcess::errorOccurred, this, [this, sessionId](const QString &message) {
        onAgentError(sessionId, message);
    });
}

void SessionOrchestrator::removeAgent(const QString &sessionId)
{
    AgentProcess *agent = m_agents.take(sessionId);
    m_deltaBuffers.remove(sessionId);
    m_flushScheduled.remove(sessionId);
    m_initialPrompts.remove(sessionId);

    if (agent) {
        agent->disconnect(this);
        // Usually called from inside one of the agent's own signals
        agent->deleteLater();
        Q_EMIT sessionRemoved(sessionId);
    }
}

OperationResult SessionOrchestrator::startAgent(const AgentProcessOptions &options, const QString &prompt, QString *sessionId)
{
    if (!m_initialized) {
        return OperationResult(ErrorCode::InvalidState, QStringLiteral("Orchestrator not initialized"));
    }

    if (!options.sessionId.isEmpty()) {
        if (AgentProcess *existing = m_agents.value(options.sessionId)) {
            if (existing->isRunning()) {
                return OperationResult(ErrorCode::AlreadyRunning, QStringLiteral("Agent process already running"));
            }
            return OperationResult(ErrorCode::InvalidState, QStringLiteral("Session %1 already exists, use sendMessage").arg(options.sessionId));
        }
    }

    AgentProcess *agent = createAgent(options);
    const QString id = agent->sessionId();
    if (!prompt.isEmpty()) {
        m_initialPrompts.insert(id, prompt);
    }

    const OperationResult result = agent->start(prompt);
    if (!result.ok()) {
        qWarning() << "SessionOrchestrator: Failed to start" << id << result.message();
        removeAgent(id);
        return result;
    }

    qDebug() << "SessionOrchestrator: Started session" << id << "in" << agent->projectPath();
    if (sessionId) {
        *sessionId = id;
    }
    Q_EMIT sessionStarted(id);
    return OperationResult::success();
}

void SessionOrchestrator::startAgentInWorktree(const AgentProcessOptions &options,
                                               const QString &prompt,
                                               const WorktreeStartOptions &worktreeOptions,
                                               const StartCallback &callback)
{
    if (!m_initialized) {
        callback(OperationResult(ErrorCode::InvalidState, QStringLiteral("Orchestrator not initialized")), QString(), WorktreeRecord());
        return;
    }

    WorktreeCreateOptions create;
    create.projectPath = options.projectPath;
    create.sessionId = newIdentity();
    create.baseBranch = worktreeOptions.baseBranch;
    create.includeChanges = worktreeOptions.includeChanges;

    m_worktrees->create(create, [this, options, prompt, callback](const OperationResult &created, const WorktreeRecord &record) {
        if (!created.ok()) {
            qWarning() << "SessionOrchestrator: Worktree creation failed, not starting agent:" << created.message();
            callback(created, QString(), record);
            return;
        }

        AgentProcessOptions inWorktree = options;
        inWorktree.projectPath = record.worktreePath;

        QString sessionId;
        const OperationResult started = startAgent(inWorktree, prompt, &sessionId);
        if (!started.ok()) {
            m_worktrees->remove(record.sessionId, [](const OperationResult &removed) {
                if (!removed.ok()) {
                    qWarning() << "SessionOrchestrator: Could not remove unused worktree:" << removed.message();
                }
            });
            callback(started, QString(), record);
            return;
        }

        callback(started, sessionId, record);
    });
}

OperationResult SessionOrchestrator::resumeAgent(const QString &sessionId, const QString &projectPath, const QString &model, const QString &message)
{
    if (!m_initialized) {
        return OperationResult(ErrorCode::InvalidState, QStringLiteral("Orchestrator not initialized"));
    }
    if (sessionId.isEmpty()) {
        return OperationResult(ErrorCode::NotFound, QStringLiteral("No session id to resume"));
    }

    AgentProcess *agent = m_agents.value(sessionId);
    const bool created = !agent;
    if (agent) {
        if (agent->isRunning()) {
            return OperationResult(ErrorCode::AlreadyRunning, QStringLiteral("Agent is still processing, wait for it to finish"));
        }
        if (!model.isEmpty()) {
            agent->setModel(model);
        }
    } else {
        AgentProcessOptions options;
        options.projectPath = projectPath;
        options.sessionId = sessionId;
        options.model = model;
        options.resumable = true;
        agent = createAgent(options);
    }

    const OperationResult result = agent->resume(message);
    if (!result.ok()) {
        if (created) {
            removeAgent(sessionId);
        }
        return result;
    }

    if (created) {
        Q_EMIT sessionStarted(sessionId);
    }
    return OperationResult::success();
}

OperationResult SessionOrchestrator::sendMessage(const QString &sessionId, const QString &content)
{
    if (!m_initialized) {
        return OperationResult(ErrorCode::InvalidState, QStringLiteral("Orchestrator not initialized"));
    }
    AgentProcess *agent = m_agents.value(sessionId);
    if (!agent) {
        return OperationResult(ErrorCode::NotFound, QStringLiteral("No agent session found for %1").arg(sessionId));
    }
    return agent->resume(content);
}

OperationResult SessionOrchestrator::setModel(const QString &sessionId, const QString &model)
{
    if (!m_initialized) {
        return OperationResult(ErrorCode::InvalidState, QStringLiteral("Orchestrator not initialized"));
    }
    AgentProcess *agent = m_agents.value(sessionId);
    if (!agent) {
        return OperationResult(ErrorCode::NotFound, QStringLiteral("No agent session found for %1").arg(sessionId));
    }
    agent->setModel(model);
    return OperationResult::success();
}

OperationResult SessionOrchestrator::stopAgent(const QString &sessionId)
{
    if (sessionId.isEmpty()) {
        const QList<AgentProcess *> agents = m_agents.values();
        for (AgentProcess *agent : agents) {
            agent->stop();
        }
        return OperationResult::success();
    }

    AgentProcess *agent = m_agents.value(sessionId);
    if (!agent) {
        return OperationResult(ErrorCode::NotFound, QStringLiteral("No agent session found for %1").arg(sessionId));
    }
    agent->stop();
    return OperationResult::success();
}

SessionStatus SessionOrchestrator::getStatus(const QString &sessionId) const
{
    SessionStatus status;
    const AgentProcess *agent = m_agents.value(sessionId);
    if (!agent) {
        return status;
    }

    status.sessionId = agent->sessionId();
    status.projectPath = agent->projectPath();
    status.isRunning = agent->isRunning();
    status.hasCompletedFirstTurn = agent->hasCompletedFirstTurn();
    status.state = agent->state();
    return status;
}

void SessionOrchestrator::onAgentEvent(const QString &sessionId, const TurnEvent &event)
{
    if (event.isTextDelta()) {
        QJsonArray &buffer = m_deltaBuffers[sessionId];
        buffer.append(event.toJson());
        if (buffer.size() >= m_config.maxDeltaBatch) {
            flushDeltas(sessionId);
        } else if (!m_flushScheduled.contains(sessionId)) {
            m_flushScheduled.insert(sessionId);
            QTimer::singleShot(0, this, [this, sessionId]() {
                flushDeltas(sessionId);
            });
        }
        return;
    }

    flushDeltas(sessionId);

    QJsonObject payload;
    payload[QStringLiteral("sessionId")] = sessionId;
    payload[QStringLiteral("event")] = event.toJson();
    m_broadcaster->send(QStringLiteral("agent:event"), payload);

    if (event.kind() == TurnEvent::Kind::ToolResult) {
        if (const AgentProcess *agent = m_agents.value(sessionId)) {
            Q_EMIT filesChanged(agent->projectPath());
        }
    }
}

void SessionOrchestrator::flushDeltas(const QString &sessionId)
{
    m_flushScheduled.remove(sessionId);
    const QJsonArray events = m_deltaBuffers.take(sessionId);
    if (events.isEmpty()) {
        return;
    }

    QJsonObject payload;
    payload[QStringLiteral("sessionId")] = sessionId;
    payload[QStringLiteral("events")] = events;
    m_broadcaster->send(QStringLiteral("agent:events"), payload);
}

void SessionOrchestrator::onAgentClosed(const QString &sessionId, int exitCode)
{
    flushDeltas(sessionId);

    QJsonObject closed;
    closed[QStringLiteral("sessionId")] = sessionId;
    closed[QStringLiteral("code")] = exitCode;
    m_broadcaster->send(QStringLiteral("agent:closed"), closed);

    if (m_config.notificationsEnabled) {
        QJsonObject notification;
        notification[QStringLiteral("sessionId")] = sessionId;
        notification[QStringLiteral("title")] = QStringLiteral("Agent finished");
        notification[QStringLiteral("body")] = exitCode == 0 ? QStringLiteral("Task completed") : QStringLiteral("Agent exited with code %1").arg(exitCode);
        m_broadcaster->send(QStringLiteral("agent:notification"), notification);
    }

    // Title the session once, from the prompt that opened it
    if (m_config.generateTitles && m_initialPrompts.contains(sessionId) && !m_titleRequested.contains(sessionId)) {
        m_titleRequested.insert(sessionId);
        m_titleGenerator->generate(sessionId, m_initialPrompts.take(sessionId));
    }
}

void SessionOrchestrator::onAgentError(const QString &sessionId, const QString &message)
{
    flushDeltas(sessionId);

    QJsonObject payload;
    payload[QStringLiteral("sessionId")] = sessionId;
    payload[QStringLiteral("error")] = message;
    m_broadcaster->send(QStringLiteral("agent:error"), payload);

    // A session that never got a turn through is dropped so the caller can
    // retry with a fresh identity
    const AgentProcess *agent = m_agents.value(sessionId);
    if (agent && agent->completedTurns() == 0) {
        qWarning() << "SessionOrchestrator: Dropping session" << sessionId << "after failed start:" << message;
        removeAgent(sessionId);
    }
}

void SessionOrchestrator::fork(const QString &sessionId, const QString &projectPath, const QString &knownLogId, const ForkCallback &callback)
{
    if (!m_initialized) {
        callback(OperationResult(ErrorCode::InvalidState, QStringLiteral("Orchestrator not initialized")), ForkResult());
        return;
    }

    QString model = m_config.defaultModel;
    if (AgentProcess *agent = m_agents.value(sessionId)) {
        if (!agent->hasCompletedFirstTurn()) {
            callback(OperationResult(ErrorCode::InvalidState, QStringLiteral("Session %1 has no completed turn to fork").arg(sessionId)), ForkResult());
            return;
        }
        model = agent->model();
        agent->stop();
    }

    const QString logId = knownLogId.isEmpty() ? sessionId : knownLogId;
    const TranscriptLocator &locator = m_logTail->locator();
    const QString transcriptPath = locator.logPath(logId, projectPath);

    qDebug() << "SessionOrchestrator: Forking" << sessionId << "from transcript" << transcriptPath;

    // Checked before any worktree exists, so a missing transcript leaves nothing behind
    QFile transcript(transcriptPath);
    if (!transcript.exists()) {
        callback(OperationResult(ErrorCode::NotFound, QStringLiteral("Session transcript not found. The session may not have had any agent turns yet.")),
                 ForkResult());
        return;
    }
    if (!transcript.open(QIODevice::ReadOnly)) {
        callback(OperationResult(ErrorCode::Io, QStringLiteral("Cannot read %1: %2").arg(transcriptPath, transcript.errorString())), ForkResult());
        return;
    }
    const QByteArray content = transcript.readAll();
    transcript.close();

    const QString sideDirectory = locator.sessionSideDirectory(logId, projectPath);
    createForkWorktrees(projectPath, content, QFileInfo(sideDirectory).isDir() ? sideDirectory : QString(), model, callback);
}

void SessionOrchestrator::createForkWorktrees(const QString &projectPath,
                                              const QByteArray &transcript,
                                              const QString &sideDirectory,
                                              const QString &model,
                                              const ForkCallback &callback)
{
    WorktreeCreateOptions optionsA;
    optionsA.projectPath = projectPath;
    optionsA.sessionId = newIdentity();
    optionsA.includeChanges = true;

    m_worktrees->create(optionsA, [this, projectPath, transcript, sideDirectory, model, callback](const OperationResult &createdA, const WorktreeRecord &recordA) {
        if (!createdA.ok()) {
            callback(createdA, ForkResult());
            return;
        }

        WorktreeCreateOptions optionsB;
        optionsB.projectPath = projectPath;
        optionsB.sessionId = newIdentity();
        optionsB.includeChanges = true;

        m_worktrees->create(optionsB, [this, recordA, transcript, sideDirectory, model, callback](const OperationResult &createdB, const WorktreeRecord &recordB) {
            auto rollback = [this](const QStringList &worktreeIds) {
                for (const QString &id : worktreeIds) {
                    m_worktrees->remove(id, [id](const OperationResult &removed) {
                        if (!removed.ok()) {
                            qWarning() << "SessionOrchestrator: Fork rollback could not remove worktree" << id << removed.message();
                        }
                    });
                }
            };

            if (!createdB.ok()) {
                rollback({recordA.sessionId});
                callback(createdB, ForkResult());
                return;
            }

            ForkResult fork;
            fork.forkA = {newIdentity(), recordA.worktreePath, recordA.sessionId};
            fork.forkB = {newIdentity(), recordB.worktreePath, recordB.sessionId};

            for (const ForkBranch &branch : {fork.forkA, fork.forkB}) {
                const OperationResult seeded = seedForkTranscript(branch, transcript, sideDirectory);
                if (!seeded.ok()) {
                    rollback({recordA.sessionId, recordB.sessionId});
                    callback(seeded, ForkResult());
                    return;
                }
            }

            // Both forks are established identities, ready for sendMessage()
            for (const ForkBranch &branch : {fork.forkA, fork.forkB}) {
                AgentProcessOptions options;
                options.projectPath = branch.worktreePath;
                options.sessionId = branch.sessionId;
                options.model = model;
                options.resumable = true;
                createAgent(options);
                Q_EMIT sessionStarted(branch.sessionId);
            }

            qDebug() << "SessionOrchestrator: Forked into" << fork.forkA.sessionId << "and" << fork.forkB.sessionId;
            callback(OperationResult::success(), fork);
        });
    });
}

OperationResult SessionOrchestrator::seedForkTranscript(const ForkBranch &branch, const QByteArray &transcript, const QString &sideDirectory) const
{
    const TranscriptLocator &locator = m_logTail->locator();
    const QString directory = locator.projectDirectory(branch.worktreePath);
    if (!QDir().mkpath(directory)) {
        return OperationResult(ErrorCode::Io, QStringLiteral("Cannot create %1").arg(directory));
    }

    QFile file(locator.logPath(branch.sessionId, branch.worktreePath));
    if (!file.open(QIODevice::WriteOnly) || file.write(transcript) != transcript.size()) {
        return OperationResult(ErrorCode::Io, QStringLiteral("Cannot write %1: %2").arg(file.fileName(), file.errorString()));
    }
    file.close();

    if (!sideDirectory.isEmpty() && !copyDirectory(sideDirectory, locator.sessionSideDirectory(branch.sessionId, branch.worktreePath))) {
        // Subagent transcripts are optional
        qWarning() << "SessionOrchestrator: Could not copy session side directory" << sideDirectory;
    }

    return OperationResult::success();
}

void SessionOrchestrator::wireLogTail()
{
    connect(m_logTail, &SessionLogTail::entriesAppended, this, [this](const QString &consumerId, const QJsonArray &entries) {
        QJsonObject payload;
        payload[QStringLiteral("consumerId")] = consumerId;
        payload[QStringLiteral("entries")] = entries;
        m_broadcaster->send(QStringLiteral("session-file:entries"), payload);
    });
    connect(m_logTail, &SessionLogTail::logReset, this, [this](const QString &consumerId, const QJsonArray &entries) {
        QJsonObject payload;
        payload[QStringLiteral("consumerId")] = consumerId;
        payload[QStringLiteral("entries")] = entries;
        m_broadcaster->send(QStringLiteral("session-file:reset"), payload);
    });
    connect(m_logTail, &SessionLogTail::logNotFound, this, [this](const QString &consumerId, const QString &message) {
        QJsonObject payload;
        payload[QStringLiteral("consumerId")] = consumerId;
        payload[QStringLiteral("error")] = message;
        m_broadcaster->send(QStringLiteral("session-file:error"), payload);
    });
}

} // namespace Agentdeck

#include "moc_SessionOrchestrator.cpp"
