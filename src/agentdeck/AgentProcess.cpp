/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AgentProcess.h"
#include "StreamParser.h"

#include <QDebug>
#include <QUuid>

namespace Agentdeck
{

AgentProcess::AgentProcess(const AgentProcessOptions &options, const TurnRunnerFactory &runnerFactory, QObject *parent)
    : QObject(parent)
    , m_runnerFactory(runnerFactory)
    , m_parser(new StreamParser(this))
    , m_sessionId(options.sessionId)
    , m_projectPath(options.projectPath)
    , m_model(options.model)
    , m_mcpServers(options.mcpServers)
    , m_systemPromptAppend(options.systemPromptAppend)
    , m_hasCompletedFirstTurn(options.resumable)
{
    if (m_sessionId.isEmpty()) {
        m_sessionId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    connect(m_parser, &StreamParser::eventParsed, this, &AgentProcess::onRecord);
    connect(m_parser, &StreamParser::parseError, this, [this](const QString &rawLine) {
        qWarning() << "AgentProcess: Skipping unparseable line for" << m_sessionId << rawLine.left(100);
    });
}

AgentProcess::~AgentProcess()
{
    if (m_runner) {
        m_runner->disconnect(this);
        m_runner->cancel();
    }
}

OperationResult AgentProcess::start(const QString &prompt)
{
    if (m_state == State::Running) {
        return OperationResult(ErrorCode::AlreadyRunning, QStringLiteral("Agent process already running"));
    }
    if (m_state != State::Idle || m_hasCompletedFirstTurn) {
        return OperationResult(ErrorCode::InvalidState, QStringLiteral("Session %1 already started, use resume").arg(m_sessionId));
    }

    return runTurn(prompt, false);
}

OperationResult AgentProcess::resume(const QString &message)
{
    if (m_state == State::Running) {
        return OperationResult(ErrorCode::AlreadyRunning, QStringLiteral("Agent is still processing, wait for it to finish"));
    }

    return runTurn(message, true);
}

void AgentProcess::stop()
{
    if (m_state == State::Running && m_runner) {
        qDebug() << "AgentProcess: Stopping turn for" << m_sessionId;
        m_stopRequested = true;
        m_runner->cancel();
        return;
    }

    if (m_state == State::Idle) {
        setState(State::Closed);
    }
}

void AgentProcess::setModel(const QString &model)
{
    m_model = model;
}

OperationResult AgentProcess::runTurn(const QString &prompt, bool isResume)
{
    TurnRunner *runner = m_runnerFactory ? m_runnerFactory(this) : nullptr;
    if (!runner) {
        return OperationResult(ErrorCode::Spawn, QStringLiteral("No execution unit available for %1").arg(m_sessionId));
    }

    m_stopRequested = false;
    m_parser->reset();
    m_stderrBuffer.clear();
    m_runner = runner;

    connect(runner, &TurnRunner::stdoutData, this, [this, runner](const QByteArray &data) {
        if (runner == m_runner) {
            m_parser->feed(data);
        }
    });
    connect(runner, &TurnRunner::stderrData, this, [this, runner](const QByteArray &data) {
        if (runner == m_runner) {
            onStderr(data);
        }
    });
    connect(runner, &TurnRunner::finished, this, [this, runner](int exitCode, bool cancelled) {
        if (runner == m_runner) {
            onRunnerFinished(exitCode, cancelled);
        }
    });
    connect(runner, &TurnRunner::failed, this, [this, runner](const QString &message) {
        if (runner == m_runner) {
            onRunnerFailed(message);
        }
    });

    TurnRequest request;
    request.prompt = prompt;
    request.sessionId = m_sessionId;
    request.resume = isResume;
    request.model = m_model;
    request.workingDirectory = m_projectPath;
    request.mcpServers = m_mcpServers;
    request.systemPromptAppend = m_systemPromptAppend;

    qDebug() << "AgentProcess: Starting turn (resume=" << isResume << ") for" << m_sessionId << "in" << m_projectPath;

    setState(State::Running);
    runner->run(request);
    return OperationResult::success();
}

void AgentProcess::onRecord(const QJsonObject &record)
{
    const TurnEvent event = TurnEvent::fromRecord(record);
    if (event.kind() == TurnEvent::Kind::Unknown) {
        return;
    }
    Q_EMIT eventReceived(event);
}

void AgentProcess::onStderr(const QByteArray &data)
{
    m_stderrBuffer.append(data);
    int newline = m_stderrBuffer.indexOf('\n');
    while (newline >= 0) {
        const QByteArray line = m_stderrBuffer.left(newline).trimmed();
        m_stderrBuffer.remove(0, newline + 1);
        if (!line.isEmpty()) {
            Q_EMIT eventReceived(TurnEvent::processStderr(QString::fromUtf8(line)));
        }
        newline = m_stderrBuffer.indexOf('\n');
    }
}

void AgentProcess::finishTurn()
{
    m_parser->flush();

    const QByteArray tail = m_stderrBuffer.trimmed();
    m_stderrBuffer.clear();
    if (!tail.isEmpty()) {
        Q_EMIT eventReceived(TurnEvent::processStderr(QString::fromUtf8(tail)));
    }

    if (m_runner) {
        m_runner->disconnect(this);
        m_runner->deleteLater();
        m_runner.clear();
    }
}

void AgentProcess::onRunnerFinished(int exitCode, bool cancelled)
{
    finishTurn();

    const bool stopped = cancelled || m_stopRequested;
    m_hasCompletedFirstTurn = true;
    ++m_completedTurns;
    setState(stopped ? State::Closed : State::Idle);

    qDebug() << "AgentProcess: Turn completed for" << m_sessionId << "code:" << exitCode << "stopped:" << stopped;
    Q_EMIT closed(stopped ? 0 : exitCode);
}

void AgentProcess::onRunnerFailed(const QString &message)
{
    finishTurn();

    if (m_stopRequested) {
        // A failed cancellation still ends in close
        m_hasCompletedFirstTurn = true;
        ++m_completedTurns;
        setState(State::Closed);
        Q_EMIT closed(0);
        return;
    }

    qWarning() << "AgentProcess: Turn failed for" << m_sessionId << message;
    setState(State::Idle);
    Q_EMIT eventReceived(TurnEvent::processError(message));
    Q_EMIT errorOccurred(message);
}

void AgentProcess::setState(State newState)
{
    if (m_state != newState) {
        m_state = newState;
        Q_EMIT stateChanged(newState);
    }
}

} // namespace Agentdeck

#include "moc_AgentProcess.cpp"
