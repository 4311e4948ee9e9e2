/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTPROCESS_H
#define AGENTPROCESS_H

#include "agentdeck_export.h"

#include "OperationResult.h"
#include "TurnEvent.h"
#include "TurnRunner.h"

#include <QJsonObject>
#include <QObject>
#include <QPointer>
#include <QString>

namespace Agentdeck
{

class StreamParser;

struct AGENTDECK_EXPORT AgentProcessOptions {
    QString projectPath;
    QString sessionId; // empty = generate a new identity
    QString model;
    QJsonObject mcpServers;
    QString systemPromptAppend;
    bool resumable = false; // identity already exists in the agent's store (restored or forked)
};

/**
 * AgentProcess manages one session's turn lifecycle.
 *
 * A turn is a bounded execution of the agent: the CLI exits when the turn is
 * done, and the next turn resumes the same session identity. Conversation
 * history lives in the agent's own store, never in this object.
 *
 * While a turn runs, decoded events are emitted in production order,
 * followed by exactly one closed() or one errorOccurred().
 */
class AGENTDECK_EXPORT AgentProcess : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle, // No turn in flight
        Running, // A turn is in flight
        Closed // Stopped by the caller; resume() is still allowed
    };
    Q_ENUM(State)

    AgentProcess(const AgentProcessOptions &options, const TurnRunnerFactory &runnerFactory, QObject *parent = nullptr);
    ~AgentProcess() override;

    QString sessionId() const { return m_sessionId; }
    QString projectPath() const { return m_projectPath; }
    QString model() const { return m_model; }
    State state() const { return m_state; }
    bool isRunning() const { return m_state == State::Running; }
    bool hasCompletedFirstTurn() const { return m_hasCompletedFirstTurn; }
    int completedTurns() const { return m_completedTurns; }

    /**
     * Run the first turn, creating the session identity
     */
    OperationResult start(const QString &prompt);

    /**
     * Run a follow-up turn on the same identity
     */
    OperationResult resume(const QString &message);

    /**
     * Cancel the in-flight turn. closed(0) follows once the execution unit is gone.
     */
    void stop();

    /**
     * Model for the next turn; an in-flight turn keeps its model
     */
    void setModel(const QString &model);

Q_SIGNALS:
    void eventReceived(const Agentdeck::TurnEvent &event);
    void closed(int exitCode);
    void errorOccurred(const QString &message);
    void stateChanged(Agentdeck::AgentProcess::State newState);

private:
    OperationResult runTurn(const QString &prompt, bool isResume);
    void onRecord(const QJsonObject &record);
    void onStderr(const QByteArray &data);
    void onRunnerFinished(int exitCode, bool cancelled);
    void onRunnerFailed(const QString &message);
    void finishTurn();
    void setState(State newState);

    TurnRunnerFactory m_runnerFactory;
    StreamParser *m_parser = nullptr;
    QPointer<TurnRunner> m_runner;

    QString m_sessionId;
    QString m_projectPath;
    QString m_model;
    QJsonObject m_mcpServers;
    QString m_systemPromptAppend;

    State m_state = State::Idle;
    bool m_hasCompletedFirstTurn = false;
    bool m_stopRequested = false;
    int m_completedTurns = 0;
    QByteArray m_stderrBuffer;
};

} // namespace Agentdeck

#endif // AGENTPROCESS_H
