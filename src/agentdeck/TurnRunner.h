/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TURNRUNNER_H
#define TURNRUNNER_H

#include "agentdeck_export.h"

#include <QByteArray>
#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

namespace Agentdeck
{

/**
 * Configuration bundle for one turn of the agent
 */
struct AGENTDECK_EXPORT TurnRequest {
    QString prompt;
    QString sessionId;
    bool resume = false; // re-engage sessionId instead of creating it
    QString model; // empty = CLI default
    QString workingDirectory;
    QJsonObject mcpServers; // tool bridge servers, empty = none
    QString systemPromptAppend;
    QString systemPrompt; // replaces the default system prompt when set
    bool disableTools = false;
    int maxTurns = 0; // 0 = unlimited
    bool persistSession = true;
};

/**
 * One execution of the agent: a spawned CLI process or a driver library call.
 *
 * A runner serves exactly one turn. It reports raw stdout/stderr bytes and
 * ends with exactly one of finished() or failed().
 */
class AGENTDECK_EXPORT TurnRunner : public QObject
{
    Q_OBJECT

public:
    explicit TurnRunner(QObject *parent = nullptr)
        : QObject(parent)
    {
    }
    ~TurnRunner() override = default;

    virtual void run(const TurnRequest &request) = 0;

    /**
     * Best-effort cooperative cancellation. The runner still reports
     * finished() (with cancelled set) once the execution unit is gone.
     */
    virtual void cancel() = 0;

    virtual bool isActive() const = 0;

Q_SIGNALS:
    void stdoutData(const QByteArray &data);
    void stderrData(const QByteArray &data);
    void finished(int exitCode, bool cancelled);
    void failed(const QString &message);
};

using TurnRunnerFactory = std::function<TurnRunner *(QObject *parent)>;

} // namespace Agentdeck

#endif // TURNRUNNER_H
