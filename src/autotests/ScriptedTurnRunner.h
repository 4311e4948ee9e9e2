/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SCRIPTEDTURNRUNNER_H
#define SCRIPTEDTURNRUNNER_H

#include "../agentdeck/TurnRunner.h"

#include <QByteArray>
#include <QList>
#include <QPointer>

namespace Agentdeck
{

/**
 * Test double for one agent turn. The test drives its output by hand, or
 * the owning pool replays a canned script when run() is called.
 */
class ScriptedTurnRunner : public TurnRunner
{
    Q_OBJECT

public:
    explicit ScriptedTurnRunner(QObject *parent = nullptr);

    void run(const TurnRequest &request) override;
    void cancel() override;
    bool isActive() const override { return m_active; }

    TurnRequest request() const { return m_request; }
    bool cancelRequested() const { return m_cancelRequested; }

    void writeStdout(const QByteArray &data);
    void writeStderr(const QByteArray &data);
    void finish(int exitCode = 0);
    void fail(const QString &message);

    // Canned output replayed on the next event loop iteration after run()
    QByteArray scriptedStdout;
    int scriptedExitCode = 0;
    bool autoFinish = false;

private:
    TurnRequest m_request;
    bool m_active = false;
    bool m_cancelRequested = false;
};

/**
 * Hands out ScriptedTurnRunners through a TurnRunnerFactory and keeps track
 * of every runner it created
 */
class ScriptedRunnerPool
{
public:
    TurnRunnerFactory factory();

    int count() const { return m_runners.size(); }
    ScriptedTurnRunner *runner(int index) const { return m_runners.value(index); }
    ScriptedTurnRunner *last() const { return m_runners.isEmpty() ? nullptr : m_runners.last().data(); }

    // Output every future runner replays by itself
    void setScript(const QByteArray &stdoutData, int exitCode = 0);
    void clearScript();

    // Make the factory return null, as if nothing could be spawned
    void setBroken(bool broken) { m_broken = broken; }

    static QByteArray line(const QJsonObject &record);
    static QByteArray deltaRecord(const QString &text);
    static QByteArray assistantRecord(const QString &text);
    static QByteArray resultRecord(const QString &text, bool isError = false);
    static QByteArray toolResultRecord();

private:
    QList<QPointer<ScriptedTurnRunner>> m_runners;
    QByteArray m_scriptStdout;
    int m_scriptExitCode = 0;
    bool m_scripted = false;
    bool m_broken = false;
};

}

#endif // SCRIPTEDTURNRUNNER_H
