/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CLITURNRUNNER_H
#define CLITURNRUNNER_H

#include "TurnRunner.h"

#include <QProcess>
#include <QTimer>

namespace Agentdeck
{

/**
 * CliTurnRunner runs one turn of the Claude CLI as a child process.
 *
 * The CLI is started in print mode with stream-json output and exits when the
 * turn is complete. Cancellation sends SIGTERM and escalates to SIGKILL when
 * the process is still alive after the grace period.
 */
class AGENTDECK_EXPORT CliTurnRunner : public TurnRunner
{
    Q_OBJECT

public:
    explicit CliTurnRunner(const QString &executable = QString(), QObject *parent = nullptr);
    ~CliTurnRunner() override;

    void run(const TurnRequest &request) override;
    void cancel() override;
    bool isActive() const override;

    void setGracePeriod(int msecs) { m_gracePeriodMs = msecs; }
    int gracePeriod() const { return m_gracePeriodMs; }

    /**
     * Command line arguments for a turn (without the executable)
     */
    static QStringList buildArguments(const TurnRequest &request);

    /**
     * Get the path to the Claude CLI executable, empty when not installed
     */
    static QString executablePath();

    /**
     * Check if the Claude CLI is available on the system
     */
    static bool isAvailable();

    static constexpr int DefaultGracePeriodMs = 5000;

private:
    void onFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onErrorOccurred(QProcess::ProcessError error);

    QString m_executable;
    QProcess *m_process = nullptr;
    QTimer *m_killTimer = nullptr;
    int m_gracePeriodMs = DefaultGracePeriodMs;
    bool m_cancelRequested = false;
    bool m_done = false;
};

} // namespace Agentdeck

#endif // CLITURNRUNNER_H
