/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "CliTurnRunner.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QStandardPaths>

namespace Agentdeck
{

CliTurnRunner::CliTurnRunner(const QString &executable, QObject *parent)
    : TurnRunner(parent)
    , m_executable(executable)
    , m_killTimer(new QTimer(this))
{
    m_killTimer->setSingleShot(true);
    connect(m_killTimer, &QTimer::timeout, this, [this]() {
        if (m_process && m_process->state() != QProcess::NotRunning) {
            qWarning() << "CliTurnRunner: Process ignored SIGTERM, killing pid" << m_process->processId();
            m_process->kill();
        }
    });
}

CliTurnRunner::~CliTurnRunner()
{
    m_killTimer->stop();
    if (m_process && m_process->state() != QProcess::NotRunning) {
        // Never leave an orphaned CLI behind
        m_process->disconnect(this);
        m_process->kill();
        m_process->waitForFinished(1000);
    }
}

void CliTurnRunner::run(const TurnRequest &request)
{
    if (m_process) {
        qWarning() << "CliTurnRunner::run: runner already used for a turn";
        return;
    }

    const QString program = m_executable.isEmpty() ? executablePath() : m_executable;

    m_process = new QProcess(this);
    m_process->setStandardInputFile(QProcess::nullDevice());
    if (!request.workingDirectory.isEmpty()) {
        m_process->setWorkingDirectory(request.workingDirectory);
    }

    connect(m_process, &QProcess::readyReadStandardOutput, this, [this]() {
        Q_EMIT stdoutData(m_process->readAllStandardOutput());
    });
    connect(m_process, &QProcess::readyReadStandardError, this, [this]() {
        Q_EMIT stderrData(m_process->readAllStandardError());
    });
    connect(m_process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, &CliTurnRunner::onFinished);
    connect(m_process, &QProcess::errorOccurred, this, &CliTurnRunner::onErrorOccurred);

    if (program.isEmpty()) {
        m_done = true;
        // Report asynchronously like every other outcome of run()
        QTimer::singleShot(0, this, [this]() {
            Q_EMIT failed(QStringLiteral("Claude CLI executable not found"));
        });
        return;
    }

    const QStringList args = buildArguments(request);
    qDebug() << "CliTurnRunner: Starting" << program << "resume:" << request.resume << "cwd:" << request.workingDirectory
             << "prompt length:" << request.prompt.length();

    m_process->start(program, args);
}

void CliTurnRunner::cancel()
{
    if (!isActive()) {
        return;
    }

    m_cancelRequested = true;
    m_process->terminate();
    m_killTimer->start(m_gracePeriodMs);
}

bool CliTurnRunner::isActive() const
{
    return m_process && !m_done && m_process->state() != QProcess::NotRunning;
}

QStringList CliTurnRunner::buildArguments(const TurnRequest &request)
{
    QStringList args;
    args << QStringLiteral("-p") << request.prompt;
    args << QStringLiteral("--output-format") << QStringLiteral("stream-json");
    args << QStringLiteral("--verbose");
    args << QStringLiteral("--include-partial-messages");
    args << QStringLiteral("--permission-mode") << QStringLiteral("bypassPermissions");

    if (!request.sessionId.isEmpty()) {
        if (request.resume) {
            args << QStringLiteral("--resume") << request.sessionId;
        } else {
            args << QStringLiteral("--session-id") << request.sessionId;
        }
    }

    if (!request.model.isEmpty()) {
        args << QStringLiteral("--model") << request.model;
    }

    if (!request.mcpServers.isEmpty()) {
        QJsonObject config;
        config[QStringLiteral("mcpServers")] = request.mcpServers;
        args << QStringLiteral("--mcp-config") << QString::fromUtf8(QJsonDocument(config).toJson(QJsonDocument::Compact));
    }

    if (!request.systemPrompt.isEmpty()) {
        args << QStringLiteral("--system-prompt") << request.systemPrompt;
    }

    if (!request.systemPromptAppend.isEmpty()) {
        args << QStringLiteral("--append-system-prompt") << request.systemPromptAppend;
    }

    if (request.disableTools) {
        args << QStringLiteral("--tools") << QString();
    }

    if (request.maxTurns > 0) {
        args << QStringLiteral("--max-turns") << QString::number(request.maxTurns);
    }

    if (!request.persistSession) {
        args << QStringLiteral("--no-session-persistence");
    }

    return args;
}

QString CliTurnRunner::executablePath()
{
    // First check if claude is in PATH
    QString path = QStandardPaths::findExecutable(QStringLiteral("claude"));
    if (!path.isEmpty()) {
        return path;
    }

    // Check common installation locations
    const QStringList commonPaths = {
        QStringLiteral("/usr/local/bin/claude"),
        QStringLiteral("/usr/bin/claude"),
        QDir::homePath() + QStringLiteral("/.local/bin/claude"),
        QDir::homePath() + QStringLiteral("/.claude/local/claude"),
    };

    for (const QString &p : commonPaths) {
        if (QFile::exists(p)) {
            return p;
        }
    }

    return QString();
}

bool CliTurnRunner::isAvailable()
{
    return !executablePath().isEmpty();
}

void CliTurnRunner::onFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    m_killTimer->stop();
    if (m_done) {
        return;
    }
    m_done = true;

    const QByteArray remainingOut = m_process->readAllStandardOutput();
    if (!remainingOut.isEmpty()) {
        Q_EMIT stdoutData(remainingOut);
    }
    const QByteArray remainingErr = m_process->readAllStandardError();
    if (!remainingErr.isEmpty()) {
        Q_EMIT stderrData(remainingErr);
    }

    if (m_cancelRequested) {
        qDebug() << "CliTurnRunner: Turn cancelled";
        Q_EMIT finished(0, true);
        return;
    }

    if (exitStatus == QProcess::CrashExit) {
        Q_EMIT failed(QStringLiteral("Claude CLI crashed: %1").arg(m_process->errorString()));
        return;
    }

    Q_EMIT finished(exitCode, false);
}

void CliTurnRunner::onErrorOccurred(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart || m_done) {
        // Crashes are reported through finished()
        return;
    }

    m_done = true;
    m_killTimer->stop();
    Q_EMIT failed(QStringLiteral("Failed to start Claude CLI: %1").arg(m_process->errorString()));
}

} // namespace Agentdeck

#include "moc_CliTurnRunner.cpp"
