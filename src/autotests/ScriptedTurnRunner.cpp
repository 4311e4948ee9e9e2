/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "ScriptedTurnRunner.h"

// Qt
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimer>

namespace Agentdeck
{

ScriptedTurnRunner::ScriptedTurnRunner(QObject *parent)
    : TurnRunner(parent)
{
}

void ScriptedTurnRunner::run(const TurnRequest &request)
{
    m_request = request;
    m_active = true;

    if (autoFinish) {
        QTimer::singleShot(0, this, [this]() {
            if (!m_active) {
                return;
            }
            if (!scriptedStdout.isEmpty()) {
                writeStdout(scriptedStdout);
            }
            finish(scriptedExitCode);
        });
    }
}

void ScriptedTurnRunner::cancel()
{
    if (!m_active) {
        return;
    }
    m_cancelRequested = true;
    // The execution unit goes away on the next iteration, like a terminated process
    QTimer::singleShot(0, this, [this]() {
        if (m_active) {
            m_active = false;
            Q_EMIT finished(0, true);
        }
    });
}

void ScriptedTurnRunner::writeStdout(const QByteArray &data)
{
    Q_EMIT stdoutData(data);
}

void ScriptedTurnRunner::writeStderr(const QByteArray &data)
{
    Q_EMIT stderrData(data);
}

void ScriptedTurnRunner::finish(int exitCode)
{
    if (!m_active) {
        return;
    }
    m_active = false;
    Q_EMIT finished(exitCode, false);
}

void ScriptedTurnRunner::fail(const QString &message)
{
    if (!m_active) {
        return;
    }
    m_active = false;
    Q_EMIT failed(message);
}

TurnRunnerFactory ScriptedRunnerPool::factory()
{
    return [this](QObject *parent) -> TurnRunner * {
        if (m_broken) {
            return nullptr;
        }
        auto *runner = new ScriptedTurnRunner(parent);
        if (m_scripted) {
            runner->scriptedStdout = m_scriptStdout;
            runner->scriptedExitCode = m_scriptExitCode;
            runner->autoFinish = true;
        }
        m_runners.append(runner);
        return runner;
    };
}

void ScriptedRunnerPool::setScript(const QByteArray &stdoutData, int exitCode)
{
    m_scriptStdout = stdoutData;
    m_scriptExitCode = exitCode;
    m_scripted = true;
}

void ScriptedRunnerPool::clearScript()
{
    m_scriptStdout.clear();
    m_scriptExitCode = 0;
    m_scripted = false;
}

QByteArray ScriptedRunnerPool::line(const QJsonObject &record)
{
    return QJsonDocument(record).toJson(QJsonDocument::Compact) + '\n';
}

QByteArray ScriptedRunnerPool::deltaRecord(const QString &text)
{
    QJsonObject delta;
    delta[QStringLiteral("type")] = QStringLiteral("text_delta");
    delta[QStringLiteral("text")] = text;

    QJsonObject event;
    event[QStringLiteral("type")] = QStringLiteral("content_block_delta");
    event[QStringLiteral("index")] = 0;
    event[QStringLiteral("delta")] = delta;

    QJsonObject record;
    record[QStringLiteral("type")] = QStringLiteral("stream_event");
    record[QStringLiteral("event")] = event;
    return line(record);
}

QByteArray ScriptedRunnerPool::assistantRecord(const QString &text)
{
    QJsonObject block;
    block[QStringLiteral("type")] = QStringLiteral("text");
    block[QStringLiteral("text")] = text;

    QJsonObject message;
    message[QStringLiteral("role")] = QStringLiteral("assistant");
    message[QStringLiteral("content")] = QJsonArray{block};

    QJsonObject record;
    record[QStringLiteral("type")] = QStringLiteral("assistant");
    record[QStringLiteral("message")] = message;
    return line(record);
}

QByteArray ScriptedRunnerPool::resultRecord(const QString &text, bool isError)
{
    QJsonObject record;
    record[QStringLiteral("type")] = QStringLiteral("result");
    record[QStringLiteral("subtype")] = isError ? QStringLiteral("error_during_execution") : QStringLiteral("success");
    record[QStringLiteral("is_error")] = isError;
    record[QStringLiteral("result")] = text;
    record[QStringLiteral("total_cost_usd")] = 0.0125;
    return line(record);
}

QByteArray ScriptedRunnerPool::toolResultRecord()
{
    QJsonObject block;
    block[QStringLiteral("type")] = QStringLiteral("tool_result");
    block[QStringLiteral("tool_use_id")] = QStringLiteral("toolu_01");
    block[QStringLiteral("content")] = QStringLiteral("ok");

    QJsonObject message;
    message[QStringLiteral("role")] = QStringLiteral("user");
    message[QStringLiteral("content")] = QJsonArray{block};

    QJsonObject record;
    record[QStringLiteral("type")] = QStringLiteral("user");
    record[QStringLiteral("message")] = message;
    return line(record);
}

}

#include "moc_ScriptedTurnRunner.cpp"
