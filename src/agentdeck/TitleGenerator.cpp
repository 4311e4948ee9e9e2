/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TitleGenerator.h"
#include "StreamParser.h"
#include "TurnEvent.h"

#include <QDebug>
#include <QDir>
#include <QRegularExpression>

#include <memory>

namespace Agentdeck
{

TitleGenerator::TitleGenerator(const TurnRunnerFactory &runnerFactory, QObject *parent)
    : QObject(parent)
    , m_runnerFactory(runnerFactory)
    , m_model(QStringLiteral("claude-haiku-4-5"))
{
}

TitleGenerator::~TitleGenerator()
{
    for (TurnRunner *runner : std::as_const(m_pending)) {
        runner->disconnect(this);
        runner->cancel();
    }
}

QString TitleGenerator::buildPrompt(const QString &userMessage)
{
    QString truncated = userMessage;
    if (truncated.length() > MaxPromptChars) {
        truncated = truncated.left(MaxPromptChars) + QStringLiteral("...");
    }
    return QStringLiteral("Generate a very short title (2-5 words, no quotes) for a coding session that starts with this message:\n\n") + truncated;
}

QString TitleGenerator::cleanTitle(const QString &raw)
{
    static const QRegularExpression quotes(QStringLiteral("^[\"']|[\"']$"));
    QString title = raw.trimmed();
    title.remove(quotes);
    return title.trimmed().left(MaxTitleChars);
}

void TitleGenerator::generate(const QString &sessionId, const QString &prompt)
{
    Q_EMIT generationStarted(sessionId);

    TurnRunner *runner = m_runnerFactory ? m_runnerFactory(this) : nullptr;
    if (!runner) {
        qWarning() << "TitleGenerator: No execution unit for" << sessionId;
        Q_EMIT generationFailed(sessionId, QStringLiteral("No execution unit available"));
        return;
    }
    m_pending.insert(runner);

    auto *parser = new StreamParser(runner);
    auto resultText = std::make_shared<QString>();

    connect(parser, &StreamParser::eventParsed, runner, [resultText](const QJsonObject &record) {
        const TurnEvent event = TurnEvent::fromRecord(record);
        if (event.kind() == TurnEvent::Kind::TurnResult && !event.isError()) {
            *resultText = event.text();
        }
    });
    connect(runner, &TurnRunner::stdoutData, parser, &StreamParser::feed);
    connect(runner, &TurnRunner::finished, this, [this, runner, parser, resultText, sessionId](int exitCode, bool cancelled) {
        parser->flush();
        const QString title = cleanTitle(*resultText);
        if (cancelled) {
            finish(runner, sessionId, QString(), QStringLiteral("Cancelled"));
        } else if (title.isEmpty()) {
            finish(runner, sessionId, QString(), QStringLiteral("No title in result (exit code %1)").arg(exitCode));
        } else {
            finish(runner, sessionId, title, QString());
        }
    });
    connect(runner, &TurnRunner::failed, this, [this, runner, sessionId](const QString &message) {
        finish(runner, sessionId, QString(), message);
    });

    TurnRequest request;
    request.prompt = buildPrompt(prompt);
    request.model = m_model;
    request.workingDirectory = QDir::tempPath();
    request.systemPrompt = QStringLiteral("You are a title generator. Respond with only a short title, nothing else.");
    request.disableTools = true;
    request.maxTurns = 1;
    request.persistSession = false;

    runner->run(request);
}

void TitleGenerator::finish(TurnRunner *runner, const QString &sessionId, const QString &title, const QString &failure)
{
    if (!m_pending.remove(runner)) {
        return;
    }
    runner->disconnect(this);
    runner->deleteLater();

    if (title.isEmpty()) {
        qWarning() << "TitleGenerator: Failed to generate title for" << sessionId << failure;
        Q_EMIT generationFailed(sessionId, failure);
        return;
    }

    qDebug() << "TitleGenerator: Title for" << sessionId << "is" << title;
    Q_EMIT titleReady(sessionId, title);
}

} // namespace Agentdeck

#include "moc_TitleGenerator.cpp"
