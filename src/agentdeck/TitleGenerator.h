/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TITLEGENERATOR_H
#define TITLEGENERATOR_H

#include "agentdeck_export.h"

#include "TurnRunner.h"

#include <QObject>
#include <QSet>
#include <QString>

namespace Agentdeck
{

/**
 * TitleGenerator asks a small model for a short session title.
 *
 * Each generate() call runs one tool-free, non-persisted turn of its own
 * and ends with exactly one of titleReady() or generationFailed(). Failures
 * are reported and logged, never propagated.
 */
class AGENTDECK_EXPORT TitleGenerator : public QObject
{
    Q_OBJECT

public:
    explicit TitleGenerator(const TurnRunnerFactory &runnerFactory, QObject *parent = nullptr);
    ~TitleGenerator() override;

    void setModel(const QString &model) { m_model = model; }
    QString model() const { return m_model; }

    void generate(const QString &sessionId, const QString &prompt);

    int pendingCount() const { return m_pending.size(); }

    /**
     * Prompt sent to the title model for a user's first message
     */
    static QString buildPrompt(const QString &userMessage);

    /**
     * Strip surrounding quotes and whitespace, cap the length
     */
    static QString cleanTitle(const QString &raw);

    static constexpr int MaxPromptChars = 300;
    static constexpr int MaxTitleChars = 50;

Q_SIGNALS:
    void generationStarted(const QString &sessionId);
    void titleReady(const QString &sessionId, const QString &title);
    void generationFailed(const QString &sessionId, const QString &reason);

private:
    void finish(TurnRunner *runner, const QString &sessionId, const QString &title, const QString &failure);

    TurnRunnerFactory m_runnerFactory;
    QString m_model;
    QSet<TurnRunner *> m_pending;
};

} // namespace Agentdeck

#endif // TITLEGENERATOR_H
