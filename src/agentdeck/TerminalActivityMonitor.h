/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALACTIVITYMONITOR_H
#define TERMINALACTIVITYMONITOR_H

#include "agentdeck_export.h"

#include <QList>
#include <QObject>
#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QTimer>

namespace Agentdeck
{

/**
 * TerminalActivityMonitor tracks an agent CLI running in a raw terminal pane.
 *
 * State machine:
 *   any output            -> Running
 *   silence while Running -> Attention if a recent line matches an attention
 *                            pattern, Idle otherwise
 *   processExited()       -> Done (final)
 *
 * Attention detection is pattern matching on free text and may be wrong in
 * both directions. Consumers should treat it as a hint.
 */
class AGENTDECK_EXPORT TerminalActivityMonitor : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Running,
        Attention, // waiting on the user (permission prompt, question)
        Done
    };
    Q_ENUM(State)

    explicit TerminalActivityMonitor(QObject *parent = nullptr);
    ~TerminalActivityMonitor() override;

    State state() const { return m_state; }

    void setSilenceTimeout(int msecs);
    int silenceTimeout() const { return m_silenceTimer->interval(); }

    void setAttentionPatterns(const QList<QRegularExpression> &patterns) { m_attentionPatterns = patterns; }
    QList<QRegularExpression> attentionPatterns() const { return m_attentionPatterns; }
    static QList<QRegularExpression> defaultAttentionPatterns();

    /**
     * Most recent output lines, ANSI sequences removed. The unterminated
     * current line counts as the last one.
     */
    QStringList recentLines(int count) const;

    int idleCycles() const { return m_idleCycles; }
    QString sessionId() const { return m_sessionId; }

    /**
     * Task name guessed from terminal output: the last prompt line after '>'
     * or '❯', else the first substantive non-banner line. Empty if none.
     */
    static QString extractTaskName(const QStringList &lines);

    static QString stripAnsi(const QString &text);

    static constexpr int DefaultSilenceTimeoutMs = 3000;
    static constexpr int MaxBufferedLines = 200;
    static constexpr int AttentionWindowLines = 5;
    static constexpr int MaxTaskNameChars = 40;

public Q_SLOTS:
    void dataReceived(const QByteArray &data);
    void processExited();

Q_SIGNALS:
    void stateChanged(Agentdeck::TerminalActivityMonitor::State newState);
    void taskNameSuggested(const QString &name);
    void titleChanged(const QString &title);
    void sessionIdDetected(const QString &sessionId);

private:
    void onSilence();
    void setState(State newState);
    void scanForMetadata(const QString &chunk);
    bool matchesAttention() const;

    State m_state = State::Idle;
    QTimer *m_silenceTimer = nullptr;
    QList<QRegularExpression> m_attentionPatterns;

    QStringList m_lines;
    QString m_partialLine;

    bool m_hasBeenRunning = false;
    bool m_taskNameSuggested = false;
    int m_idleCycles = 0;
    QString m_sessionId;
};

} // namespace Agentdeck

#endif // TERMINALACTIVITYMONITOR_H
