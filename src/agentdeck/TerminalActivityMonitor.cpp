/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminalActivityMonitor.h"

#include <QDebug>

namespace Agentdeck
{

TerminalActivityMonitor::TerminalActivityMonitor(QObject *parent)
    : QObject(parent)
    , m_silenceTimer(new QTimer(this))
    , m_attentionPatterns(defaultAttentionPatterns())
{
    m_silenceTimer->setSingleShot(true);
    m_silenceTimer->setInterval(DefaultSilenceTimeoutMs);
    connect(m_silenceTimer, &QTimer::timeout, this, &TerminalActivityMonitor::onSilence);
}

TerminalActivityMonitor::~TerminalActivityMonitor()
{
    m_silenceTimer->stop();
}

void TerminalActivityMonitor::setSilenceTimeout(int msecs)
{
    m_silenceTimer->setInterval(msecs);
}

QList<QRegularExpression> TerminalActivityMonitor::defaultAttentionPatterns()
{
    const auto options = QRegularExpression::CaseInsensitiveOption;
    return {
        QRegularExpression(QStringLiteral("\\b(allow|approve|permission|accept)\\b"), options),
        QRegularExpression(QStringLiteral("\\(y/n\\)"), options),
        QRegularExpression(QStringLiteral("\\(yes/no\\)"), options),
        QRegularExpression(QStringLiteral("do you want"), options),
        QRegularExpression(QStringLiteral("would you like"), options),
    };
}

QString TerminalActivityMonitor::stripAnsi(const QString &text)
{
    // CSI sequences, OSC sequences (BEL or ST terminated), then lone escapes
    static const QRegularExpression ansi(QStringLiteral("\\x1b\\[[0-9;?]*[ -/]*[@-~]|\\x1b\\][^\\x07\\x1b]*(?:\\x07|\\x1b\\\\)|\\x1b[@-Z\\\\-_]"));
    QString stripped = text;
    stripped.remove(ansi);
    stripped.remove(QLatin1Char('\r'));
    return stripped;
}

void TerminalActivityMonitor::dataReceived(const QByteArray &data)
{
    if (m_state == State::Done) {
        return;
    }

    const QString chunk = QString::fromUtf8(data);
    scanForMetadata(chunk);

    m_partialLine += chunk;
    QStringList parts = m_partialLine.split(QLatin1Char('\n'));
    m_partialLine = parts.takeLast();
    for (const QString &line : std::as_const(parts)) {
        m_lines.append(stripAnsi(line));
    }
    while (m_lines.size() > MaxBufferedLines) {
        m_lines.removeFirst();
    }

    setState(State::Running);
    m_silenceTimer->start();
}

void TerminalActivityMonitor::processExited()
{
    m_silenceTimer->stop();
    setState(State::Done);
}

QStringList TerminalActivityMonitor::recentLines(int count) const
{
    QStringList lines = m_lines;
    const QString partial = stripAnsi(m_partialLine);
    if (!partial.trimmed().isEmpty()) {
        lines.append(partial);
    }
    return lines.mid(qMax(0, lines.size() - count));
}

bool TerminalActivityMonitor::matchesAttention() const
{
    const QString text = recentLines(AttentionWindowLines).join(QLatin1Char('\n'));
    for (const QRegularExpression &pattern : m_attentionPatterns) {
        if (pattern.match(text).hasMatch()) {
            return true;
        }
    }
    return false;
}

void TerminalActivityMonitor::onSilence()
{
    if (m_state != State::Running) {
        return;
    }
    setState(matchesAttention() ? State::Attention : State::Idle);
}

void TerminalActivityMonitor::setState(State newState)
{
    if (m_state == newState || m_state == State::Done) {
        return;
    }

    const State previous = m_state;
    m_state = newState;
    if (newState == State::Running) {
        m_hasBeenRunning = true;
    }

    Q_EMIT stateChanged(newState);

    if (m_hasBeenRunning && previous == State::Running && (newState == State::Idle || newState == State::Attention)) {
        ++m_idleCycles;
    }

    // The first cycle is the CLI's startup banner
    if (!m_taskNameSuggested && m_idleCycles >= 2) {
        m_taskNameSuggested = true;
        const QString name = extractTaskName(recentLines(MaxBufferedLines));
        if (!name.isEmpty()) {
            qDebug() << "TerminalActivityMonitor: Suggesting task name" << name;
            Q_EMIT taskNameSuggested(name);
        }
    }
}

void TerminalActivityMonitor::scanForMetadata(const QString &chunk)
{
    static const QRegularExpression oscTitle(QStringLiteral("\\x1b\\](?:0|2);([^\\x07\\x1b]*?)(?:\\x07|\\x1b\\\\)"));
    const QRegularExpressionMatch titleMatch = oscTitle.match(chunk);
    if (titleMatch.hasMatch()) {
        const QString title = titleMatch.captured(1).trimmed();
        if (!title.isEmpty()) {
            Q_EMIT titleChanged(title);
        }
    }

    if (m_sessionId.isEmpty()) {
        static const QRegularExpression sessionPattern(
            QStringLiteral("session[_ ]?id:?\\s*([0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12})"),
            QRegularExpression::CaseInsensitiveOption);
        const QRegularExpressionMatch sessionMatch = sessionPattern.match(chunk);
        if (sessionMatch.hasMatch()) {
            m_sessionId = sessionMatch.captured(1);
            Q_EMIT sessionIdDetected(m_sessionId);
        }
    }
}

static QString trimDecoration(const QString &text)
{
    static const QRegularExpression decoration(QStringLiteral("^[-─━=~*\\s]+|[-─━=~*\\s]+$"));
    QString trimmed = text;
    trimmed.remove(decoration);
    return trimmed;
}

static QString capTaskName(const QString &name)
{
    if (name.length() > TerminalActivityMonitor::MaxTaskNameChars) {
        return name.left(TerminalActivityMonitor::MaxTaskNameChars - 3) + QStringLiteral("...");
    }
    return name;
}

QString TerminalActivityMonitor::extractTaskName(const QStringList &lines)
{
    static const QRegularExpression promptLine(QStringLiteral("^[>❯]\\s*(.+)"));
    for (int i = lines.size() - 1; i >= 0; --i) {
        const QRegularExpressionMatch match = promptLine.match(lines.at(i).trimmed());
        if (!match.hasMatch() || match.captured(1).trimmed().length() < 3) {
            continue;
        }
        const QString name = trimDecoration(match.captured(1).trimmed());
        if (!name.isEmpty()) {
            return capTaskName(name);
        }
    }

    // No prompt echoed, fall back to the first line that is not banner chrome
    static const QRegularExpression chrome(
        QStringLiteral("^[\\s│╭╮╰╯─┌┐└┘├┤┬┴┼━┃┏┓┗┛┣┫┳┻╋\\-=_.*~#]*$|^[\\s*✻>]+\\s*(Welcome|Type|Tips|Claude Code|/help)"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression barePrompt(QStringLiteral("^[>❯$%#]\\s*$"));
    static const QRegularExpression ruleStart(QStringLiteral("^[-─━=~*]{2,}"));
    static const QRegularExpression ruleEnd(QStringLiteral("[-─━=~*]{2,}$"));
    static const QRegularExpression header(QStringLiteral("^(v\\d|claude\\s+code|model:|session:)"), QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression promptPrefix(QStringLiteral("^[>❯$%#]\\s*"));

    for (const QString &line : lines) {
        const QString trimmed = line.trimmed();
        if (trimmed.length() < 3 || chrome.match(line).hasMatch() || barePrompt.match(trimmed).hasMatch()) {
            continue;
        }
        if (ruleStart.match(trimmed).hasMatch() && ruleEnd.match(trimmed).hasMatch()) {
            continue;
        }
        if (header.match(trimmed).hasMatch()) {
            continue;
        }

        QString name = trimmed;
        name.remove(promptPrefix);
        name = trimDecoration(name);
        if (name.length() >= 3) {
            return capTaskName(name);
        }
    }

    return QString();
}

} // namespace Agentdeck

#include "moc_TerminalActivityMonitor.cpp"
