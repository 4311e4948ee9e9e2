/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TURNEVENT_H
#define TURNEVENT_H

#include "agentdeck_export.h"

#include <QJsonObject>
#include <QMetaType>
#include <QString>

namespace Agentdeck
{

/**
 * One record of a session's turn, decoded from the agent's stream-json output.
 *
 * The set of kinds is closed. Records with an unrecognized "type" decode to
 * Kind::Unknown and are dropped by AgentProcess, so new upstream record types
 * never reach consumers half-understood. The raw record is kept for
 * forwarding over the event channel.
 */
class AGENTDECK_EXPORT TurnEvent
{
public:
    enum class Kind {
        SystemInit, // {"type":"system","subtype":"init"}
        StreamDelta, // stream_event carrying content_block_delta
        StreamMarker, // other stream_event records (message_start, content_block_stop...)
        AssistantMessage, // complete assistant message
        ToolResult, // tool output fed back to the agent
        TurnResult, // final "result" record of the turn
        ProcessError, // produced locally: the execution unit failed
        ProcessStderr, // produced locally: a stderr line of the execution unit
        Unknown
    };

    TurnEvent() = default;

    /**
     * Classify a decoded stdout record
     */
    static TurnEvent fromRecord(const QJsonObject &record);

    static TurnEvent processError(const QString &message);
    static TurnEvent processStderr(const QString &text);

    Kind kind() const { return m_kind; }
    bool isTextDelta() const { return m_kind == Kind::StreamDelta; }

    /**
     * Session identity carried by the record, if any
     */
    QString sessionId() const { return m_sessionId; }

    /**
     * Record subtype: system subtype, stream sub-event type or result subtype
     */
    QString subtype() const { return m_subtype; }

    /**
     * Human readable payload: delta text, assistant text, result text,
     * stderr line or error message depending on the kind
     */
    QString text() const { return m_text; }

    bool isError() const { return m_isError; }
    double costUsd() const { return m_costUsd; }

    /**
     * JSON form delivered to observers
     */
    QJsonObject toJson() const { return m_record; }

    static QString kindName(Kind kind);

private:
    static TurnEvent classifyStreamEvent(const QJsonObject &record);
    static TurnEvent classifyResult(const QJsonObject &record);
    static QString joinTextBlocks(const QJsonObject &message);
    static bool containsToolResult(const QJsonObject &message);

    Kind m_kind = Kind::Unknown;
    QJsonObject m_record;
    QString m_sessionId;
    QString m_subtype;
    QString m_text;
    bool m_isError = false;
    double m_costUsd = 0.0;
};

} // namespace Agentdeck

Q_DECLARE_METATYPE(Agentdeck::TurnEvent)

#endif // TURNEVENT_H
