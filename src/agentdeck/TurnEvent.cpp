/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TurnEvent.h"

#include <QJsonArray>
#include <QStringList>

namespace Agentdeck
{

TurnEvent TurnEvent::fromRecord(const QJsonObject &record)
{
    const QString type = record.value(QStringLiteral("type")).toString();

    TurnEvent event;
    event.m_record = record;
    event.m_sessionId = record.value(QStringLiteral("session_id")).toString();

    if (type == QStringLiteral("system")) {
        event.m_subtype = record.value(QStringLiteral("subtype")).toString();
        // Other system records (status, hook output) are not part of the protocol we forward
        event.m_kind = event.m_subtype == QStringLiteral("init") ? Kind::SystemInit : Kind::Unknown;
        return event;
    }

    if (type == QStringLiteral("stream_event")) {
        return classifyStreamEvent(record);
    }

    if (type == QStringLiteral("assistant")) {
        event.m_kind = Kind::AssistantMessage;
        event.m_text = joinTextBlocks(record.value(QStringLiteral("message")).toObject());
        return event;
    }

    if (type == QStringLiteral("tool_result")) {
        event.m_kind = Kind::ToolResult;
        event.m_isError = record.value(QStringLiteral("is_error")).toBool();
        return event;
    }

    // The CLI reports tool output as a user message with tool_result blocks
    if (type == QStringLiteral("user") && containsToolResult(record.value(QStringLiteral("message")).toObject())) {
        event.m_kind = Kind::ToolResult;
        return event;
    }

    if (type == QStringLiteral("result")) {
        return classifyResult(record);
    }

    event.m_kind = Kind::Unknown;
    return event;
}

TurnEvent TurnEvent::processError(const QString &message)
{
    TurnEvent event;
    event.m_kind = Kind::ProcessError;
    event.m_text = message;
    event.m_isError = true;
    event.m_record[QStringLiteral("type")] = QStringLiteral("process_error");
    event.m_record[QStringLiteral("message")] = message;
    return event;
}

TurnEvent TurnEvent::processStderr(const QString &text)
{
    TurnEvent event;
    event.m_kind = Kind::ProcessStderr;
    event.m_text = text;
    event.m_record[QStringLiteral("type")] = QStringLiteral("process_stderr");
    event.m_record[QStringLiteral("text")] = text;
    return event;
}

QString TurnEvent::kindName(Kind kind)
{
    switch (kind) {
    case Kind::SystemInit:
        return QStringLiteral("system-init");
    case Kind::StreamDelta:
        return QStringLiteral("stream-delta");
    case Kind::StreamMarker:
        return QStringLiteral("stream-marker");
    case Kind::AssistantMessage:
        return QStringLiteral("assistant-message");
    case Kind::ToolResult:
        return QStringLiteral("tool-result");
    case Kind::TurnResult:
        return QStringLiteral("turn-result");
    case Kind::ProcessError:
        return QStringLiteral("process-error");
    case Kind::ProcessStderr:
        return QStringLiteral("process-stderr");
    case Kind::Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

TurnEvent TurnEvent::classifyStreamEvent(const QJsonObject &record)
{
    TurnEvent event;
    event.m_record = record;
    event.m_sessionId = record.value(QStringLiteral("session_id")).toString();

    const QJsonObject inner = record.value(QStringLiteral("event")).toObject();
    event.m_subtype = inner.value(QStringLiteral("type")).toString();

    if (event.m_subtype == QStringLiteral("content_block_delta")) {
        event.m_kind = Kind::StreamDelta;
        const QJsonObject delta = inner.value(QStringLiteral("delta")).toObject();
        event.m_text = delta.value(QStringLiteral("text")).toString();
        return event;
    }

    if (event.m_subtype == QStringLiteral("message_start") || event.m_subtype == QStringLiteral("message_delta")
        || event.m_subtype == QStringLiteral("message_stop") || event.m_subtype == QStringLiteral("content_block_start")
        || event.m_subtype == QStringLiteral("content_block_stop")) {
        event.m_kind = Kind::StreamMarker;
        return event;
    }

    event.m_kind = Kind::Unknown;
    return event;
}

TurnEvent TurnEvent::classifyResult(const QJsonObject &record)
{
    TurnEvent event;
    event.m_kind = Kind::TurnResult;
    event.m_sessionId = record.value(QStringLiteral("session_id")).toString();
    event.m_subtype = record.value(QStringLiteral("subtype")).toString() == QStringLiteral("success") ? QStringLiteral("success") : QStringLiteral("error");
    event.m_isError = record.contains(QStringLiteral("is_error")) ? record.value(QStringLiteral("is_error")).toBool()
                                                                   : event.m_subtype != QStringLiteral("success");
    event.m_text = record.value(QStringLiteral("result")).toString();

    double cost = record.value(QStringLiteral("total_cost_usd")).toDouble();
    if (record.contains(QStringLiteral("cost_usd"))) {
        cost = record.value(QStringLiteral("cost_usd")).toDouble();
    }
    event.m_costUsd = cost;

    // Normalize to the shape observers expect
    QJsonObject normalized = record;
    normalized[QStringLiteral("subtype")] = event.m_subtype;
    normalized[QStringLiteral("is_error")] = event.m_isError;
    normalized[QStringLiteral("cost_usd")] = cost;
    const QJsonArray errors = record.value(QStringLiteral("errors")).toArray();
    if (!errors.isEmpty() && !record.contains(QStringLiteral("error"))) {
        QStringList messages;
        for (const QJsonValue &value : errors) {
            messages << value.toString();
        }
        normalized[QStringLiteral("error")] = messages.join(QLatin1Char('\n'));
    }
    event.m_record = normalized;
    return event;
}

QString TurnEvent::joinTextBlocks(const QJsonObject &message)
{
    QStringList parts;
    const QJsonArray content = message.value(QStringLiteral("content")).toArray();
    for (const QJsonValue &block : content) {
        const QJsonObject obj = block.toObject();
        if (obj.value(QStringLiteral("type")).toString() == QStringLiteral("text")) {
            parts << obj.value(QStringLiteral("text")).toString();
        }
    }
    return parts.join(QString());
}

bool TurnEvent::containsToolResult(const QJsonObject &message)
{
    const QJsonArray content = message.value(QStringLiteral("content")).toArray();
    for (const QJsonValue &block : content) {
        if (block.toObject().value(QStringLiteral("type")).toString() == QStringLiteral("tool_result")) {
            return true;
        }
    }
    return false;
}

} // namespace Agentdeck
