/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "StreamParser.h"

#include <QJsonDocument>
#include <QJsonParseError>

namespace Agentdeck
{

StreamParser::StreamParser(QObject *parent)
    : QObject(parent)
{
}

StreamParser::~StreamParser() = default;

void StreamParser::feed(const QByteArray &chunk)
{
    m_buffer.append(chunk);

    const int lastNewline = m_buffer.lastIndexOf('\n');
    if (lastNewline < 0) {
        return;
    }

    // Detach the complete lines first: a slot connected to eventParsed may
    // call reset() or feed() re-entrantly.
    const QByteArray complete = m_buffer.left(lastNewline + 1);
    m_buffer.remove(0, lastNewline + 1);

    int start = 0;
    int newline = complete.indexOf('\n', start);
    while (newline >= 0) {
        parseLine(complete.mid(start, newline - start));
        start = newline + 1;
        newline = complete.indexOf('\n', start);
    }
}

void StreamParser::flush()
{
    const QByteArray rest = m_buffer;
    m_buffer.clear();
    parseLine(rest);
}

void StreamParser::reset()
{
    m_buffer.clear();
}

void StreamParser::parseLine(const QByteArray &line)
{
    const QByteArray trimmed = line.trimmed();
    if (trimmed.isEmpty()) {
        return;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(trimmed, &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        Q_EMIT parseError(QString::fromUtf8(trimmed));
        return;
    }

    Q_EMIT eventParsed(doc.object());
}

} // namespace Agentdeck

#include "moc_StreamParser.cpp"
