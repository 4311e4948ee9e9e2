/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STREAMPARSER_H
#define STREAMPARSER_H

#include "agentdeck_export.h"

#include <QByteArray>
#include <QJsonObject>
#include <QObject>
#include <QString>

namespace Agentdeck
{

/**
 * Line-buffered JSON-lines decoder for the agent CLI's stdout.
 *
 * Chunks may end anywhere, including inside a record or inside a UTF-8
 * sequence. Complete lines are decoded in order; the trailing partial line
 * is kept until the next feed() or flush().
 */
class AGENTDECK_EXPORT StreamParser : public QObject
{
    Q_OBJECT

public:
    explicit StreamParser(QObject *parent = nullptr);
    ~StreamParser() override;

    void feed(const QByteArray &chunk);

    /**
     * Decode whatever is left in the buffer (end of stream) and clear it
     */
    void flush();

    /**
     * Drop buffered data so the parser can serve a respawned process
     */
    void reset();

    bool hasPendingData() const { return !m_buffer.trimmed().isEmpty(); }

Q_SIGNALS:
    void eventParsed(const QJsonObject &record);
    void parseError(const QString &rawLine);

private:
    void parseLine(const QByteArray &line);

    QByteArray m_buffer;
};

} // namespace Agentdeck

#endif // STREAMPARSER_H
