/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef RECORDINGCHANNEL_H
#define RECORDINGCHANNEL_H

#include "../agentdeck/EventChannel.h"

#include <QJsonObject>
#include <QList>
#include <QPair>
#include <QStringList>

namespace Agentdeck
{

/**
 * Event channel that keeps every delivered message for inspection
 */
class RecordingChannel : public EventChannel
{
public:
    explicit RecordingChannel(QObject *parent = nullptr)
        : EventChannel(parent)
    {
    }

    void deliver(const QString &name, const QJsonObject &payload) override
    {
        messages.append(qMakePair(name, payload));
    }

    QStringList names() const
    {
        QStringList result;
        for (const auto &message : messages) {
            result << message.first;
        }
        return result;
    }

    QList<QJsonObject> payloads(const QString &name) const
    {
        QList<QJsonObject> result;
        for (const auto &message : messages) {
            if (message.first == name) {
                result << message.second;
            }
        }
        return result;
    }

    QList<QPair<QString, QJsonObject>> messages;
};

}

#endif // RECORDINGCHANNEL_H
