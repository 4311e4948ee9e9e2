/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef EVENTBROADCASTER_H
#define EVENTBROADCASTER_H

#include "agentdeck_export.h"

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QPair>
#include <QString>

namespace Agentdeck
{

class EventChannel;

/**
 * EventBroadcaster delivers every message to all registered channels.
 *
 * A channel registered as not ready queues its messages; markReady() replays
 * them in send order. Destroyed channels unregister themselves.
 */
class AGENTDECK_EXPORT EventBroadcaster : public QObject
{
    Q_OBJECT

public:
    explicit EventBroadcaster(QObject *parent = nullptr);
    ~EventBroadcaster() override;

    void addChannel(EventChannel *channel, bool ready = true);
    void removeChannel(EventChannel *channel);
    void markReady(EventChannel *channel);

    void send(const QString &name, const QJsonObject &payload);

    int channelCount() const { return m_channels.size(); }
    bool isReady(EventChannel *channel) const;
    int queuedCount(EventChannel *channel) const;

private:
    struct ChannelState {
        bool ready = false;
        QList<QPair<QString, QJsonObject>> queue;
    };

    QList<EventChannel *> m_order;
    QHash<EventChannel *, ChannelState> m_channels;
};

} // namespace Agentdeck

#endif // EVENTBROADCASTER_H
