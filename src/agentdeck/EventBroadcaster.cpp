/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "EventBroadcaster.h"
#include "EventChannel.h"

#include <QDebug>

namespace Agentdeck
{

EventBroadcaster::EventBroadcaster(QObject *parent)
    : QObject(parent)
{
}

EventBroadcaster::~EventBroadcaster()
{
    for (EventChannel *channel : std::as_const(m_order)) {
        channel->disconnect(this);
    }
}

void EventBroadcaster::addChannel(EventChannel *channel, bool ready)
{
    if (!channel || m_channels.contains(channel)) {
        return;
    }

    ChannelState state;
    state.ready = ready;
    m_channels.insert(channel, state);
    m_order.append(channel);

    connect(channel, &QObject::destroyed, this, [this, channel]() {
        m_channels.remove(channel);
        m_order.removeAll(channel);
    });
}

void EventBroadcaster::removeChannel(EventChannel *channel)
{
    if (!m_channels.remove(channel)) {
        return;
    }
    m_order.removeAll(channel);
    channel->disconnect(this);
}

void EventBroadcaster::markReady(EventChannel *channel)
{
    auto it = m_channels.find(channel);
    if (it == m_channels.end() || it->ready) {
        return;
    }

    it->ready = true;
    const QList<QPair<QString, QJsonObject>> queue = it->queue;
    it->queue.clear();

    if (!queue.isEmpty()) {
        qDebug() << "EventBroadcaster: Flushing" << queue.size() << "queued messages";
    }
    for (const auto &message : queue) {
        channel->deliver(message.first, message.second);
    }
}

void EventBroadcaster::send(const QString &name, const QJsonObject &payload)
{
    // A channel may unregister itself from inside deliver()
    const QList<EventChannel *> channels = m_order;
    for (EventChannel *channel : channels) {
        auto it = m_channels.find(channel);
        if (it == m_channels.end()) {
            continue;
        }
        if (it->ready) {
            channel->deliver(name, payload);
        } else {
            it->queue.append(qMakePair(name, payload));
        }
    }
}

bool EventBroadcaster::isReady(EventChannel *channel) const
{
    return m_channels.value(channel).ready;
}

int EventBroadcaster::queuedCount(EventChannel *channel) const
{
    return m_channels.value(channel).queue.size();
}

} // namespace Agentdeck

#include "moc_EventBroadcaster.cpp"
