/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef EVENTBROADCASTERTEST_H
#define EVENTBROADCASTERTEST_H

#include <QObject>

namespace Agentdeck
{

class EventBroadcasterTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testDeliversToAllChannels();
    void testNotReadyChannelQueuesInOrder();
    void testRemoveChannel();
    void testDestroyedChannelUnregisters();
    void testDuplicateAddIgnored();
};

}

#endif // EVENTBROADCASTERTEST_H
