/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef EVENTCHANNEL_H
#define EVENTCHANNEL_H

#include "agentdeck_export.h"

#include <QJsonObject>
#include <QObject>
#include <QString>

namespace Agentdeck
{

/**
 * One observer of orchestrator messages, usually the IPC link to a window.
 *
 * The transport behind deliver() is up to the implementation.
 */
class AGENTDECK_EXPORT EventChannel : public QObject
{
    Q_OBJECT

public:
    explicit EventChannel(QObject *parent = nullptr)
        : QObject(parent)
    {
    }
    ~EventChannel() override = default;

    virtual void deliver(const QString &name, const QJsonObject &payload) = 0;
};

} // namespace Agentdeck

#endif // EVENTCHANNEL_H
