/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "OperationResult.h"

namespace Agentdeck
{

QString OperationResult::codeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:
        return QStringLiteral("none");
    case ErrorCode::AlreadyRunning:
        return QStringLiteral("already-running");
    case ErrorCode::InvalidState:
        return QStringLiteral("invalid-state");
    case ErrorCode::NotFound:
        return QStringLiteral("not-found");
    case ErrorCode::Spawn:
        return QStringLiteral("spawn");
    case ErrorCode::Apply:
        return QStringLiteral("apply");
    case ErrorCode::Git:
        return QStringLiteral("git");
    case ErrorCode::Io:
        return QStringLiteral("io");
    }
    return QString();
}

} // namespace Agentdeck
