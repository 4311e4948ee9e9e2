/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef OPERATIONRESULT_H
#define OPERATIONRESULT_H

#include "agentdeck_export.h"

#include <QString>

namespace Agentdeck
{

/**
 * Failure categories reported by caller-invoked operations.
 */
enum class ErrorCode {
    None,
    AlreadyRunning, // a turn is already in flight for the session
    InvalidState, // operation not valid in the current lifecycle state
    NotFound, // unknown session, worktree or transcript
    Spawn, // execution unit failed to start or crashed
    Apply, // a patch did not apply
    Git, // a git subcommand failed
    Io // filesystem error
};

/**
 * Outcome of a caller-invoked operation.
 *
 * Synchronous operations return it directly, asynchronous ones hand it to
 * their completion callback. A default constructed result is a success.
 */
class AGENTDECK_EXPORT OperationResult
{
public:
    OperationResult() = default;
    OperationResult(ErrorCode code, const QString &message)
        : m_code(code)
        , m_message(message)
    {
    }

    static OperationResult success()
    {
        return OperationResult();
    }

    bool ok() const { return m_code == ErrorCode::None; }
    ErrorCode code() const { return m_code; }
    QString message() const { return m_message; }

    /**
     * Short stable name of an error code, used in broadcast payloads and logs
     */
    static QString codeName(ErrorCode code);

private:
    ErrorCode m_code = ErrorCode::None;
    QString m_message;
};

} // namespace Agentdeck

#endif // OPERATIONRESULT_H
