/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef ORCHESTRATORCONFIG_H
#define ORCHESTRATORCONFIG_H

#include "agentdeck_export.h"

#include "SessionLogTail.h"

#include <QString>

namespace Agentdeck
{

/**
 * Plain settings snapshot a SessionOrchestrator is built with.
 *
 * Empty paths select the component defaults.
 */
struct AGENTDECK_EXPORT OrchestratorConfig {
    // Agent
    QString executable; // empty = locate `claude`
    QString defaultModel; // empty = CLI default
    QString titleModel = QStringLiteral("claude-haiku-4-5");
    bool generateTitles = true;
    int stopGracePeriodMs = 5000;
    int maxDeltaBatch = 500;

    // Transcripts
    QString transcriptRoot;
    LogTailTimings logTail;

    // Worktrees
    QString worktreeBaseDirectory;
    QString worktreeRegistryFile;

    // Tool bridge, disabled unless port and token are set
    int bridgePort = 0;
    QString bridgeToken;
    QString bridgeServerScript;

    // Notifications
    bool notificationsEnabled = true;
};

} // namespace Agentdeck

#endif // ORCHESTRATORCONFIG_H
