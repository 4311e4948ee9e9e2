/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTDECK_SETTINGS_H
#define AGENTDECK_SETTINGS_H

#include "agentdeck_export.h"

#include "OrchestratorConfig.h"

#include <QObject>
#include <QString>

#include <KSharedConfig>

namespace Agentdeck
{

/**
 * AgentdeckSettings manages application-wide settings.
 *
 * Settings include:
 * - Agent CLI executable and models
 * - Transcript location and tail timings
 * - Worktree storage
 * - Tool bridge endpoint
 */
class AGENTDECK_EXPORT AgentdeckSettings : public QObject
{
    Q_OBJECT

public:
    static AgentdeckSettings *instance();

    explicit AgentdeckSettings(const QString &configName = QStringLiteral("agentdeckrc"), QObject *parent = nullptr);
    ~AgentdeckSettings() override;

    /**
     * Agent CLI executable, empty to search PATH for `claude`
     */
    QString executable() const;
    void setExecutable(const QString &path);

    /**
     * Default model for new sessions, empty for the CLI default
     */
    QString defaultModel() const;
    void setDefaultModel(const QString &model);

    /**
     * Model used for session titles
     */
    QString titleModel() const;
    void setTitleModel(const QString &model);

    bool generateTitles() const;
    void setGenerateTitles(bool enabled);

    /**
     * Time between SIGTERM and SIGKILL when stopping a turn
     */
    int stopGracePeriodMs() const;
    void setStopGracePeriodMs(int msecs);

    /**
     * Largest number of text deltas delivered in one batch
     */
    int maxDeltaBatch() const;
    void setMaxDeltaBatch(int count);

    // ========== Transcripts ==========

    /**
     * Root of the agent's per-project transcript directories
     * (default: ~/.claude/projects)
     */
    QString transcriptRoot() const;
    void setTranscriptRoot(const QString &path);

    int transcriptPollIntervalMs() const;
    void setTranscriptPollIntervalMs(int msecs);

    int transcriptAppearAttempts() const;
    void setTranscriptAppearAttempts(int attempts);

    int transcriptAppearIntervalMs() const;
    void setTranscriptAppearIntervalMs(int msecs);

    // ========== Worktrees ==========

    QString worktreeBaseDirectory() const;
    void setWorktreeBaseDirectory(const QString &path);

    QString worktreeRegistryFile() const;
    void setWorktreeRegistryFile(const QString &path);

    // ========== Tool bridge ==========

    /**
     * Loopback port of the tool bridge (0 = disabled)
     */
    int bridgePort() const;
    void setBridgePort(int port);

    QString bridgeToken() const;
    void setBridgeToken(const QString &token);

    /**
     * Path of the bridge MCP server script run with node
     */
    QString bridgeServerScript() const;
    void setBridgeServerScript(const QString &path);

    bool notificationsEnabled() const;
    void setNotificationsEnabled(bool enabled);

    /**
     * Snapshot of the current settings for a SessionOrchestrator
     */
    OrchestratorConfig orchestratorConfig() const;

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    KSharedConfig::Ptr m_config;

    static AgentdeckSettings *s_instance;
};

} // namespace Agentdeck

#endif // AGENTDECK_SETTINGS_H
