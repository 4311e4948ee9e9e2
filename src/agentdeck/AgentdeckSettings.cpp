/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AgentdeckSettings.h"
#include "TranscriptLocator.h"

#include <KConfigGroup>
#include <QDir>
#include <QStandardPaths>

namespace Agentdeck
{

AgentdeckSettings *AgentdeckSettings::s_instance = nullptr;

AgentdeckSettings *AgentdeckSettings::instance()
{
    return s_instance;
}

AgentdeckSettings::AgentdeckSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    if (!s_instance) {
        s_instance = this;
    }

    // Load config from ~/.config/agentdeckrc
    m_config = KSharedConfig::openConfig(configName);
}

AgentdeckSettings::~AgentdeckSettings()
{
    save();
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

QString AgentdeckSettings::executable() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("Executable", QString());
}

void AgentdeckSettings::setExecutable(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("Executable", path);
    Q_EMIT settingsChanged();
}

QString AgentdeckSettings::defaultModel() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("DefaultModel", QString());
}

void AgentdeckSettings::setDefaultModel(const QString &model)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("DefaultModel", model);
    Q_EMIT settingsChanged();
}

QString AgentdeckSettings::titleModel() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("TitleModel", QStringLiteral("claude-haiku-4-5"));
}

void AgentdeckSettings::setTitleModel(const QString &model)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("TitleModel", model);
    Q_EMIT settingsChanged();
}

bool AgentdeckSettings::generateTitles() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("GenerateTitles", true);
}

void AgentdeckSettings::setGenerateTitles(bool enabled)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("GenerateTitles", enabled);
    Q_EMIT settingsChanged();
}

int AgentdeckSettings::stopGracePeriodMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return group.readEntry("StopGraceMs", 5000);
}

void AgentdeckSettings::setStopGracePeriodMs(int msecs)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("StopGraceMs", msecs);
    Q_EMIT settingsChanged();
}

int AgentdeckSettings::maxDeltaBatch() const
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    return qMax(1, group.readEntry("MaxDeltaBatch", 500));
}

void AgentdeckSettings::setMaxDeltaBatch(int count)
{
    KConfigGroup group(m_config, QStringLiteral("Agent"));
    group.writeEntry("MaxDeltaBatch", count);
    Q_EMIT settingsChanged();
}

QString AgentdeckSettings::transcriptRoot() const
{
    KConfigGroup group(m_config, QStringLiteral("Transcripts"));
    return group.readEntry("Root", TranscriptLocator::defaultRoot());
}

void AgentdeckSettings::setTranscriptRoot(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Transcripts"));
    group.writeEntry("Root", path);
    Q_EMIT settingsChanged();
}

int AgentdeckSettings::transcriptPollIntervalMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Transcripts"));
    return group.readEntry("PollIntervalMs", LogTailTimings().pollIntervalMs);
}

void AgentdeckSettings::setTranscriptPollIntervalMs(int msecs)
{
    KConfigGroup group(m_config, QStringLiteral("Transcripts"));
    group.writeEntry("PollIntervalMs", msecs);
    Q_EMIT settingsChanged();
}

int AgentdeckSettings::transcriptAppearAttempts() const
{
    KConfigGroup group(m_config, QStringLiteral("Transcripts"));
    return group.readEntry("AppearAttempts", LogTailTimings().appearAttempts);
}

void AgentdeckSettings::setTranscriptAppearAttempts(int attempts)
{
    KConfigGroup group(m_config, QStringLiteral("Transcripts"));
    group.writeEntry("AppearAttempts", attempts);
    Q_EMIT settingsChanged();
}

int AgentdeckSettings::transcriptAppearIntervalMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Transcripts"));
    return group.readEntry("AppearIntervalMs", LogTailTimings().appearIntervalMs);
}

void AgentdeckSettings::setTranscriptAppearIntervalMs(int msecs)
{
    KConfigGroup group(m_config, QStringLiteral("Transcripts"));
    group.writeEntry("AppearIntervalMs", msecs);
    Q_EMIT settingsChanged();
}

QString AgentdeckSettings::worktreeBaseDirectory() const
{
    KConfigGroup group(m_config, QStringLiteral("Worktrees"));
    const QString defaultBase = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + QStringLiteral("/worktrees");
    return group.readEntry("BaseDirectory", defaultBase);
}

void AgentdeckSettings::setWorktreeBaseDirectory(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Worktrees"));
    group.writeEntry("BaseDirectory", path);
    Q_EMIT settingsChanged();
}

QString AgentdeckSettings::worktreeRegistryFile() const
{
    KConfigGroup group(m_config, QStringLiteral("Worktrees"));
    const QString defaultFile = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + QStringLiteral("/worktree-registry.json");
    return group.readEntry("RegistryFile", defaultFile);
}

void AgentdeckSettings::setWorktreeRegistryFile(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Worktrees"));
    group.writeEntry("RegistryFile", path);
    Q_EMIT settingsChanged();
}

int AgentdeckSettings::bridgePort() const
{
    KConfigGroup group(m_config, QStringLiteral("Bridge"));
    return group.readEntry("Port", 0);
}

void AgentdeckSettings::setBridgePort(int port)
{
    KConfigGroup group(m_config, QStringLiteral("Bridge"));
    group.writeEntry("Port", port);
    Q_EMIT settingsChanged();
}

QString AgentdeckSettings::bridgeToken() const
{
    KConfigGroup group(m_config, QStringLiteral("Bridge"));
    return group.readEntry("Token", QString());
}

void AgentdeckSettings::setBridgeToken(const QString &token)
{
    KConfigGroup group(m_config, QStringLiteral("Bridge"));
    group.writeEntry("Token", token);
    Q_EMIT settingsChanged();
}

QString AgentdeckSettings::bridgeServerScript() const
{
    KConfigGroup group(m_config, QStringLiteral("Bridge"));
    return group.readEntry("ServerScript", QString());
}

void AgentdeckSettings::setBridgeServerScript(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Bridge"));
    group.writeEntry("ServerScript", path);
    Q_EMIT settingsChanged();
}

bool AgentdeckSettings::notificationsEnabled() const
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    return group.readEntry("Enabled", true);
}

void AgentdeckSettings::setNotificationsEnabled(bool enabled)
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    group.writeEntry("Enabled", enabled);
    Q_EMIT settingsChanged();
}

OrchestratorConfig AgentdeckSettings::orchestratorConfig() const
{
    OrchestratorConfig config;
    config.executable = executable();
    config.defaultModel = defaultModel();
    config.titleModel = titleModel();
    config.generateTitles = generateTitles();
    config.stopGracePeriodMs = stopGracePeriodMs();
    config.maxDeltaBatch = maxDeltaBatch();

    config.transcriptRoot = transcriptRoot();
    config.logTail.pollIntervalMs = transcriptPollIntervalMs();
    config.logTail.appearAttempts = transcriptAppearAttempts();
    config.logTail.appearIntervalMs = transcriptAppearIntervalMs();

    config.worktreeBaseDirectory = worktreeBaseDirectory();
    config.worktreeRegistryFile = worktreeRegistryFile();

    config.bridgePort = bridgePort();
    config.bridgeToken = bridgeToken();
    config.bridgeServerScript = bridgeServerScript();

    config.notificationsEnabled = notificationsEnabled();
    return config;
}

void AgentdeckSettings::save()
{
    m_config->sync();
}

} // namespace Agentdeck

#include "moc_AgentdeckSettings.cpp"
