/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TRANSCRIPTLOCATOR_H
#define TRANSCRIPTLOCATOR_H

#include "agentdeck_export.h"

#include <QString>

namespace Agentdeck
{

/**
 * Maps project paths and log identities to the agent's transcript files.
 *
 * Layout: <root>/<hashed project path>/<logId>.jsonl, with per-session side
 * data (subagent transcripts) in <root>/<hashed project path>/<logId>/.
 */
class AGENTDECK_EXPORT TranscriptLocator
{
public:
    explicit TranscriptLocator(const QString &root = QString());

    /**
     * ~/.claude/projects
     */
    static QString defaultRoot();

    QString root() const { return m_root; }
    void setRoot(const QString &root);

    /**
     * Every character outside [A-Za-z0-9-] becomes '-'
     */
    static QString hashProjectPath(const QString &projectPath);

    QString projectDirectory(const QString &projectPath) const;
    QString logPath(const QString &logId, const QString &projectPath) const;
    QString sessionSideDirectory(const QString &logId, const QString &projectPath) const;

    /**
     * Identity of the most recently modified log of a project, empty if none
     */
    QString findLatestLogId(const QString &projectPath) const;

    static constexpr const char *LogSuffix = ".jsonl";

private:
    QString m_root;
};

} // namespace Agentdeck

#endif // TRANSCRIPTLOCATOR_H
