/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef GITRUNNER_H
#define GITRUNNER_H

#include "agentdeck_export.h"

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>

namespace Agentdeck
{

/**
 * Outcome of one git subcommand
 */
struct AGENTDECK_EXPORT GitResult {
    bool ok = false;
    int exitCode = -1;
    QByteArray output; // raw stdout, patches may carry any bytes
    QString errorOutput;

    QString text() const { return QString::fromUtf8(output); }
    QString trimmedOutput() const { return text().trimmed(); }
};

/**
 * GitRunner runs git subcommands asynchronously.
 *
 * Every call spawns one git process and reports through its callback on the
 * event loop. Commands are not cancellable; pending ones are killed when the
 * runner is destroyed and their callbacks never run.
 */
class AGENTDECK_EXPORT GitRunner : public QObject
{
    Q_OBJECT

public:
    using Callback = std::function<void(const GitResult &)>;

    explicit GitRunner(QObject *parent = nullptr);
    ~GitRunner() override;

    /**
     * Run `git <args>` in workingDir, writing stdinData to its standard input
     */
    void run(const QString &workingDir, const QStringList &args, const Callback &callback, const QByteArray &stdinData = QByteArray());

    int pendingCount() const { return m_pending; }

    /**
     * Check if git is available on the system
     */
    static bool isAvailable();
    static QString executablePath();

Q_SIGNALS:
    /**
     * Emitted when a command ends, before its callback runs
     */
    void commandFinished(const QStringList &args, bool ok);

private:
    int m_pending = 0;
};

} // namespace Agentdeck

#endif // GITRUNNER_H
