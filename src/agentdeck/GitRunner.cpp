/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "GitRunner.h"

#include <QDebug>
#include <QProcess>
#include <QStandardPaths>

#include <memory>

namespace Agentdeck
{

GitRunner::GitRunner(QObject *parent)
    : QObject(parent)
{
}

GitRunner::~GitRunner() = default;

QString GitRunner::executablePath()
{
    return QStandardPaths::findExecutable(QStringLiteral("git"));
}

bool GitRunner::isAvailable()
{
    return !executablePath().isEmpty();
}

void GitRunner::run(const QString &workingDir, const QStringList &args, const Callback &callback, const QByteArray &stdinData)
{
    auto *process = new QProcess(this);
    process->setWorkingDirectory(workingDir);
    ++m_pending;

    // finished() and errorOccurred() can both fire for one process
    auto reported = std::make_shared<bool>(false);
    auto report = [this, process, args, callback, reported](const GitResult &result) {
        if (*reported) {
            return;
        }
        *reported = true;
        --m_pending;
        if (!result.ok) {
            qDebug() << "GitRunner: git" << args.value(0) << "failed:" << result.errorOutput.trimmed().left(200);
        }
        process->deleteLater();
        Q_EMIT commandFinished(args, result.ok);
        if (callback) {
            callback(result);
        }
    };

    connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, [process, report](int exitCode, QProcess::ExitStatus exitStatus) {
        GitResult result;
        result.exitCode = exitCode;
        result.ok = exitStatus == QProcess::NormalExit && exitCode == 0;
        result.output = process->readAllStandardOutput();
        result.errorOutput = QString::fromUtf8(process->readAllStandardError());
        report(result);
    });
    connect(process, &QProcess::errorOccurred, this, [process, report](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) {
            return;
        }
        GitResult result;
        result.errorOutput = QStringLiteral("Failed to start git: %1").arg(process->errorString());
        report(result);
    });

    if (stdinData.isEmpty()) {
        process->setStandardInputFile(QProcess::nullDevice());
    } else {
        connect(process, &QProcess::started, process, [process, stdinData]() {
            process->write(stdinData);
            process->closeWriteChannel();
        });
    }

    process->start(QStringLiteral("git"), args);
}

} // namespace Agentdeck

#include "moc_GitRunner.cpp"
