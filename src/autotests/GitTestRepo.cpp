/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "GitTestRepo.h"

// Qt
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QProcess>

namespace Agentdeck
{

namespace GitTestRepo
{

bool run(const QString &directory, const QStringList &args, QString *output)
{
    QProcess process;
    process.setWorkingDirectory(directory);
    process.start(QStringLiteral("git"), args);
    if (!process.waitForFinished(30000) || process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        return false;
    }
    if (output) {
        *output = QString::fromUtf8(process.readAllStandardOutput()).trimmed();
    }
    return true;
}

QString git(const QString &directory, const QStringList &args)
{
    QString output;
    run(directory, args, &output);
    return output;
}

bool init(const QString &directory)
{
    if (!QDir().mkpath(directory)) {
        return false;
    }
    if (!run(directory, {QStringLiteral("init"), QStringLiteral("-q")})) {
        return false;
    }
    const bool configured = run(directory, {QStringLiteral("config"), QStringLiteral("user.email"), QStringLiteral("test@example.com")})
        && run(directory, {QStringLiteral("config"), QStringLiteral("user.name"), QStringLiteral("Agentdeck Test")})
        && run(directory, {QStringLiteral("config"), QStringLiteral("commit.gpgsign"), QStringLiteral("false")});

    return configured && writeFile(directory + QStringLiteral("/a.txt"), "line one\nline two\n") && commitAll(directory, QStringLiteral("Initial commit"));
}

bool writeFile(const QString &path, const QByteArray &content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

bool commitAll(const QString &directory, const QString &message)
{
    return run(directory, {QStringLiteral("add"), QStringLiteral("-A")})
        && run(directory, {QStringLiteral("commit"), QStringLiteral("-q"), QStringLiteral("-m"), message});
}

}

}
