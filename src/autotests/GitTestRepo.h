/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef GITTESTREPO_H
#define GITTESTREPO_H

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace Agentdeck
{

/**
 * Synchronous git helpers for building fixture repositories in tests
 */
namespace GitTestRepo
{

/**
 * Run git in directory, true when it exits with 0. output gets trimmed stdout.
 */
bool run(const QString &directory, const QStringList &args, QString *output = nullptr);

/**
 * Trimmed stdout of a git command, empty on failure
 */
QString git(const QString &directory, const QStringList &args);

/**
 * Initialize a repository with one commit containing a.txt
 */
bool init(const QString &directory);

bool writeFile(const QString &path, const QByteArray &content);
QByteArray readFile(const QString &path);

bool commitAll(const QString &directory, const QString &message);

}

}

#endif // GITTESTREPO_H
