/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CLITURNRUNNERTEST_H
#define CLITURNRUNNERTEST_H

#include <QObject>
#include <QTemporaryDir>

namespace Agentdeck
{

class CliTurnRunnerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    // Command line
    void testArgumentsForNewSession();
    void testArgumentsForResume();
    void testArgumentsForTitleTurn();
    void testMcpConfigArgument();

    // Process handling
    void testStreamsOutputAndExitCode();
    void testMissingExecutableFails();
    void testCancelEscalatesToKill();

private:
    QString writeScript(const QString &name, const QByteArray &body);

    QTemporaryDir m_dir;
};

}

#endif // CLITURNRUNNERTEST_H
