/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "TitleGeneratorTest.h"

// Qt
#include <QSignalSpy>
#include <QTest>

// Agentdeck
#include "../agentdeck/TitleGenerator.h"
#include "ScriptedTurnRunner.h"

using namespace Agentdeck;

void TitleGeneratorTest::testBuildPromptTruncates()
{
    const QString shortPrompt = TitleGenerator::buildPrompt(QStringLiteral("fix the login bug"));
    QVERIFY(shortPrompt.endsWith(QStringLiteral("\n\nfix the login bug")));
    QVERIFY(shortPrompt.startsWith(QStringLiteral("Generate a very short title")));

    const QString longMessage(400, QLatin1Char('x'));
    const QString longPrompt = TitleGenerator::buildPrompt(longMessage);
    QVERIFY(longPrompt.endsWith(QString(TitleGenerator::MaxPromptChars, QLatin1Char('x')) + QStringLiteral("...")));
    QVERIFY(!longPrompt.contains(QString(TitleGenerator::MaxPromptChars + 1, QLatin1Char('x'))));
}

void TitleGeneratorTest::testCleanTitle()
{
    QCOMPARE(TitleGenerator::cleanTitle(QStringLiteral("  \"Fix Login Bug\"\n")), QStringLiteral("Fix Login Bug"));
    QCOMPARE(TitleGenerator::cleanTitle(QStringLiteral("'Refactor parser'")), QStringLiteral("Refactor parser"));
    QCOMPARE(TitleGenerator::cleanTitle(QString()), QString());

    const QString longTitle(80, QLatin1Char('t'));
    QCOMPARE(TitleGenerator::cleanTitle(longTitle).length(), TitleGenerator::MaxTitleChars);
}

void TitleGeneratorTest::testGenerateFromResult()
{
    ScriptedRunnerPool pool;
    pool.setScript(ScriptedRunnerPool::assistantRecord(QStringLiteral("ignored")) + ScriptedRunnerPool::resultRecord(QStringLiteral("\"Add Unit Tests\"")));

    TitleGenerator generator(pool.factory());
    generator.setModel(QStringLiteral("claude-haiku-4-5"));
    QSignalSpy started(&generator, &TitleGenerator::generationStarted);
    QSignalSpy ready(&generator, &TitleGenerator::titleReady);
    QSignalSpy failed(&generator, &TitleGenerator::generationFailed);

    generator.generate(QStringLiteral("s-1"), QStringLiteral("add tests"));
    QCOMPARE(started.count(), 1);
    QCOMPARE(generator.pendingCount(), 1);

    const TurnRequest request = pool.last()->request();
    QVERIFY(request.prompt.endsWith(QStringLiteral("add tests")));
    QCOMPARE(request.model, QStringLiteral("claude-haiku-4-5"));
    QVERIFY(request.disableTools);
    QCOMPARE(request.maxTurns, 1);
    QVERIFY(!request.persistSession);
    QVERIFY(request.sessionId.isEmpty());

    QTRY_COMPARE(ready.count(), 1);
    QCOMPARE(failed.count(), 0);
    QCOMPARE(ready.at(0).at(0).toString(), QStringLiteral("s-1"));
    QCOMPARE(ready.at(0).at(1).toString(), QStringLiteral("Add Unit Tests"));
    QCOMPARE(generator.pendingCount(), 0);
}

void TitleGeneratorTest::testErrorResultFails()
{
    ScriptedRunnerPool pool;
    pool.setScript(ScriptedRunnerPool::resultRecord(QStringLiteral("Rate limited"), true));

    TitleGenerator generator(pool.factory());
    QSignalSpy ready(&generator, &TitleGenerator::titleReady);
    QSignalSpy failed(&generator, &TitleGenerator::generationFailed);

    generator.generate(QStringLiteral("s-2"), QStringLiteral("anything"));

    QTRY_COMPARE(failed.count(), 1);
    QCOMPARE(ready.count(), 0);
    QCOMPARE(failed.at(0).at(0).toString(), QStringLiteral("s-2"));
}

void TitleGeneratorTest::testRunnerFailure()
{
    ScriptedRunnerPool pool;
    TitleGenerator generator(pool.factory());
    QSignalSpy failed(&generator, &TitleGenerator::generationFailed);

    generator.generate(QStringLiteral("s-3"), QStringLiteral("anything"));
    pool.last()->fail(QStringLiteral("Claude CLI executable not found"));

    QCOMPARE(failed.count(), 1);
    QCOMPARE(failed.at(0).at(1).toString(), QStringLiteral("Claude CLI executable not found"));
    QCOMPARE(generator.pendingCount(), 0);
}

void TitleGeneratorTest::testNoRunnerAvailable()
{
    ScriptedRunnerPool pool;
    pool.setBroken(true);
    TitleGenerator generator(pool.factory());
    QSignalSpy failed(&generator, &TitleGenerator::generationFailed);

    generator.generate(QStringLiteral("s-4"), QStringLiteral("anything"));
    QCOMPARE(failed.count(), 1);
    QCOMPARE(generator.pendingCount(), 0);
}

QTEST_GUILESS_MAIN(TitleGeneratorTest)

#include "moc_TitleGeneratorTest.cpp"
