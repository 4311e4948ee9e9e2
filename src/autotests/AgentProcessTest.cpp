/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "AgentProcessTest.h"

// Qt
#include <QSignalSpy>
#include <QTest>

// Agentdeck
#include "../agentdeck/AgentProcess.h"
#include "ScriptedTurnRunner.h"

using namespace Agentdeck;

static AgentProcessOptions projectOptions()
{
    AgentProcessOptions options;
    options.projectPath = QStringLiteral("/tmp/project");
    return options;
}

static TurnEvent eventAt(const QSignalSpy &spy, int index)
{
    return spy.at(index).at(0).value<TurnEvent>();
}

void AgentProcessTest::initTestCase()
{
    qRegisterMetaType<Agentdeck::TurnEvent>();
}

void AgentProcessTest::testStartEmitsEventsInOrder()
{
    ScriptedRunnerPool pool;
    AgentProcess agent(projectOptions(), pool.factory());
    QSignalSpy events(&agent, &AgentProcess::eventReceived);
    QSignalSpy closed(&agent, &AgentProcess::closed);

    QVERIFY(!agent.sessionId().isEmpty());
    QVERIFY(agent.start(QStringLiteral("add tests")).ok());
    QVERIFY(agent.isRunning());
    QCOMPARE(pool.count(), 1);

    const TurnRequest request = pool.last()->request();
    QCOMPARE(request.prompt, QStringLiteral("add tests"));
    QCOMPARE(request.sessionId, agent.sessionId());
    QCOMPARE(request.workingDirectory, QStringLiteral("/tmp/project"));
    QVERIFY(!request.resume);

    pool.last()->writeStdout(ScriptedRunnerPool::deltaRecord(QStringLiteral("Hi")) + ScriptedRunnerPool::assistantRecord(QStringLiteral("Hi there")));
    pool.last()->writeStdout(ScriptedRunnerPool::resultRecord(QStringLiteral("Hi there")));
    pool.last()->finish(0);

    QCOMPARE(events.count(), 3);
    QCOMPARE(eventAt(events, 0).kind(), TurnEvent::Kind::StreamDelta);
    QCOMPARE(eventAt(events, 1).kind(), TurnEvent::Kind::AssistantMessage);
    QCOMPARE(eventAt(events, 2).kind(), TurnEvent::Kind::TurnResult);

    QCOMPARE(closed.count(), 1);
    QCOMPARE(closed.at(0).at(0).toInt(), 0);
    QVERIFY(!agent.isRunning());
    QVERIFY(agent.hasCompletedFirstTurn());
    QCOMPARE(agent.completedTurns(), 1);
    QCOMPARE(agent.state(), AgentProcess::State::Idle);
}

void AgentProcessTest::testSecondStartWhileRunningFails()
{
    ScriptedRunnerPool pool;
    AgentProcess agent(projectOptions(), pool.factory());
    QSignalSpy closed(&agent, &AgentProcess::closed);

    QVERIFY(agent.start(QStringLiteral("first")).ok());
    const OperationResult second = agent.start(QStringLiteral("second"));
    QCOMPARE(second.code(), ErrorCode::AlreadyRunning);
    QCOMPARE(agent.resume(QStringLiteral("third")).code(), ErrorCode::AlreadyRunning);
    QCOMPARE(pool.count(), 1);

    pool.last()->finish(0);
    QCOMPARE(closed.count(), 1);
}

void AgentProcessTest::testResumeKeepsIdentity()
{
    ScriptedRunnerPool pool;
    AgentProcess agent(projectOptions(), pool.factory());

    QVERIFY(agent.start(QStringLiteral("first")).ok());
    pool.last()->finish(0);

    QCOMPARE(agent.start(QStringLiteral("again")).code(), ErrorCode::InvalidState);

    QVERIFY(agent.resume(QStringLiteral("follow up")).ok());
    QCOMPARE(pool.count(), 2);
    const TurnRequest request = pool.last()->request();
    QVERIFY(request.resume);
    QCOMPARE(request.sessionId, agent.sessionId());
    QCOMPARE(request.prompt, QStringLiteral("follow up"));

    pool.last()->finish(0);
    QCOMPARE(agent.completedTurns(), 2);
}

void AgentProcessTest::testResumableSessionSkipsCreation()
{
    ScriptedRunnerPool pool;
    AgentProcessOptions options = projectOptions();
    options.sessionId = QStringLiteral("restored-id");
    options.resumable = true;
    AgentProcess agent(options, pool.factory());

    QVERIFY(agent.hasCompletedFirstTurn());
    QCOMPARE(agent.completedTurns(), 0);
    QCOMPARE(agent.start(QStringLiteral("hello")).code(), ErrorCode::InvalidState);

    QVERIFY(agent.resume(QStringLiteral("hello")).ok());
    QCOMPARE(pool.last()->request().sessionId, QStringLiteral("restored-id"));
    QVERIFY(pool.last()->request().resume);
}

void AgentProcessTest::testModelAppliesToNextTurn()
{
    ScriptedRunnerPool pool;
    AgentProcessOptions options = projectOptions();
    options.model = QStringLiteral("claude-sonnet-4-5");
    AgentProcess agent(options, pool.factory());

    QVERIFY(agent.start(QStringLiteral("first")).ok());
    agent.setModel(QStringLiteral("claude-opus-4-1"));
    QCOMPARE(pool.last()->request().model, QStringLiteral("claude-sonnet-4-5"));
    pool.last()->finish(0);

    QVERIFY(agent.resume(QStringLiteral("second")).ok());
    QCOMPARE(pool.last()->request().model, QStringLiteral("claude-opus-4-1"));
}

void AgentProcessTest::testStopEmitsClosedZero()
{
    ScriptedRunnerPool pool;
    AgentProcess agent(projectOptions(), pool.factory());
    QSignalSpy closed(&agent, &AgentProcess::closed);
    QSignalSpy errors(&agent, &AgentProcess::errorOccurred);

    QVERIFY(agent.start(QStringLiteral("long task")).ok());
    agent.stop();
    QVERIFY(pool.last()->cancelRequested());

    QTRY_COMPARE(closed.count(), 1);
    QCOMPARE(closed.at(0).at(0).toInt(), 0);
    QCOMPARE(errors.count(), 0);
    QCOMPARE(agent.state(), AgentProcess::State::Closed);

    // A stopped session can still continue
    QVERIFY(agent.resume(QStringLiteral("continue")).ok());
    QVERIFY(agent.isRunning());
}

void AgentProcessTest::testStopWhileIdleCloses()
{
    ScriptedRunnerPool pool;
    AgentProcess agent(projectOptions(), pool.factory());
    QSignalSpy closed(&agent, &AgentProcess::closed);
    QSignalSpy states(&agent, &AgentProcess::stateChanged);

    agent.stop();
    QCOMPARE(agent.state(), AgentProcess::State::Closed);
    QCOMPARE(states.count(), 1);
    QCOMPARE(closed.count(), 0);
    QCOMPARE(pool.count(), 0);
}

void AgentProcessTest::testNonZeroExitCode()
{
    ScriptedRunnerPool pool;
    AgentProcess agent(projectOptions(), pool.factory());
    QSignalSpy closed(&agent, &AgentProcess::closed);

    QVERIFY(agent.start(QStringLiteral("task")).ok());
    pool.last()->finish(2);

    QCOMPARE(closed.count(), 1);
    QCOMPARE(closed.at(0).at(0).toInt(), 2);
    QCOMPARE(agent.state(), AgentProcess::State::Idle);
}

void AgentProcessTest::testRunnerFailure()
{
    ScriptedRunnerPool pool;
    AgentProcess agent(projectOptions(), pool.factory());
    QSignalSpy events(&agent, &AgentProcess::eventReceived);
    QSignalSpy closed(&agent, &AgentProcess::closed);
    QSignalSpy errors(&agent, &AgentProcess::errorOccurred);

    QVERIFY(agent.start(QStringLiteral("task")).ok());
    pool.last()->fail(QStringLiteral("Failed to start Claude CLI: No such file"));

    QCOMPARE(errors.count(), 1);
    QCOMPARE(closed.count(), 0);
    QCOMPARE(events.count(), 1);
    QCOMPARE(eventAt(events, 0).kind(), TurnEvent::Kind::ProcessError);
    QCOMPARE(agent.completedTurns(), 0);
    QVERIFY(!agent.hasCompletedFirstTurn());
    QCOMPARE(agent.state(), AgentProcess::State::Idle);
}

void AgentProcessTest::testNoRunnerAvailable()
{
    ScriptedRunnerPool pool;
    pool.setBroken(true);
    AgentProcess agent(projectOptions(), pool.factory());

    const OperationResult result = agent.start(QStringLiteral("task"));
    QCOMPARE(result.code(), ErrorCode::Spawn);
    QVERIFY(!agent.isRunning());
}

void AgentProcessTest::testStderrLinesBecomeEvents()
{
    ScriptedRunnerPool pool;
    AgentProcess agent(projectOptions(), pool.factory());
    QSignalSpy events(&agent, &AgentProcess::eventReceived);

    QVERIFY(agent.start(QStringLiteral("task")).ok());
    pool.last()->writeStderr(QByteArrayLiteral("first warn"));
    QCOMPARE(events.count(), 0);
    pool.last()->writeStderr(QByteArrayLiteral("ing\n\nsecond"));
    QCOMPARE(events.count(), 1);
    pool.last()->finish(0);

    QCOMPARE(events.count(), 2);
    QCOMPARE(eventAt(events, 0).kind(), TurnEvent::Kind::ProcessStderr);
    QCOMPARE(eventAt(events, 0).text(), QStringLiteral("first warning"));
    QCOMPARE(eventAt(events, 1).text(), QStringLiteral("second"));
}

void AgentProcessTest::testUnknownRecordsDropped()
{
    ScriptedRunnerPool pool;
    AgentProcess agent(projectOptions(), pool.factory());
    QSignalSpy events(&agent, &AgentProcess::eventReceived);

    QVERIFY(agent.start(QStringLiteral("task")).ok());
    pool.last()->writeStdout(QByteArrayLiteral("{\"type\":\"rate_limit_event\"}\ngarbage\n"));
    pool.last()->writeStdout(ScriptedRunnerPool::resultRecord(QStringLiteral("ok")));
    pool.last()->finish(0);

    QCOMPARE(events.count(), 1);
    QCOMPARE(eventAt(events, 0).kind(), TurnEvent::Kind::TurnResult);
}

QTEST_GUILESS_MAIN(AgentProcessTest)

#include "moc_AgentProcessTest.cpp"
