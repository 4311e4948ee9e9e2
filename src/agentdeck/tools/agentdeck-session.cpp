/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    agentdeck-session - drive agent sessions from the command line

    Runs the session orchestrator headless and prints every broadcast
    message to stdout as one JSON object per line:
        {"name": "agent:events", "payload": {...}}

    Usage:
        agentdeck-session run --project <path> [--model <m>] [--worktree] <prompt>
        agentdeck-session resume --project <path> --session <id> <message>
        agentdeck-session fork --project <path> --session <id> [--log <id>]
        agentdeck-session tail --project <path> [--log <id>]
        agentdeck-session worktrees [--project <path>]
        agentdeck-session remove-worktree --session <id>
*/

#include "AgentdeckSettings.h"
#include "EventBroadcaster.h"
#include "EventChannel.h"
#include "SessionLogTail.h"
#include "SessionOrchestrator.h"
#include "WorktreeIsolator.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>
#include <QTextStream>
#include <QTimer>

using namespace Agentdeck;

// Callbacks can fire before the event loop runs
static void quitLater(int code)
{
    QTimer::singleShot(0, qApp, [code]() {
        QCoreApplication::exit(code);
    });
}

// Writes broadcast messages to stdout as JSON lines
class StdoutChannel : public EventChannel
{
public:
    explicit StdoutChannel(QObject *parent = nullptr)
        : EventChannel(parent)
    {
    }

    void deliver(const QString &name, const QJsonObject &payload) override
    {
        QJsonObject message;
        message[QStringLiteral("name")] = name;
        message[QStringLiteral("payload")] = payload;

        QTextStream out(stdout);
        out << QJsonDocument(message).toJson(QJsonDocument::Compact) << "\n";
        out.flush();

        if (m_exitOnClose && (name == QLatin1String("agent:closed") || name == QLatin1String("agent:error"))) {
            const int code = name == QLatin1String("agent:closed") ? payload.value(QStringLiteral("code")).toInt() : 1;
            m_pending.remove(payload.value(QStringLiteral("sessionId")).toString());
            if (m_pending.isEmpty()) {
                quitLater(code);
            }
        }
    }

    // Quit once every listed session has ended its turn
    void exitAfter(const QString &sessionId)
    {
        m_exitOnClose = true;
        m_pending.insert(sessionId);
    }

private:
    bool m_exitOnClose = false;
    QSet<QString> m_pending;
};

static void printJson(const QJsonObject &object)
{
    QTextStream out(stdout);
    out << QJsonDocument(object).toJson(QJsonDocument::Compact) << "\n";
}

static int fail(const OperationResult &result)
{
    QTextStream err(stderr);
    err << "Error (" << OperationResult::codeName(result.code()) << "): " << result.message() << "\n";
    return 1;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("agentdeck"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Headless agent session orchestrator"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("run, resume, fork, tail, worktrees or remove-worktree"));
    parser.addPositionalArgument(QStringLiteral("text"), QStringLiteral("Prompt or message for run and resume"), QStringLiteral("[text...]"));

    QCommandLineOption projectOption(QStringList() << QStringLiteral("p") << QStringLiteral("project"),
                                     QStringLiteral("Project directory"),
                                     QStringLiteral("path"));
    parser.addOption(projectOption);

    QCommandLineOption sessionOption(QStringList() << QStringLiteral("s") << QStringLiteral("session"),
                                     QStringLiteral("Session id (or worktree id for remove-worktree)"),
                                     QStringLiteral("id"));
    parser.addOption(sessionOption);

    QCommandLineOption modelOption(QStringList() << QStringLiteral("m") << QStringLiteral("model"), QStringLiteral("Model for the turn"), QStringLiteral("model"));
    parser.addOption(modelOption);

    QCommandLineOption logOption(QStringList() << QStringLiteral("l") << QStringLiteral("log"),
                                 QStringLiteral("Transcript id when it differs from the session id"),
                                 QStringLiteral("id"));
    parser.addOption(logOption);

    QCommandLineOption worktreeOption(QStringList() << QStringLiteral("w") << QStringLiteral("worktree"), QStringLiteral("Run the session in a new worktree"));
    parser.addOption(worktreeOption);

    QCommandLineOption baseBranchOption(QStringLiteral("base-branch"), QStringLiteral("Branch the worktree starts from"), QStringLiteral("branch"));
    parser.addOption(baseBranchOption);

    QCommandLineOption includeChangesOption(QStringLiteral("include-changes"), QStringLiteral("Carry uncommitted changes into the worktree"));
    parser.addOption(includeChangesOption);

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        QTextStream err(stderr);
        err << "Error: a command is required\n";
        return 1;
    }

    const QString command = positional.first();
    const QString text = positional.mid(1).join(QLatin1Char(' '));
    const QString projectPath = parser.value(projectOption);
    const QString sessionId = parser.value(sessionOption);

    const bool needsProject = command != QLatin1String("worktrees") && command != QLatin1String("remove-worktree");
    if (needsProject && projectPath.isEmpty()) {
        QTextStream err(stderr);
        err << "Error: --project option is required\n";
        return 1;
    }

    AgentdeckSettings settings;
    OrchestratorConfig config = settings.orchestratorConfig();
    // Nobody is left to receive a title once the turn has ended
    config.generateTitles = false;

    SessionOrchestrator orchestrator(config);
    auto *channel = new StdoutChannel(&orchestrator);
    orchestrator.broadcaster()->addChannel(channel);
    // Listing or removing a worktree must not race the orphan cleanup
    if (needsProject) {
        orchestrator.init();
    }

    if (command == QLatin1String("run")) {
        if (text.isEmpty()) {
            QTextStream err(stderr);
            err << "Error: a prompt is required\n";
            return 1;
        }

        AgentProcessOptions options;
        options.projectPath = projectPath;
        options.sessionId = sessionId;
        options.model = parser.value(modelOption);

        if (parser.isSet(worktreeOption)) {
            WorktreeStartOptions worktree;
            worktree.baseBranch = parser.value(baseBranchOption);
            worktree.includeChanges = parser.isSet(includeChangesOption);
            orchestrator.startAgentInWorktree(options, text, worktree, [channel](const OperationResult &result, const QString &id, const WorktreeRecord &record) {
                if (!result.ok()) {
                    quitLater(fail(result));
                    return;
                }
                printJson(QJsonObject{{QStringLiteral("sessionId"), id}, {QStringLiteral("worktree"), record.toJson()}});
                channel->exitAfter(id);
            });
            return app.exec();
        }

        QString id;
        const OperationResult result = orchestrator.startAgent(options, text, &id);
        if (!result.ok()) {
            return fail(result);
        }
        printJson(QJsonObject{{QStringLiteral("sessionId"), id}});
        channel->exitAfter(id);
        return app.exec();
    }

    if (command == QLatin1String("resume")) {
        if (sessionId.isEmpty() || text.isEmpty()) {
            QTextStream err(stderr);
            err << "Error: --session and a message are required\n";
            return 1;
        }
        const OperationResult result = orchestrator.resumeAgent(sessionId, projectPath, parser.value(modelOption), text);
        if (!result.ok()) {
            return fail(result);
        }
        channel->exitAfter(sessionId);
        return app.exec();
    }

    if (command == QLatin1String("fork")) {
        if (sessionId.isEmpty()) {
            QTextStream err(stderr);
            err << "Error: --session option is required\n";
            return 1;
        }
        orchestrator.fork(sessionId, projectPath, parser.value(logOption), [](const OperationResult &result, const ForkResult &fork) {
            if (!result.ok()) {
                quitLater(fail(result));
                return;
            }
            printJson(QJsonObject{{QStringLiteral("forkA"), fork.forkA.toJson()}, {QStringLiteral("forkB"), fork.forkB.toJson()}});
            quitLater(0);
        });
        return app.exec();
    }

    if (command == QLatin1String("tail")) {
        const QJsonArray initial = orchestrator.logTail()->watch(QStringLiteral("cli"), parser.value(logOption), projectPath);
        printJson(QJsonObject{{QStringLiteral("name"), QStringLiteral("session-file:initial")}, {QStringLiteral("payload"), QJsonObject{{QStringLiteral("entries"), initial}}}});
        // Runs until interrupted
        return app.exec();
    }

    if (command == QLatin1String("worktrees")) {
        const QList<WorktreeRecord> records = projectPath.isEmpty() ? orchestrator.worktrees()->all() : orchestrator.worktrees()->list(projectPath);
        QJsonArray array;
        for (const WorktreeRecord &record : records) {
            array.append(record.toJson());
        }
        QTextStream out(stdout);
        out << QJsonDocument(array).toJson(QJsonDocument::Indented);
        return 0;
    }

    if (command == QLatin1String("remove-worktree")) {
        if (sessionId.isEmpty()) {
            QTextStream err(stderr);
            err << "Error: --session option is required\n";
            return 1;
        }
        orchestrator.worktrees()->remove(sessionId, [](const OperationResult &result) {
            quitLater(result.ok() ? 0 : fail(result));
        });
        return app.exec();
    }

    QTextStream err(stderr);
    err << "Error: unknown command " << command << "\n";
    return 1;
}
