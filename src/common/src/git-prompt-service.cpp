#include "git-prompt-service.h"
#include "git-status-parser.h"
#include "git-ref-resolver.h"
#include "git-stash-utils.h"
#include "git-prompt-formatter.h"

#include <QDebug>

GitPromptService::GitPromptService(GitCommandExecutor *executor, const QString &workingDirectory)
    : m_executor(executor)
    , m_workingDirectory(workingDirectory)
{
}

GitPromptService::Outcome GitPromptService::collect(GitPromptSummary &summary)
{
    summary = GitPromptSummary();

    GitCommandExecutor::GitCommand cmd;
    cmd.command = "status";
    cmd.arguments = QStringList() << "status" << "--porcelain" << "--branch";
    cmd.workingDirectory = m_workingDirectory;

    QString output, error;
    const auto statusResult = m_executor->executeCommand(cmd, output, error);

    switch (statusResult) {
    case GitCommandExecutor::Result::Success:
        break;
    case GitCommandExecutor::Result::CommandError:
    case GitCommandExecutor::Result::PathError:
        qDebug() << "DEBUG: [GitPromptService::collect] Not a git repository:" << m_workingDirectory;
        return Outcome::NotRepository;
    case GitCommandExecutor::Result::ParseError:
    case GitCommandExecutor::Result::ProcessError:
        qCritical() << "ERROR: [GitPromptService::collect] git status failed:"
                    << GitCommandExecutor::resultName(statusResult) << error;
        return Outcome::Failed;
    }

    GitRefResolver resolver(m_executor, m_workingDirectory);
    GitStatusSnapshot snapshot;
    if (GitStatusParser::parseGitStatus(output, &resolver, snapshot) == GitCommandExecutor::Result::ProcessError) {
        qCritical() << "ERROR: [GitPromptService::collect] Cannot resolve detached HEAD label";
        return Outcome::Failed;
    }

    int stashCount = 0;
    if (GitStashUtils::getStashCount(m_executor, m_workingDirectory, stashCount) == GitCommandExecutor::Result::ProcessError) {
        return Outcome::Failed;
    }

    summary = GitPromptFormatter::summarize(snapshot, stashCount);
    return Outcome::Ready;
}
