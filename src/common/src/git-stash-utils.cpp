#include "git-stash-utils.h"

#include <QDir>
#include <QFile>
#include <QDebug>

GitCommandExecutor::Result GitStashUtils::getStashCount(GitCommandExecutor *executor,
                                                        const QString &repositoryPath,
                                                        int &count)
{
    count = 0;

    GitCommandExecutor::GitCommand cmd;
    cmd.command = "rev-parse";
    cmd.arguments = QStringList() << "rev-parse" << "--git-dir";
    cmd.workingDirectory = repositoryPath;

    QString output, error;
    const auto result = executor->executeCommand(cmd, output, error);

    if (result == GitCommandExecutor::Result::ProcessError) {
        qCritical() << "ERROR: [GitStashUtils::getStashCount] Cannot resolve git directory:" << error;
        return result;
    }

    const QString gitDir = output.trimmed();
    if (gitDir.isEmpty()) {
        qInfo() << "INFO: [GitStashUtils::getStashCount] Empty git directory for" << repositoryPath;
        return GitCommandExecutor::Result::Success;
    }

    count = countLogLines(stashLogPath(gitDir, repositoryPath));
    qDebug() << "DEBUG: [GitStashUtils::getStashCount] Found" << count << "stashes";
    return GitCommandExecutor::Result::Success;
}

QString GitStashUtils::stashLogPath(const QString &gitDir, const QString &repositoryPath)
{
    // QDir::filePath对绝对路径原样返回
    return QDir(repositoryPath).filePath(gitDir + QStringLiteral("/logs/refs/stash"));
}

int GitStashUtils::countLogLines(const QString &filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qDebug() << "DEBUG: [GitStashUtils::countLogLines] No stash log at" << filePath;
        return 0;
    }

    int lines = 0;
    while (!file.atEnd()) {
        const QByteArray line = file.readLine();
        if (line.isEmpty()) {
            break;
        }
        ++lines;
    }
    return lines;
}
