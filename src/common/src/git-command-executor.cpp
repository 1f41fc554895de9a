#include "git-command-executor.h"

#include <QDir>
#include <QProcessEnvironment>
#include <QDebug>

GitCommandExecutor::Result GitCommandExecutor::executeCommand(const GitCommand &cmd, QString &output, QString &error)
{
    output.clear();
    error.clear();

    // 参数验证
    if (cmd.arguments.isEmpty()) {
        error = QStringLiteral("No Git command arguments provided");
        qWarning() << "ERROR: [GitCommandExecutor::executeCommand] Empty arguments";
        return Result::ParseError;
    }

    if (!QDir(cmd.workingDirectory).exists()) {
        error = QStringLiteral("Working directory does not exist: %1").arg(cmd.workingDirectory);
        qWarning() << "ERROR: [GitCommandExecutor::executeCommand] Invalid working directory:" << cmd.workingDirectory;
        return Result::PathError;
    }

    QProcess process;
    process.setWorkingDirectory(cmd.workingDirectory);
    setupProcessEnvironment(&process);

    qDebug() << "DEBUG: [GitCommandExecutor::executeCommand] Executing git" << cmd.arguments.join(' ')
             << "in directory:" << cmd.workingDirectory;

    process.start("git", cmd.arguments);

    if (!process.waitForStarted()) {
        error = QStringLiteral("Failed to start git process: %1").arg(process.errorString());
        qCritical() << "ERROR: [GitCommandExecutor::executeCommand] Failed to start git process:" << process.errorString();
        return Result::ProcessError;
    }

    // 提示符场景不设置超时，等待进程自然结束
    process.waitForFinished(-1);

    output = QString::fromUtf8(process.readAllStandardOutput());
    error = QString::fromUtf8(process.readAllStandardError());

    const Result result = processToResult(process.exitCode(), process.exitStatus());

    if (result == Result::Success) {
        qDebug() << "DEBUG: [GitCommandExecutor::executeCommand] Command completed successfully:" << cmd.command;
    } else {
        qInfo() << "INFO: [GitCommandExecutor::executeCommand] Command failed:" << cmd.command
                << "Exit code:" << process.exitCode() << "Error:" << error.trimmed();
    }

    return result;
}

QString GitCommandExecutor::resultName(Result result)
{
    switch (result) {
    case Result::Success:
        return QStringLiteral("Success");
    case Result::CommandError:
        return QStringLiteral("CommandError");
    case Result::ParseError:
        return QStringLiteral("ParseError");
    case Result::PathError:
        return QStringLiteral("PathError");
    case Result::ProcessError:
        return QStringLiteral("ProcessError");
    }
    return QStringLiteral("Unknown");
}

void GitCommandExecutor::setupProcessEnvironment(QProcess *process)
{
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();

    env.insert("GIT_TERMINAL_PROMPT", "0");   // 禁用交互式提示
    env.insert("GIT_OPTIONAL_LOCKS", "0");    // 只读查询不抢占index锁
    env.insert("LC_ALL", "C");                // 使用英文输出便于解析

    process->setProcessEnvironment(env);
}

GitCommandExecutor::Result GitCommandExecutor::processToResult(int exitCode, QProcess::ExitStatus exitStatus)
{
    // 进程已启动，崩溃和非零退出都视为命令本身失败
    if (exitStatus != QProcess::NormalExit) {
        return Result::CommandError;
    }

    return (exitCode == 0) ? Result::Success : Result::CommandError;
}
